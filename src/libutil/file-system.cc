#include "fedfs/util/file-system.hh"
#include "fedfs/util/logging.hh"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>

namespace fedfs {

bool pathExists(const std::filesystem::path & path)
{
    struct stat st;
    if (lstat(path.c_str(), &st) == 0)
        return true;
    if (errno != ENOENT && errno != ENOTDIR)
        throw SysError("getting status of '%s'", path.string());
    return false;
}

std::string readFile(const std::filesystem::path & path)
{
    int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd == -1)
        throw SysError("opening file '%1%'", path.string());

    std::string res;
    char buf[64 * 1024];
    while (true) {
        auto rd = read(fd, buf, sizeof(buf));
        if (rd == -1) {
            if (errno == EINTR)
                continue;
            auto savedErrno = errno;
            close(fd);
            throw SysError(savedErrno, "reading from file '%1%'", path.string());
        }
        if (rd == 0)
            break;
        res.append(buf, rd);
    }

    if (close(fd) == -1)
        throw SysError("closing file '%1%'", path.string());

    return res;
}

static void writeFull(int fd, std::string_view s, const std::filesystem::path & path)
{
    while (!s.empty()) {
        auto res = write(fd, s.data(), s.size());
        if (res == -1) {
            if (errno == EINTR)
                continue;
            throw SysError("writing to file '%1%'", path.string());
        }
        s.remove_prefix(res);
    }
}

void writeFileAtomic(const std::filesystem::path & path, std::string_view s)
{
    auto tmp = path;
    tmp += fmt(".tmp-%d", getpid());

    int fd = open(tmp.c_str(), O_WRONLY | O_TRUNC | O_CREAT | O_CLOEXEC, 0666);
    if (fd == -1)
        throw SysError("opening file '%1%'", tmp.string());

    try {
        writeFull(fd, s, tmp);
        if (fsync(fd) == -1)
            throw SysError("fsyncing file '%1%'", tmp.string());
    } catch (Error &) {
        close(fd);
        unlink(tmp.c_str());
        throw;
    }

    if (close(fd) == -1)
        throw SysError("closing file '%1%'", tmp.string());

    if (rename(tmp.c_str(), path.c_str()) == -1) {
        auto savedErrno = errno;
        unlink(tmp.c_str());
        throw SysError(savedErrno, "renaming '%1%' to '%2%'", tmp.string(), path.string());
    }
}

void deletePathIfExists(const std::filesystem::path & path)
{
    if (unlink(path.c_str()) == -1 && errno != ENOENT)
        throw SysError("deleting '%1%'", path.string());
}

std::filesystem::path createTempDir(const std::filesystem::path & tmpRoot, const std::string & prefix)
{
    static std::atomic<unsigned int> counter{0};

    auto root = tmpRoot.empty() ? std::filesystem::temp_directory_path() : tmpRoot;

    while (true) {
        auto tmpDir = root / fmt("%s-%d-%d", prefix, getpid(), counter++);
        if (mkdir(tmpDir.c_str(), 0755) == 0)
            return tmpDir;
        if (errno != EEXIST)
            throw SysError("creating directory '%1%'", tmpDir.string());
    }
}

AutoDelete::AutoDelete()
    : del{false}
{
}

AutoDelete::AutoDelete(const std::filesystem::path & p)
    : _path(p)
    , del{true}
{
}

AutoDelete::~AutoDelete()
{
    if (!del)
        return;
    std::error_code ec;
    std::filesystem::remove_all(_path, ec);
    if (ec)
        printError("cannot delete '%s': %s", _path.string(), ec.message());
}

void AutoDelete::cancel()
{
    del = false;
}

} // namespace fedfs
