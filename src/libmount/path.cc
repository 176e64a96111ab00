#include "fedfs/mount/path.hh"
#include "fedfs/util/strings.hh"

namespace fedfs {

static void checkAbsolute(std::string_view s)
{
    if (s.empty() || s[0] != '/')
        throw BadPath("path '%s' is not absolute", s);
}

DirPath DirPath::parse(std::string_view s)
{
    checkAbsolute(s);
    if (!hasSuffix(s, "/"))
        throw BadPath("'%s' is not a directory path; directory paths end in '/'", s);
    return DirPath(CanonPath(s));
}

std::optional<DirPath> DirPath::parent() const
{
    if (auto p = path.parent())
        return DirPath(std::move(*p));
    return std::nullopt;
}

FilePath DirPath::file(std::string_view name) const
{
    return FilePath(path / name);
}

std::string DirPath::to_string() const
{
    return path.isRoot() ? "/" : path.abs() + "/";
}

FilePath::FilePath(CanonPath path)
    : path(std::move(path))
{
    if (this->path.isRoot())
        throw BadPath("the root directory is not a file");
}

FilePath FilePath::parse(std::string_view s)
{
    checkAbsolute(s);
    if (hasSuffix(s, "/"))
        throw BadPath("'%s' is not a file path; file paths do not end in '/'", s);
    return FilePath(CanonPath(s));
}

AnyPath parseAnyPath(std::string_view s)
{
    if (hasSuffix(s, "/"))
        return DirPath::parse(s);
    else
        return FilePath::parse(s);
}

const CanonPath & canonOf(const AnyPath & path)
{
    return std::visit([](const auto & p) -> const CanonPath & { return p.canon(); }, path);
}

std::string showPath(const AnyPath & path)
{
    return std::visit([](const auto & p) { return p.to_string(); }, path);
}

static CanonPath relativize(const CanonPath & p, const DirPath & mount)
{
    if (!p.isWithin(mount.canon()))
        throw BadPath("path '%s' is not below the mount point '%s'", p.abs(), mount.to_string());
    return p.removePrefix(mount.canon());
}

DirPath relativize(const DirPath & p, const DirPath & mount)
{
    return DirPath(relativize(p.canon(), mount));
}

FilePath relativize(const FilePath & p, const DirPath & mount)
{
    return FilePath(relativize(p.canon(), mount));
}

CanonPath absolutize(const CanonPath & p, const DirPath & mount)
{
    return mount.canon() / p;
}

DirPath absolutize(const DirPath & p, const DirPath & mount)
{
    return DirPath(absolutize(p.canon(), mount));
}

FilePath absolutize(const FilePath & p, const DirPath & mount)
{
    return FilePath(absolutize(p.canon(), mount));
}

std::ostream & operator<<(std::ostream & str, const DirPath & path)
{
    return str << path.to_string();
}

std::ostream & operator<<(std::ostream & str, const FilePath & path)
{
    return str << path.to_string();
}

} // namespace fedfs
