#include "fedfs/mount/memory-backend.hh"
#include "fedfs/mount/errors.hh"

namespace fedfs {

namespace {

/**
 * Plans pushed down to a memory backend read straight from it.
 */
struct LocalContext : QueryContext
{
    ref<MemoryBackend> backend;

    LocalContext(ref<MemoryBackend> backend)
        : backend(std::move(backend))
    {
    }

    ref<RecordCursor> read(const FilePath & path) override
    {
        return backend->read(path, 0, std::nullopt);
    }
};

bool dirExists(const std::map<CanonPath, Records> & files, const DirPath & dir)
{
    if (dir.isRoot())
        return true;
    auto i = files.upper_bound(dir.canon());
    return i != files.end() && i->first.isWithin(dir.canon());
}

} // namespace

std::string MemoryBackend::doc()
{
    return R"(
      A backend that keeps its files in memory. Its contents are lost
      when it is unmounted. It takes no parameters.
    )";
}

OpenedBackend MemoryBackend::open(const StringMap & params)
{
    if (!params.empty())
        throw Error("the '%s' backend does not accept the parameter '%s'", kind(), params.begin()->first);

    auto backend = make_ref<MemoryBackend>();
    return OpenedBackend{
        .backend = backend,
        .release = [backend]() { backend->close(); },
    };
}

ref<RecordCursor> MemoryBackend::read(const FilePath & path, size_t offset, std::optional<size_t> limit)
{
    auto state(state_.lock());
    if (state->closed)
        throw Error("the backend is closed");

    auto records = get(state->files, path.canon());
    if (!records)
        throw PathNotFound(path.canon());

    auto begin = records->begin() + std::min(offset, records->size());
    auto end = limit ? begin + std::min(*limit, size_t(records->end() - begin)) : records->end();

    return makeVectorCursor(Records(begin, end));
}

WriteResult MemoryBackend::store(const FilePath & path, const Records & records, bool truncate)
{
    auto state(state_.lock());
    if (state->closed)
        throw Error("the backend is closed");

    /* A file cannot also be a directory. */
    if (dirExists(state->files, DirPath(path.canon())))
        throw Error("cannot write to '%s' because it is a directory", path.to_string());
    for (auto dir = path.dir(); !dir.isRoot(); dir = *dir.parent())
        if (state->files.contains(dir.canon()))
            throw Error("cannot write to '%s' because '%s' is a file", path.to_string(), dir.canon().abs());

    auto & file = state->files[path.canon()];
    if (truncate)
        file.clear();

    WriteResult res;
    for (size_t n = 0; n < records.size(); ++n) {
        if (!records[n].is_object()) {
            res.errors.push_back({n, fmt("record is a %s, not an object", records[n].type_name())});
            continue;
        }
        file.push_back(records[n]);
        res.written++;
    }

    return res;
}

WriteResult MemoryBackend::write(const FilePath & path, const Records & records)
{
    return store(path, records, true);
}

WriteResult MemoryBackend::append(const FilePath & path, const Records & records)
{
    return store(path, records, false);
}

void MemoryBackend::remove(const AnyPath & path)
{
    auto state(state_.lock());
    if (state->closed)
        throw Error("the backend is closed");

    std::visit(
        overloaded{
            [&](const FilePath & file) {
                if (!state->files.erase(file.canon()))
                    throw PathNotFound(file.canon());
            },
            [&](const DirPath & dir) {
                if (!dir.isRoot() && !dirExists(state->files, dir))
                    throw PathNotFound(dir.canon());
                std::erase_if(state->files, [&](auto & file) { return file.first.isWithin(dir.canon()); });
            },
        },
        path);
}

DirEntries MemoryBackend::list(const DirPath & path)
{
    auto state(state_.lock());
    if (state->closed)
        throw Error("the backend is closed");

    if (!dirExists(state->files, path))
        throw PathNotFound(path.canon());

    DirEntries res;
    for (auto & [file, _] : state->files) {
        if (!file.isStrictlyWithin(path.canon()))
            continue;
        auto rel = file.removePrefix(path.canon());
        res.insert_or_assign(
            std::string(*rel.begin()),
            DirEntry{.type = rel.depth() == 1 ? DirEntry::Type::File : DirEntry::Type::Directory});
    }

    return res;
}

void MemoryBackend::move(const AnyPath & src, const AnyPath & dst, MoveSemantics semantics)
{
    auto state(state_.lock());
    if (state->closed)
        throw Error("the backend is closed");

    auto & files = state->files;

    auto checkDestination = [&](bool dstExists) {
        if (semantics == MoveSemantics::FailIfExists && dstExists)
            throw Error("cannot move '%s' to '%s' because the destination exists", showPath(src), showPath(dst));
        if (semantics == MoveSemantics::FailIfMissing && !dstExists)
            throw PathNotFound(canonOf(dst));
    };

    if (auto srcFile = std::get_if<FilePath>(&src)) {
        auto & dstFile = std::get<FilePath>(dst);
        auto i = files.find(srcFile->canon());
        if (i == files.end())
            throw PathNotFound(srcFile->canon());
        checkDestination(files.contains(dstFile.canon()));
        if (dstFile == *srcFile)
            return;
        auto records = std::move(i->second);
        files.erase(i);
        files.insert_or_assign(dstFile.canon(), std::move(records));
        return;
    }

    auto & srcDir = std::get<DirPath>(src);
    auto & dstDir = std::get<DirPath>(dst);
    if (!dirExists(files, srcDir))
        throw PathNotFound(srcDir.canon());
    if (dstDir.isWithin(srcDir) || srcDir.isWithin(dstDir))
        throw Error("cannot move '%s' to '%s' because one contains the other", srcDir.to_string(), dstDir.to_string());
    checkDestination(dirExists(files, dstDir));

    std::erase_if(files, [&](auto & file) { return file.first.isWithin(dstDir.canon()); });

    std::map<CanonPath, Records> moved;
    std::erase_if(files, [&](auto & file) {
        if (!file.first.isWithin(srcDir.canon()))
            return false;
        moved.emplace(dstDir.canon() / file.first.removePrefix(srcDir.canon()), std::move(file.second));
        return true;
    });
    files.merge(moved);
}

bool MemoryBackend::exists(const FilePath & path)
{
    auto state(state_.lock());
    if (state->closed)
        throw Error("the backend is closed");
    return state->files.contains(path.canon());
}

ref<RecordCursor> MemoryBackend::query(const QueryPlan & plan, const Variables & vars)
{
    return plan.execute(make_ref<LocalContext>(ref(shared_from_this())), vars);
}

void MemoryBackend::close()
{
    state_.lock()->closed = true;
}

static RegisterBackendImplementation<MemoryBackend> regMemoryBackend;

} // namespace fedfs
