#include "fedfs/mount/mount-table.hh"
#include "fedfs/util/logging.hh"
#include "fedfs/util/strings.hh"

namespace fedfs {

LiveHandle::LiveHandle(DirPath mountPoint, OpenedBackend opened)
    : mountPoint(std::move(mountPoint))
    , backend(std::move(opened.backend))
    , releaseFn(std::move(opened.release))
{
}

void LiveHandle::unavailable() const
{
    throw BackendUnavailable("the backend mounted at '%s' has been unmounted", mountPoint.to_string());
}

std::optional<std::string> LiveHandle::release()
{
    if (released.exchange(true))
        return std::nullopt;

    debug("releasing the backend mounted at '%s'", mountPoint.to_string());

    if (!releaseFn)
        return std::nullopt;

    try {
        releaseFn();
    } catch (Error & e) {
        return e.message();
    } catch (std::exception & e) {
        return std::string(e.what());
    }

    return std::nullopt;
}

const DirPath & MountEntry::dirPath() const
{
    if (auto p = std::get_if<DirPath>(&path))
        return *p;
    unreachable();
}

std::shared_ptr<const MountEntry> MountTable::lookup(const CanonPath & path) const
{
    auto i = entries.find(path);
    if (i == entries.end())
        return nullptr;
    return i->second;
}

std::shared_ptr<const MountEntry> MountTable::deepestEnclosingMount(const AnyPath & path) const
{
    CanonPath cur = canonOf(path);

    /* A view is a file, so it only covers its own path. */
    if (auto file = std::get_if<FilePath>(&path)) {
        if (auto entry = lookup(cur); entry && entry->isView())
            return entry;
        cur = file->dir().canon();
    }

    // Find the nearest parent of `path` that is a backend mount point.
    while (true) {
        if (auto entry = lookup(cur); entry && !entry->isView())
            return entry;
        if (cur.isRoot())
            return nullptr;
        cur.pop();
    }
}

MountTable MountTable::insert(ref<const MountEntry> entry) const
{
    auto res = *this;
    auto [i, inserted] = res.entries.emplace(entry->key(), entry);
    if (!inserted)
        throw MountExists("there is already a mount at '%s'", showPath(i->second->path));
    return res;
}

MountTable MountTable::remove(const CanonPath & path) const
{
    auto res = *this;
    if (!res.entries.erase(path))
        throw MountNotFound("there is no mount at '%s'", path.abs());
    return res;
}

std::vector<ref<const MountEntry>> MountTable::mountsBelow(const DirPath & dir) const
{
    std::vector<ref<const MountEntry>> res;
    /* Paths that have `dir` as a string prefix sort directly after
       it. Not all of them are below `dir` ("/data" vs. "/database"). */
    auto & prefix = dir.canon().abs();
    for (auto i = entries.upper_bound(dir.canon()); i != entries.end() && hasPrefix(i->first.abs(), prefix); ++i)
        if (i->first.isWithin(dir.canon()))
            res.push_back(i->second);
    return res;
}

} // namespace fedfs
