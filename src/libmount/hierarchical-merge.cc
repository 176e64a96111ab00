#include "fedfs/mount/hierarchical-merge.hh"

namespace fedfs {

DirEntry mountPointEntry(const MountEntry & entry)
{
    return DirEntry{
        .type = entry.isView() ? DirEntry::Type::File : DirEntry::Type::Directory,
        .mountKind = mountType(entry.config),
    };
}

DirEntries mergeNestedMounts(DirEntries native, const DirPath & dir, const std::vector<ref<const MountEntry>> & nested)
{
    for (auto & mount : nested) {
        auto rel = mount->key().removePrefix(dir.canon());
        auto name = std::string(*rel.begin());

        if (rel.depth() == 1) {
            // The mount point hides whatever the backend has there.
            native.insert_or_assign(name, mountPointEntry(*mount));
            continue;
        }

        auto i = native.find(name);
        if (i == native.end())
            native.emplace(name, DirEntry{.type = DirEntry::Type::Directory});
        else if (!i->second.mountKind && i->second.type != DirEntry::Type::Directory)
            i->second = DirEntry{.type = DirEntry::Type::Directory};
    }

    return native;
}

} // namespace fedfs
