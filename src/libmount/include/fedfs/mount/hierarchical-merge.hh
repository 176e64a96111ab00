#pragma once
/**
 * @file
 *
 * @brief Grafting nested mounts into directory listings.
 */

#include "fedfs/mount/mount-table.hh"

namespace fedfs {

/**
 * The listing entry that stands for the mount point of `entry`.
 */
DirEntry mountPointEntry(const MountEntry & entry);

/**
 * Add to `native`, the listing of `dir` as reported by the backend
 * serving it (possibly empty), one entry per name under which
 * something in `nested` is mounted. `nested` must be the mounts
 * strictly below `dir`, in path order.
 *
 * A mount directly in `dir` replaces a native entry of the same
 * name. A mount deeper down shows up as a directory named after the
 * first component below `dir`, unless there is a native directory or
 * a mount point of that name already.
 */
DirEntries mergeNestedMounts(DirEntries native, const DirPath & dir, const std::vector<ref<const MountEntry>> & nested);

} // namespace fedfs
