#pragma once
/**
 * @file
 *
 * @brief Persistence of the mount table.
 */

#include "fedfs/mount/mount-config.hh"
#include "fedfs/util/ref.hh"

#include <filesystem>

namespace fedfs {

typedef std::vector<std::pair<AnyPath, MountConfig>> MountConfigs;

/**
 * Where the mounts are remembered between runs. `MountManager` loads
 * the store at startup and writes through to it on every successful
 * mount and unmount.
 */
struct MountConfigStore
{
    virtual ~MountConfigStore() {}

    /**
     * All stored mounts, in path order.
     */
    virtual MountConfigs load() = 0;

    virtual void save(const AnyPath & path, const MountConfig & config) = 0;

    virtual void remove(const AnyPath & path) = 0;
};

/**
 * A store that lives only as long as the process.
 */
ref<MountConfigStore> makeEphemeralMountConfigStore(MountConfigs initial = {});

/**
 * A store backed by a JSON file of the form
 *
 *     { "mountings": { "/data/": { "backend": ... }, "/v.json": { "view": ... } } }
 *
 * The file is replaced atomically on every change. A missing file is
 * an empty store.
 */
ref<MountConfigStore> makeJSONMountConfigStore(std::filesystem::path file);

/**
 * The store selected by the `mount-config-file` setting.
 */
ref<MountConfigStore> openMountConfigStore();

} // namespace fedfs
