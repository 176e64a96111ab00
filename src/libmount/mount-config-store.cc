#include "fedfs/mount/mount-config-store.hh"
#include "fedfs/mount/globals.hh"
#include "fedfs/util/file-system.hh"
#include "fedfs/util/json-utils.hh"
#include "fedfs/util/logging.hh"
#include "fedfs/util/sync.hh"

namespace fedfs {

namespace {

typedef std::map<CanonPath, std::pair<AnyPath, MountConfig>> MountMap;

MountConfigs toList(const MountMap & map)
{
    MountConfigs res;
    for (auto & [_, mount] : map)
        res.push_back(mount);
    return res;
}

struct EphemeralMountConfigStore : MountConfigStore
{
    Sync<MountMap> state_;

    EphemeralMountConfigStore(MountConfigs initial)
    {
        auto state(state_.lock());
        for (auto & [path, config] : initial)
            state->insert_or_assign(canonOf(path), std::pair{path, config});
    }

    MountConfigs load() override
    {
        return toList(*state_.lock());
    }

    void save(const AnyPath & path, const MountConfig & config) override
    {
        state_.lock()->insert_or_assign(canonOf(path), std::pair{path, config});
    }

    void remove(const AnyPath & path) override
    {
        state_.lock()->erase(canonOf(path));
    }
};

struct JSONMountConfigStore : MountConfigStore
{
    std::filesystem::path file;

    /**
     * Serialises read-modify-write cycles on `file` within this
     * process.
     */
    std::mutex lock_;

    JSONMountConfigStore(std::filesystem::path file)
        : file(std::move(file))
    {
    }

    MountMap read()
    {
        MountMap res;

        if (!pathExists(file))
            return res;

        try {
            auto json = nlohmann::json::parse(readFile(file));
            for (auto & [key, value] : getObject(valueAt(getObject(json), "mountings"))) {
                auto path = parseAnyPath(key);
                res.insert_or_assign(canonOf(path), std::pair{path, mountConfigFromJSON(value)});
            }
        } catch (nlohmann::json::exception & e) {
            throw Error("mount configuration file '%s' is not valid JSON: %s", file.string(), e.what());
        } catch (Error & e) {
            e.addTrace("while reading the mount configuration file '%s'", file.string());
            throw;
        }

        return res;
    }

    void write(const MountMap & map)
    {
        auto mountings = nlohmann::json::object();
        for (auto & [_, mount] : map)
            mountings[showPath(mount.first)] = mountConfigToJSON(mount.second);
        writeFileAtomic(file, nlohmann::json{{"mountings", std::move(mountings)}}.dump(2) + "\n");
        debug("wrote %d mounts to '%s'", map.size(), file.string());
    }

    MountConfigs load() override
    {
        std::lock_guard<std::mutex> lock(lock_);
        return toList(read());
    }

    void save(const AnyPath & path, const MountConfig & config) override
    {
        std::lock_guard<std::mutex> lock(lock_);
        auto map = read();
        map.insert_or_assign(canonOf(path), std::pair{path, config});
        write(map);
    }

    void remove(const AnyPath & path) override
    {
        std::lock_guard<std::mutex> lock(lock_);
        auto map = read();
        if (map.erase(canonOf(path)))
            write(map);
    }
};

} // namespace

ref<MountConfigStore> makeEphemeralMountConfigStore(MountConfigs initial)
{
    return make_ref<EphemeralMountConfigStore>(std::move(initial));
}

ref<MountConfigStore> makeJSONMountConfigStore(std::filesystem::path file)
{
    return make_ref<JSONMountConfigStore>(std::move(file));
}

ref<MountConfigStore> openMountConfigStore()
{
    auto file = mountSettings.mountConfigFile.get();
    if (file.empty())
        return makeEphemeralMountConfigStore();
    return makeJSONMountConfigStore(file);
}

} // namespace fedfs
