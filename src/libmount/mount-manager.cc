#include "fedfs/mount/mount-manager.hh"
#include "fedfs/mount/globals.hh"
#include "fedfs/util/finally.hh"
#include "fedfs/util/logging.hh"

namespace fedfs {

MountManager::MountManager(
    const BackendRegistry & registry,
    ref<const QueryCompiler> compiler,
    ref<MountConfigStore> store,
    bool writeThrough)
    : registry(registry)
    , compiler(std::move(compiler))
    , store(std::move(store))
    , writeThrough(writeThrough)
    , handleSeq(mountSettings.randomHandleSeed ? MonotonicSeq::randomStart() : 0)
    , results(handleSeq)
{
    publish(MountTable(), 0);
}

MountManager::~MountManager()
{
    std::lock_guard<std::mutex> lock(mutationLock);
    for (auto & [path, entry] : snapshot()->table.all()) {
        if (!entry->live)
            continue;
        if (auto problem = entry->live->release())
            warn("failed to release the backend mounted at '%s': %s", path.abs(), *problem);
    }
}

void MountManager::publish(MountTable table, uint64_t version)
{
    auto evaluator = make_ref<Evaluator>(table, compiler);
    current.store(std::make_shared<const MountSnapshot>(MountSnapshot{
        .table = std::move(table),
        .version = version,
        .evaluator = evaluator,
    }));
}

ref<const MountSnapshot> MountManager::snapshot() const
{
    return ref<const MountSnapshot>(current.load());
}

void MountManager::mount(const AnyPath & path, const MountConfig & config)
{
    doMount(path, config, writeThrough);
}

void MountManager::doMount(const AnyPath & path, const MountConfig & config, bool save)
{
    std::lock_guard<std::mutex> lock(mutationLock);

    auto snap = snapshot();

    if (snap->table.lookup(canonOf(path)))
        throw MountExists("there is already a mount at '%s'", showPath(path));

    checkMountPathKind(path, config);

    auto entry = std::make_shared<MountEntry>(MountEntry{.path = path, .config = config});

    std::visit(
        overloaded{
            [&](const ViewConfig & view) {
                try {
                    compiler->compile(view.query, std::get<FilePath>(path).dir());
                } catch (Error & e) {
                    e.addTrace("while mounting the view '%s'", showPath(path));
                    throw;
                }
            },
            [&](const BackendConfig & backend) {
                entry->live = std::make_shared<LiveHandle>(std::get<DirPath>(path), registry.open(backend));
            },
        },
        config);

    /* From here on, the table must not change unless the whole mount
       succeeds, and the connection we just opened must not leak. */
    Finally releaseOnFailure([&]() {
        if (!entry->live)
            return;
        if (auto problem = entry->live->release())
            warn("failed to release the backend for '%s' after a failed mount: %s", showPath(path), *problem);
    });

    auto table = snap->table.insert(ref<const MountEntry>(std::shared_ptr<const MountEntry>(entry)));

    if (save)
        store->save(path, config);

    publish(std::move(table), snap->version + 1);

    releaseOnFailure.cancel();

    printInfo("mounted %s at '%s'", fedfs::mountType(config), showPath(path));
}

UnmountResult MountManager::unmount(const AnyPath & path)
{
    std::lock_guard<std::mutex> lock(mutationLock);

    auto snap = snapshot();

    auto entry = snap->table.lookup(canonOf(path));
    if (!entry)
        throw MountNotFound("there is no mount at '%s'", showPath(path));

    auto table = snap->table.remove(entry->key());

    if (writeThrough)
        store->remove(entry->path);

    UnmountResult result;

    if (entry->live) {
        if (auto problem = entry->live->release()) {
            warn("failed to release the backend mounted at '%s': %s", showPath(entry->path), *problem);
            result.warnings.push_back(*problem);
        }
    }

    publish(std::move(table), snap->version + 1);

    printInfo("unmounted '%s'", showPath(entry->path));

    return result;
}

void MountManager::mountAll()
{
    for (auto & [path, config] : store->load()) {
        try {
            doMount(path, config, false);
        } catch (Error & e) {
            e.addTrace("while mounting '%s' from the mount configuration store", showPath(path));
            throw;
        }
    }
}

std::optional<MountConfig> MountManager::lookupMountConfig(const AnyPath & path) const
{
    if (auto entry = snapshot()->table.lookup(canonOf(path)))
        return entry->config;
    return std::nullopt;
}

std::optional<std::string> MountManager::mountType(const AnyPath & path) const
{
    if (auto config = lookupMountConfig(path))
        return fedfs::mountType(*config);
    return std::nullopt;
}

MountConfigs MountManager::mounts() const
{
    MountConfigs res;
    for (auto & [_, entry] : snapshot()->table.all())
        res.emplace_back(entry->path, entry->config);
    return res;
}

ResultHandle MountManager::openQuery(const DirPath & base, std::string_view query, const Variables & vars)
{
    return results.openQuery(*evaluator(), base, query, vars);
}

Records MountManager::more(ResultHandle handle, size_t n)
{
    return results.more(handle, n ? n : mountSettings.defaultPageSize.get());
}

void MountManager::close(ResultHandle handle)
{
    results.close(handle);
}

std::unique_ptr<MountManager> openMountManager(ref<const QueryCompiler> compiler)
{
    auto manager = std::make_unique<MountManager>(
        BackendRegistry::global(), std::move(compiler), openMountConfigStore(), mountSettings.persistMounts);
    manager->mountAll();
    return manager;
}

} // namespace fedfs
