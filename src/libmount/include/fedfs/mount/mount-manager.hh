#pragma once
/**
 * @file
 *
 * @brief Owner of the live mount table.
 */

#include "fedfs/mount/backend-registry.hh"
#include "fedfs/mount/evaluator.hh"
#include "fedfs/mount/mount-config-store.hh"
#include "fedfs/mount/result-handles.hh"

#include <mutex>

namespace fedfs {

/**
 * A mount table together with the evaluator derived from it.
 */
struct MountSnapshot
{
    MountTable table;

    /**
     * Incremented on every successful mount and unmount.
     */
    uint64_t version;

    ref<const Evaluator> evaluator;
};

struct UnmountResult
{
    /**
     * Problems releasing the backend. They do not prevent the mount
     * from being removed.
     */
    std::vector<std::string> warnings;
};

/**
 * Owns the mount table and publishes it, with its evaluator, as one
 * immutable snapshot. Readers load the current snapshot without
 * locking. Mutations are serialised and replace the snapshot
 * wholesale.
 *
 * A mount or unmount either takes full effect (table, store and
 * snapshot) or none at all.
 */
class MountManager
{
    const BackendRegistry & registry;
    ref<const QueryCompiler> compiler;
    ref<MountConfigStore> store;
    bool writeThrough;

    std::atomic<std::shared_ptr<const MountSnapshot>> current;

    /**
     * Held across a whole mount or unmount, including opening or
     * releasing the backend.
     */
    std::mutex mutationLock;

    MonotonicSeq handleSeq;
    ResultHandleTable results;

    void publish(MountTable table, uint64_t version);

    void doMount(const AnyPath & path, const MountConfig & config, bool save);

public:

    /**
     * @param registry Must outlive the manager.
     * @param writeThrough Whether to record mount and unmount in
     * `store`.
     */
    MountManager(
        const BackendRegistry & registry,
        ref<const QueryCompiler> compiler,
        ref<MountConfigStore> store,
        bool writeThrough = true);

    /**
     * Releases every backend still mounted.
     */
    ~MountManager();

    ref<const MountSnapshot> snapshot() const;

    /**
     * The evaluator for the current mount table. It stays usable, on
     * the table it was built for, after later mutations.
     */
    ref<const Evaluator> evaluator() const
    {
        return snapshot()->evaluator;
    }

    /**
     * Mount `config` at `path`. Backends mount on directories, views
     * on files.
     *
     * @throws MountExists if something is mounted at `path` already.
     * @throws PathTypeMismatch if `path` is the wrong kind for `config`.
     * @throws UnknownBackendKind if no backend of the requested kind is
     * registered.
     * @throws BackendConnectError if the backend cannot be opened.
     * @throws QueryError if a view's query does not compile.
     */
    void mount(const AnyPath & path, const MountConfig & config);

    /**
     * @throws MountNotFound if nothing is mounted at `path`.
     */
    UnmountResult unmount(const AnyPath & path);

    /**
     * Mount everything in the mount configuration store, without
     * writing back to it. Stops at the first mount that fails.
     */
    void mountAll();

    std::optional<MountConfig> lookupMountConfig(const AnyPath & path) const;

    /**
     * `"view"` or the backend kind of the mount at exactly `path`.
     */
    std::optional<std::string> mountType(const AnyPath & path) const;

    /**
     * All mounts, in path order.
     */
    MountConfigs mounts() const;

    ResultHandle openQuery(const DirPath & base, std::string_view query, const Variables & vars = {});

    /**
     * Up to `n` further results, or `default-page-size` if `n` is 0.
     */
    Records more(ResultHandle handle, size_t n = 0);

    void close(ResultHandle handle);
};

/**
 * A mount manager over the global backend registry and the mount
 * configuration store selected by `mount-config-file`, with
 * everything in that store mounted. Mutations are written back to the
 * store if `persist-mounts` is set.
 */
std::unique_ptr<MountManager> openMountManager(ref<const QueryCompiler> compiler);

} // namespace fedfs
