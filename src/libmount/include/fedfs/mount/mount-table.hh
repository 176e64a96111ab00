#pragma once
/**
 * @file
 *
 * @brief The table of mount points.
 *
 * A `MountTable` is an immutable value: inserting or removing an entry
 * yields a new table that shares the unchanged entries with the old
 * one. This is what lets readers keep using an old table while a
 * mutation builds the next one.
 */

#include "fedfs/mount/backend-registry.hh"
#include "fedfs/mount/errors.hh"
#include "fedfs/mount/mount-config.hh"

#include <atomic>
#include <type_traits>

namespace fedfs {

/**
 * An open backend connection owned by a mount entry.
 *
 * Operations in flight when the mount is removed keep the `Backend`
 * object alive, but once `release()` has started they fail with
 * `BackendUnavailable` instead of returning whatever the shut down
 * connection produced.
 */
class LiveHandle
{
    DirPath mountPoint;
    ref<Backend> backend;
    std::function<void()> releaseFn;
    std::atomic<bool> released{false};

    [[noreturn]] void unavailable() const;

public:

    LiveHandle(DirPath mountPoint, OpenedBackend opened);

    /**
     * Run `f` against the backend.
     *
     * @throws BackendUnavailable if the handle has been released
     * before or during the call.
     */
    template<typename F>
    auto use(F && f) -> std::invoke_result_t<F, Backend &>
    {
        if (released)
            unavailable();
        try {
            if constexpr (std::is_void_v<std::invoke_result_t<F, Backend &>>) {
                f(*backend);
                if (released)
                    unavailable();
            } else {
                auto res = f(*backend);
                if (released)
                    unavailable();
                return res;
            }
        } catch (BackendUnavailable &) {
            throw;
        } catch (Error &) {
            if (released)
                unavailable();
            throw;
        }
    }

    bool isReleased() const
    {
        return released;
    }

    /**
     * Run the release action. Only the first call does anything.
     *
     * @return the failure message if the release action threw.
     */
    std::optional<std::string> release();
};

struct MountEntry
{
    /**
     * A `DirPath` for backends, a `FilePath` for views.
     */
    AnyPath path;

    MountConfig config;

    /**
     * Only set for backends.
     */
    std::shared_ptr<LiveHandle> live;

    bool isView() const
    {
        return std::holds_alternative<ViewConfig>(config);
    }

    const CanonPath & key() const
    {
        return canonOf(path);
    }

    /**
     * The mount point of a backend entry.
     */
    const DirPath & dirPath() const;
};

class MountTable
{
public:

    typedef std::map<CanonPath, ref<const MountEntry>> Entries;

private:

    Entries entries;

public:

    MountTable() {}

    /**
     * The entry mounted at exactly `path`, if any.
     */
    std::shared_ptr<const MountEntry> lookup(const CanonPath & path) const;

    /**
     * The most specific mount covering `path`: a view mounted at
     * exactly `path` if `path` is a file, otherwise the backend with
     * the longest mount point that is `path` or one of its
     * ancestors.
     */
    std::shared_ptr<const MountEntry> deepestEnclosingMount(const AnyPath & path) const;

    /**
     * @throws MountExists if there already is an entry at the same
     * path.
     */
    MountTable insert(ref<const MountEntry> entry) const;

    /**
     * @throws MountNotFound if there is no entry at `path`.
     */
    MountTable remove(const CanonPath & path) const;

    /**
     * All entries strictly below `dir`, in path order.
     */
    std::vector<ref<const MountEntry>> mountsBelow(const DirPath & dir) const;

    const Entries & all() const
    {
        return entries;
    }

    size_t size() const
    {
        return entries.size();
    }

    bool empty() const
    {
        return entries.empty();
    }

    /**
     * Two tables are equal if they have the same entries, by
     * identity.
     */
    bool operator==(const MountTable & other) const = default;
};

} // namespace fedfs
