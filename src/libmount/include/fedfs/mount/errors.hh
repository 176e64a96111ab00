#pragma once
/**
 * @file
 *
 * @brief The failures the mount layer reports.
 *
 * All of these are recoverable and are thrown to the caller of the
 * failing operation. Errors raised by a backend itself pass through
 * unchanged in type, with a trace naming the mount point they came
 * from.
 */

#include "fedfs/util/canon-path.hh"

namespace fedfs {

/**
 * A path that is not covered by any mount, or that the backend
 * serving it does not have. `path` is always in the global
 * namespace.
 */
class PathNotFound : public Error
{
public:
    CanonPath path;

    PathNotFound(const CanonPath & path)
        : Error("path '%s' does not exist", path.abs())
        , path(path)
    {
    }

    template<typename... Args>
    PathNotFound(const CanonPath & path, const std::string & fs, const Args &... args)
        : Error(fs, args...)
        , path(path)
    {
    }
};

/**
 * Precondition failures of `mount` and `unmount`.
 */
MakeError(MountError, Error);
MakeError(MountExists, MountError);
MakeError(MountNotFound, MountError);
MakeError(PathTypeMismatch, MountError);
MakeError(UnknownBackendKind, MountError);
MakeError(BackendConnectError, MountError);

/**
 * A mutating operation against a view.
 */
MakeError(ReadOnlyMount, Error);

/**
 * An operation that would have to span two mounts, such as moving a
 * file from one backend to another.
 */
MakeError(CrossMountOperation, Error);

/**
 * A view whose query (transitively) reads the view itself.
 */
MakeError(ViewCycle, Error);

MakeError(UnknownHandle, Error);

/**
 * A backend used after its mount was removed.
 */
MakeError(BackendUnavailable, Error);

/**
 * Compile-time or semantic failure of a query.
 */
MakeError(QueryError, Error);

} // namespace fedfs
