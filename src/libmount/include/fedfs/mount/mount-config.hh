#pragma once
/**
 * @file
 *
 * What can be mounted at a path.
 */

#include "fedfs/mount/data.hh"
#include "fedfs/mount/path.hh"
#include "fedfs/util/types.hh"

#include <variant>

namespace fedfs {

/**
 * A saved query that appears as a read-only file. Reading it runs
 * `query` with the caller's variables overlaid on `defaultVars`.
 */
struct ViewConfig
{
    std::string query;
    Variables defaultVars;

    bool operator==(const ViewConfig &) const = default;
};

/**
 * A connection to a physical backend of kind `kind` (see
 * `BackendRegistry`), opened with `params`.
 */
struct BackendConfig
{
    std::string kind;
    StringMap params;

    bool operator==(const BackendConfig &) const = default;
};

typedef std::variant<ViewConfig, BackendConfig> MountConfig;

/**
 * `"view"` for views, the backend kind otherwise.
 */
std::string mountType(const MountConfig & config);

/**
 * Views are files, backends are directories. Throws
 * `PathTypeMismatch` if `path` is the wrong kind for `config`.
 */
void checkMountPathKind(const AnyPath & path, const MountConfig & config);

/**
 * JSON form, used by the durable mount configuration store:
 *
 *     { "view": { "query": "...", "vars": { ... } } }
 *     { "backend": { "kind": "...", "params": { ... } } }
 */
nlohmann::json mountConfigToJSON(const MountConfig & config);

MountConfig mountConfigFromJSON(const nlohmann::json & json);

std::ostream & operator<<(std::ostream & str, const MountConfig & config);

} // namespace fedfs
