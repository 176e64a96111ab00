#pragma once
///@file

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <vector>

namespace fedfs {

/**
 * A single record as stored by backends and produced by queries.
 * Records are opaque to the mount layer; it only moves them around.
 */
typedef nlohmann::json Data;

typedef std::vector<Data> Records;

/**
 * Query variable bindings, by variable name.
 */
typedef std::map<std::string, Data, std::less<>> Variables;

/**
 * Bindings in `overlay` take precedence over those in `base`.
 */
Variables overlayVariables(const Variables & base, const Variables & overlay);

} // namespace fedfs
