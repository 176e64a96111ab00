#pragma once
/**
 * @file
 *
 * Checked access to JSON documents. Every accessor fails with an
 * `Error` that shows the offending value, instead of the
 * `nlohmann::json::exception` unchecked access would throw.
 */

#include <nlohmann/json.hpp>

#include "fedfs/util/error.hh"
#include "fedfs/util/types.hh"

namespace fedfs {

/**
 * @throws Error if `map` has no member `key`.
 */
const nlohmann::json & valueAt(const nlohmann::json::object_t & map, std::string_view key);

/**
 * The member `key` of `map`, or nullptr.
 */
const nlohmann::json * optionalValueAt(const nlohmann::json::object_t & map, std::string_view key);

const nlohmann::json::object_t & getObject(const nlohmann::json & value);

const nlohmann::json::string_t & getString(const nlohmann::json & value);

/**
 * An object whose members are all strings, such as the parameters of
 * a backend.
 */
StringMap getStringMap(const nlohmann::json & value);

} // namespace fedfs
