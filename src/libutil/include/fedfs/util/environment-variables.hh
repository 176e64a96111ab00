#pragma once
/**
 * @file
 *
 * Utilities for working with the environment.
 */

#include <optional>
#include <string>

namespace fedfs {

/**
 * @return an environment variable.
 */
std::optional<std::string> getEnv(const std::string & key);

/**
 * Like `getEnv`, but using `nullopt` to indicate the empty string.
 */
std::optional<std::string> getEnvNonEmpty(const std::string & key);

} // namespace fedfs
