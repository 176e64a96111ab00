#pragma once
/**
 * @file
 *
 * Helpers for reading and writing files on the host file system.
 */

#include "fedfs/util/error.hh"

#include <filesystem>
#include <string>

namespace fedfs {

/**
 * @return true iff the given path exists.
 */
bool pathExists(const std::filesystem::path & path);

/**
 * Read the contents of a file into a string.
 */
std::string readFile(const std::filesystem::path & path);

/**
 * Write a string to a file. The file is written to a temporary
 * sibling first and renamed into place, so readers see either the old
 * or the new contents.
 */
void writeFileAtomic(const std::filesystem::path & path, std::string_view s);

/**
 * Delete a file if it exists.
 */
void deletePathIfExists(const std::filesystem::path & path);

/**
 * Create a fresh directory under `tmpRoot` (the system temporary
 * directory by default).
 */
std::filesystem::path createTempDir(const std::filesystem::path & tmpRoot = "", const std::string & prefix = "fedfs");

/**
 * Delete a path recursively when this object goes out of scope.
 */
class AutoDelete
{
    std::filesystem::path _path;
    bool del;

public:
    AutoDelete();
    AutoDelete(const std::filesystem::path & p);
    AutoDelete(AutoDelete &&) = delete;
    ~AutoDelete();

    void cancel();

    const std::filesystem::path & path() const
    {
        return _path;
    }

    operator std::filesystem::path() const
    {
        return _path;
    }
};

} // namespace fedfs
