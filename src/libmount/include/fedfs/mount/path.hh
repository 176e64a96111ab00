#pragma once
/**
 * @file
 *
 * Paths in the federated namespace. Every path is absolute and is
 * statically either a directory (`DirPath`) or a file (`FilePath`).
 * In textual form a directory ends in a slash (`/data/`) and a file
 * does not (`/data/zips.json`).
 */

#include "fedfs/util/canon-path.hh"

#include <variant>

namespace fedfs {

MakeError(BadPath, Error);

class FilePath;

/**
 * An absolute directory path. The root directory is `/`.
 */
class DirPath
{
    CanonPath path;

public:

    explicit DirPath(CanonPath path)
        : path(std::move(path))
    {
    }

    static DirPath root()
    {
        return DirPath(CanonPath::root);
    }

    /**
     * Parse a directory path. It must be absolute and, unless it is
     * the root, end in a slash.
     */
    static DirPath parse(std::string_view s);

    const CanonPath & canon() const
    {
        return path;
    }

    bool isRoot() const
    {
        return path.isRoot();
    }

    /**
     * The last component, or nothing for the root.
     */
    std::optional<std::string_view> name() const
    {
        return path.baseName();
    }

    std::optional<DirPath> parent() const;

    DirPath dir(std::string_view name) const
    {
        return DirPath(path / name);
    }

    FilePath file(std::string_view name) const;

    /**
     * Whether `this` is `other` or a directory below it.
     */
    bool isWithin(const DirPath & other) const
    {
        return path.isWithin(other.path);
    }

    std::string to_string() const;

    bool operator==(const DirPath &) const = default;
    auto operator<=>(const DirPath &) const = default;
};

/**
 * An absolute file path. A file path always has a parent directory,
 * so it is never the root.
 */
class FilePath
{
    CanonPath path;

public:

    /**
     * @throws BadPath if `path` is the root.
     */
    explicit FilePath(CanonPath path);

    /**
     * Parse a file path. It must be absolute and must not end in a
     * slash.
     */
    static FilePath parse(std::string_view s);

    const CanonPath & canon() const
    {
        return path;
    }

    DirPath dir() const
    {
        return DirPath(*path.parent());
    }

    std::string_view name() const
    {
        return *path.baseName();
    }

    bool isWithin(const DirPath & d) const
    {
        return path.isStrictlyWithin(d.canon());
    }

    std::string to_string() const
    {
        return path.abs();
    }

    bool operator==(const FilePath &) const = default;
    auto operator<=>(const FilePath &) const = default;
};

/**
 * Either kind of path, for operations (like mounting) that accept
 * both.
 */
typedef std::variant<DirPath, FilePath> AnyPath;

/**
 * Parse a path, using the trailing slash to decide between a
 * directory and a file.
 */
AnyPath parseAnyPath(std::string_view s);

const CanonPath & canonOf(const AnyPath & path);

std::string showPath(const AnyPath & path);

/**
 * Strip the mount point `mount` from `p`, giving the path as the
 * backend mounted at `mount` sees it in its own namespace.
 *
 * @throws BadPath if `p` is not below `mount`.
 */
DirPath relativize(const DirPath & p, const DirPath & mount);
FilePath relativize(const FilePath & p, const DirPath & mount);

/**
 * Inverse of `relativize()`: turn a path in the namespace of the
 * backend mounted at `mount` into a global one.
 */
DirPath absolutize(const DirPath & p, const DirPath & mount);
FilePath absolutize(const FilePath & p, const DirPath & mount);
CanonPath absolutize(const CanonPath & p, const DirPath & mount);

std::ostream & operator<<(std::ostream & str, const DirPath & path);
std::ostream & operator<<(std::ostream & str, const FilePath & path);

} // namespace fedfs
