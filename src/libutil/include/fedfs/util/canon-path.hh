#pragma once
///@file

#include "fedfs/util/error.hh"

#include <cassert>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fedfs {

MakeError(BadCanonPath, Error);

/**
 * A canonical representation of a path in the federated namespace. It
 * ensures the following:
 *
 * - It always starts with a slash.
 *
 * - It never ends with a slash, except if the path is "/".
 *
 * - A slash is never followed by a slash (i.e. no empty components).
 *
 * - There are no components equal to '.' or '..'.
 *
 * - It does not contain NUL bytes.
 *
 * A `CanonPath` does not record whether it names a file or a
 * directory; see `DirPath` and `FilePath` in `fedfs/mount/path.hh`
 * for that.
 */
class CanonPath
{
    std::string path;

public:

    /**
     * Construct a canon path from a non-canonical path. Any '.', '..'
     * or empty components are removed.
     */
    CanonPath(std::string_view raw);

    explicit CanonPath(const char * raw)
        : CanonPath(std::string_view(raw))
    {
    }

    struct unchecked_t
    {};

    CanonPath(unchecked_t _, std::string path)
        : path(std::move(path))
    {
    }

    /**
     * Construct a canon path from a vector of elements.
     */
    CanonPath(const std::vector<std::string> & elems);

    static const CanonPath root;

    /**
     * If `raw` starts with a slash, return
     * `CanonPath(raw)`. Otherwise return a `CanonPath` representing
     * `root + "/" + raw`.
     */
    CanonPath(std::string_view raw, const CanonPath & root);

    bool isRoot() const
    {
        return path.size() <= 1;
    }

    const std::string & abs() const
    {
        return path;
    }

    std::string_view rel() const
    {
        return ((std::string_view) path).substr(1);
    }

    struct Iterator
    {
        std::string_view remaining;
        size_t slash;

        Iterator(std::string_view remaining)
            : remaining(remaining)
            , slash(remaining.find('/'))
        {
        }

        bool operator!=(const Iterator & x) const
        {
            return remaining.data() != x.remaining.data();
        }

        bool operator==(const Iterator & x) const
        {
            return !(*this != x);
        }

        const std::string_view operator*() const
        {
            return remaining.substr(0, slash);
        }

        void operator++()
        {
            if (slash == remaining.npos)
                remaining = remaining.substr(remaining.size());
            else {
                remaining = remaining.substr(slash + 1);
                slash = remaining.find('/');
            }
        }
    };

    Iterator begin() const
    {
        return Iterator(rel());
    }

    Iterator end() const
    {
        return Iterator(rel().substr(path.size() - 1));
    }

    std::optional<CanonPath> parent() const;

    /**
     * Remove the last component. Panics if this path is the root.
     */
    void pop();

    std::optional<std::string_view> baseName() const
    {
        if (isRoot())
            return std::nullopt;
        return ((std::string_view) path).substr(path.rfind('/') + 1);
    }

    bool operator==(const CanonPath & x) const
    {
        return path == x.path;
    }

    /**
     * Compare paths lexicographically except that path separators
     * are sorted before any other character. That is, in the sorted order
     * a directory is always followed directly by its children. For
     * instance, 'foo' < 'foo/bar' < 'foo!'.
     */
    std::strong_ordering operator<=>(const CanonPath & x) const
    {
        auto i = path.begin();
        auto j = x.path.begin();
        for (; i != path.end() && j != x.path.end(); ++i, ++j) {
            auto c_i = *i;
            if (c_i == '/')
                c_i = 0;
            auto c_j = *j;
            if (c_j == '/')
                c_j = 0;
            if (auto cmp = c_i <=> c_j; cmp != 0)
                return cmp;
        }
        return (i != path.end()) <=> (j != x.path.end());
    }

    /**
     * Return true if `this` is equal to `parent` or a child of
     * `parent`.
     */
    bool isWithin(const CanonPath & parent) const;

    /**
     * Return true if `this` is a child (at any depth) of `parent`,
     * but not `parent` itself.
     */
    bool isStrictlyWithin(const CanonPath & parent) const
    {
        return path != parent.path && isWithin(parent);
    }

    /**
     * Strip `prefix` from this path. `this` must be within `prefix`.
     */
    CanonPath removePrefix(const CanonPath & prefix) const;

    /**
     * Append another path to this one.
     */
    void extend(const CanonPath & x);

    /**
     * Concatenate two paths.
     */
    CanonPath operator/(const CanonPath & x) const;

    /**
     * Add a path component to this one. It must not contain any slashes.
     */
    void push(std::string_view c);

    CanonPath operator/(std::string_view c) const;

    /**
     * The number of components.
     */
    size_t depth() const;
};

std::ostream & operator<<(std::ostream & stream, const CanonPath & path);

} // namespace fedfs
