#include "fedfs/util/canon-path.hh"
#include "fedfs/util/strings.hh"

#include <algorithm>
#include <cstring>

namespace fedfs {

const CanonPath CanonPath::root = CanonPath("/");

/**
 * Resolve '.', '..' and empty components in an absolute path. '..'
 * at the root stays at the root.
 */
static std::string canonicalise(std::string_view path)
{
    std::string s;
    s.reserve(path.size() + 1);

    while (true) {
        /* Skip slashes. */
        while (!path.empty() && path[0] == '/')
            path.remove_prefix(1);

        if (path.empty())
            break;

        auto slash = path.find('/');
        auto component = path.substr(0, slash);

        if (component == ".")
            ;

        else if (component == "..") {
            if (!s.empty())
                s.resize(s.rfind('/'));
        }

        else {
            s += '/';
            s += component;
        }

        if (slash == path.npos)
            break;
        path.remove_prefix(slash);
    }

    return s.empty() ? "/" : std::move(s);
}

static void ensureNoNullBytes(std::string_view s)
{
    if (std::memchr(s.data(), '\0', s.size())) [[unlikely]] {
        using namespace std::string_view_literals;
        auto str = replaceStrings(std::string(s), "\0"sv, "␀"sv);
        throw BadCanonPath("path segment '%s' must not contain null (\\0) bytes", str);
    }
}

CanonPath::CanonPath(std::string_view raw)
    : path(canonicalise(raw))
{
    ensureNoNullBytes(raw);
}

CanonPath::CanonPath(std::string_view raw, const CanonPath & root)
    : path(canonicalise(raw.size() > 0 && raw[0] == '/' ? std::string(raw) : concatStrings(root.abs(), "/", raw)))
{
    ensureNoNullBytes(raw);
}

CanonPath::CanonPath(const std::vector<std::string> & elems)
    : path("/")
{
    for (auto & s : elems)
        push(s);
}

std::optional<CanonPath> CanonPath::parent() const
{
    if (isRoot())
        return std::nullopt;
    return CanonPath(unchecked_t(), path.substr(0, std::max((size_t) 1, path.rfind('/'))));
}

void CanonPath::pop()
{
    assert(!isRoot());
    path.resize(std::max((size_t) 1, path.rfind('/')));
}

bool CanonPath::isWithin(const CanonPath & parent) const
{
    return !(
        path.size() < parent.path.size() || path.substr(0, parent.path.size()) != parent.path
        || (parent.path.size() > 1 && path.size() > parent.path.size() && path[parent.path.size()] != '/'));
}

CanonPath CanonPath::removePrefix(const CanonPath & prefix) const
{
    assert(isWithin(prefix));
    if (prefix.isRoot())
        return *this;
    if (path.size() == prefix.path.size())
        return root;
    return CanonPath(unchecked_t(), path.substr(prefix.path.size()));
}

void CanonPath::extend(const CanonPath & x)
{
    if (x.isRoot())
        return;
    if (isRoot())
        path += x.rel();
    else
        path += x.abs();
}

CanonPath CanonPath::operator/(const CanonPath & x) const
{
    auto res = *this;
    res.extend(x);
    return res;
}

void CanonPath::push(std::string_view c)
{
    assert(c.find('/') == c.npos);
    assert(c != "." && c != "..");
    ensureNoNullBytes(c);
    if (!isRoot())
        path += '/';
    path += c;
}

CanonPath CanonPath::operator/(std::string_view c) const
{
    auto res = *this;
    res.push(c);
    return res;
}

size_t CanonPath::depth() const
{
    return isRoot() ? 0 : std::count(path.begin(), path.end(), '/');
}

std::ostream & operator<<(std::ostream & stream, const CanonPath & path)
{
    stream << path.abs();
    return stream;
}

} // namespace fedfs
