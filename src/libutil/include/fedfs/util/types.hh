#pragma once
///@file

#include <list>
#include <set>
#include <string>
#include <map>
#include <variant>
#include <vector>

namespace fedfs {

typedef std::list<std::string> Strings;

/**
 * Ordered string map with a transparent comparator, so that lookups
 * by `std::string_view` do not allocate.
 */
using StringMap = std::map<std::string, std::string, std::less<>>;

/**
 * Ordered string set with a transparent comparator.
 */
using StringSet = std::set<std::string, std::less<>>;

/**
 * Get a value for the specified key from an associate container.
 */
template<class T, typename K>
const typename T::mapped_type * get(const T & map, const K & key)
{
    auto i = map.find(key);
    if (i == map.end())
        return nullptr;
    return &i->second;
}

/**
 * Helper for `std::visit` over a set of lambdas.
 */
template<class... Ts>
struct overloaded : Ts...
{
    using Ts::operator()...;
};

template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // namespace fedfs
