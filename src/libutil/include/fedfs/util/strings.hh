#pragma once

#include "fedfs/util/types.hh"

#include <list>
#include <optional>
#include <string_view>
#include <string>
#include <vector>

namespace fedfs {

/**
 * Concatenate the given strings with a separator between the elements.
 */
template<class C>
std::string concatStringsSep(const std::string_view sep, const C & ss);

extern template std::string concatStringsSep(std::string_view, const std::list<std::string> &);
extern template std::string concatStringsSep(std::string_view, const std::vector<std::string> &);

/**
 * Concatenate the given strings without a separator.
 */
template<typename... Parts>
std::string concatStrings(Parts &&... parts)
{
    std::string res;
    (res.append(std::string_view(parts)), ...);
    return res;
}

/**
 * Replace all occurrences of a string inside another string.
 */
std::string replaceStrings(std::string s, std::string_view from, std::string_view to);

/**
 * Remove whitespace from the start and end of a string.
 */
std::string trim(std::string_view s, std::string_view whitespace = " \n\r\t");

/**
 * Remove common leading whitespace from the lines in the string
 * 's'. For example, if every line is indented by at least 3 spaces,
 * then we remove 3 spaces from the start of every line.
 */
std::string stripIndentation(std::string_view s);

/**
 * Remove ANSI escape sequences. If `filterAll` is false, colour
 * sequences are kept.
 */
std::string filterANSIEscapes(std::string_view s, bool filterAll = false);

/**
 * Parse a string into an integer.
 */
template<class N>
std::optional<N> string2Int(const std::string_view s);

/**
 * @return true iff `s` starts with `prefix`.
 */
bool hasPrefix(std::string_view s, std::string_view prefix);

/**
 * @return true iff `s` ends in `suffix`.
 */
bool hasSuffix(std::string_view s, std::string_view suffix);

} // namespace fedfs
