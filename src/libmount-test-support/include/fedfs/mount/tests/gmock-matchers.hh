#pragma once
///@file

#include "fedfs/util/strings.hh"

#include <gmock/gmock.h>

namespace fedfs::testing {

/**
 * Matches strings containing `substring` once ANSI escapes (which
 * error messages are full of) are stripped. Combine with
 * `::testing::ThrowsMessage` to check what an exception says.
 */
MATCHER_P(
    HasSubstrIgnoreANSI,
    substring,
    std::string(negation ? "has no substring " : "has substring ") + ::testing::PrintToString(substring))
{
    return filterANSIEscapes(std::string_view(arg), /*filterAll=*/true).find(substring) != std::string::npos;
}

} // namespace fedfs::testing
