#pragma once
///@file

#include <rapidcheck/gen/Arbitrary.h>

#include "fedfs/mount/path.hh"

namespace rc {
using namespace fedfs;

/**
 * Paths over a three-letter alphabet of components and at most four
 * levels deep, so that generated paths often share prefixes.
 */
template<>
struct Arbitrary<DirPath>
{
    static Gen<DirPath> arbitrary();
};

template<>
struct Arbitrary<FilePath>
{
    static Gen<FilePath> arbitrary();
};

} // namespace rc
