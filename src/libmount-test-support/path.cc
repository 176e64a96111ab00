#include <exception> // Needed by rapidcheck on Darwin
#include <rapidcheck.h>

#include "fedfs/mount/tests/path.hh"

namespace rc {
using namespace fedfs;

static Gen<std::vector<std::string>> components(size_t minDepth)
{
    return gen::mapcat(gen::inRange<size_t>(minDepth, 5), [](size_t depth) {
        return gen::container<std::vector<std::string>>(depth, gen::element<std::string>("a", "b", "c"));
    });
}

Gen<DirPath> Arbitrary<DirPath>::arbitrary()
{
    return gen::map(components(0), [](std::vector<std::string> elems) { return DirPath(CanonPath(elems)); });
}

Gen<FilePath> Arbitrary<FilePath>::arbitrary()
{
    return gen::map(components(1), [](std::vector<std::string> elems) { return FilePath(CanonPath(elems)); });
}

} // namespace rc
