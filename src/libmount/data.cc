#include "fedfs/mount/data.hh"

namespace fedfs {

Variables overlayVariables(const Variables & base, const Variables & overlay)
{
    auto res = base;
    for (auto & [name, value] : overlay)
        res.insert_or_assign(name, value);
    return res;
}

} // namespace fedfs
