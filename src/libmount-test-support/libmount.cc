#include "fedfs/mount/tests/libmount.hh"

namespace fedfs {

LibMountTest::LibMountTest()
    : compiler(make_ref<MiniSqlCompiler>(std::map<std::string, FilePath, std::less<>>{
          {"zips", FilePath::parse("/data/zips.json")},
      }))
    , store(makeEphemeralMountConfigStore())
{
    registry.add<MemoryBackend>();
    registry.add("counting", makeCountingBackendFactory(counters));
    manager = std::make_unique<MountManager>(registry, compiler, store);
}

Records LibMountTest::zips()
{
    return {
        {{"city", "NEW YORK"}, {"state", "NY"}, {"pop", 8336817}},
        {{"city", "BOULDER"}, {"state", "CO"}, {"pop", 108250}},
        {{"city", "AGAWAM"}, {"state", "MA"}, {"pop", 15338}},
        {{"city", "CHICAGO"}, {"state", "IL"}, {"pop", 2693976}},
        {{"city", "BARRE"}, {"state", "VT"}, {"pop", 8565}},
    };
}

void LibMountTest::mountZips()
{
    manager->mount(dir("/data/"), counting());
    auto res = manager->evaluator()->write(file("/data/zips.json"), zips());
    ASSERT_EQ(res.written, zips().size());
    ASSERT_TRUE(res.errors.empty());
}

Records LibMountTest::readAll(const FilePath & path, const Variables & vars)
{
    return drainCursor(*manager->evaluator()->read(path, 0, std::nullopt, vars));
}

std::vector<std::string> names(const DirEntries & entries)
{
    std::vector<std::string> res;
    for (auto & [name, _] : entries)
        res.push_back(name);
    return res;
}

std::vector<std::string> showListing(const DirEntries & entries)
{
    std::vector<std::string> res;
    for (auto & [name, entry] : entries)
        res.push_back(showDirEntry(name, entry));
    return res;
}

} // namespace fedfs
