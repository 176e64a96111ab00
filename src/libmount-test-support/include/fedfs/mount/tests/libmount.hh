#pragma once
///@file

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "fedfs/mount/mount-manager.hh"
#include "fedfs/mount/tests/counting-backend.hh"
#include "fedfs/mount/tests/mini-sql.hh"

namespace fedfs {

/**
 * A mount manager over a private backend registry offering the
 * `memory` kind and a `counting` kind that reports to `counters`.
 * Queries are compiled by a `MiniSqlCompiler` that knows the table
 * `zips` as `/data/zips.json`.
 */
class LibMountTest : public virtual ::testing::Test
{
protected:

    std::shared_ptr<BackendCounters> counters = std::make_shared<BackendCounters>();
    BackendRegistry registry;
    ref<MiniSqlCompiler> compiler;
    ref<MountConfigStore> store;
    std::unique_ptr<MountManager> manager;

    LibMountTest();

    static BackendConfig counting()
    {
        return BackendConfig{.kind = "counting"};
    }

    static DirPath dir(std::string_view s)
    {
        return DirPath::parse(s);
    }

    static FilePath file(std::string_view s)
    {
        return FilePath::parse(s);
    }

    /**
     * A few US zip codes with `city`, `state` and `pop` fields.
     */
    static Records zips();

    /**
     * Mount a counting backend at `/data/` holding `zips.json`.
     */
    void mountZips();

    Records readAll(const FilePath & path, const Variables & vars = {});
};

/**
 * The names in a listing.
 */
std::vector<std::string> names(const DirEntries & entries);

/**
 * The listing as a shell would show it.
 */
std::vector<std::string> showListing(const DirEntries & entries);

} // namespace fedfs
