#pragma once
///@file

#include "fedfs/util/configuration.hh"

namespace fedfs {

struct MountSettings : public Config
{
    Setting<std::string> mountConfigFile{
        this,
        "",
        "mount-config-file",
        R"(
          Path of the JSON file in which mounts are recorded so that
          they survive a restart. If empty, mounts are only kept in
          memory.
        )"};

    Setting<unsigned int> defaultPageSize{
        this,
        100,
        "default-page-size",
        R"(
          The number of query results returned by a request for more
          results that does not specify how many it wants.
        )"};

    Setting<bool> randomHandleSeed{
        this,
        false,
        "random-handle-seed",
        R"(
          Whether result handle numbers start at a random value rather
          than at 0.
        )"};

    Setting<bool> persistMounts{
        this,
        true,
        "persist-mounts",
        R"(
          Whether mounting and unmounting update the mount
          configuration store.
        )"};
};

extern MountSettings mountSettings;

/**
 * Apply the settings in the file named by `$FEDFS_CONF` and the
 * inline settings in `$FEDFS_CONFIG`, in that order.
 */
void initLibMount();

} // namespace fedfs
