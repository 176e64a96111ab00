#pragma once
///@file

#include "fedfs/util/configuration.hh"

#include <vector>

namespace fedfs {

/**
 * The union of every `Config` that registered itself with
 * `GlobalConfig::Register`. Setting a name here sets it in the first
 * registered config that knows it.
 */
struct GlobalConfig : public AbstractConfig
{
    typedef std::vector<Config *> ConfigRegistrations;

    static ConfigRegistrations & configRegistrations()
    {
        static ConfigRegistrations configRegistrations;
        return configRegistrations;
    }

    bool set(const std::string & name, const std::string & value) override;

    struct Register
    {
        Register(Config * config);
    };
};

extern GlobalConfig globalConfig;

} // namespace fedfs
