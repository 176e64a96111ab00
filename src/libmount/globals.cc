#include "fedfs/mount/globals.hh"
#include "fedfs/util/config-global.hh"
#include "fedfs/util/environment-variables.hh"
#include "fedfs/util/file-system.hh"

namespace fedfs {

MountSettings mountSettings;

static GlobalConfig::Register rMountSettings(&mountSettings);

void initLibMount()
{
    if (auto file = getEnvNonEmpty("FEDFS_CONF")) {
        try {
            globalConfig.applyConfig(readFile(*file), *file);
        } catch (Error & e) {
            e.addTrace("while loading the settings file named by $FEDFS_CONF");
            throw;
        }
    }

    if (auto contents = getEnvNonEmpty("FEDFS_CONFIG"))
        globalConfig.applyConfig(*contents, "FEDFS_CONFIG");

    globalConfig.warnUnknownSettings();
}

} // namespace fedfs
