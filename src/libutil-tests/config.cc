#include "fedfs/util/config-global.hh"
#include "fedfs/util/configuration.hh"
#include "fedfs/util/error.hh"

#include <gtest/gtest.h>

namespace fedfs {

/* ----------------------------------------------------------------------------
 * Config
 * --------------------------------------------------------------------------*/

TEST(Config, setUndefinedSetting)
{
    Config config;
    ASSERT_FALSE(config.set("undefined-key", "value"));
}

TEST(Config, setDefinedSetting)
{
    Config config;
    Setting<std::string> file{&config, "", "mount-config-file", "description"};
    ASSERT_FALSE(file.overridden);

    ASSERT_TRUE(config.set("mount-config-file", "/etc/fedfs/mounts.json"));
    ASSERT_EQ(file.get(), "/etc/fedfs/mounts.json");
    ASSERT_EQ(file.defaultValue, "");
    ASSERT_TRUE(file.overridden);
}

TEST(Config, assignDirectly)
{
    Config config;
    Setting<unsigned int> pageSize{&config, 100, "page-size", "description"};

    pageSize = 5;
    ASSERT_EQ(pageSize.get(), 5u);
    ASSERT_TRUE(pageSize.overridden);
}

TEST(Config, descriptionIsUnindented)
{
    Config config;
    Setting<bool> setting{&config, false, "flag", R"(
        First line.
          Indented.
    )"};
    ASSERT_EQ(setting.description, "\nFirst line.\n  Indented.\n\n");
}

TEST(Config, unsignedSetting)
{
    Config config;
    Setting<unsigned int> pageSize{&config, 100, "page-size", "results per page"};

    ASSERT_TRUE(config.set("page-size", "10"));
    ASSERT_EQ(pageSize.get(), 10u);

    ASSERT_THROW(config.set("page-size", "ten"), UsageError);
    ASSERT_THROW(config.set("page-size", "-1"), UsageError);
    ASSERT_THROW(config.set("page-size", ""), UsageError);
    ASSERT_EQ(pageSize.get(), 10u);
}

TEST(Config, boolSetting)
{
    Config config;
    Setting<bool> persist{&config, true, "persist", "whether to persist"};

    for (auto s : {"false", "no", "0"}) {
        persist = true;
        ASSERT_TRUE(config.set("persist", s));
        ASSERT_FALSE(persist.get());
    }

    for (auto s : {"true", "yes", "1"}) {
        persist = false;
        ASSERT_TRUE(config.set("persist", s));
        ASSERT_TRUE(persist.get());
    }

    ASSERT_THROW(config.set("persist", "maybe"), UsageError);
}

TEST(Config, applyConfig)
{
    Config config;
    Setting<std::string> name{&config, "", "name", "description"};
    Setting<unsigned int> size{&config, 0, "size", "description"};

    config.applyConfig(
        "# comment\n"
        "name = some  value  # trailing comment\n"
        "\n"
        "   \n"
        "size=7");

    ASSERT_EQ(name.get(), "some  value");
    ASSERT_EQ(size.get(), 7u);
}

TEST(Config, applyConfigEmptyValue)
{
    Config config;
    Setting<std::string> name{&config, "default", "name", "description"};

    config.applyConfig("name =\n");
    ASSERT_EQ(name.get(), "");
}

TEST(Config, applyConfigSyntaxError)
{
    Config config;
    ASSERT_THROW(config.applyConfig("name value\n"), UsageError);
    ASSERT_THROW(config.applyConfig(" = value\n"), UsageError);
}

TEST(Config, applyConfigInvalidValue)
{
    Config config;
    Setting<unsigned int> size{&config, 0, "size", "description"};
    ASSERT_THROW(config.applyConfig("size = big\n", "fedfs.conf"), UsageError);
}

TEST(Config, unknownSettingsApplyOnRegistration)
{
    Config config;
    config.applyConfig("late = 1\n");

    /* A setting registered afterwards picks up the earlier value. */
    Setting<std::string> late{&config, "", "late", "description"};
    ASSERT_EQ(late.get(), "1");
    ASSERT_TRUE(late.overridden);
}

TEST(GlobalConfig, forwardsToRegisteredConfigs)
{
    static Config extra;
    static Setting<std::string> setting{&extra, "", "global-config-test-setting", "description"};
    static GlobalConfig::Register r(&extra);

    ASSERT_TRUE(globalConfig.set("global-config-test-setting", "value"));
    ASSERT_EQ(setting.get(), "value");
    ASSERT_FALSE(globalConfig.set("no-such-setting-anywhere", "value"));
}

} // namespace fedfs
