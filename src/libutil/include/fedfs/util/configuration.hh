#pragma once
///@file

#include <string>
#include <string_view>

#include "fedfs/util/types.hh"

namespace fedfs {

/**
 * Named, typed settings that can be changed at runtime.
 *
 * A setting registers itself with a `Config` when it is constructed:
 *
 *   Config config;
 *   Setting<unsigned int> pageSize{&config, 100, "page-size", "results per page"};
 *
 * Afterwards it can be set by name (`config.set("page-size", "10")`),
 * from the contents of a configuration file (`config.applyConfig(...)`)
 * or directly (`pageSize = 10`).
 */

class AbstractSetting;

class AbstractConfig
{
protected:

    /**
     * Values assigned to names that no setting claimed, by name.
     */
    StringMap unknownSettings;

public:

    virtual ~AbstractConfig() = default;

    /**
     * Parse `value` and assign it to the setting called `name`.
     *
     * @return false if there is no such setting.
     * @throws UsageError if `value` is not valid for the setting.
     */
    virtual bool set(const std::string & name, const std::string & value) = 0;

    /**
     * Apply a configuration file. Every non-empty line has the form
     * `name = value`, where the value runs to the end of the line and
     * `#` starts a comment. Values for unknown names are remembered
     * rather than rejected.
     *
     * @param origin Where `contents` came from, for error messages.
     */
    void applyConfig(std::string_view contents, std::string_view origin = "<unknown>");

    /**
     * Log a warning for every remembered value that no setting has
     * claimed.
     */
    void warnUnknownSettings() const;
};

class Config : public AbstractConfig
{
    std::map<std::string, AbstractSetting *, std::less<>> settings;

public:

    bool set(const std::string & name, const std::string & value) override;

    /**
     * Called by the `Setting` constructor. A value that was assigned to
     * the setting's name before it existed is applied now.
     */
    void addSetting(AbstractSetting * setting);
};

class AbstractSetting
{
    friend class Config;

public:

    const std::string name;
    const std::string description;

    /**
     * Whether the value was set explicitly rather than being the
     * default.
     */
    bool overridden = false;

protected:

    AbstractSetting(const std::string & name, std::string_view description);

    virtual ~AbstractSetting() = default;

    virtual void set(const std::string & str) = 0;
};

/**
 * A setting of type `T`. `std::string`, `unsigned int` and `bool` are
 * supported.
 */
template<typename T>
class Setting : public AbstractSetting
{
    T value;

public:

    const T defaultValue;

    Setting(Config * config, const T & def, const std::string & name, std::string_view description)
        : AbstractSetting(name, description)
        , value(def)
        , defaultValue(def)
    {
        config->addSetting(this);
    }

    operator const T &() const
    {
        return value;
    }

    const T & get() const
    {
        return value;
    }

    void operator=(const T & v)
    {
        value = v;
        overridden = true;
    }

    /**
     * @throws UsageError if `str` is not a valid `T`.
     */
    T parse(const std::string & str) const;

protected:

    void set(const std::string & str) override
    {
        *this = parse(str);
    }
};

template<>
std::string Setting<std::string>::parse(const std::string & str) const;
template<>
unsigned int Setting<unsigned int>::parse(const std::string & str) const;
template<>
bool Setting<bool>::parse(const std::string & str) const;

extern template class Setting<std::string>;
extern template class Setting<unsigned int>;
extern template class Setting<bool>;

} // namespace fedfs
