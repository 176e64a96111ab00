#include "fedfs/util/configuration.hh"
#include "fedfs/util/logging.hh"
#include "fedfs/util/strings.hh"

namespace fedfs {

void AbstractConfig::applyConfig(std::string_view contents, std::string_view origin)
{
    size_t lineNo = 0;

    while (!contents.empty()) {
        auto eol = contents.find('\n');
        auto line = contents.substr(0, eol);
        contents = eol == contents.npos ? std::string_view() : contents.substr(eol + 1);
        lineNo++;

        if (auto hash = line.find('#'); hash != line.npos)
            line = line.substr(0, hash);

        if (trim(line).empty())
            continue;

        auto eq = line.find('=');
        auto name = trim(line.substr(0, eq));
        if (eq == line.npos || name.empty())
            throw UsageError("syntax error on line %d of '%s': expected 'name = value'", lineNo, origin);

        auto value = trim(line.substr(eq + 1));
        if (!set(name, value))
            unknownSettings.insert_or_assign(std::move(name), std::move(value));
    }
}

void AbstractConfig::warnUnknownSettings() const
{
    for (auto & [name, _] : unknownSettings)
        warn("unknown setting '%s'", name);
}

bool Config::set(const std::string & name, const std::string & value)
{
    auto setting = get(settings, name);
    if (!setting)
        return false;
    (*setting)->set(value);
    return true;
}

void Config::addSetting(AbstractSetting * setting)
{
    if (!settings.emplace(setting->name, setting).second)
        panic(fmt("setting '%s' is defined twice", setting->name));

    if (auto i = unknownSettings.find(setting->name); i != unknownSettings.end()) {
        setting->set(i->second);
        unknownSettings.erase(i);
    }
}

AbstractSetting::AbstractSetting(const std::string & name, std::string_view description)
    : name(name)
    , description(stripIndentation(description))
{
}

template<>
std::string Setting<std::string>::parse(const std::string & str) const
{
    return str;
}

template<>
unsigned int Setting<unsigned int>::parse(const std::string & str) const
{
    if (auto n = string2Int<unsigned int>(str))
        return *n;
    throw UsageError("setting '%s' has invalid value '%s', expected a non-negative integer", name, str);
}

template<>
bool Setting<bool>::parse(const std::string & str) const
{
    if (str == "true" || str == "yes" || str == "1")
        return true;
    if (str == "false" || str == "no" || str == "0")
        return false;
    throw UsageError("Boolean setting '%s' has invalid value '%s'", name, str);
}

template class Setting<std::string>;
template class Setting<unsigned int>;
template class Setting<bool>;

} // namespace fedfs
