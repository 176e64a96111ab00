#include "fedfs/util/json-utils.hh"

namespace fedfs {

const nlohmann::json & valueAt(const nlohmann::json::object_t & map, std::string_view key)
{
    if (auto * p = optionalValueAt(map, key))
        return *p;
    throw Error("JSON object has no member '%s': %s", key, nlohmann::json(map).dump());
}

const nlohmann::json * optionalValueAt(const nlohmann::json::object_t & map, std::string_view key)
{
    auto i = map.find(std::string(key));
    return i == map.end() ? nullptr : &i->second;
}

static const nlohmann::json & expectType(const nlohmann::json & value, nlohmann::json::value_t type)
{
    if (value.type() != type)
        throw Error(
            "expected a JSON %s but got a %s: %s", nlohmann::json(type).type_name(), value.type_name(), value.dump());
    return value;
}

const nlohmann::json::object_t & getObject(const nlohmann::json & value)
{
    return expectType(value, nlohmann::json::value_t::object).get_ref<const nlohmann::json::object_t &>();
}

const nlohmann::json::string_t & getString(const nlohmann::json & value)
{
    return expectType(value, nlohmann::json::value_t::string).get_ref<const nlohmann::json::string_t &>();
}

StringMap getStringMap(const nlohmann::json & value)
{
    StringMap res;
    for (auto & [key, item] : getObject(value)) {
        try {
            res.emplace(key, getString(item));
        } catch (Error & e) {
            e.addTrace("while reading the member '%s'", key);
            throw;
        }
    }
    return res;
}

} // namespace fedfs
