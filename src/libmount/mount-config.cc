#include "fedfs/mount/mount-config.hh"
#include "fedfs/mount/errors.hh"
#include "fedfs/util/json-utils.hh"

namespace fedfs {

std::string mountType(const MountConfig & config)
{
    return std::visit(
        overloaded{
            [](const ViewConfig &) -> std::string { return "view"; },
            [](const BackendConfig & backend) { return backend.kind; },
        },
        config);
}

void checkMountPathKind(const AnyPath & path, const MountConfig & config)
{
    std::visit(
        overloaded{
            [&](const ViewConfig &) {
                if (!std::holds_alternative<FilePath>(path))
                    throw PathTypeMismatch(
                        "cannot mount a view at '%s': views must be mounted at a file path", showPath(path));
            },
            [&](const BackendConfig & backend) {
                if (!std::holds_alternative<DirPath>(path))
                    throw PathTypeMismatch(
                        "cannot mount a '%s' backend at '%s': backends must be mounted at a directory path",
                        backend.kind,
                        showPath(path));
            },
        },
        config);
}

nlohmann::json mountConfigToJSON(const MountConfig & config)
{
    return std::visit(
        overloaded{
            [](const ViewConfig & view) {
                auto vars = nlohmann::json::object();
                for (auto & [name, value] : view.defaultVars)
                    vars[name] = value;
                return nlohmann::json{{"view", {{"query", view.query}, {"vars", std::move(vars)}}}};
            },
            [](const BackendConfig & backend) {
                auto params = nlohmann::json::object();
                for (auto & [name, value] : backend.params)
                    params[name] = value;
                return nlohmann::json{{"backend", {{"kind", backend.kind}, {"params", std::move(params)}}}};
            },
        },
        config);
}

MountConfig mountConfigFromJSON(const nlohmann::json & json)
{
    auto & obj = getObject(json);

    if (obj.size() != 1)
        throw Error("mount configuration must have exactly one of the keys 'view' and 'backend': %s", json.dump());

    if (auto * view = optionalValueAt(obj, "view")) {
        auto & viewObj = getObject(*view);
        ViewConfig res{.query = getString(valueAt(viewObj, "query"))};
        if (auto * vars = optionalValueAt(viewObj, "vars"))
            for (auto & [name, value] : getObject(*vars))
                res.defaultVars.insert_or_assign(name, value);
        return res;
    }

    if (auto * backend = optionalValueAt(obj, "backend")) {
        auto & backendObj = getObject(*backend);
        BackendConfig res{.kind = getString(valueAt(backendObj, "kind"))};
        if (auto * params = optionalValueAt(backendObj, "params"))
            res.params = getStringMap(*params);
        return res;
    }

    throw Error("mount configuration must have exactly one of the keys 'view' and 'backend': %s", json.dump());
}

std::ostream & operator<<(std::ostream & str, const MountConfig & config)
{
    return str << mountConfigToJSON(config).dump();
}

} // namespace fedfs
