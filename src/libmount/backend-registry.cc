#include "fedfs/mount/backend-registry.hh"
#include "fedfs/mount/errors.hh"
#include "fedfs/util/logging.hh"

namespace fedfs {

void BackendRegistry::add(const std::string & kind, BackendFactory factory)
{
    auto [it, didInsert] = factories.insert({kind, std::move(factory)});
    if (!didInsert)
        throw Error("a backend of kind '%s' is already registered", it->first);
}

const BackendFactory * BackendRegistry::lookup(std::string_view kind) const
{
    return get(factories, kind);
}

StringSet BackendRegistry::kinds() const
{
    StringSet res;
    for (auto & [kind, _] : factories)
        res.insert(kind);
    return res;
}

OpenedBackend BackendRegistry::open(const BackendConfig & config) const
{
    auto factory = lookup(config.kind);
    if (!factory)
        throw UnknownBackendKind("unknown backend kind '%s'", config.kind);

    debug("opening a backend of kind '%s'", config.kind);

    try {
        return factory->open(config.params);
    } catch (BackendConnectError &) {
        throw;
    } catch (Error & e) {
        throw BackendConnectError(
            "cannot connect to a backend of kind '%s': %s", config.kind, Uncolored(e.message()));
    } catch (std::exception & e) {
        throw BackendConnectError("cannot connect to a backend of kind '%s': %s", config.kind, Uncolored(e.what()));
    }
}

BackendRegistry & BackendRegistry::global()
{
    static BackendRegistry registry;
    return registry;
}

} // namespace fedfs
