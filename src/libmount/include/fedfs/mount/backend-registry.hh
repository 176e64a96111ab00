#pragma once
/**
 * @file
 *
 * @brief Backend kinds and how to connect to them.
 */

#include "fedfs/mount/backend.hh"
#include "fedfs/mount/mount-config.hh"

#include <functional>

namespace fedfs {

/**
 * A freshly opened connection plus the action that shuts it down.
 */
struct OpenedBackend
{
    ref<Backend> backend;
    std::function<void()> release;
};

struct BackendFactory
{
    /**
     * Documentation for users, listing the parameters the kind
     * accepts.
     */
    std::string doc;

    /**
     * Open a connection. Any exception is reported as a
     * `BackendConnectError`.
     */
    std::function<OpenedBackend(const StringMap & params)> open;
};

class BackendRegistry
{
    std::map<std::string, BackendFactory, std::less<>> factories;

public:

    /**
     * @throws Error if `kind` is already registered.
     */
    void add(const std::string & kind, BackendFactory factory);

    /**
     * Register a backend type that provides static `kind()`, `doc()`
     * and `open(params)` members.
     */
    template<typename T>
    void add()
    {
        add(T::kind(),
            BackendFactory{
                .doc = T::doc(),
                .open = [](const StringMap & params) -> OpenedBackend { return T::open(params); },
            });
    }

    const BackendFactory * lookup(std::string_view kind) const;

    StringSet kinds() const;

    /**
     * Connect to the backend described by `config`.
     *
     * @throws UnknownBackendKind if nothing is registered for
     * `config.kind`.
     * @throws BackendConnectError if the factory fails.
     */
    OpenedBackend open(const BackendConfig & config) const;

    /**
     * The registry that `RegisterBackendImplementation` adds to.
     */
    static BackendRegistry & global();
};

template<typename T>
struct RegisterBackendImplementation
{
    RegisterBackendImplementation()
    {
        BackendRegistry::global().add<T>();
    }
};

} // namespace fedfs
