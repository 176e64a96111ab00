#include "fedfs/mount/view-overlay.hh"
#include "fedfs/util/strings.hh"

#include <algorithm>

namespace fedfs {

ViewInvocation prepareView(
    const MountEntry & entry, const QueryCompiler & compiler, const Variables & callerVars, const ViewStack & stack)
{
    auto & path = std::get<FilePath>(entry.path);
    auto & view = std::get<ViewConfig>(entry.config);

    if (std::find(stack.begin(), stack.end(), path) != stack.end()) {
        Strings chain;
        for (auto & p : stack)
            chain.push_back(p.to_string());
        chain.push_back(path.to_string());
        throw ViewCycle("view '%s' depends on itself: %s", path.to_string(), concatStringsSep(" -> ", chain));
    }

    try {
        auto plan = compiler.compile(view.query, path.dir());

        auto newStack = stack;
        newStack.push_back(path);

        return ViewInvocation{
            .plan = plan,
            .vars = overlayVariables(view.defaultVars, callerVars),
            .stack = std::move(newStack),
        };
    } catch (Error & e) {
        e.addTrace("while compiling the query of the view '%s'", path.to_string());
        throw;
    }
}

} // namespace fedfs
