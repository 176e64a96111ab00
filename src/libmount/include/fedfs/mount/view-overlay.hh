#pragma once
/**
 * @file
 *
 * @brief Views: saved queries mounted as read-only files.
 */

#include "fedfs/mount/mount-table.hh"
#include "fedfs/mount/query.hh"

namespace fedfs {

/**
 * The views currently being evaluated, outermost first. A view that
 * is already on the stack is not evaluated again.
 */
typedef std::vector<FilePath> ViewStack;

/**
 * Everything needed to run a view: its compiled query, the bindings to
 * run it with and the view stack to evaluate its inputs under.
 */
struct ViewInvocation
{
    ref<QueryPlan> plan;
    Variables vars;
    ViewStack stack;
};

/**
 * Prepare to evaluate the view mounted by `entry` on behalf of a
 * caller that supplied `callerVars`. The view's query is resolved
 * relative to the directory containing the view.
 *
 * @throws ViewCycle if the view is already being evaluated.
 * @throws QueryError if the view's query does not compile.
 */
ViewInvocation prepareView(
    const MountEntry & entry, const QueryCompiler & compiler, const Variables & callerVars, const ViewStack & stack);

} // namespace fedfs
