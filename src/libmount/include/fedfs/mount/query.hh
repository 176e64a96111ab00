#pragma once
/**
 * @file
 *
 * @brief Interface to the query compiler.
 *
 * The mount layer does not parse or plan queries itself. It hands
 * query text to a `QueryCompiler` and gets back a `QueryPlan`, which
 * it either passes to a backend that can run it natively or executes
 * against a `QueryContext` that reads through the federated
 * namespace.
 */

#include "fedfs/mount/backend.hh"

#include <functional>

namespace fedfs {

/**
 * Where a plan executed by the mount layer gets its input from.
 */
struct QueryContext
{
    virtual ~QueryContext() {}

    /**
     * All records of an input file.
     */
    virtual ref<RecordCursor> read(const FilePath & path) = 0;
};

struct QueryPlan
{
    virtual ~QueryPlan() {}

    /**
     * The files this plan reads, as absolute paths in the namespace
     * the plan was compiled or rebased for.
     */
    virtual std::vector<FilePath> inputs() const = 0;

    /**
     * The same plan with every input path replaced by `f(path)`. `f`
     * is not used after `rebase()` returns.
     */
    virtual ref<QueryPlan> rebase(std::function<FilePath(const FilePath &)> f) const = 0;

    /**
     * Run the plan. The returned cursor may keep using `context`
     * until it is closed.
     */
    virtual ref<RecordCursor> execute(ref<QueryContext> context, const Variables & vars) const = 0;

    /**
     * Human readable form, for logging.
     */
    virtual std::string show() const = 0;
};

struct QueryCompiler
{
    virtual ~QueryCompiler() {}

    /**
     * Compile `text`. Relative table references are resolved against
     * `base`.
     *
     * @throws QueryError if the text is not a valid query.
     */
    virtual ref<QueryPlan> compile(std::string_view text, const DirPath & base) const = 0;
};

} // namespace fedfs
