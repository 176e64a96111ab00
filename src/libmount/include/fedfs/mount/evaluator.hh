#pragma once
/**
 * @file
 *
 * @brief Dispatch of filesystem operations over a mount table.
 */

#include "fedfs/mount/mount-table.hh"
#include "fedfs/mount/query.hh"
#include "fedfs/mount/view-overlay.hh"

namespace fedfs {

/**
 * Serves every filesystem operation on the federated namespace by
 * routing it to the mount that covers the path. An `Evaluator` is
 * immutable: it is built for one version of the mount table and
 * replaced, not updated, when the table changes.
 *
 * Paths passed to and returned from an `Evaluator` are global. The
 * translation to and from a backend's own namespace happens here.
 */
class Evaluator : public std::enable_shared_from_this<Evaluator>
{
    MountTable table;
    ref<const QueryCompiler> compiler;

    struct Context;

public:

    Evaluator(MountTable table, ref<const QueryCompiler> compiler);

    const MountTable & mountTable() const
    {
        return table;
    }

    /**
     * Read records `offset` up to `offset + limit` of a file. For a
     * view this runs the view's query with `vars` overlaid on the
     * view's default bindings.
     */
    ref<RecordCursor> read(
        const FilePath & path,
        size_t offset = 0,
        std::optional<size_t> limit = std::nullopt,
        const Variables & vars = {}) const;

    WriteResult write(const FilePath & path, const Records & records) const;

    WriteResult append(const FilePath & path, const Records & records) const;

    /**
     * Delete a file, or a directory and everything below it. A
     * directory containing a mount point cannot be deleted.
     */
    void remove(const AnyPath & path) const;

    /**
     * The entries of a directory, including the mount points nested
     * below it.
     */
    DirEntries list(const DirPath & path) const;

    /**
     * A listing with the single entry for a file, which may be a
     * view.
     */
    DirEntries list(const FilePath & path) const;

    /**
     * Rename within a single mount.
     *
     * @throws CrossMountOperation if `src` and `dst` are served by
     * different mounts, or if a directory being moved contains or
     * would contain a mount point.
     */
    void move(const AnyPath & src, const AnyPath & dst, MoveSemantics semantics) const;

    /**
     * Compile and run a query, resolving relative table references
     * against `base`. If every input of the query lives in a single
     * backend that can execute plans, the whole query is handed to
     * that backend. Otherwise it is executed here, reading the inputs
     * through `read()`.
     */
    ref<RecordCursor> query(std::string_view text, const DirPath & base, const Variables & vars = {}) const;

    bool exists(const FilePath & path) const;

private:

    ref<RecordCursor> doRead(
        const FilePath & path,
        size_t offset,
        std::optional<size_t> limit,
        const Variables & vars,
        const ViewStack & stack) const;

    ref<RecordCursor> execute(const QueryPlan & plan, const Variables & vars, const ViewStack & stack) const;

    /**
     * The mount that must serve a mutation of `path`.
     */
    ref<const MountEntry> writableMount(const AnyPath & path, std::string_view action) const;

    /**
     * The backend mounted at exactly `path`, if any. That makes `path`
     * a directory, whatever the backend around it has stored under the
     * same name.
     */
    std::shared_ptr<const MountEntry> backendMountedAt(const FilePath & path) const;
};

} // namespace fedfs
