#pragma once
/**
 * @file
 *
 * @brief The capability a connected physical backend exposes.
 *
 * A backend sees only its own namespace: every path it is handed, and
 * every path it reports back (in listings and in `PathNotFound`
 * errors), is relative to the point it is mounted at, with its mount
 * point playing the role of `/`.
 */

#include "fedfs/mount/data.hh"
#include "fedfs/mount/path.hh"
#include "fedfs/util/ref.hh"

#include <optional>

namespace fedfs {

struct QueryPlan;

/**
 * A lazily produced sequence of records, consumed a page at a time.
 */
struct RecordCursor
{
    virtual ~RecordCursor() {}

    /**
     * Return up to `n` further records. An empty result means the
     * cursor is exhausted.
     */
    virtual Records more(size_t n) = 0;

    /**
     * Release whatever the producer holds for this cursor. Calling
     * `more()` afterwards is not allowed.
     */
    virtual void close() {}
};

/**
 * A cursor over records that are already in memory.
 */
ref<RecordCursor> makeVectorCursor(Records records);

/**
 * A cursor that skips the first `offset` records of `inner` and stops
 * after `limit` records, if given.
 */
ref<RecordCursor> makeWindowCursor(ref<RecordCursor> inner, size_t offset, std::optional<size_t> limit);

/**
 * Pull every remaining record out of `cursor`, `pageSize` at a time,
 * and close it.
 */
Records drainCursor(RecordCursor & cursor, size_t pageSize = 1024);

struct DirEntry
{
    enum class Type { File, Directory };

    Type type;

    /**
     * Set for entries that stand for a mount point rather than for
     * something the backend stores: `"view"` or the backend kind.
     */
    std::optional<std::string> mountKind;

    bool operator==(const DirEntry &) const = default;
};

typedef std::map<std::string, DirEntry, std::less<>> DirEntries;

/**
 * Render a listing entry the way a shell shows it: `name@ (kind)` for
 * mount points, `name/` for directories and `name` for files.
 */
std::string showDirEntry(std::string_view name, const DirEntry & entry);

/**
 * The outcome of writing several records. Writes are not atomic: the
 * records that could not be stored are reported individually.
 */
struct WriteResult
{
    struct RecordError
    {
        size_t index;
        std::string message;

        bool operator==(const RecordError &) const = default;
    };

    size_t written = 0;
    std::vector<RecordError> errors;
};

enum class MoveSemantics {
    /**
     * Replace the destination if it exists.
     */
    Overwrite,

    /**
     * Fail if the destination exists.
     */
    FailIfExists,

    /**
     * Fail if the destination does not exist.
     */
    FailIfMissing,
};

struct Backend
{
    virtual ~Backend() {}

    /**
     * Read the records of a file, starting at record `offset` and
     * returning at most `limit` records.
     *
     * @throws PathNotFound if the file does not exist.
     */
    virtual ref<RecordCursor> read(const FilePath & path, size_t offset, std::optional<size_t> limit) = 0;

    /**
     * Replace the contents of a file, creating it if necessary.
     */
    virtual WriteResult write(const FilePath & path, const Records & records) = 0;

    /**
     * Add records to the end of a file, creating it if necessary.
     */
    virtual WriteResult append(const FilePath & path, const Records & records) = 0;

    /**
     * Delete a file or a directory with everything below it.
     *
     * @throws PathNotFound if there is nothing at `path`.
     */
    virtual void remove(const AnyPath & path) = 0;

    /**
     * The immediate children of a directory.
     *
     * @throws PathNotFound if the directory does not exist.
     */
    virtual DirEntries list(const DirPath & path) = 0;

    /**
     * Rename a file to a file or a directory to a directory.
     */
    virtual void move(const AnyPath & src, const AnyPath & dst, MoveSemantics semantics) = 0;

    virtual bool exists(const FilePath & path) = 0;

    /**
     * Whether `query()` can execute plans natively. If not, queries
     * over this backend are executed by the mount layer on top of
     * `read()`.
     */
    virtual bool supportsQuery() const
    {
        return false;
    }

    /**
     * Execute a plan whose inputs are all paths in this backend's
     * namespace.
     */
    virtual ref<RecordCursor> query(const QueryPlan & plan, const Variables & vars);

    /**
     * Shut down the connection. The backend is not used afterwards.
     */
    virtual void close() {}
};

} // namespace fedfs
