#pragma once
/**
 * @file
 *
 * @brief Paginated query results that outlive a single call.
 */

#include "fedfs/mount/evaluator.hh"
#include "fedfs/util/sync.hh"

#include <atomic>

namespace fedfs {

/**
 * A thread-safe source of increasing numbers. Used to allocate result
 * handles, which are never reused during the lifetime of the process.
 */
class MonotonicSeq
{
    std::atomic<uint64_t> nextValue;

public:

    explicit MonotonicSeq(uint64_t start = 0)
        : nextValue(start)
    {
    }

    /**
     * A random starting point, so that handles from different
     * processes are unlikely to collide.
     */
    static uint64_t randomStart();

    uint64_t next()
    {
        return nextValue++;
    }
};

struct ResultHandle
{
    uint64_t id;

    auto operator<=>(const ResultHandle &) const = default;
};

std::ostream & operator<<(std::ostream & str, const ResultHandle & handle);

/**
 * The open query cursors. A handle is not meant to be shared: using
 * the same handle from several threads at once is the caller's
 * responsibility to prevent.
 */
class ResultHandleTable
{
    struct OpenQuery
    {
        DirPath base;
        ref<RecordCursor> cursor;
    };

    MonotonicSeq & seq;

    Sync<std::map<ResultHandle, OpenQuery>> state_;

public:

    explicit ResultHandleTable(MonotonicSeq & seq)
        : seq(seq)
    {
    }

    ~ResultHandleTable();

    /**
     * Start `query` relative to `base` and register its cursor.
     */
    ResultHandle openQuery(const Evaluator & evaluator, const DirPath & base, std::string_view query, const Variables & vars);

    /**
     * Up to `n` further results. Once the cursor is exhausted (an
     * empty page) the handle is closed.
     *
     * @throws UnknownHandle if `handle` is not open.
     */
    Records more(ResultHandle handle, size_t n);

    /**
     * Close the handle. Closing a handle that is not open does
     * nothing, and a cursor that fails to close is logged rather than
     * reported, so this never fails.
     */
    void close(ResultHandle handle);

    size_t size();
};

} // namespace fedfs
