#pragma once
///@file

#include "fedfs/mount/memory-backend.hh"

#include <atomic>

namespace fedfs {

/**
 * What happened to the backends opened by a counting backend factory,
 * and knobs to make them misbehave.
 */
struct BackendCounters
{
    std::atomic<unsigned int> openAttempts{0};
    std::atomic<unsigned int> opens{0};
    std::atomic<unsigned int> releases{0};
    std::atomic<unsigned int> pushedDownQueries{0};

    std::atomic<bool> failOpen{false};
    std::atomic<bool> failRelease{false};

    /**
     * Whether closing a cursor returned by `read()` or `query()`
     * fails, after closing it.
     */
    std::atomic<bool> failCursorClose{false};

    /**
     * Whether the backends execute query plans themselves.
     */
    std::atomic<bool> nativeQueries{true};

    /**
     * Whether `read()` defers all of its work, including failing for
     * a missing file, until the first page is fetched.
     */
    std::atomic<bool> lazyReads{false};

    /**
     * Called at the start of every `read()`, or of its deferred work
     * if `lazyReads` is set. Set it before mounting.
     */
    std::function<void()> onRead;

    /**
     * Connections opened and not yet released.
     */
    unsigned int live() const
    {
        return opens - releases;
    }
};

/**
 * A memory backend that reports to a `BackendCounters`.
 */
struct CountingBackend : MemoryBackend
{
    ref<RecordCursor> readNow(const FilePath & path, size_t offset, std::optional<size_t> limit);

    std::shared_ptr<BackendCounters> counters;

    CountingBackend(std::shared_ptr<BackendCounters> counters)
        : counters(std::move(counters))
    {
    }

    ref<RecordCursor> read(const FilePath & path, size_t offset, std::optional<size_t> limit) override;

    bool supportsQuery() const override
    {
        return counters->nativeQueries;
    }

    ref<RecordCursor> query(const QueryPlan & plan, const Variables & vars) override;
};

/**
 * A factory for `CountingBackend`s that all share `counters`.
 */
BackendFactory makeCountingBackendFactory(std::shared_ptr<BackendCounters> counters);

} // namespace fedfs
