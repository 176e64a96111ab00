#include "fedfs/mount/tests/counting-backend.hh"

namespace fedfs {

namespace {

/**
 * Opens its source on the first call to `more()`.
 */
struct DeferredCursor : RecordCursor
{
    std::function<ref<RecordCursor>()> open;
    std::shared_ptr<RecordCursor> inner;

    DeferredCursor(std::function<ref<RecordCursor>()> open)
        : open(std::move(open))
    {
    }

    Records more(size_t n) override
    {
        if (!inner)
            inner = open();
        return inner->more(n);
    }

    void close() override
    {
        if (inner)
            inner->close();
    }
};

struct CountedCursor : RecordCursor
{
    std::shared_ptr<BackendCounters> counters;
    ref<RecordCursor> inner;

    CountedCursor(std::shared_ptr<BackendCounters> counters, ref<RecordCursor> inner)
        : counters(std::move(counters))
        , inner(std::move(inner))
    {
    }

    Records more(size_t n) override
    {
        return inner->more(n);
    }

    void close() override
    {
        inner->close();
        if (counters->failCursorClose)
            throw Error("simulated cursor close failure");
    }
};

} // namespace

ref<RecordCursor> CountingBackend::readNow(const FilePath & path, size_t offset, std::optional<size_t> limit)
{
    if (counters->onRead)
        counters->onRead();
    return MemoryBackend::read(path, offset, limit);
}

ref<RecordCursor> CountingBackend::read(const FilePath & path, size_t offset, std::optional<size_t> limit)
{
    if (!counters->lazyReads)
        return make_ref<CountedCursor>(counters, readNow(path, offset, limit));

    auto self = std::static_pointer_cast<CountingBackend>(shared_from_this());
    return make_ref<CountedCursor>(
        counters,
        make_ref<DeferredCursor>([self, path, offset, limit]() { return self->readNow(path, offset, limit); }));
}

ref<RecordCursor> CountingBackend::query(const QueryPlan & plan, const Variables & vars)
{
    counters->pushedDownQueries++;
    return make_ref<CountedCursor>(counters, MemoryBackend::query(plan, vars));
}

BackendFactory makeCountingBackendFactory(std::shared_ptr<BackendCounters> counters)
{
    return BackendFactory{
        .doc = "An in-memory backend that counts how often it is opened and released.",
        .open = [counters](const StringMap & params) -> OpenedBackend {
            counters->openAttempts++;
            if (counters->failOpen)
                throw Error("simulated connection failure");
            auto backend = make_ref<CountingBackend>(counters);
            counters->opens++;
            return OpenedBackend{
                .backend = backend,
                .release =
                    [counters, backend]() {
                        counters->releases++;
                        backend->close();
                        if (counters->failRelease)
                            throw Error("simulated release failure");
                    },
            };
        },
    };
}

} // namespace fedfs
