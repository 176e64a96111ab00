#include "fedfs/mount/backend.hh"
#include "fedfs/mount/query.hh"

namespace fedfs {

namespace {

struct VectorCursor : RecordCursor
{
    Records records;
    size_t pos = 0;

    VectorCursor(Records records)
        : records(std::move(records))
    {
    }

    Records more(size_t n) override
    {
        auto end = pos + std::min(n, records.size() - pos);
        Records res(
            std::make_move_iterator(records.begin() + pos), std::make_move_iterator(records.begin() + end));
        pos = end;
        return res;
    }

    void close() override
    {
        records.clear();
        pos = 0;
    }
};

struct WindowCursor : RecordCursor
{
    ref<RecordCursor> inner;
    size_t toSkip;
    std::optional<size_t> remaining;

    WindowCursor(ref<RecordCursor> inner, size_t offset, std::optional<size_t> limit)
        : inner(std::move(inner))
        , toSkip(offset)
        , remaining(limit)
    {
    }

    Records more(size_t n) override
    {
        while (toSkip) {
            auto skipped = inner->more(toSkip);
            if (skipped.empty())
                return {};
            toSkip -= skipped.size();
        }

        if (remaining) {
            n = std::min(n, *remaining);
            if (!n)
                return {};
        }

        auto res = inner->more(n);
        if (remaining)
            *remaining -= res.size();
        return res;
    }

    void close() override
    {
        inner->close();
    }
};

} // namespace

ref<RecordCursor> makeVectorCursor(Records records)
{
    return make_ref<VectorCursor>(std::move(records));
}

ref<RecordCursor> makeWindowCursor(ref<RecordCursor> inner, size_t offset, std::optional<size_t> limit)
{
    if (!offset && !limit)
        return inner;
    return make_ref<WindowCursor>(std::move(inner), offset, limit);
}

Records drainCursor(RecordCursor & cursor, size_t pageSize)
{
    Records res;
    while (true) {
        auto page = cursor.more(pageSize);
        if (page.empty())
            break;
        std::move(page.begin(), page.end(), std::back_inserter(res));
    }
    cursor.close();
    return res;
}

std::string showDirEntry(std::string_view name, const DirEntry & entry)
{
    if (entry.mountKind)
        return fmt("%s@ (%s)", name, *entry.mountKind);
    if (entry.type == DirEntry::Type::Directory)
        return std::string(name) + "/";
    return std::string(name);
}

ref<RecordCursor> Backend::query(const QueryPlan & plan, const Variables & vars)
{
    throw UnimplementedError("this backend cannot execute the query '%s'", plan.show());
}

} // namespace fedfs
