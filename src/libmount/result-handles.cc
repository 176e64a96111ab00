#include "fedfs/mount/result-handles.hh"
#include "fedfs/util/logging.hh"

#include <random>

namespace fedfs {

uint64_t MonotonicSeq::randomStart()
{
    std::random_device rd;
    /* Leave plenty of room before wrapping around. */
    return (uint64_t(rd()) << 16) ^ rd();
}

std::ostream & operator<<(std::ostream & str, const ResultHandle & handle)
{
    return str << "#" << handle.id;
}

ResultHandleTable::~ResultHandleTable()
{
    auto state(state_.lock());
    for (auto & [handle, query] : *state) {
        try {
            query.cursor->close();
        } catch (std::exception &) {
            ignoreException(lvlWarn);
        }
    }
}

ResultHandle ResultHandleTable::openQuery(
    const Evaluator & evaluator, const DirPath & base, std::string_view query, const Variables & vars)
{
    auto cursor = evaluator.query(query, base, vars);

    ResultHandle handle{seq.next()};

    {
        auto state(state_.lock());
        if (!state->emplace(handle, OpenQuery{base, cursor}).second)
            panic(fmt("result handle %d was allocated twice", handle.id));
    }

    debug("opened result handle %d for query '%s'", handle.id, query);

    return handle;
}

Records ResultHandleTable::more(ResultHandle handle, size_t n)
{
    std::shared_ptr<RecordCursor> cursor;

    {
        auto state(state_.lock());
        auto i = state->find(handle);
        if (i == state->end())
            throw UnknownHandle("result handle %d is not open", handle.id);
        cursor = i->second.cursor;
    }

    /* Don't hold the lock while the backend produces results. */
    auto res = cursor->more(n);

    if (res.empty())
        close(handle);

    return res;
}

void ResultHandleTable::close(ResultHandle handle)
{
    std::optional<OpenQuery> query;

    {
        auto state(state_.lock());
        auto i = state->find(handle);
        if (i == state->end())
            return;
        query.emplace(std::move(i->second));
        state->erase(i);
    }

    debug("closing result handle %d", handle.id);

    /* The handle is gone either way, so a cursor that fails to clean
       up is only worth a warning. */
    try {
        query->cursor->close();
    } catch (std::exception &) {
        ignoreException(lvlWarn);
    }
}

size_t ResultHandleTable::size()
{
    return state_.lock()->size();
}

} // namespace fedfs
