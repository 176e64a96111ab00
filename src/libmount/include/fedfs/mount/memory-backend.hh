#pragma once
/**
 * @file
 *
 * @brief A backend that keeps everything in memory.
 */

#include "fedfs/mount/backend-registry.hh"
#include "fedfs/mount/query.hh"
#include "fedfs/util/sync.hh"

namespace fedfs {

/**
 * Files are lists of JSON objects. Directories are not stored: a
 * directory exists if it is the root or if some file is below it.
 */
struct MemoryBackend : Backend, std::enable_shared_from_this<MemoryBackend>
{
    static std::string kind()
    {
        return "memory";
    }

    static std::string doc();

    /**
     * Accepts no parameters.
     */
    static OpenedBackend open(const StringMap & params);

    ref<RecordCursor> read(const FilePath & path, size_t offset, std::optional<size_t> limit) override;

    WriteResult write(const FilePath & path, const Records & records) override;

    WriteResult append(const FilePath & path, const Records & records) override;

    void remove(const AnyPath & path) override;

    DirEntries list(const DirPath & path) override;

    void move(const AnyPath & src, const AnyPath & dst, MoveSemantics semantics) override;

    bool exists(const FilePath & path) override;

    bool supportsQuery() const override
    {
        return true;
    }

    ref<RecordCursor> query(const QueryPlan & plan, const Variables & vars) override;

    void close() override;

private:

    struct State
    {
        std::map<CanonPath, Records> files;
        bool closed = false;
    };

    Sync<State> state_;

    WriteResult store(const FilePath & path, const Records & records, bool truncate);
};

} // namespace fedfs
