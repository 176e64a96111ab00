#include <gtest/gtest.h>

#include "fedfs/mount/errors.hh"
#include "fedfs/mount/memory-backend.hh"
#include "fedfs/mount/tests/mini-sql.hh"

namespace fedfs {

class MemoryBackendTest : public ::testing::Test
{
protected:
    ref<MemoryBackend> backend = make_ref<MemoryBackend>();

    static FilePath file(std::string_view s)
    {
        return FilePath::parse(s);
    }

    static DirPath dir(std::string_view s)
    {
        return DirPath::parse(s);
    }

    static Records numbered(int from, int to)
    {
        Records res;
        for (int n = from; n < to; ++n)
            res.push_back({{"n", n}});
        return res;
    }

    Records readAll(const FilePath & path, size_t offset = 0, std::optional<size_t> limit = std::nullopt)
    {
        return drainCursor(*backend->read(path, offset, limit));
    }
};

TEST_F(MemoryBackendTest, writeReplacesAppendAdds)
{
    backend->write(file("/f"), numbered(0, 3));
    backend->write(file("/f"), numbered(3, 5));
    ASSERT_EQ(readAll(file("/f")), numbered(3, 5));

    backend->append(file("/f"), numbered(5, 7));
    ASSERT_EQ(readAll(file("/f")), numbered(3, 7));

    backend->append(file("/g"), numbered(0, 1));
    ASSERT_EQ(readAll(file("/g")), numbered(0, 1));
}

TEST_F(MemoryBackendTest, readWindow)
{
    backend->write(file("/f"), numbered(0, 10));

    ASSERT_EQ(readAll(file("/f"), 2, 3), numbered(2, 5));
    ASSERT_EQ(readAll(file("/f"), 8), numbered(8, 10));
    ASSERT_EQ(readAll(file("/f"), 8, 5), numbered(8, 10));
    ASSERT_EQ(readAll(file("/f"), 20), Records{});
    ASSERT_EQ(readAll(file("/f"), 0, 0), Records{});
}

TEST_F(MemoryBackendTest, readMissing)
{
    try {
        backend->read(file("/a/missing"), 0, std::nullopt);
        FAIL() << "reading a missing file should fail";
    } catch (PathNotFound & e) {
        ASSERT_EQ(e.path, CanonPath("/a/missing"));
    }
}

TEST_F(MemoryBackendTest, partialWrite)
{
    auto res = backend->write(file("/f"), {{{"a", 1}}, 42, {{"b", 2}}, "text"});

    ASSERT_EQ(res.written, 2u);
    ASSERT_EQ(res.errors.size(), 2u);
    ASSERT_EQ(res.errors[0].index, 1u);
    ASSERT_EQ(res.errors[1].index, 3u);

    ASSERT_EQ(readAll(file("/f")).size(), 2u);
}

TEST_F(MemoryBackendTest, list)
{
    backend->write(file("/a.json"), numbered(0, 1));
    backend->write(file("/sub/b.json"), numbered(0, 1));
    backend->write(file("/sub/deeper/c.json"), numbered(0, 1));

    auto root = backend->list(DirPath::root());
    ASSERT_EQ(root.size(), 2u);
    ASSERT_EQ(root.at("a.json").type, DirEntry::Type::File);
    ASSERT_EQ(root.at("sub").type, DirEntry::Type::Directory);
    ASSERT_FALSE(root.at("sub").mountKind);

    auto sub = backend->list(dir("/sub/"));
    ASSERT_EQ(sub.size(), 2u);
    ASSERT_EQ(sub.at("deeper").type, DirEntry::Type::Directory);

    ASSERT_THROW(backend->list(dir("/nope/")), PathNotFound);
    ASSERT_THROW(backend->list(dir("/a.json/")), PathNotFound);

    /* An empty backend still has a root. */
    ASSERT_TRUE(make_ref<MemoryBackend>()->list(DirPath::root()).empty());
}

TEST_F(MemoryBackendTest, writeOverDirectoryFails)
{
    backend->write(file("/sub/b.json"), numbered(0, 1));
    ASSERT_THROW(backend->write(file("/sub"), numbered(0, 1)), Error);
    ASSERT_THROW(backend->write(file("/sub/b.json/c.json"), numbered(0, 1)), Error);
}

TEST_F(MemoryBackendTest, remove)
{
    backend->write(file("/a.json"), numbered(0, 1));
    backend->write(file("/sub/b.json"), numbered(0, 1));
    backend->write(file("/sub/c.json"), numbered(0, 1));

    backend->remove(file("/a.json"));
    ASSERT_FALSE(backend->exists(file("/a.json")));
    ASSERT_THROW(backend->remove(file("/a.json")), PathNotFound);

    backend->remove(dir("/sub/"));
    ASSERT_FALSE(backend->exists(file("/sub/b.json")));
    ASSERT_THROW(backend->remove(dir("/sub/")), PathNotFound);
}

TEST_F(MemoryBackendTest, moveFile)
{
    backend->write(file("/a"), numbered(0, 1));
    backend->write(file("/b"), numbered(1, 2));

    ASSERT_THROW(backend->move(file("/a"), file("/b"), MoveSemantics::FailIfExists), Error);
    ASSERT_THROW(backend->move(file("/a"), file("/c"), MoveSemantics::FailIfMissing), PathNotFound);
    ASSERT_THROW(backend->move(file("/nope"), file("/c"), MoveSemantics::Overwrite), PathNotFound);

    backend->move(file("/a"), file("/b"), MoveSemantics::FailIfMissing);
    ASSERT_FALSE(backend->exists(file("/a")));
    ASSERT_EQ(readAll(file("/b")), numbered(0, 1));

    backend->move(file("/b"), file("/sub/c"), MoveSemantics::Overwrite);
    ASSERT_EQ(readAll(file("/sub/c")), numbered(0, 1));
}

TEST_F(MemoryBackendTest, moveDirectory)
{
    backend->write(file("/src/a"), numbered(0, 1));
    backend->write(file("/src/x/b"), numbered(1, 2));
    backend->write(file("/dst/old"), numbered(2, 3));

    ASSERT_THROW(backend->move(dir("/src/"), dir("/dst/"), MoveSemantics::FailIfExists), Error);
    ASSERT_THROW(backend->move(dir("/src/"), dir("/src/x/"), MoveSemantics::Overwrite), Error);
    ASSERT_THROW(backend->move(dir("/src/x/"), dir("/src/"), MoveSemantics::Overwrite), Error);
    ASSERT_EQ(readAll(file("/src/x/b")), numbered(1, 2));

    backend->move(dir("/src/"), dir("/dst/"), MoveSemantics::Overwrite);

    ASSERT_THROW(backend->list(dir("/src/")), PathNotFound);
    ASSERT_FALSE(backend->exists(file("/dst/old")));
    ASSERT_EQ(readAll(file("/dst/a")), numbered(0, 1));
    ASSERT_EQ(readAll(file("/dst/x/b")), numbered(1, 2));
}

TEST_F(MemoryBackendTest, nativeQuery)
{
    backend->write(file("/t.json"), {{{"v", 1}}, {{"v", 5}}, {{"v", 10}}});

    MiniSqlCompiler compiler;
    auto plan = compiler.compile("select v from t.json where v >= :min", DirPath::root());

    ASSERT_TRUE(backend->supportsQuery());
    auto res = drainCursor(*backend->query(*plan, {{"min", 5}}));
    ASSERT_EQ(res, (Records{{{"v", 5}}, {{"v", 10}}}));
}

TEST_F(MemoryBackendTest, closed)
{
    backend->write(file("/f"), numbered(0, 1));
    backend->close();
    ASSERT_THROW(backend->read(file("/f"), 0, std::nullopt), Error);
    ASSERT_THROW(backend->write(file("/f"), numbered(0, 1)), Error);
}

} // namespace fedfs
