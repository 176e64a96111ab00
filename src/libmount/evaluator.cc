#include "fedfs/mount/evaluator.hh"
#include "fedfs/mount/hierarchical-merge.hh"
#include "fedfs/util/logging.hh"

#include <chrono>

namespace fedfs {

namespace {

/**
 * Run `f` on the backend behind `live`, mounted at `mountPoint`,
 * translating any path it reports back into the global namespace.
 */
template<typename F>
auto onBackend(LiveHandle & live, const DirPath & mountPoint, F && f)
{
    try {
        return live.use(std::forward<F>(f));
    } catch (PathNotFound & e) {
        PathNotFound e2(absolutize(e.path, mountPoint));
        e2.addTrace("in the backend mounted at '%s'", mountPoint.to_string());
        throw e2;
    } catch (Error & e) {
        e.addTrace("in the backend mounted at '%s'", mountPoint.to_string());
        throw;
    }
}

template<typename F>
auto onBackend(const MountEntry & entry, F && f)
{
    return onBackend(*entry.live, entry.dirPath(), std::forward<F>(f));
}

/**
 * A backend cursor that stops working once its mount is gone. Backends
 * may fail lazily, so every page is fetched the way any other backend
 * call is made.
 */
struct GuardedCursor : RecordCursor
{
    std::shared_ptr<LiveHandle> live;
    DirPath mountPoint;
    ref<RecordCursor> inner;

    GuardedCursor(const MountEntry & entry, ref<RecordCursor> inner)
        : live(entry.live)
        , mountPoint(entry.dirPath())
        , inner(std::move(inner))
    {
    }

    Records more(size_t n) override
    {
        return onBackend(*live, mountPoint, [&](Backend &) { return inner->more(n); });
    }

    void close() override
    {
        /* Closing after the backend was released is harmless: there
           is nothing left to free. */
        if (!live->isReleased())
            inner->close();
    }
};

ref<RecordCursor> guard(const MountEntry & entry, ref<RecordCursor> cursor)
{
    return make_ref<GuardedCursor>(entry, std::move(cursor));
}

} // namespace

/**
 * Input for queries that are executed here rather than by a backend.
 * Every read goes through the evaluator, so a query can read from any
 * mount, including views.
 */
struct Evaluator::Context : QueryContext
{
    ref<const Evaluator> evaluator;
    Variables vars;
    ViewStack stack;

    Context(ref<const Evaluator> evaluator, Variables vars, ViewStack stack)
        : evaluator(std::move(evaluator))
        , vars(std::move(vars))
        , stack(std::move(stack))
    {
    }

    ref<RecordCursor> read(const FilePath & path) override
    {
        return evaluator->doRead(path, 0, std::nullopt, vars, stack);
    }
};

Evaluator::Evaluator(MountTable table, ref<const QueryCompiler> compiler)
    : table(std::move(table))
    , compiler(std::move(compiler))
{
}

ref<RecordCursor>
Evaluator::read(const FilePath & path, size_t offset, std::optional<size_t> limit, const Variables & vars) const
{
    return doRead(path, offset, limit, vars, {});
}

ref<RecordCursor> Evaluator::doRead(
    const FilePath & path,
    size_t offset,
    std::optional<size_t> limit,
    const Variables & vars,
    const ViewStack & stack) const
{
    if (backendMountedAt(path))
        throw PathNotFound(path.canon(), "cannot read '%s' because it is a mount point", path.to_string());

    auto entry = table.deepestEnclosingMount(path);
    if (!entry)
        throw PathNotFound(path.canon());

    if (entry->isView()) {
        auto view = prepareView(*entry, *compiler, vars, stack);
        try {
            return makeWindowCursor(execute(*view.plan, view.vars, view.stack), offset, limit);
        } catch (Error & e) {
            e.addTrace("while evaluating the view '%s'", path.to_string());
            throw;
        }
    }

    auto rel = relativize(path, entry->dirPath());
    return guard(*entry, onBackend(*entry, [&](Backend & backend) { return backend.read(rel, offset, limit); }));
}

std::shared_ptr<const MountEntry> Evaluator::backendMountedAt(const FilePath & path) const
{
    auto entry = table.lookup(path.canon());
    return entry && !entry->isView() ? entry : nullptr;
}

ref<const MountEntry> Evaluator::writableMount(const AnyPath & path, std::string_view action) const
{
    if (auto file = std::get_if<FilePath>(&path))
        if (backendMountedAt(*file))
            throw CrossMountOperation(
                "cannot %s '%s' because a backend is mounted at '%s'",
                action,
                file->to_string(),
                DirPath(file->canon()).to_string());

    auto entry = table.deepestEnclosingMount(path);
    if (!entry)
        throw PathNotFound(canonOf(path));
    if (entry->isView())
        throw ReadOnlyMount("cannot %s '%s' because it is a view", action, showPath(path));
    return ref(entry);
}

WriteResult Evaluator::write(const FilePath & path, const Records & records) const
{
    auto entry = writableMount(path, "write to");
    auto rel = relativize(path, entry->dirPath());
    return onBackend(*entry, [&](Backend & backend) { return backend.write(rel, records); });
}

WriteResult Evaluator::append(const FilePath & path, const Records & records) const
{
    auto entry = writableMount(path, "append to");
    auto rel = relativize(path, entry->dirPath());
    return onBackend(*entry, [&](Backend & backend) { return backend.append(rel, records); });
}

void Evaluator::remove(const AnyPath & path) const
{
    if (auto dir = std::get_if<DirPath>(&path)) {
        auto nested = table.mountsBelow(*dir);
        if (!nested.empty())
            throw CrossMountOperation(
                "cannot delete '%s' because '%s' is mounted below it",
                dir->to_string(),
                showPath(nested.front()->path));
    }

    auto entry = writableMount(path, "delete");
    auto & mountPoint = entry->dirPath();

    std::visit(
        [&](const auto & p) {
            auto rel = relativize(p, mountPoint);
            onBackend(*entry, [&](Backend & backend) { backend.remove(rel); });
        },
        path);
}

DirEntries Evaluator::list(const DirPath & path) const
{
    auto nested = table.mountsBelow(path);
    auto entry = table.deepestEnclosingMount(path);

    if (!entry && nested.empty())
        throw PathNotFound(path.canon());

    DirEntries native;

    if (entry) {
        auto rel = relativize(path, entry->dirPath());
        try {
            native = onBackend(*entry, [&](Backend & backend) { return backend.list(rel); });
        } catch (PathNotFound &) {
            /* The backend does not have this directory, but it leads
               to a mount point, so it exists in the namespace. */
            if (nested.empty())
                throw;
        }
    }

    return mergeNestedMounts(std::move(native), path, nested);
}

DirEntries Evaluator::list(const FilePath & path) const
{
    if (backendMountedAt(path))
        throw PathNotFound(path.canon(), "'%s' is a mount point, not a file", path.to_string());

    auto entry = table.deepestEnclosingMount(path);
    if (!entry)
        throw PathNotFound(path.canon());

    if (entry->isView())
        return {{std::string(path.name()), mountPointEntry(*entry)}};

    auto rel = relativize(path, entry->dirPath());
    if (!onBackend(*entry, [&](Backend & backend) { return backend.exists(rel); }))
        throw PathNotFound(path.canon());

    return {{std::string(path.name()), DirEntry{.type = DirEntry::Type::File}}};
}

void Evaluator::move(const AnyPath & src, const AnyPath & dst, MoveSemantics semantics) const
{
    if (src.index() != dst.index())
        throw UsageError("cannot move '%s' to '%s': both must be files or both directories", showPath(src), showPath(dst));

    auto srcEntry = writableMount(src, "move");
    auto dstEntry = writableMount(dst, "move to");

    if (srcEntry != dstEntry)
        throw CrossMountOperation(
            "cannot move '%s' to '%s' because they are in different mounts ('%s' and '%s')",
            showPath(src),
            showPath(dst),
            showPath(srcEntry->path),
            showPath(dstEntry->path));

    auto & mountPoint = srcEntry->dirPath();

    if (auto srcDir = std::get_if<DirPath>(&src)) {
        auto & dstDir = std::get<DirPath>(dst);
        if (*srcDir == mountPoint || dstDir == mountPoint)
            throw CrossMountOperation("cannot move the mount point '%s'", mountPoint.to_string());
        for (auto & dir : {*srcDir, dstDir}) {
            auto nested = table.mountsBelow(dir);
            if (!nested.empty())
                throw CrossMountOperation(
                    "cannot move '%s' to '%s' because '%s' is mounted below '%s'",
                    showPath(src),
                    showPath(dst),
                    showPath(nested.front()->path),
                    dir.to_string());
        }
    }

    auto relative = [&](const AnyPath & p) -> AnyPath {
        return std::visit([&](const auto & p2) -> AnyPath { return relativize(p2, mountPoint); }, p);
    };

    auto relSrc = relative(src);
    auto relDst = relative(dst);
    onBackend(*srcEntry, [&](Backend & backend) { backend.move(relSrc, relDst, semantics); });
}

ref<RecordCursor> Evaluator::query(std::string_view text, const DirPath & base, const Variables & vars) const
{
    auto start = std::chrono::steady_clock::now();

    auto plan = compiler->compile(text, base);
    auto res = execute(*plan, vars, {});

    debug(
        "started query '%s' in %d ms",
        plan->show(),
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count());

    return res;
}

ref<RecordCursor> Evaluator::execute(const QueryPlan & plan, const Variables & vars, const ViewStack & stack) const
{
    /* Hand the plan to a backend if it only reads from that backend
       and the backend knows how to run plans. */
    std::shared_ptr<const MountEntry> target;
    auto inputs = plan.inputs();
    bool pushDown = !inputs.empty();

    for (auto & input : inputs) {
        auto entry = table.deepestEnclosingMount(input);
        if (!entry || entry->isView() || (target && entry != target) || backendMountedAt(input)) {
            pushDown = false;
            break;
        }
        target = entry;
    }

    if (pushDown && onBackend(*target, [](Backend & backend) { return backend.supportsQuery(); })) {
        auto & mountPoint = target->dirPath();
        debug("executing query '%s' in the backend mounted at '%s'", plan.show(), mountPoint.to_string());
        auto rebased = plan.rebase([&](const FilePath & p) { return relativize(p, mountPoint); });
        return guard(*target, onBackend(*target, [&](Backend & backend) { return backend.query(*rebased, vars); }));
    }

    debug("executing query '%s' in the mount layer", plan.show());
    return plan.execute(make_ref<Context>(ref(shared_from_this()), vars, stack), vars);
}

bool Evaluator::exists(const FilePath & path) const
{
    if (backendMountedAt(path))
        return false;

    auto entry = table.deepestEnclosingMount(path);
    if (!entry)
        return false;
    if (entry->isView())
        return true;
    auto rel = relativize(path, entry->dirPath());
    return onBackend(*entry, [&](Backend & backend) { return backend.exists(rel); });
}

} // namespace fedfs
