#include "fedfs/mount/tests/mini-sql.hh"
#include "fedfs/mount/errors.hh"
#include "fedfs/util/strings.hh"

#include <cctype>

namespace fedfs {

namespace {

struct Operand
{
    /**
     * Set for `:name` operands.
     */
    std::optional<std::string> var;

    Data literal;

    std::string show() const
    {
        return var ? ":" + *var : literal.dump();
    }
};

struct Condition
{
    std::string field;
    std::string op;
    Operand value;

    bool matches(const Data & record, const Variables & vars) const
    {
        if (!record.is_object() || !record.contains(field))
            return false;

        auto & lhs = record[field];
        const Data * rhs = &value.literal;
        if (value.var) {
            auto i = vars.find(*value.var);
            if (i == vars.end())
                throw QueryError("variable ':%s' is not bound", *value.var);
            rhs = &i->second;
        }

        if (op == "=")
            return lhs == *rhs;
        if (op == "!=")
            return lhs != *rhs;
        if (op == "<")
            return lhs < *rhs;
        if (op == "<=")
            return lhs <= *rhs;
        if (op == ">")
            return lhs > *rhs;
        if (op == ">=")
            return lhs >= *rhs;
        unreachable();
    }
};

struct MiniSqlPlan : QueryPlan
{
    /**
     * Empty for `*`.
     */
    std::vector<std::string> fields;

    FilePath table;

    std::optional<Condition> where;

    MiniSqlPlan(std::vector<std::string> fields, FilePath table, std::optional<Condition> where)
        : fields(std::move(fields))
        , table(std::move(table))
        , where(std::move(where))
    {
    }

    std::vector<FilePath> inputs() const override
    {
        return {table};
    }

    ref<QueryPlan> rebase(std::function<FilePath(const FilePath &)> f) const override
    {
        return make_ref<MiniSqlPlan>(fields, f(table), where);
    }

    ref<RecordCursor> execute(ref<QueryContext> context, const Variables & vars) const override
    {
        Records res;

        for (auto & record : drainCursor(*context->read(table))) {
            if (where && !where->matches(record, vars))
                continue;
            if (fields.empty()) {
                res.push_back(record);
                continue;
            }
            auto projected = Data::object();
            for (auto & field : fields)
                if (record.contains(field))
                    projected[field] = record[field];
            res.push_back(std::move(projected));
        }

        return makeVectorCursor(std::move(res));
    }

    std::string show() const override
    {
        auto s = fmt(
            "select %s from %s", fields.empty() ? "*" : concatStringsSep(", ", fields), table.to_string());
        if (where)
            s += fmt(" where %s %s %s", where->field, where->op, where->value.show());
        return s;
    }
};

std::vector<std::string> tokenize(std::string_view text)
{
    std::vector<std::string> tokens;
    size_t pos = 0;

    while (pos < text.size()) {
        auto c = text[pos];
        if (isspace((unsigned char) c)) {
            pos++;
        } else if (c == ',') {
            tokens.push_back(",");
            pos++;
        } else if (c == '\'') {
            auto end = text.find('\'', pos + 1);
            if (end == text.npos)
                throw QueryError("unterminated string in query '%s'", text);
            tokens.emplace_back(text.substr(pos, end - pos + 1));
            pos = end + 1;
        } else if (std::string_view("<>=!").find(c) != std::string_view::npos) {
            auto end = text.find_first_not_of("<>=!", pos);
            if (end == text.npos)
                end = text.size();
            tokens.emplace_back(text.substr(pos, end - pos));
            pos = end;
        } else {
            auto end = text.find_first_of(" \t\n,<>=!'", pos);
            if (end == text.npos)
                end = text.size();
            tokens.emplace_back(text.substr(pos, end - pos));
            pos = end;
        }
    }

    return tokens;
}

Operand parseOperand(const std::string & token, std::string_view text)
{
    if (hasPrefix(token, ":") && token.size() > 1)
        return Operand{.var = token.substr(1)};

    if (hasPrefix(token, "'"))
        return Operand{.literal = token.substr(1, token.size() - 2)};

    if (token == "true" || token == "false")
        return Operand{.literal = token == "true"};

    auto value = nlohmann::json::parse(token, nullptr, /*allow_exceptions=*/false);
    if (value.is_number())
        return Operand{.literal = std::move(value)};

    throw QueryError("invalid value '%s' in query '%s'", token, text);
}

} // namespace

ref<QueryPlan> MiniSqlCompiler::compile(std::string_view text, const DirPath & base) const
{
    auto tokens = tokenize(text);
    size_t pos = 0;

    auto next = [&](std::string_view what) -> const std::string & {
        if (pos >= tokens.size())
            throw QueryError("expected %s at the end of query '%s'", what, text);
        return tokens[pos++];
    };

    auto expect = [&](std::string_view keyword) {
        if (next(fmt("'%s'", keyword)) != keyword)
            throw QueryError("expected '%s' in query '%s'", keyword, text);
    };

    expect("select");

    std::vector<std::string> fields;
    if (pos < tokens.size() && tokens[pos] == "*")
        pos++;
    else {
        while (true) {
            fields.push_back(next("a field name"));
            if (pos < tokens.size() && tokens[pos] == ",")
                pos++;
            else
                break;
        }
    }

    expect("from");

    auto & tableName = next("a table");
    auto table = [&]() {
        if (auto alias = get(tables, tableName))
            return *alias;
        try {
            return FilePath(CanonPath(tableName, base.canon()));
        } catch (BadPath &) {
            throw QueryError("invalid table '%s' in query '%s'", tableName, text);
        }
    }();

    std::optional<Condition> where;
    if (pos < tokens.size()) {
        expect("where");
        auto & field = next("a field name");
        auto & op = next("an operator");
        if (op != "=" && op != "!=" && op != "<" && op != "<=" && op != ">" && op != ">=")
            throw QueryError("unknown operator '%s' in query '%s'", op, text);
        auto value = parseOperand(next("a value"), text);
        where = Condition{.field = field, .op = op, .value = std::move(value)};
    }

    if (pos < tokens.size())
        throw QueryError("unexpected '%s' in query '%s'", tokens[pos], text);

    return make_ref<MiniSqlPlan>(std::move(fields), std::move(table), std::move(where));
}

} // namespace fedfs
