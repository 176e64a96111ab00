#pragma once
/**
 * @file
 *
 * A query compiler for tests, understanding just
 *
 *     select <field>[, <field>...] | * from <table> [where <field> <op> <value>]
 *
 * where `<op>` is one of `=`, `!=`, `<`, `<=`, `>`, `>=` and `<value>`
 * is a number, `true`, `false`, a single-quoted string without spaces
 * or a variable `:name`. `<table>` is an alias registered with the
 * compiler, an absolute file path, or a file path relative to the
 * directory the query is compiled in.
 */

#include "fedfs/mount/query.hh"

namespace fedfs {

class MiniSqlCompiler : public QueryCompiler
{
    std::map<std::string, FilePath, std::less<>> tables;

public:

    MiniSqlCompiler(std::map<std::string, FilePath, std::less<>> tables = {})
        : tables(std::move(tables))
    {
    }

    ref<QueryPlan> compile(std::string_view text, const DirPath & base) const override;
};

} // namespace fedfs
