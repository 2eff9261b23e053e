#pragma once

#include <string>
#include <vector>
#include "data/Records.hpp"

namespace lexicon {

    struct ColumnDef {
        std::string name;
        std::string type;
        bool nullable;
    };

    struct IndexDef {
        std::string name;
        std::string column;
    };

    // One store. Every table except `dictionaries` gets a surrogate `id`
    // column fed by its own sequence.
    struct TableDef {
        StoreName store;
        std::string name;
        bool surrogateId;
        std::vector<ColumnDef> columns;
        std::vector<IndexDef> indexes;

        std::string sequenceName() const { return name + "_id_seq"; }
    };

    class Schema {
    public:
        static const std::vector<TableDef>& tables();
        static const TableDef& table(StoreName store);

        // Idempotent DDL, in execution order: sequences, tables, then indexes.
        static std::vector<std::string> createStatements();

        // INSERT with one positional parameter per column, in declaration order.
        static std::string insertStatement(StoreName store);

        static std::string quoteIdentifier(const std::string& name);
    };
}
