#include "data/Schema.hpp"
#include <sstream>
#include <stdexcept>

namespace lexicon {

    namespace {
        const char* TEXT = "VARCHAR";
        const char* INT = "INTEGER";
        const char* BIGINT = "BIGINT";
        const char* BLOB = "BLOB";

        std::vector<TableDef> buildTables() {
            return {
                {StoreName::Dictionaries, "dictionaries", false,
                 {
                     {"title", TEXT, false},
                     {"version", BIGINT, false},
                     {"revision", TEXT, true},
                     {"sequenced", INT, true},
                     {"author", TEXT, true},
                     {"url", TEXT, true},
                     {"description", TEXT, true},
                     {"attribution", TEXT, true},
                     {"frequency_mode", TEXT, true},
                     {"prefix_wildcards_supported", INT, true},
                     {"styles", TEXT, true},
                     {"counts", TEXT, true},
                     {"yomitan_version", TEXT, true},
                 },
                 {}},
                {StoreName::Terms, "terms", true,
                 {
                     {"dictionary", TEXT, false},
                     {"expression", TEXT, false},
                     {"reading", TEXT, false},
                     {"expression_reverse", TEXT, true},
                     {"reading_reverse", TEXT, true},
                     {"definition_tags", TEXT, true},
                     {"rules", TEXT, false},
                     {"score", BIGINT, false},
                     {"glossary", TEXT, false},
                     {"sequence", BIGINT, true},
                     {"term_tags", TEXT, true},
                 },
                 {
                     {"idx_terms_dictionary", "dictionary"},
                     {"idx_terms_expression", "expression"},
                     {"idx_terms_reading", "reading"},
                     {"idx_terms_expression_reverse", "expression_reverse"},
                     {"idx_terms_reading_reverse", "reading_reverse"},
                     {"idx_terms_sequence", "sequence"},
                 }},
                {StoreName::TermMeta, "term_meta", true,
                 {
                     {"dictionary", TEXT, false},
                     {"term", TEXT, false},
                     {"mode", TEXT, false},
                     {"data", TEXT, false},
                 },
                 {
                     {"idx_term_meta_dictionary", "dictionary"},
                     {"idx_term_meta_term", "term"},
                     {"idx_term_meta_mode", "mode"},
                 }},
                {StoreName::Kanji, "kanji", true,
                 {
                     {"dictionary", TEXT, false},
                     {"character", TEXT, false},
                     {"onyomi", TEXT, false},
                     {"kunyomi", TEXT, false},
                     {"tags", TEXT, false},
                     {"meanings", TEXT, false},
                     {"stats", TEXT, true},
                 },
                 {
                     {"idx_kanji_dictionary", "dictionary"},
                     {"idx_kanji_character", "character"},
                 }},
                {StoreName::KanjiMeta, "kanji_meta", true,
                 {
                     {"dictionary", TEXT, false},
                     {"character", TEXT, false},
                     {"mode", TEXT, false},
                     {"data", TEXT, false},
                 },
                 {
                     {"idx_kanji_meta_dictionary", "dictionary"},
                     {"idx_kanji_meta_character", "character"},
                     {"idx_kanji_meta_mode", "mode"},
                 }},
                {StoreName::TagMeta, "tag_meta", true,
                 {
                     {"dictionary", TEXT, false},
                     {"name", TEXT, false},
                     {"category", TEXT, false},
                     {"order_value", BIGINT, false},
                     {"notes", TEXT, false},
                     {"score", BIGINT, false},
                 },
                 {
                     {"idx_tag_meta_dictionary", "dictionary"},
                     {"idx_tag_meta_name", "name"},
                     {"idx_tag_meta_category", "category"},
                 }},
                {StoreName::Media, "media", true,
                 {
                     {"dictionary", TEXT, false},
                     {"path", TEXT, false},
                     {"media_type", TEXT, false},
                     {"width", BIGINT, false},
                     {"height", BIGINT, false},
                     {"content", BLOB, false},
                 },
                 {
                     {"idx_media_dictionary", "dictionary"},
                     {"idx_media_path", "path"},
                 }},
            };
        }
    }

    const std::vector<TableDef>& Schema::tables() {
        static const std::vector<TableDef> definitions = buildTables();
        return definitions;
    }

    const TableDef& Schema::table(StoreName store) {
        for (const auto& def : tables()) {
            if (def.store == store) {
                return def;
            }
        }
        throw std::out_of_range(std::string("No table for store ") + storeNameToString(store));
    }

    std::string Schema::quoteIdentifier(const std::string& name) {
        std::string quoted = "\"";
        for (char c : name) {
            if (c == '"') quoted += '"';
            quoted += c;
        }
        quoted += '"';
        return quoted;
    }

    std::vector<std::string> Schema::createStatements() {
        std::vector<std::string> statements;

        for (const auto& def : tables()) {
            if (def.surrogateId) {
                statements.push_back("CREATE SEQUENCE IF NOT EXISTS " + def.sequenceName() + ";");
            }
        }

        for (const auto& def : tables()) {
            std::ostringstream sql;
            sql << "CREATE TABLE IF NOT EXISTS " << def.name << " (";
            bool first = true;
            if (def.surrogateId) {
                sql << "id BIGINT PRIMARY KEY DEFAULT nextval('" << def.sequenceName() << "')";
                first = false;
            }
            for (const auto& column : def.columns) {
                if (!first) sql << ", ";
                first = false;
                sql << quoteIdentifier(column.name) << " " << column.type;
                if (!def.surrogateId && column.name == "title") {
                    sql << " PRIMARY KEY";
                } else if (!column.nullable) {
                    sql << " NOT NULL";
                }
            }
            sql << ");";
            statements.push_back(sql.str());
        }

        for (const auto& def : tables()) {
            for (const auto& index : def.indexes) {
                statements.push_back("CREATE INDEX IF NOT EXISTS " + index.name + " ON " + def.name +
                                     " (" + quoteIdentifier(index.column) + ");");
            }
        }

        return statements;
    }

    std::string Schema::insertStatement(StoreName store) {
        const TableDef& def = table(store);
        std::ostringstream sql;
        sql << "INSERT INTO " << def.name << " (";
        for (size_t i = 0; i < def.columns.size(); ++i) {
            if (i > 0) sql << ", ";
            sql << quoteIdentifier(def.columns[i].name);
        }
        sql << ") VALUES (";
        for (size_t i = 0; i < def.columns.size(); ++i) {
            if (i > 0) sql << ", ";
            sql << "?";
        }
        sql << ")";
        return sql.str();
    }
}
