#include "codec/JsonCodec.hpp"
#include "core/Error.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <sstream>

namespace lexicon {
namespace codec {

    namespace {
        simdjson::dom::element parseDocument(simdjson::dom::parser& parser, std::string_view json,
                                             const char* what) {
            simdjson::padded_string padded(json);
            simdjson::dom::element doc;
            auto error = parser.parse(padded).get(doc);
            if (error) {
                std::ostringstream message;
                message << "Cannot decode " << what << ": " << simdjson::error_message(error);
                throw DatabaseError(ErrorCode::Decode, message.str());
            }
            return doc;
        }

        [[noreturn]] void mistyped(const char* what, const char* expected) {
            throw DatabaseError(ErrorCode::Decode,
                                std::string("Cannot decode ") + what + ": expected " + expected);
        }

        simdjson::dom::parser& localParser() {
            thread_local simdjson::dom::parser parser;
            return parser;
        }

        // Object members keep their insertion order so structured glossary
        // entries are stored as written.
        using json = nlohmann::ordered_json;

        std::string dump(const json& value, const char* what) {
            try {
                return value.dump();
            } catch (const json::exception& e) {
                throw DatabaseError(ErrorCode::Decode, std::string("Cannot encode ") + what + ": " + e.what());
            }
        }
    }

    std::string compact(std::string_view json) {
        auto& parser = localParser();
        simdjson::dom::element doc = parseDocument(parser, json, "payload");
        return simdjson::minify(doc);
    }

    std::string encodeGlossary(const std::vector<GlossaryEntry>& glossary) {
        json items = json::array();
        for (const auto& entry : glossary) {
            if (entry.kind == GlossaryEntry::Kind::Text) {
                items.push_back(entry.value);
                continue;
            }
            try {
                items.push_back(json::parse(entry.value));
            } catch (const json::parse_error& e) {
                throw DatabaseError(ErrorCode::Decode, std::string("Cannot encode glossary: ") + e.what());
            }
        }
        return dump(items, "glossary");
    }

    std::vector<GlossaryEntry> decodeGlossary(std::string_view json) {
        auto& parser = localParser();
        simdjson::dom::element doc = parseDocument(parser, json, "glossary");

        simdjson::dom::array items;
        if (doc.get(items) != simdjson::SUCCESS) {
            mistyped("glossary", "array");
        }

        std::vector<GlossaryEntry> glossary;
        for (simdjson::dom::element item : items) {
            std::string_view sv;
            if (item.get(sv) == simdjson::SUCCESS) {
                glossary.push_back(GlossaryEntry::text(std::string(sv)));
            } else {
                glossary.push_back(GlossaryEntry::structured(simdjson::minify(item)));
            }
        }
        return glossary;
    }

    std::string encodeStringList(const std::vector<std::string>& values) {
        return dump(json(values), "string list");
    }

    std::vector<std::string> decodeStringList(std::string_view json) {
        auto& parser = localParser();
        simdjson::dom::element doc = parseDocument(parser, json, "string list");

        simdjson::dom::array items;
        if (doc.get(items) != simdjson::SUCCESS) {
            mistyped("string list", "array");
        }

        std::vector<std::string> values;
        for (simdjson::dom::element item : items) {
            std::string_view sv;
            if (item.get(sv) != simdjson::SUCCESS) {
                mistyped("string list", "string element");
            }
            values.emplace_back(sv);
        }
        return values;
    }

    std::string encodeStringMap(const KanjiStats& values) {
        return dump(json(values), "string map");
    }

    KanjiStats decodeStringMap(std::string_view json) {
        auto& parser = localParser();
        simdjson::dom::element doc = parseDocument(parser, json, "string map");

        simdjson::dom::object object;
        if (doc.get(object) != simdjson::SUCCESS) {
            mistyped("string map", "object");
        }

        KanjiStats values;
        for (auto field : object) {
            std::string_view sv;
            if (field.value.get(sv) == simdjson::SUCCESS) {
                values[std::string(field.key)] = std::string(sv);
            } else {
                // Some dictionaries store numeric stats; keep their JSON text.
                values[std::string(field.key)] = simdjson::minify(field.value);
            }
        }
        return values;
    }

    std::string encodeCounts(const SummaryCounts& counts) {
        json stores = json::object();
        for (const auto& [store, counters] : counts) {
            stores[store] = json(counters);
        }
        return dump(stores, "counts");
    }

    SummaryCounts decodeCounts(std::string_view json) {
        auto& parser = localParser();
        simdjson::dom::element doc = parseDocument(parser, json, "counts");

        SummaryCounts counts;
        // Summaries written without counts serialize as null.
        if (doc.is_null()) {
            return counts;
        }

        simdjson::dom::object stores;
        if (doc.get(stores) != simdjson::SUCCESS) {
            mistyped("counts", "object");
        }

        for (auto store : stores) {
            simdjson::dom::object counters;
            if (store.value.get(counters) != simdjson::SUCCESS) {
                mistyped("counts", "object of counters");
            }
            auto& target = counts[std::string(store.key)];
            for (auto counter : counters) {
                int64_t value = 0;
                if (counter.value.get(value) != simdjson::SUCCESS) {
                    mistyped("counts", "integer counter");
                }
                target[std::string(counter.key)] = value;
            }
        }
        return counts;
    }

}
}
