#pragma once

#include <string>
#include <string_view>
#include <vector>
#include "data/Records.hpp"

namespace lexicon {
namespace codec {

    // Encoders write compact JSON through nlohmann::json. Decoders parse with
    // simdjson. Both throw DatabaseError(ErrorCode::Decode) on malformed or
    // mistyped input.

    // Parses `json` and returns it re-serialized without whitespace.
    std::string compact(std::string_view json);

    std::string encodeGlossary(const std::vector<GlossaryEntry>& glossary);
    std::vector<GlossaryEntry> decodeGlossary(std::string_view json);

    std::string encodeStringList(const std::vector<std::string>& values);
    std::vector<std::string> decodeStringList(std::string_view json);

    std::string encodeStringMap(const KanjiStats& values);
    KanjiStats decodeStringMap(std::string_view json);

    std::string encodeCounts(const SummaryCounts& counts);
    SummaryCounts decodeCounts(std::string_view json);

}
}
