#include "data/Records.hpp"

namespace lexicon {

    const char* storeNameToString(StoreName store) {
        switch (store) {
            case StoreName::Dictionaries: return "dictionaries";
            case StoreName::Terms: return "terms";
            case StoreName::TermMeta: return "termMeta";
            case StoreName::Kanji: return "kanji";
            case StoreName::KanjiMeta: return "kanjiMeta";
            case StoreName::TagMeta: return "tagMeta";
            case StoreName::Media: return "media";
        }
        return "";
    }

    const char* matchTypeToString(MatchType type) {
        switch (type) {
            case MatchType::Exact: return "exact";
            case MatchType::Prefix: return "prefix";
            case MatchType::Suffix: return "suffix";
            case MatchType::Anywhere: return "anywhere";
        }
        return "";
    }

    const char* frequencyModeToString(FrequencyMode mode) {
        switch (mode) {
            case FrequencyMode::OccurrenceBased: return "occurrence-based";
            case FrequencyMode::RankBased: return "rank-based";
        }
        return "";
    }

    std::optional<FrequencyMode> frequencyModeFromString(const std::string& name) {
        if (name == "occurrence-based") return FrequencyMode::OccurrenceBased;
        if (name == "rank-based") return FrequencyMode::RankBased;
        return std::nullopt;
    }
}
