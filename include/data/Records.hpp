#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace lexicon {

    enum class StoreName {
        Dictionaries,
        Terms,
        TermMeta,
        Kanji,
        KanjiMeta,
        TagMeta,
        Media
    };

    enum class MatchType {
        Exact,
        Prefix,
        Suffix,
        Anywhere
    };

    enum class MatchSource {
        Term,
        Reading,
        Sequence
    };

    enum class FrequencyMode {
        OccurrenceBased,
        RankBased
    };

    // One definition of a term. Plain strings are kept as text; anything else
    // (structured content, images, deinflection arrays) is kept as compact JSON.
    struct GlossaryEntry {
        enum class Kind { Text, Structured };

        Kind kind = Kind::Text;
        std::string value;

        static GlossaryEntry text(std::string value) {
            return GlossaryEntry{Kind::Text, std::move(value)};
        }
        static GlossaryEntry structured(std::string json) {
            return GlossaryEntry{Kind::Structured, std::move(json)};
        }

        bool operator==(const GlossaryEntry& other) const {
            return kind == other.kind && value == other.value;
        }
        bool operator!=(const GlossaryEntry& other) const { return !(*this == other); }
    };

    // Import summary counters, e.g. {"terms": {"total": 120}, "termMeta": {"freq": 40}}.
    using SummaryCounts = std::map<std::string, std::map<std::string, int64_t>>;

    using KanjiStats = std::map<std::string, std::string>;

    struct DictionarySummary {
        std::string title;
        int64_t version = 0;
        std::string revision;
        bool sequenced = false;
        std::optional<std::string> author;
        std::optional<std::string> url;
        std::optional<std::string> description;
        std::optional<std::string> attribution;
        std::optional<FrequencyMode> frequencyMode;
        bool prefixWildcardsSupported = false;
        std::string styles;
        std::optional<SummaryCounts> counts;
        std::optional<std::string> toolVersion;
    };

    // ------------------------------------------------------------------
    // Insert items, as delivered by an importer.
    // ------------------------------------------------------------------

    struct TermRecord {
        std::string dictionary;
        std::string expression;
        std::string reading;
        // Ignored on insert; the stored columns are always recomputed.
        std::optional<std::string> expressionReverse;
        std::optional<std::string> readingReverse;
        std::optional<std::string> definitionTags;
        // Legacy name for definitionTags.
        std::optional<std::string> tags;
        std::string rules;
        int64_t score = 0;
        std::vector<GlossaryEntry> glossary;
        std::optional<int64_t> sequence;
        std::optional<std::string> termTags;
    };

    struct TermMetaRecord {
        std::string dictionary;
        std::string term;
        std::string mode;
        std::string data;
    };

    struct KanjiRecord {
        std::string dictionary;
        std::string character;
        std::string onyomi;
        std::string kunyomi;
        std::string tags;
        std::vector<std::string> meanings;
        std::optional<KanjiStats> stats;
    };

    struct KanjiMetaRecord {
        std::string dictionary;
        std::string character;
        std::string mode;
        std::string data;
    };

    struct TagRecord {
        std::string name;
        std::string category;
        int64_t order = 0;
        std::string notes;
        int64_t score = 0;
        std::string dictionary;
    };

    struct MediaRecord {
        std::string dictionary;
        std::string path;
        std::string mediaType;
        int64_t width = 0;
        int64_t height = 0;
        std::vector<uint8_t> content;
    };

    // ------------------------------------------------------------------
    // Lookup keys.
    // ------------------------------------------------------------------

    struct TermReadingQuery {
        std::string term;
        std::string reading;
    };

    struct SequenceQuery {
        int64_t sequence = 0;
        std::string dictionary;
    };

    struct TagQuery {
        std::string name;
        std::string dictionary;
    };

    struct MediaQuery {
        std::string path;
        std::string dictionary;
    };

    // ------------------------------------------------------------------
    // Lookup results. `index` is the position of the originating key.
    // ------------------------------------------------------------------

    struct TermEntry {
        size_t index = 0;
        MatchType matchType = MatchType::Exact;
        MatchSource matchSource = MatchSource::Term;
        std::string term;
        std::string reading;
        std::vector<std::string> definitionTags;
        std::vector<std::string> termTags;
        std::vector<std::string> rules;
        std::vector<GlossaryEntry> definitions;
        int64_t score = 0;
        std::string dictionary;
        int64_t id = 0;
        int64_t sequence = 0;
    };

    struct TermMetaEntry {
        size_t index = 0;
        std::string term;
        std::string mode;
        std::string data;
        std::string dictionary;
    };

    struct KanjiEntry {
        size_t index = 0;
        std::string character;
        std::vector<std::string> onyomi;
        std::vector<std::string> kunyomi;
        std::vector<std::string> tags;
        std::vector<std::string> definitions;
        KanjiStats stats;
        std::string dictionary;
    };

    struct KanjiMetaEntry {
        size_t index = 0;
        std::string character;
        std::string mode;
        std::string data;
        std::string dictionary;
    };

    struct TagEntry {
        size_t index = 0;
        TagRecord tag;
    };

    struct MediaEntry {
        size_t index = 0;
        MediaRecord media;
    };

    struct CountGroup {
        int64_t terms = 0;
        int64_t kanji = 0;
        int64_t termMeta = 0;
        int64_t kanjiMeta = 0;
        int64_t tagMeta = 0;
        int64_t media = 0;

        CountGroup& operator+=(const CountGroup& other) {
            terms += other.terms;
            kanji += other.kanji;
            termMeta += other.termMeta;
            kanjiMeta += other.kanjiMeta;
            tagMeta += other.tagMeta;
            media += other.media;
            return *this;
        }

        bool operator==(const CountGroup& other) const {
            return terms == other.terms && kanji == other.kanji &&
                   termMeta == other.termMeta && kanjiMeta == other.kanjiMeta &&
                   tagMeta == other.tagMeta && media == other.media;
        }
    };

    struct DictionaryCounts {
        std::optional<CountGroup> total;
        std::vector<CountGroup> counts;
    };

    const char* storeNameToString(StoreName store);
    const char* matchTypeToString(MatchType type);
    const char* frequencyModeToString(FrequencyMode mode);
    std::optional<FrequencyMode> frequencyModeFromString(const std::string& name);
}
