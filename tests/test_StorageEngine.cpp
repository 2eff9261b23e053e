#include <gtest/gtest.h>
#include <filesystem>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "core/Error.hpp"
#include "data/StorageEngine.hpp"

namespace lexicon {
namespace test {

namespace {
    StorageOptions memoryOptions() {
        return StorageOptionsBuilder().inMemory().build();
    }

    TermRecord term(const std::string& dictionary, const std::string& expression,
                    const std::string& reading, int64_t score = 0) {
        TermRecord record;
        record.dictionary = dictionary;
        record.expression = expression;
        record.reading = reading;
        record.definitionTags = std::string("n");
        record.rules = "";
        record.score = score;
        record.glossary = {GlossaryEntry::text(expression + " gloss")};
        return record;
    }

    KanjiRecord kanji(const std::string& dictionary, const std::string& character) {
        KanjiRecord record;
        record.dictionary = dictionary;
        record.character = character;
        record.onyomi = "ニチ ジツ";
        record.kunyomi = "ひ";
        record.tags = "jouyou";
        record.meanings = {"day", "sun"};
        record.stats = KanjiStats{{"strokes", "4"}};
        return record;
    }

    DictionarySummary summary(const std::string& title) {
        DictionarySummary s;
        s.title = title;
        s.version = 3;
        s.revision = "rev1";
        return s;
    }

    std::vector<std::string> expressions(const std::vector<TermEntry>& entries) {
        std::vector<std::string> out;
        for (const auto& e : entries) {
            out.push_back(e.term);
        }
        return out;
    }

    // Holds the first open inside schema creation until released.
    class BlockingConnectionManager : public ConnectionManager {
    public:
        BlockingConnectionManager(std::promise<void>& entered, std::shared_future<void> release)
            : entered_(entered), release_(std::move(release)) {}

    protected:
        void createSchema(duckdb::Connection& con) override {
            if (!blocked_) {
                blocked_ = true;
                entered_.set_value();
                release_.wait();
            }
            ConnectionManager::createSchema(con);
        }

    private:
        std::promise<void>& entered_;
        std::shared_future<void> release_;
        bool blocked_ = false;
    };

    class UndeletableConnectionManager : public ConnectionManager {
    public:
        void dropStore(const std::string& name) override {
            throw DatabaseError(ErrorCode::Storage, "Cannot delete " + name + ": Device or resource busy");
        }
    };

    class StorageEngineFixture : public ::testing::Test {
    protected:
        void SetUp() override {
            engine.prepare();
        }

        void addTerms(const std::vector<TermRecord>& records) {
            engine.bulkAdd(records, 0, static_cast<int64_t>(records.size()));
        }

        StorageEngine engine{memoryOptions()};
        NameSet all{"jmdict", "other"};
    };
}


TEST(StorageEngineTest, PrepareAndClose) {
    StorageEngine engine(memoryOptions());
    EXPECT_FALSE(engine.isPrepared());
    engine.prepare();
    EXPECT_TRUE(engine.isPrepared());
    engine.close();
    EXPECT_FALSE(engine.isPrepared());
}

TEST(StorageEngineTest, DoublePrepareThrowsAlreadyOpen) {
    StorageEngine engine(memoryOptions());
    engine.prepare();
    try {
        engine.prepare();
        FAIL() << "expected DatabaseError";
    } catch (const DatabaseError& e) {
        EXPECT_EQ(e.code(), ErrorCode::AlreadyOpen);
    }
}

TEST(StorageEngineTest, LookupBeforePrepareThrowsNotOpen) {
    StorageEngine engine(memoryOptions());
    NameSet set{"jmdict"};
    try {
        engine.findTermsBulk({"x"}, set);
        FAIL() << "expected DatabaseError";
    } catch (const DatabaseError& e) {
        EXPECT_EQ(e.code(), ErrorCode::NotOpen);
    }
}

TEST(StorageEngineTest, EmptyInputDoesNotTouchStorage) {
    // Never prepared: any storage access would throw NotOpen.
    StorageEngine engine(memoryOptions());
    NameSet set;
    EXPECT_TRUE(engine.findTermsBulk({}, set).empty());
    EXPECT_TRUE(engine.findTermsExactBulk({}, set).empty());
    EXPECT_TRUE(engine.findTermsBySequenceBulk({}).empty());
    EXPECT_TRUE(engine.findKanjiBulk({}, set).empty());
    EXPECT_TRUE(engine.findTermMetaBulk({}, set).empty());
    EXPECT_TRUE(engine.findKanjiMetaBulk({}, set).empty());
    EXPECT_TRUE(engine.findTagMetaBulk({}).empty());
    EXPECT_TRUE(engine.getMedia({}).empty());
    EXPECT_NO_THROW(engine.bulkAdd(std::vector<TermRecord>{}, 0, 10));
}

// ============================================================
// Term lookups
// ============================================================

TEST_F(StorageEngineFixture, ExactLookupAfterBulkAdd) {
    addTerms({term("jmdict", "日本語", "にほんご", 5)});

    auto results = engine.findTermsBulk({"日本語"}, all, MatchType::Exact);

    ASSERT_EQ(results.size(), 1u);
    const TermEntry& entry = results[0];
    EXPECT_EQ(entry.index, 0u);
    EXPECT_EQ(entry.matchType, MatchType::Exact);
    EXPECT_EQ(entry.matchSource, MatchSource::Term);
    EXPECT_EQ(entry.term, "日本語");
    EXPECT_EQ(entry.reading, "にほんご");
    EXPECT_EQ(entry.dictionary, "jmdict");
    EXPECT_EQ(entry.score, 5);
    EXPECT_EQ(entry.definitionTags, std::vector<std::string>{"n"});
    EXPECT_TRUE(entry.rules.empty());
    EXPECT_TRUE(entry.termTags.empty());
    EXPECT_EQ(entry.sequence, 0);
    ASSERT_EQ(entry.definitions.size(), 1u);
    EXPECT_EQ(entry.definitions[0], GlossaryEntry::text("日本語 gloss"));
    EXPECT_GT(entry.id, 0);
}

TEST_F(StorageEngineFixture, SuffixLookup) {
    addTerms({term("jmdict", "日本語", "にほんご")});

    auto suffix = engine.findTermsBulk({"語"}, all, MatchType::Suffix);
    ASSERT_EQ(suffix.size(), 1u);
    EXPECT_EQ(suffix[0].term, "日本語");
    EXPECT_EQ(suffix[0].matchType, MatchType::Suffix);

    EXPECT_TRUE(engine.findTermsBulk({"本"}, all, MatchType::Suffix).empty());
}

TEST_F(StorageEngineFixture, PrefixAndAnywhereLookup) {
    addTerms({term("jmdict", "日本語", "にほんご"), term("jmdict", "日本", "にほん"), term("jmdict", "語学", "ごがく")});

    auto prefix = engine.findTermsBulk({"日本"}, all, MatchType::Prefix);
    EXPECT_EQ(expressions(prefix), (std::vector<std::string>{"日本語", "日本"}));

    auto anywhere = engine.findTermsBulk({"語"}, all, MatchType::Anywhere);
    EXPECT_EQ(expressions(anywhere), (std::vector<std::string>{"日本語", "語学"}));
}

TEST_F(StorageEngineFixture, PrefixRangeStopsAtNextCodePoint) {
    // 旦 (U+65E6) is the first code point after 日 (U+65E5).
    addTerms({term("jmdict", "日本", "にほん"), term("jmdict", "旦", "たん"), term("jmdict", "日", "ひ"),
              term("jmdict", "早日", "はやび")});

    EXPECT_EQ(expressions(engine.findTermsBulk({"日"}, all, MatchType::Prefix)),
              (std::vector<std::string>{"日本", "日"}));
    EXPECT_EQ(expressions(engine.findTermsBulk({"日"}, all, MatchType::Suffix)),
              (std::vector<std::string>{"日", "早日"}));
    EXPECT_TRUE(engine.findTermsBulk({"日本語"}, all, MatchType::Prefix).empty());
}

TEST_F(StorageEngineFixture, EmptyPrefixMatchesEverything) {
    addTerms({term("jmdict", "a", ""), term("jmdict", "\xF4\x8F\xBF\xBF", "")});
    EXPECT_EQ(engine.findTermsBulk({""}, all, MatchType::Prefix).size(), 2u);
    EXPECT_EQ(engine.findTermsBulk({"\xF4\x8F\xBF\xBF"}, all, MatchType::Prefix).size(), 1u);
}

TEST_F(StorageEngineFixture, MalformedUtf8IsRejected) {
    try {
        addTerms({term("jmdict", "\x81\x82\xE3", "")});
        FAIL() << "expected DatabaseError";
    } catch (const DatabaseError& e) {
        EXPECT_EQ(e.code(), ErrorCode::Storage);
    }
    EXPECT_THROW(engine.findTermsBulk({"\x81\x82\xE3"}, all, MatchType::Suffix), DatabaseError);
}

TEST_F(StorageEngineFixture, WildcardCharactersAreLiteral) {
    addTerms({term("jmdict", "100%", "ひゃくぱーせんと"), term("jmdict", "1000", "せん")});

    EXPECT_EQ(expressions(engine.findTermsBulk({"10%"}, all, MatchType::Anywhere)), std::vector<std::string>{});
    EXPECT_EQ(expressions(engine.findTermsBulk({"100%"}, all, MatchType::Prefix)),
              std::vector<std::string>{"100%"});
    EXPECT_TRUE(engine.findTermsBulk({"_"}, all, MatchType::Anywhere).empty());
}

TEST_F(StorageEngineFixture, DictionaryFiltering) {
    addTerms({term("jmdict", "猫", "ねこ"), term("other", "猫", "ねこ")});

    NameSet onlyJmdict{"jmdict"};
    auto results = engine.findTermsBulk({"猫"}, onlyJmdict);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].dictionary, "jmdict");

    EXPECT_EQ(engine.findTermsBulk({"猫"}, all).size(), 2u);

    NameSet none;
    EXPECT_TRUE(engine.findTermsBulk({"猫"}, none).empty());
}

TEST_F(StorageEngineFixture, ResultsGroupedByIndexThenInsertionOrder) {
    addTerms({term("jmdict", "b", "1"), term("jmdict", "a", "2"), term("other", "b", "3"), term("jmdict", "a", "4")});

    auto results = engine.findTermsBulk({"a", "missing", "b"}, all);

    ASSERT_EQ(results.size(), 4u);
    EXPECT_EQ(results[0].index, 0u);
    EXPECT_EQ(results[0].reading, "2");
    EXPECT_EQ(results[1].index, 0u);
    EXPECT_EQ(results[1].reading, "4");
    EXPECT_EQ(results[2].index, 2u);
    EXPECT_EQ(results[2].reading, "1");
    EXPECT_EQ(results[3].index, 2u);
    EXPECT_EQ(results[3].reading, "3");
    EXPECT_LT(results[0].id, results[1].id);
    EXPECT_LT(results[2].id, results[3].id);
}

TEST_F(StorageEngineFixture, ExactPairLookup) {
    addTerms({term("jmdict", "日", "ひ"), term("jmdict", "日", "にち")});

    auto results = engine.findTermsExactBulk({{"日", "にち"}, {"日", "か"}, {"日", "ひ"}}, all);

    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].index, 0u);
    EXPECT_EQ(results[0].reading, "にち");
    EXPECT_EQ(results[1].index, 2u);
    EXPECT_EQ(results[1].reading, "ひ");
    EXPECT_EQ(results[1].matchType, MatchType::Exact);
}

TEST_F(StorageEngineFixture, SequenceLookup) {
    TermRecord first = term("jmdict", "食べる", "たべる");
    first.sequence = 1358280;
    TermRecord second = term("other", "食べる", "たべる");
    second.sequence = 1358280;
    addTerms({first, second});

    auto results = engine.findTermsBySequenceBulk({{1358280, "jmdict"}, {1, "jmdict"}});

    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].dictionary, "jmdict");
    EXPECT_EQ(results[0].sequence, 1358280);
    EXPECT_EQ(results[0].matchSource, MatchSource::Sequence);
}

TEST_F(StorageEngineFixture, ReverseColumnsAreRecomputed) {
    TermRecord record = term("jmdict", "日本語", "にほんご");
    record.expressionReverse = std::string("bogus");
    record.readingReverse = std::string("bogus");
    addTerms({record});

    auto result = engine.findTermsBulk({"本日"}, all, MatchType::Suffix);
    EXPECT_TRUE(result.empty());
    EXPECT_EQ(engine.findTermsBulk({"本語"}, all, MatchType::Suffix).size(), 1u);
    EXPECT_TRUE(engine.findTermsBulk({"sugob"}, all, MatchType::Suffix).empty());
}

TEST_F(StorageEngineFixture, LegacyTagsFallback) {
    TermRecord record = term("jmdict", "走る", "はしる");
    record.definitionTags.reset();
    record.tags = std::string("v5r vi");
    record.rules = "v5";
    record.termTags = std::string("P ichi1");
    addTerms({record});

    auto results = engine.findTermsBulk({"走る"}, all);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].definitionTags, (std::vector<std::string>{"v5r", "vi"}));
    EXPECT_EQ(results[0].rules, std::vector<std::string>{"v5"});
    EXPECT_EQ(results[0].termTags, (std::vector<std::string>{"P", "ichi1"}));
}

TEST_F(StorageEngineFixture, StructuredGlossarySurvives) {
    TermRecord record = term("jmdict", "犬", "いぬ");
    record.glossary = {GlossaryEntry::text("dog"),
                       GlossaryEntry::structured(R"({"type": "image", "path": "img/dog.png"})")};
    addTerms({record});

    auto results = engine.findTermsBulk({"犬"}, all);
    ASSERT_EQ(results.size(), 1u);
    ASSERT_EQ(results[0].definitions.size(), 2u);
    EXPECT_EQ(results[0].definitions[0], GlossaryEntry::text("dog"));
    EXPECT_EQ(results[0].definitions[1],
              GlossaryEntry::structured(R"({"type":"image","path":"img/dog.png"})"));
}

// ============================================================
// Kanji, meta, tags, media
// ============================================================

TEST_F(StorageEngineFixture, KanjiIndexPreservation) {
    engine.bulkAdd(std::vector<KanjiRecord>{kanji("jmdict", "日"), kanji("jmdict", "月")}, 0, 2);

    auto results = engine.findKanjiBulk({"月", "火", "日"}, all);

    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].index, 0u);
    EXPECT_EQ(results[0].character, "月");
    EXPECT_EQ(results[1].index, 2u);
    EXPECT_EQ(results[1].character, "日");
    EXPECT_EQ(results[1].onyomi, (std::vector<std::string>{"ニチ", "ジツ"}));
    EXPECT_EQ(results[1].kunyomi, std::vector<std::string>{"ひ"});
    EXPECT_EQ(results[1].tags, std::vector<std::string>{"jouyou"});
    EXPECT_EQ(results[1].definitions, (std::vector<std::string>{"day", "sun"}));
    EXPECT_EQ(results[1].stats.at("strokes"), "4");
}

TEST_F(StorageEngineFixture, KanjiWithoutStats) {
    KanjiRecord record = kanji("other", "木");
    record.stats.reset();
    engine.bulkAdd(std::vector<KanjiRecord>{record}, 0, 1);

    auto results = engine.findKanjiBulk({"木"}, all);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_TRUE(results[0].stats.empty());

    NameSet onlyJmdict{"jmdict"};
    EXPECT_TRUE(engine.findKanjiBulk({"木"}, onlyJmdict).empty());
}

TEST_F(StorageEngineFixture, TermMetaLookup) {
    engine.bulkAdd(std::vector<TermMetaRecord>{
        {"jmdict", "日本", "freq", R"({ "value": 120 })"},
        {"other", "日本", "pitch", R"({"reading": "にほん", "pitches": [{"position": 2}]})"},
    }, 0, 2);

    auto results = engine.findTermMetaBulk({"日本"}, all);
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].mode, "freq");
    EXPECT_EQ(results[0].data, R"({"value":120})");
    EXPECT_EQ(results[1].mode, "pitch");
    EXPECT_EQ(results[1].dictionary, "other");
}

TEST_F(StorageEngineFixture, InvalidMetaPayloadIsRejected) {
    try {
        engine.bulkAdd(std::vector<TermMetaRecord>{{"jmdict", "x", "freq", "{oops"}}, 0, 1);
        FAIL() << "expected DatabaseError";
    } catch (const DatabaseError& e) {
        EXPECT_EQ(e.code(), ErrorCode::Decode);
    }
    EXPECT_TRUE(engine.findTermMetaBulk({"x"}, all).empty());
}

TEST_F(StorageEngineFixture, KanjiMetaLookup) {
    engine.bulkAdd(std::vector<KanjiMetaRecord>{{"jmdict", "日", "freq", "17"}}, 0, 1);

    auto results = engine.findKanjiMetaBulk({"月", "日"}, all);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].index, 1u);
    EXPECT_EQ(results[0].data, "17");
}

TEST_F(StorageEngineFixture, TagMetaLookup) {
    std::vector<TagRecord> tags = {
        {"n", "partOfSpeech", -3, "noun", 0, "jmdict"},
        {"n", "partOfSpeech", 0, "noun (other)", 1, "other"},
        {"P", "popular", 10, "popular term", 5, "jmdict"},
    };
    engine.bulkAdd(tags, 0, 3);

    auto results = engine.findTagMetaBulk({{"P", "jmdict"}, {"n", "other"}, {"v1", "jmdict"}});
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].index, 0u);
    EXPECT_EQ(results[0].tag.category, "popular");
    EXPECT_EQ(results[0].tag.score, 5);
    EXPECT_EQ(results[1].index, 1u);
    EXPECT_EQ(results[1].tag.notes, "noun (other)");
}

TEST_F(StorageEngineFixture, FindTagForTitleUsesLikePattern) {
    std::vector<TagRecord> tags = {
        {"jmdict-2024", "dictionary", 0, "", 0, "jmdict"},
        {"jmdict-2023", "dictionary", 0, "", 0, "jmdict"},
        {"kanjidic", "dictionary", 0, "", 0, "kanjidic"},
    };
    engine.bulkAdd(tags, 0, 3);

    auto matches = engine.findTagForTitle("jmdict%");
    ASSERT_EQ(matches.size(), 2u);
    EXPECT_EQ(matches[0].name, "jmdict-2024");
    EXPECT_EQ(engine.findTagForTitle("kanjidi_").size(), 1u);
    EXPECT_EQ(engine.findTagForTitle("JMDict%").size(), 2u);
    EXPECT_EQ(engine.findTagForTitle("KANJIDIC").size(), 1u);
    EXPECT_TRUE(engine.findTagForTitle("nothing").empty());
}

TEST_F(StorageEngineFixture, MediaLookup) {
    MediaRecord image;
    image.dictionary = "jmdict";
    image.path = "img/dog.png";
    image.mediaType = "image/png";
    image.width = 32;
    image.height = 16;
    image.content = {0x89, 'P', 'N', 'G', 0x00, 0xFF};
    engine.bulkAdd(std::vector<MediaRecord>{image}, 0, 1);

    auto results = engine.getMedia({{"img/cat.png", "jmdict"}, {"img/dog.png", "jmdict"}, {"img/dog.png", "other"}});
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].index, 1u);
    EXPECT_EQ(results[0].media.mediaType, "image/png");
    EXPECT_EQ(results[0].media.width, 32);
    EXPECT_EQ(results[0].media.height, 16);
    EXPECT_EQ(results[0].media.content, image.content);
}

// ============================================================
// Bulk add slices and transactions
// ============================================================

TEST_F(StorageEngineFixture, BulkAddSlice) {
    std::vector<TermRecord> records = {term("jmdict", "a", ""), term("jmdict", "b", ""),
                                       term("jmdict", "c", ""), term("jmdict", "d", "")};

    engine.bulkAdd(records, 1, 2);
    EXPECT_EQ(expressions(engine.findTermsBulk({"a", "b", "c", "d"}, all)),
              (std::vector<std::string>{"b", "c"}));

    engine.bulkAdd(records, 3, 100);
    engine.bulkAdd(records, 10, 5);
    engine.bulkAdd(records, 0, 0);
    engine.bulkAdd(records, 0, -1);
    EXPECT_EQ(expressions(engine.findTermsBulk({"a", "b", "c", "d"}, all)),
              (std::vector<std::string>{"b", "c", "d"}));
}

TEST_F(StorageEngineFixture, DuplicateTitleFailsAndRollsBack) {
    engine.bulkAdd(std::vector<DictionarySummary>{summary("jmdict")}, 0, 1);

    std::vector<DictionarySummary> batch = {summary("kanjidic"), summary("jmdict")};
    try {
        engine.bulkAdd(batch, 0, 2);
        FAIL() << "expected DatabaseError";
    } catch (const DatabaseError& e) {
        EXPECT_EQ(e.code(), ErrorCode::Storage);
    }

    EXPECT_FALSE(engine.dictionaryExists("kanjidic"));
    EXPECT_EQ(engine.getDictionaryInfo().size(), 1u);
}

TEST(StorageEngineTest, NonTransactionalBulkAddKeepsEarlierRows) {
    StorageEngine engine(StorageOptionsBuilder().inMemory().transactionalBulkAdd(false).build());
    engine.prepare();
    engine.bulkAdd(std::vector<DictionarySummary>{summary("jmdict")}, 0, 1);

    std::vector<DictionarySummary> batch = {summary("kanjidic"), summary("jmdict")};
    EXPECT_THROW(engine.bulkAdd(batch, 0, 2), DatabaseError);

    EXPECT_TRUE(engine.dictionaryExists("kanjidic"));
}

// ============================================================
// Dictionary info and counts
// ============================================================

TEST_F(StorageEngineFixture, DictionaryInfoRoundTrip) {
    DictionarySummary full = summary("jmdict");
    full.sequenced = true;
    full.author = std::string("EDRDG");
    full.url = std::string("https://example.org");
    full.frequencyMode = FrequencyMode::RankBased;
    full.prefixWildcardsSupported = true;
    full.styles = ".gloss { color: red; }";
    full.toolVersion = std::string("2.1");
    full.counts = SummaryCounts{{"terms", {{"total", 3}}}};

    DictionarySummary minimal;
    minimal.title = "kanjidic";
    minimal.version = 1;

    engine.bulkAdd(std::vector<DictionarySummary>{full, minimal}, 0, 2);
    auto info = engine.getDictionaryInfo();

    ASSERT_EQ(info.size(), 2u);
    EXPECT_EQ(info[0].title, "jmdict");
    EXPECT_EQ(info[0].version, 3);
    EXPECT_EQ(info[0].revision, "rev1");
    EXPECT_TRUE(info[0].sequenced);
    EXPECT_EQ(info[0].author, std::optional<std::string>("EDRDG"));
    EXPECT_FALSE(info[0].description.has_value());
    EXPECT_EQ(info[0].frequencyMode, std::optional<FrequencyMode>(FrequencyMode::RankBased));
    EXPECT_TRUE(info[0].prefixWildcardsSupported);
    EXPECT_EQ(info[0].styles, ".gloss { color: red; }");
    EXPECT_EQ(info[0].toolVersion, std::optional<std::string>("2.1"));
    ASSERT_TRUE(info[0].counts.has_value());
    EXPECT_EQ(info[0].counts->at("terms").at("total"), 3);

    EXPECT_EQ(info[1].title, "kanjidic");
    EXPECT_FALSE(info[1].sequenced);
    EXPECT_FALSE(info[1].prefixWildcardsSupported);
    EXPECT_FALSE(info[1].frequencyMode.has_value());
    EXPECT_FALSE(info[1].counts.has_value());
    EXPECT_EQ(info[1].revision, "");
    EXPECT_EQ(info[1].styles, "");

    EXPECT_TRUE(engine.dictionaryExists("jmdict"));
    EXPECT_FALSE(engine.dictionaryExists("missing"));
}

TEST_F(StorageEngineFixture, LargeVersionIsNotTruncated) {
    DictionarySummary dated = summary("jmdict");
    dated.version = 20240115123045;
    engine.bulkAdd(std::vector<DictionarySummary>{dated}, 0, 1);

    auto info = engine.getDictionaryInfo();
    ASSERT_EQ(info.size(), 1u);
    EXPECT_EQ(info[0].version, 20240115123045);
}

TEST_F(StorageEngineFixture, CountsWithTotal) {
    addTerms({term("jmdict", "一", ""), term("jmdict", "二", ""), term("other", "三", "")});
    engine.bulkAdd(std::vector<KanjiRecord>{kanji("jmdict", "一"), kanji("other", "二")}, 0, 2);

    auto counts = engine.getDictionaryCounts({"jmdict", "other"}, true);

    ASSERT_EQ(counts.counts.size(), 2u);
    EXPECT_EQ(counts.counts[0].terms, 2);
    EXPECT_EQ(counts.counts[0].kanji, 1);
    EXPECT_EQ(counts.counts[1].terms, 1);
    EXPECT_EQ(counts.counts[1].kanji, 1);
    ASSERT_TRUE(counts.total.has_value());
    EXPECT_EQ(counts.total->terms, 3);
    EXPECT_EQ(counts.total->kanji, 2);
    EXPECT_EQ(counts.total->termMeta, 0);
    EXPECT_EQ(counts.total->media, 0);
}

TEST_F(StorageEngineFixture, CountsWithoutTotal) {
    auto counts = engine.getDictionaryCounts({"nothing"}, false);
    EXPECT_FALSE(counts.total.has_value());
    ASSERT_EQ(counts.counts.size(), 1u);
    EXPECT_EQ(counts.counts[0], CountGroup{});
}

// ============================================================
// Purge
// ============================================================

TEST_F(StorageEngineFixture, PurgeEmptiesStore) {
    engine.bulkAdd(std::vector<DictionarySummary>{summary("jmdict")}, 0, 1);
    addTerms({term("jmdict", "日本語", "にほんご")});

    EXPECT_TRUE(engine.purge());

    EXPECT_TRUE(engine.isPrepared());
    EXPECT_TRUE(engine.getDictionaryInfo().empty());
    EXPECT_TRUE(engine.findTermsBulk({"日本語"}, all).empty());
}

TEST(StorageEngineTest, PurgeDeletesFileStore) {
    namespace fs = std::filesystem;
    fs::path dir = fs::temp_directory_path() / "lexicon_engine_purge";
    fs::remove_all(dir);
    std::string path = (dir / "dict.duckdb").string();

    {
        StorageEngine engine(StorageOptionsBuilder().path(path).build());
        engine.prepare();
        engine.bulkAdd(std::vector<DictionarySummary>{summary("jmdict")}, 0, 1);
        EXPECT_TRUE(engine.purge());
        EXPECT_TRUE(engine.getDictionaryInfo().empty());
    }
    {
        StorageEngine reopened(StorageOptionsBuilder().path(path).build());
        reopened.prepare();
        EXPECT_FALSE(reopened.dictionaryExists("jmdict"));
    }

    fs::remove_all(dir);
}

TEST(StorageEngineTest, PurgeWhileOpeningThrows) {
    std::promise<void> entered;
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();

    StorageEngine engine(memoryOptions(), std::make_unique<BlockingConnectionManager>(entered, released));
    std::thread opener([&engine] { engine.prepare(); });
    entered.get_future().wait();

    try {
        engine.purge();
        ADD_FAILURE() << "expected DatabaseError";
    } catch (const DatabaseError& e) {
        EXPECT_EQ(e.code(), ErrorCode::CannotPurgeWhileOpening);
    }

    release.set_value();
    opener.join();
    EXPECT_TRUE(engine.isPrepared());
}

TEST(StorageEngineTest, FailedDeletionReportsFalseAndReopens) {
    StorageEngine engine(memoryOptions(), std::make_unique<UndeletableConnectionManager>());
    engine.prepare();
    engine.bulkAdd(std::vector<DictionarySummary>{summary("jmdict")}, 0, 1);

    EXPECT_FALSE(engine.purge());
    EXPECT_TRUE(engine.isPrepared());
    EXPECT_NO_THROW(engine.getDictionaryInfo());
}

TEST(StorageEngineTest, RequiresConnectionManager) {
    EXPECT_THROW(StorageEngine(memoryOptions(), nullptr), std::invalid_argument);
}

TEST(StorageEngineTest, PurgeOfClosedEngineReopens) {
    StorageEngine engine(memoryOptions());
    EXPECT_TRUE(engine.purge());
    EXPECT_TRUE(engine.isPrepared());
}

}
}
