#include "data/StorageEngine.hpp"
#include "codec/JsonCodec.hpp"
#include "core/Error.hpp"
#include "core/Utf8.hpp"
#include "data/Schema.hpp"
#include <algorithm>
#include <exception>
#include <future>
#include <iostream>
#include <iterator>
#include <stdexcept>

namespace lexicon {

    namespace {
        using Params = duckdb::vector<duckdb::Value>;
        using Rows = duckdb::MaterializedQueryResult;

        const char* SELECT_TERMS =
            "SELECT id, dictionary, expression, reading, definition_tags, rules, score, glossary, "
            "\"sequence\", term_tags FROM terms ";

        const char* SELECT_KANJI =
            "SELECT dictionary, \"character\", onyomi, kunyomi, tags, meanings, stats "
            "FROM kanji WHERE \"character\" = ? ORDER BY id";

        const char* SELECT_TERM_META =
            "SELECT dictionary, term, mode, data FROM term_meta WHERE term = ? ORDER BY id";

        const char* SELECT_KANJI_META =
            "SELECT dictionary, \"character\", mode, data FROM kanji_meta "
            "WHERE \"character\" = ? ORDER BY id";

        const char* SELECT_TAGS =
            "SELECT dictionary, name, category, order_value, notes, score FROM tag_meta ";

        const char* SELECT_MEDIA =
            "SELECT dictionary, path, media_type, width, height, content FROM media "
            "WHERE path = ? AND dictionary = ? ORDER BY id";

        const char* SELECT_DICTIONARIES =
            "SELECT title, version, revision, sequenced, author, url, description, attribution, "
            "frequency_mode, prefix_wildcards_supported, styles, counts, yomitan_version "
            "FROM dictionaries ORDER BY rowid";

        std::unique_ptr<duckdb::PreparedStatement> prepareStatement(duckdb::Connection& con,
                                                                    const std::string& sql) {
            auto stmt = con.Prepare(sql);
            if (stmt->HasError()) {
                std::cerr << "[ENGINE] Prepare failed: " << stmt->GetError() << std::endl;
                throw DatabaseError(ErrorCode::Storage, "Prepare failed: " + stmt->GetError());
            }
            return stmt;
        }

        std::unique_ptr<duckdb::QueryResult> execute(duckdb::PreparedStatement& stmt, Params& params) {
            auto result = stmt.Execute(params, false);
            if (result->HasError()) {
                throw DatabaseError(ErrorCode::Storage, result->GetError());
            }
            return result;
        }

        Params makeParams(std::initializer_list<duckdb::Value> values) {
            Params params;
            params.reserve(values.size());
            for (const auto& value : values) {
                params.push_back(value);
            }
            return params;
        }

        duckdb::Value text(const std::string& value) {
            try {
                return duckdb::Value(value);
            } catch (const std::exception& e) {
                throw DatabaseError(ErrorCode::Storage, std::string("Invalid text value: ") + e.what());
            }
        }

        duckdb::Value optionalText(const std::optional<std::string>& value) {
            return value ? text(*value) : duckdb::Value(duckdb::LogicalType::VARCHAR);
        }

        duckdb::Value integer(int64_t value) {
            return duckdb::Value::BIGINT(value);
        }

        duckdb::Value flag(bool value) {
            return duckdb::Value::INTEGER(value ? 1 : 0);
        }

        std::string textAt(Rows& rows, duckdb::idx_t col, duckdb::idx_t row) {
            duckdb::Value value = rows.GetValue(col, row);
            return value.IsNull() ? std::string() : duckdb::StringValue::Get(value);
        }

        std::optional<std::string> optionalTextAt(Rows& rows, duckdb::idx_t col, duckdb::idx_t row) {
            duckdb::Value value = rows.GetValue(col, row);
            if (value.IsNull()) {
                return std::nullopt;
            }
            return duckdb::StringValue::Get(value);
        }

        int64_t integerAt(Rows& rows, duckdb::idx_t col, duckdb::idx_t row) {
            duckdb::Value value = rows.GetValue(col, row);
            return value.IsNull() ? 0 : value.GetValue<int64_t>();
        }

        TermEntry decodeTerm(Rows& rows, duckdb::idx_t row, size_t index,
                             MatchType matchType, MatchSource matchSource) {
            TermEntry entry;
            entry.index = index;
            entry.matchType = matchType;
            entry.matchSource = matchSource;
            entry.id = integerAt(rows, 0, row);
            entry.dictionary = textAt(rows, 1, row);
            entry.term = textAt(rows, 2, row);
            entry.reading = textAt(rows, 3, row);
            entry.definitionTags = splitTokens(textAt(rows, 4, row));
            entry.rules = splitTokens(textAt(rows, 5, row));
            entry.score = integerAt(rows, 6, row);
            entry.definitions = codec::decodeGlossary(textAt(rows, 7, row));
            entry.sequence = integerAt(rows, 8, row);
            entry.termTags = splitTokens(textAt(rows, 9, row));
            return entry;
        }

        TagRecord decodeTag(Rows& rows, duckdb::idx_t row) {
            TagRecord tag;
            tag.dictionary = textAt(rows, 0, row);
            tag.name = textAt(rows, 1, row);
            tag.category = textAt(rows, 2, row);
            tag.order = integerAt(rows, 3, row);
            tag.notes = textAt(rows, 4, row);
            tag.score = integerAt(rows, 5, row);
            return tag;
        }

        std::string termMatchClause(MatchType matchType) {
            switch (matchType) {
                case MatchType::Exact: return "WHERE expression = ?";
                // Prefix matches as a half-open range [$1, $2) so the column index
                // serves it. $2 is NULL when the prefix has no upper bound.
                case MatchType::Prefix:
                    return "WHERE expression >= $1 AND ($2 IS NULL OR expression < $2)";
                // Suffix search is a prefix search over the reversed projection.
                case MatchType::Suffix:
                    return "WHERE expression_reverse >= $1 AND ($2 IS NULL OR expression_reverse < $2)";
                case MatchType::Anywhere: return "WHERE contains(expression, ?)";
            }
            return "WHERE expression = ?";
        }
    }

    StorageEngine::StorageEngine(StorageOptions options)
        : StorageEngine(options, std::make_unique<ConnectionManager>(options.verbose))
    {
    }

    StorageEngine::StorageEngine(StorageOptions options, std::unique_ptr<ConnectionManager> connection)
        : options_(std::move(options)), connection_(std::move(connection)), prepared_(false)
    {
        if (!connection_) {
            throw std::invalid_argument("StorageEngine requires a connection manager");
        }
        if (options_.lookupThreads > 1) {
            pool_ = std::make_unique<ThreadPool>(options_.lookupThreads);
        }
    }

    StorageEngine::~StorageEngine() {
        close();
    }

    void StorageEngine::prepare() {
        connection_->open(options_.path);
        prepared_ = true;
    }

    void StorageEngine::close() {
        connection_->close();
        prepared_ = false;
    }

    bool StorageEngine::purge() {
        if (connection_->isOpening()) {
            throw DatabaseError(ErrorCode::CannotPurgeWhileOpening, "Cannot purge database while opening");
        }

        if (connection_->isOpen()) {
            close();
        }

        bool deleted = false;
        try {
            connection_->dropStore(options_.path);
            deleted = true;
        } catch (const DatabaseError& e) {
            std::cerr << "[ENGINE] Purge could not delete store (" << errorCodeName(e.code()) << "): "
                      << e.what() << std::endl;
        }

        prepare();
        if (options_.verbose) {
            std::cout << "[ENGINE] Purged " << options_.path << (deleted ? "" : " (store not deleted)") << std::endl;
        }
        return deleted;
    }

    template <typename Entry, typename Key, typename Bind, typename Decode>
    std::vector<Entry> StorageEngine::lookupBulk(const std::vector<Key>& keys, const std::string& sql,
                                                 Bind bind, Decode decode) {
        std::vector<Entry> results;
        if (keys.empty()) {
            return results;
        }

        std::vector<std::vector<Entry>> perKey(keys.size());
        auto runRange = [&keys, &sql, &bind, &decode, &perKey](duckdb::Connection& con, size_t begin, size_t end) {
            auto stmt = prepareStatement(con, sql);
            for (size_t i = begin; i < end; ++i) {
                Params params = bind(keys[i]);
                auto result = execute(*stmt, params);
                auto& rows = result->Cast<Rows>();
                for (duckdb::idx_t row = 0; row < rows.RowCount(); ++row) {
                    decode(rows, row, i, perKey[i]);
                }
            }
        };

        if (!pool_ || keys.size() < 2) {
            runRange(connection_->getHandle(), 0, keys.size());
        } else {
            size_t chunks = std::min(pool_->size(), keys.size());
            size_t chunkSize = (keys.size() + chunks - 1) / chunks;

            std::vector<std::unique_ptr<duckdb::Connection>> connections;
            for (size_t begin = 0; begin < keys.size(); begin += chunkSize) {
                connections.push_back(connection_->createConnection());
            }

            std::vector<std::future<void>> pending;
            size_t begin = 0;
            for (auto& con : connections) {
                size_t end = std::min(begin + chunkSize, keys.size());
                duckdb::Connection* raw = con.get();
                pending.push_back(pool_->submit([raw, begin, end, &runRange]() {
                    runRange(*raw, begin, end);
                }));
                begin = end;
            }

            std::exception_ptr firstError;
            for (auto& future : pending) {
                try {
                    future.get();
                } catch (...) {
                    if (!firstError) {
                        firstError = std::current_exception();
                    }
                }
            }
            if (firstError) {
                std::rethrow_exception(firstError);
            }
        }

        size_t total = 0;
        for (const auto& entries : perKey) {
            total += entries.size();
        }
        results.reserve(total);
        for (auto& entries : perKey) {
            std::move(entries.begin(), entries.end(), std::back_inserter(results));
        }
        return results;
    }

    std::vector<TermEntry> StorageEngine::findTermsBulk(const std::vector<std::string>& terms,
                                                        const DictionarySet& dictionaries,
                                                        MatchType matchType) {
        std::string sql = std::string(SELECT_TERMS) + termMatchClause(matchType) + " ORDER BY id";
        auto entries = lookupBulk<TermEntry>(
            terms, sql,
            [matchType](const std::string& term) {
                if (matchType == MatchType::Prefix || matchType == MatchType::Suffix) {
                    std::string lower = matchType == MatchType::Suffix ? reverseCodePoints(term) : term;
                    return makeParams({text(lower), optionalText(prefixUpperBound(lower))});
                }
                return makeParams({text(term)});
            },
            [&dictionaries, matchType](Rows& rows, duckdb::idx_t row, size_t index, std::vector<TermEntry>& out) {
                if (!dictionaries.has(textAt(rows, 1, row))) {
                    return;
                }
                out.push_back(decodeTerm(rows, row, index, matchType, MatchSource::Term));
            });

        if (options_.verbose && !terms.empty()) {
            std::cout << "[ENGINE] findTermsBulk(" << matchTypeToString(matchType) << "): "
                      << terms.size() << " keys, " << entries.size() << " rows" << std::endl;
        }
        return entries;
    }

    std::vector<TermEntry> StorageEngine::findTermsExactBulk(const std::vector<TermReadingQuery>& queries,
                                                             const DictionarySet& dictionaries) {
        std::string sql = std::string(SELECT_TERMS) + "WHERE expression = ? AND reading = ? ORDER BY id";
        return lookupBulk<TermEntry>(
            queries, sql,
            [](const TermReadingQuery& query) {
                return makeParams({text(query.term), text(query.reading)});
            },
            [&dictionaries](Rows& rows, duckdb::idx_t row, size_t index, std::vector<TermEntry>& out) {
                if (!dictionaries.has(textAt(rows, 1, row))) {
                    return;
                }
                out.push_back(decodeTerm(rows, row, index, MatchType::Exact, MatchSource::Term));
            });
    }

    std::vector<TermEntry> StorageEngine::findTermsBySequenceBulk(const std::vector<SequenceQuery>& queries) {
        std::string sql = std::string(SELECT_TERMS) + "WHERE \"sequence\" = ? AND dictionary = ? ORDER BY id";
        return lookupBulk<TermEntry>(
            queries, sql,
            [](const SequenceQuery& query) {
                return makeParams({integer(query.sequence), text(query.dictionary)});
            },
            [](Rows& rows, duckdb::idx_t row, size_t index, std::vector<TermEntry>& out) {
                out.push_back(decodeTerm(rows, row, index, MatchType::Exact, MatchSource::Sequence));
            });
    }

    std::vector<KanjiEntry> StorageEngine::findKanjiBulk(const std::vector<std::string>& characters,
                                                         const DictionarySet& dictionaries) {
        return lookupBulk<KanjiEntry>(
            characters, SELECT_KANJI,
            [](const std::string& character) {
                return makeParams({text(character)});
            },
            [&dictionaries](Rows& rows, duckdb::idx_t row, size_t index, std::vector<KanjiEntry>& out) {
                std::string dictionary = textAt(rows, 0, row);
                if (!dictionaries.has(dictionary)) {
                    return;
                }
                KanjiEntry entry;
                entry.index = index;
                entry.dictionary = std::move(dictionary);
                entry.character = textAt(rows, 1, row);
                entry.onyomi = splitTokens(textAt(rows, 2, row));
                entry.kunyomi = splitTokens(textAt(rows, 3, row));
                entry.tags = splitTokens(textAt(rows, 4, row));
                entry.definitions = codec::decodeStringList(textAt(rows, 5, row));
                auto stats = optionalTextAt(rows, 6, row);
                if (stats) {
                    entry.stats = codec::decodeStringMap(*stats);
                }
                out.push_back(std::move(entry));
            });
    }

    std::vector<TermMetaEntry> StorageEngine::findTermMetaBulk(const std::vector<std::string>& terms,
                                                               const DictionarySet& dictionaries) {
        return lookupBulk<TermMetaEntry>(
            terms, SELECT_TERM_META,
            [](const std::string& term) {
                return makeParams({text(term)});
            },
            [&dictionaries](Rows& rows, duckdb::idx_t row, size_t index, std::vector<TermMetaEntry>& out) {
                std::string dictionary = textAt(rows, 0, row);
                if (!dictionaries.has(dictionary)) {
                    return;
                }
                TermMetaEntry entry;
                entry.index = index;
                entry.dictionary = std::move(dictionary);
                entry.term = textAt(rows, 1, row);
                entry.mode = textAt(rows, 2, row);
                entry.data = codec::compact(textAt(rows, 3, row));
                out.push_back(std::move(entry));
            });
    }

    std::vector<KanjiMetaEntry> StorageEngine::findKanjiMetaBulk(const std::vector<std::string>& characters,
                                                                 const DictionarySet& dictionaries) {
        return lookupBulk<KanjiMetaEntry>(
            characters, SELECT_KANJI_META,
            [](const std::string& character) {
                return makeParams({text(character)});
            },
            [&dictionaries](Rows& rows, duckdb::idx_t row, size_t index, std::vector<KanjiMetaEntry>& out) {
                std::string dictionary = textAt(rows, 0, row);
                if (!dictionaries.has(dictionary)) {
                    return;
                }
                KanjiMetaEntry entry;
                entry.index = index;
                entry.dictionary = std::move(dictionary);
                entry.character = textAt(rows, 1, row);
                entry.mode = textAt(rows, 2, row);
                entry.data = codec::compact(textAt(rows, 3, row));
                out.push_back(std::move(entry));
            });
    }

    std::vector<TagEntry> StorageEngine::findTagMetaBulk(const std::vector<TagQuery>& queries) {
        std::string sql = std::string(SELECT_TAGS) + "WHERE name = ? AND dictionary = ? ORDER BY id";
        return lookupBulk<TagEntry>(
            queries, sql,
            [](const TagQuery& query) {
                return makeParams({text(query.name), text(query.dictionary)});
            },
            [](Rows& rows, duckdb::idx_t row, size_t index, std::vector<TagEntry>& out) {
                out.push_back(TagEntry{index, decodeTag(rows, row)});
            });
    }

    std::vector<TagRecord> StorageEngine::findTagForTitle(const std::string& titlePattern) {
        auto& con = connection_->getHandle();
        auto stmt = prepareStatement(con, std::string(SELECT_TAGS) + "WHERE name ILIKE ? ORDER BY id");
        Params params = makeParams({text(titlePattern)});
        auto result = execute(*stmt, params);
        auto& rows = result->Cast<Rows>();

        std::vector<TagRecord> tags;
        tags.reserve(rows.RowCount());
        for (duckdb::idx_t row = 0; row < rows.RowCount(); ++row) {
            tags.push_back(decodeTag(rows, row));
        }
        return tags;
    }

    std::vector<MediaEntry> StorageEngine::getMedia(const std::vector<MediaQuery>& queries) {
        return lookupBulk<MediaEntry>(
            queries, SELECT_MEDIA,
            [](const MediaQuery& query) {
                return makeParams({text(query.path), text(query.dictionary)});
            },
            [](Rows& rows, duckdb::idx_t row, size_t index, std::vector<MediaEntry>& out) {
                MediaEntry entry;
                entry.index = index;
                entry.media.dictionary = textAt(rows, 0, row);
                entry.media.path = textAt(rows, 1, row);
                entry.media.mediaType = textAt(rows, 2, row);
                entry.media.width = integerAt(rows, 3, row);
                entry.media.height = integerAt(rows, 4, row);
                const std::string blob = textAt(rows, 5, row);
                entry.media.content.assign(blob.begin(), blob.end());
                out.push_back(std::move(entry));
            });
    }

    std::vector<DictionarySummary> StorageEngine::getDictionaryInfo() {
        auto& con = connection_->getHandle();
        auto result = con.Query(SELECT_DICTIONARIES);
        if (result->HasError()) {
            throw DatabaseError(ErrorCode::Storage, result->GetError());
        }

        std::vector<DictionarySummary> summaries;
        summaries.reserve(result->RowCount());
        for (duckdb::idx_t row = 0; row < result->RowCount(); ++row) {
            DictionarySummary summary;
            summary.title = textAt(*result, 0, row);
            summary.version = integerAt(*result, 1, row);
            summary.revision = textAt(*result, 2, row);
            summary.sequenced = integerAt(*result, 3, row) != 0;
            summary.author = optionalTextAt(*result, 4, row);
            summary.url = optionalTextAt(*result, 5, row);
            summary.description = optionalTextAt(*result, 6, row);
            summary.attribution = optionalTextAt(*result, 7, row);
            auto frequencyMode = optionalTextAt(*result, 8, row);
            if (frequencyMode) {
                summary.frequencyMode = frequencyModeFromString(*frequencyMode);
            }
            summary.prefixWildcardsSupported = integerAt(*result, 9, row) == 1;
            summary.styles = textAt(*result, 10, row);
            auto counts = optionalTextAt(*result, 11, row);
            if (counts) {
                summary.counts = codec::decodeCounts(*counts);
            }
            summary.toolVersion = optionalTextAt(*result, 12, row);
            summaries.push_back(std::move(summary));
        }
        return summaries;
    }

    DictionaryCounts StorageEngine::getDictionaryCounts(const std::vector<std::string>& dictionaryNames,
                                                        bool includeTotal) {
        static const StoreName countedStores[] = {
            StoreName::Terms, StoreName::Kanji, StoreName::TermMeta,
            StoreName::KanjiMeta, StoreName::TagMeta, StoreName::Media
        };

        DictionaryCounts result;
        if (includeTotal) {
            result.total = CountGroup{};
        }
        if (dictionaryNames.empty()) {
            return result;
        }

        auto& con = connection_->getHandle();
        std::vector<std::unique_ptr<duckdb::PreparedStatement>> statements;
        for (StoreName store : countedStores) {
            statements.push_back(prepareStatement(
                con, "SELECT count(*) FROM " + Schema::table(store).name + " WHERE dictionary = ?"));
        }

        for (const auto& name : dictionaryNames) {
            CountGroup group;
            for (size_t i = 0; i < statements.size(); ++i) {
                Params params = makeParams({text(name)});
                auto queryResult = execute(*statements[i], params);
                int64_t count = integerAt(queryResult->Cast<Rows>(), 0, 0);
                switch (countedStores[i]) {
                    case StoreName::Terms: group.terms = count; break;
                    case StoreName::Kanji: group.kanji = count; break;
                    case StoreName::TermMeta: group.termMeta = count; break;
                    case StoreName::KanjiMeta: group.kanjiMeta = count; break;
                    case StoreName::TagMeta: group.tagMeta = count; break;
                    case StoreName::Media: group.media = count; break;
                    case StoreName::Dictionaries: break;
                }
            }
            if (result.total) {
                *result.total += group;
            }
            result.counts.push_back(group);
        }
        return result;
    }

    bool StorageEngine::dictionaryExists(const std::string& title) {
        auto& con = connection_->getHandle();
        auto stmt = prepareStatement(con, "SELECT 1 FROM dictionaries WHERE title = ? LIMIT 1");
        Params params = makeParams({text(title)});
        auto result = execute(*stmt, params);
        return result->Cast<Rows>().RowCount() > 0;
    }

    template <typename Item, typename Bind>
    void StorageEngine::insertSlice(StoreName store, const std::vector<Item>& items,
                                    size_t start, int64_t count, Bind bind) {
        if (items.empty() || count <= 0 || start >= items.size()) {
            return;
        }
        size_t end = start + std::min(items.size() - start, static_cast<size_t>(count));

        auto& con = connection_->getHandle();
        auto stmt = prepareStatement(con, Schema::insertStatement(store));
        const bool transactional = options_.transactionalBulkAdd;

        if (transactional) {
            con.BeginTransaction();
        }
        try {
            for (size_t i = start; i < end; ++i) {
                Params params = bind(items[i]);
                execute(*stmt, params);
            }
            if (transactional) {
                con.Commit();
            }
        } catch (const std::exception& e) {
            std::cerr << "[ENGINE] bulkAdd(" << storeNameToString(store) << ") failed: " << e.what() << std::endl;
            if (transactional && con.HasActiveTransaction()) {
                con.Rollback();
            }
            throw;
        }

        if (options_.verbose) {
            std::cout << "[ENGINE] " << storeNameToString(store) << ": +" << (end - start) << " rows" << std::endl;
        }
    }

    void StorageEngine::bulkAdd(const std::vector<DictionarySummary>& items, size_t start, int64_t count) {
        insertSlice(StoreName::Dictionaries, items, start, count, [](const DictionarySummary& item) {
            std::optional<std::string> frequencyMode;
            if (item.frequencyMode) {
                frequencyMode = frequencyModeToString(*item.frequencyMode);
            }
            std::optional<std::string> counts;
            if (item.counts) {
                counts = codec::encodeCounts(*item.counts);
            }
            return makeParams({
                text(item.title),
                integer(item.version),
                text(item.revision),
                flag(item.sequenced),
                optionalText(item.author),
                optionalText(item.url),
                optionalText(item.description),
                optionalText(item.attribution),
                optionalText(frequencyMode),
                flag(item.prefixWildcardsSupported),
                text(item.styles),
                optionalText(counts),
                optionalText(item.toolVersion),
            });
        });
    }

    void StorageEngine::bulkAdd(const std::vector<TermRecord>& items, size_t start, int64_t count) {
        insertSlice(StoreName::Terms, items, start, count, [](const TermRecord& item) {
            std::optional<std::string> definitionTags = item.definitionTags;
            if ((!definitionTags || definitionTags->empty()) && item.tags) {
                definitionTags = item.tags;
            }
            return makeParams({
                text(item.dictionary),
                text(item.expression),
                text(item.reading),
                text(reverseCodePoints(item.expression)),
                text(reverseCodePoints(item.reading)),
                optionalText(definitionTags),
                text(item.rules),
                integer(item.score),
                text(codec::encodeGlossary(item.glossary)),
                item.sequence ? integer(*item.sequence) : duckdb::Value(duckdb::LogicalType::BIGINT),
                optionalText(item.termTags),
            });
        });
    }

    void StorageEngine::bulkAdd(const std::vector<TermMetaRecord>& items, size_t start, int64_t count) {
        insertSlice(StoreName::TermMeta, items, start, count, [](const TermMetaRecord& item) {
            return makeParams({
                text(item.dictionary),
                text(item.term),
                text(item.mode),
                text(codec::compact(item.data)),
            });
        });
    }

    void StorageEngine::bulkAdd(const std::vector<KanjiRecord>& items, size_t start, int64_t count) {
        insertSlice(StoreName::Kanji, items, start, count, [](const KanjiRecord& item) {
            std::optional<std::string> stats;
            if (item.stats) {
                stats = codec::encodeStringMap(*item.stats);
            }
            return makeParams({
                text(item.dictionary),
                text(item.character),
                text(item.onyomi),
                text(item.kunyomi),
                text(item.tags),
                text(codec::encodeStringList(item.meanings)),
                optionalText(stats),
            });
        });
    }

    void StorageEngine::bulkAdd(const std::vector<KanjiMetaRecord>& items, size_t start, int64_t count) {
        insertSlice(StoreName::KanjiMeta, items, start, count, [](const KanjiMetaRecord& item) {
            return makeParams({
                text(item.dictionary),
                text(item.character),
                text(item.mode),
                text(codec::compact(item.data)),
            });
        });
    }

    void StorageEngine::bulkAdd(const std::vector<TagRecord>& items, size_t start, int64_t count) {
        insertSlice(StoreName::TagMeta, items, start, count, [](const TagRecord& item) {
            return makeParams({
                text(item.dictionary),
                text(item.name),
                text(item.category),
                integer(item.order),
                text(item.notes),
                integer(item.score),
            });
        });
    }

    void StorageEngine::bulkAdd(const std::vector<MediaRecord>& items, size_t start, int64_t count) {
        insertSlice(StoreName::Media, items, start, count, [](const MediaRecord& item) {
            return makeParams({
                text(item.dictionary),
                text(item.path),
                text(item.mediaType),
                integer(item.width),
                integer(item.height),
                duckdb::Value::BLOB(reinterpret_cast<duckdb::const_data_ptr_t>(item.content.data()),
                                    item.content.size()),
            });
        });
    }
}
