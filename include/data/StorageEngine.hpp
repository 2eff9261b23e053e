#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <duckdb.hpp>

#include "core/ThreadPool.hpp"
#include "data/ConnectionManager.hpp"
#include "data/DictionarySet.hpp"
#include "data/Records.hpp"
#include "data/StorageOptions.hpp"

namespace lexicon {

    class StorageEngine {
    public:
        explicit StorageEngine(StorageOptions options = StorageOptions{});
        StorageEngine(StorageOptions options, std::unique_ptr<ConnectionManager> connection);
        ~StorageEngine();

        StorageEngine(const StorageEngine&) = delete;
        StorageEngine& operator=(const StorageEngine&) = delete;

        void prepare();
        void close();
        bool isPrepared() const { return prepared_; }

        // Deletes the backing store and reopens it empty. Returns false when the
        // deletion failed; the engine is reopened either way.
        bool purge();

        const StorageOptions& options() const { return options_; }

        // Lookups. Results are grouped by the position of the originating key,
        // and within one key ordered by insertion.
        std::vector<TermEntry> findTermsBulk(const std::vector<std::string>& terms,
                                             const DictionarySet& dictionaries,
                                             MatchType matchType = MatchType::Exact);
        std::vector<TermEntry> findTermsExactBulk(const std::vector<TermReadingQuery>& queries,
                                                  const DictionarySet& dictionaries);
        std::vector<TermEntry> findTermsBySequenceBulk(const std::vector<SequenceQuery>& queries);
        std::vector<KanjiEntry> findKanjiBulk(const std::vector<std::string>& characters,
                                              const DictionarySet& dictionaries);
        std::vector<TermMetaEntry> findTermMetaBulk(const std::vector<std::string>& terms,
                                                    const DictionarySet& dictionaries);
        std::vector<KanjiMetaEntry> findKanjiMetaBulk(const std::vector<std::string>& characters,
                                                      const DictionarySet& dictionaries);
        std::vector<TagEntry> findTagMetaBulk(const std::vector<TagQuery>& queries);
        // Case-insensitive LIKE pattern over tag names, across every dictionary.
        std::vector<TagRecord> findTagForTitle(const std::string& titlePattern);
        std::vector<MediaEntry> getMedia(const std::vector<MediaQuery>& queries);

        std::vector<DictionarySummary> getDictionaryInfo();
        DictionaryCounts getDictionaryCounts(const std::vector<std::string>& dictionaryNames,
                                             bool includeTotal);
        bool dictionaryExists(const std::string& title);

        // Inserts items[start, min(start + count, size)) in order. The store is
        // chosen by the item type.
        void bulkAdd(const std::vector<DictionarySummary>& items, size_t start, int64_t count);
        void bulkAdd(const std::vector<TermRecord>& items, size_t start, int64_t count);
        void bulkAdd(const std::vector<TermMetaRecord>& items, size_t start, int64_t count);
        void bulkAdd(const std::vector<KanjiRecord>& items, size_t start, int64_t count);
        void bulkAdd(const std::vector<KanjiMetaRecord>& items, size_t start, int64_t count);
        void bulkAdd(const std::vector<TagRecord>& items, size_t start, int64_t count);
        void bulkAdd(const std::vector<MediaRecord>& items, size_t start, int64_t count);

    private:
        template <typename Entry, typename Key, typename Bind, typename Decode>
        std::vector<Entry> lookupBulk(const std::vector<Key>& keys, const std::string& sql,
                                      Bind bind, Decode decode);

        template <typename Item, typename Bind>
        void insertSlice(StoreName store, const std::vector<Item>& items,
                         size_t start, int64_t count, Bind bind);

        StorageOptions options_;
        std::unique_ptr<ConnectionManager> connection_;
        std::unique_ptr<ThreadPool> pool_;
        bool prepared_;
    };
}
