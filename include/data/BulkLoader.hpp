#pragma once

#include <cstdint>
#include <vector>
#include "data/Records.hpp"
#include "data/StorageEngine.hpp"

namespace lexicon {

    // Everything an importer extracted from one dictionary archive.
    struct ImportBundle {
        DictionarySummary summary;
        std::vector<TermRecord> terms;
        std::vector<TermMetaRecord> termMeta;
        std::vector<KanjiRecord> kanji;
        std::vector<KanjiMetaRecord> kanjiMeta;
        std::vector<TagRecord> tags;
        std::vector<MediaRecord> media;
    };

    struct ImportResult {
        bool imported = false;
        CountGroup rows;
    };

    // Feeds importer output through StorageEngine::bulkAdd in fixed-size batches.
    class BulkLoader {
    public:
        explicit BulkLoader(StorageEngine& engine);
        BulkLoader(StorageEngine& engine, size_t batchSize);

        size_t batchSize() const { return batchSize_; }

        template <typename Item>
        int64_t addAll(const std::vector<Item>& items) {
            for (size_t start = 0; start < items.size(); start += batchSize_) {
                engine_.bulkAdd(items, start, static_cast<int64_t>(batchSize_));
            }
            return static_cast<int64_t>(items.size());
        }

        // Writes every store of the bundle, then the summary row, so a summary
        // only exists once its data is in place. A title that is already
        // installed is skipped and reported with imported = false.
        ImportResult import(ImportBundle bundle);

        // Counters stored with the summary: {"terms": {"total": n}, "termMeta": {"total": n, "<mode>": k}, ...}.
        static SummaryCounts summarize(const ImportBundle& bundle);

    private:
        StorageEngine& engine_;
        size_t batchSize_;
    };
}
