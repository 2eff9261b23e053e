#include "data/BulkLoader.hpp"
#include <iostream>

namespace lexicon {

    namespace {
        template <typename Item>
        std::map<std::string, int64_t> totalOnly(const std::vector<Item>& items) {
            return {{"total", static_cast<int64_t>(items.size())}};
        }

        template <typename Item>
        std::map<std::string, int64_t> totalByMode(const std::vector<Item>& items) {
            std::map<std::string, int64_t> counters{{"total", static_cast<int64_t>(items.size())}};
            for (const auto& item : items) {
                ++counters[item.mode];
            }
            return counters;
        }
    }

    BulkLoader::BulkLoader(StorageEngine& engine)
        : BulkLoader(engine, engine.options().bulkBatchSize)
    {
    }

    BulkLoader::BulkLoader(StorageEngine& engine, size_t batchSize)
        : engine_(engine), batchSize_(batchSize == 0 ? 1 : batchSize)
    {
    }

    SummaryCounts BulkLoader::summarize(const ImportBundle& bundle) {
        SummaryCounts counts;
        counts["terms"] = totalOnly(bundle.terms);
        counts["termMeta"] = totalByMode(bundle.termMeta);
        counts["kanji"] = totalOnly(bundle.kanji);
        counts["kanjiMeta"] = totalByMode(bundle.kanjiMeta);
        counts["tagMeta"] = totalOnly(bundle.tags);
        counts["media"] = totalOnly(bundle.media);
        return counts;
    }

    ImportResult BulkLoader::import(ImportBundle bundle) {
        ImportResult result;
        const bool verbose = engine_.options().verbose;
        const std::string& title = bundle.summary.title;

        if (engine_.dictionaryExists(title)) {
            std::cerr << "[LOADER] Dictionary already installed: " << title << std::endl;
            return result;
        }

        if (verbose) {
            std::cout << "[LOADER] Importing " << title << std::endl;
        }

        result.rows.terms = addAll(bundle.terms);
        result.rows.termMeta = addAll(bundle.termMeta);
        result.rows.kanji = addAll(bundle.kanji);
        result.rows.kanjiMeta = addAll(bundle.kanjiMeta);
        result.rows.tagMeta = addAll(bundle.tags);
        result.rows.media = addAll(bundle.media);

        if (!bundle.summary.counts) {
            bundle.summary.counts = summarize(bundle);
        }
        engine_.bulkAdd(std::vector<DictionarySummary>{bundle.summary}, 0, 1);
        result.imported = true;

        if (verbose) {
            std::cout << "[LOADER] " << title << ": " << result.rows.terms << " terms, "
                      << result.rows.kanji << " kanji, " << result.rows.tagMeta << " tags" << std::endl;
        }
        return result;
    }
}
