#pragma once

#include <cstddef>
#include <string>

namespace lexicon {

    struct StorageOptions {
        // DuckDB file; ":memory:" keeps everything in RAM.
        std::string path = "dict.duckdb";
        // Worker threads for per-key lookup fan-out. 1 keeps lookups on the caller's thread.
        size_t lookupThreads = 1;
        bool transactionalBulkAdd = true;
        size_t bulkBatchSize = 20000;
        bool verbose = false;
    };

    class StorageOptionsBuilder {
    public:
        StorageOptionsBuilder& path(const std::string& p) { options_.path = p; return *this; }
        StorageOptionsBuilder& inMemory() { options_.path = ":memory:"; return *this; }
        StorageOptionsBuilder& lookupThreads(size_t n) { options_.lookupThreads = n == 0 ? 1 : n; return *this; }
        StorageOptionsBuilder& transactionalBulkAdd(bool b = true) { options_.transactionalBulkAdd = b; return *this; }
        StorageOptionsBuilder& bulkBatchSize(size_t n) { options_.bulkBatchSize = n == 0 ? 1 : n; return *this; }
        StorageOptionsBuilder& verbose(bool b = true) { options_.verbose = b; return *this; }
        StorageOptions build() const { return options_; }

    private:
        StorageOptions options_;
    };
}
