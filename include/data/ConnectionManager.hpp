#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <duckdb.hpp>

namespace lexicon {

    // Owns the single DuckDB database handle of a storage engine.
    class ConnectionManager {
    public:
        static constexpr const char* IN_MEMORY = ":memory:";

        explicit ConnectionManager(bool verbose = false);
        virtual ~ConnectionManager();

        ConnectionManager(const ConnectionManager&) = delete;
        ConnectionManager& operator=(const ConnectionManager&) = delete;

        // Opens or creates the store and ensures every table and index exists.
        // Throws AlreadyOpen / AlreadyOpening on misuse, Storage on I/O failure.
        void open(const std::string& name);
        void close();

        bool isOpening() const;
        bool isOpen() const;

        // Throws NotOpen before a successful open().
        duckdb::Connection& getHandle();

        // Extra connection to the open database, for use on another thread.
        std::unique_ptr<duckdb::Connection> createConnection();

        // Removes the database file and its write-ahead log. Missing files are fine.
        static void deleteBackingStore(const std::string& name);

        // Store removal used by a purge. Must not be called while open.
        virtual void dropStore(const std::string& name);

    protected:
        virtual void createSchema(duckdb::Connection& con);

    private:

        mutable std::mutex mutex_;
        std::unique_ptr<duckdb::DuckDB> db_;
        std::unique_ptr<duckdb::Connection> con_;
        bool opening_;
        bool verbose_;
    };
}
