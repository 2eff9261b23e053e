#include "data/ConnectionManager.hpp"
#include "data/Schema.hpp"
#include "core/Error.hpp"
#include <filesystem>
#include <iostream>
#include <system_error>

namespace lexicon {

    namespace fs = std::filesystem;

    ConnectionManager::ConnectionManager(bool verbose)
        : opening_(false), verbose_(verbose)
    {
    }

    ConnectionManager::~ConnectionManager() {
        close();
    }

    void ConnectionManager::open(const std::string& name) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (db_) {
                throw DatabaseError(ErrorCode::AlreadyOpen, "Database already open");
            }
            if (opening_) {
                throw DatabaseError(ErrorCode::AlreadyOpening, "Already opening");
            }
            opening_ = true;
        }

        std::unique_ptr<duckdb::DuckDB> db;
        std::unique_ptr<duckdb::Connection> con;
        try {
            if (name == IN_MEMORY) {
                db = std::make_unique<duckdb::DuckDB>(nullptr);
            } else {
                fs::path parent = fs::path(name).parent_path();
                if (!parent.empty()) {
                    std::error_code ec;
                    fs::create_directories(parent, ec);
                    if (ec) {
                        throw DatabaseError(ErrorCode::Storage,
                                            "Cannot create directory " + parent.string() + ": " + ec.message());
                    }
                }
                db = std::make_unique<duckdb::DuckDB>(name);
            }
            con = std::make_unique<duckdb::Connection>(*db);
            createSchema(*con);
        } catch (const DatabaseError&) {
            std::lock_guard<std::mutex> lock(mutex_);
            opening_ = false;
            throw;
        } catch (const std::exception& e) {
            std::lock_guard<std::mutex> lock(mutex_);
            opening_ = false;
            std::cerr << "[DB] Open failed (" << name << "): " << e.what() << std::endl;
            throw DatabaseError(ErrorCode::Storage, std::string("Cannot open database: ") + e.what());
        }

        std::lock_guard<std::mutex> lock(mutex_);
        db_ = std::move(db);
        con_ = std::move(con);
        opening_ = false;

        if (verbose_) {
            std::cout << "[DB] Storage ready (" << name << ")" << std::endl;
        }
    }

    void ConnectionManager::close() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!db_) {
            return;
        }
        con_.reset();
        db_.reset();
        if (verbose_) {
            std::cout << "[DB] Storage closed" << std::endl;
        }
    }

    bool ConnectionManager::isOpening() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return opening_;
    }

    bool ConnectionManager::isOpen() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return db_ != nullptr;
    }

    duckdb::Connection& ConnectionManager::getHandle() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!con_) {
            throw DatabaseError(ErrorCode::NotOpen, "Database not open");
        }
        return *con_;
    }

    std::unique_ptr<duckdb::Connection> ConnectionManager::createConnection() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!db_) {
            throw DatabaseError(ErrorCode::NotOpen, "Database not open");
        }
        return std::make_unique<duckdb::Connection>(*db_);
    }

    void ConnectionManager::deleteBackingStore(const std::string& name) {
        if (name == IN_MEMORY) {
            return;
        }

        for (const std::string& file : {name, name + ".wal"}) {
            std::error_code ec;
            fs::remove(file, ec);
            if (ec && ec != std::errc::no_such_file_or_directory) {
                throw DatabaseError(ErrorCode::Storage, "Cannot delete " + file + ": " + ec.message());
            }
        }
    }

    void ConnectionManager::dropStore(const std::string& name) {
        deleteBackingStore(name);
    }

    void ConnectionManager::createSchema(duckdb::Connection& con) {
        for (const auto& statement : Schema::createStatements()) {
            auto result = con.Query(statement);
            if (result->HasError()) {
                std::cerr << "[DB] Schema creation failed: " << result->GetError() << std::endl;
                throw DatabaseError(ErrorCode::Storage, "Schema creation failed: " + result->GetError());
            }
        }
    }
}
