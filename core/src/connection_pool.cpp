#include "connection_pool.hpp"
#include "error.hpp"
#include <sqlite3.h>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace {
void exec_or_throw(sqlite3* db, const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown";
        sqlite3_free(err);
        throw StoreError("SQLite error: " + msg);
    }
}
}

ConnectionPool::ConnectionPool(const std::string& db_path, std::size_t size) {
    const bool in_memory = db_path == ":memory:";
    if (in_memory || size == 0) size = 1;
    try {
        for (std::size_t i = 0; i < size; ++i) {
            sqlite3* db = nullptr;
            int rc = sqlite3_open_v2(db_path.c_str(), &db,
                                     SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX, nullptr);
            if (rc != SQLITE_OK) {
                std::string msg = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
                if (db) sqlite3_close(db);
                throw StoreError("Failed to open SQLite DB " + db_path + ": " + msg);
            }
            all_.push_back(db);
            sqlite3_busy_timeout(db, 5000);
            exec_or_throw(db, "PRAGMA foreign_keys=ON;");
            if (i == 0 && !in_memory) exec_or_throw(db, "PRAGMA journal_mode=WAL;");
            idle_.push_back(db);
        }
    } catch (...) {
        for (auto* db : all_) sqlite3_close(db);
        throw;
    }
    spdlog::debug("opened {} connection(s) to {}", all_.size(), db_path);
}

ConnectionPool::~ConnectionPool() {
    std::unique_lock<std::mutex> lock(mtx_);
    cv_.wait(lock, [&]{ return idle_.size() == all_.size(); });
    for (auto* db : all_) sqlite3_close(db);
}

ConnectionPool::Lease ConnectionPool::acquire() {
    std::unique_lock<std::mutex> lock(mtx_);
    cv_.wait(lock, [&]{ return !idle_.empty(); });
    sqlite3* db = idle_.front();
    idle_.pop_front();
    return Lease(this, db);
}

std::size_t ConnectionPool::idle() {
    std::lock_guard<std::mutex> lock(mtx_);
    return idle_.size();
}

void ConnectionPool::release(sqlite3* db) {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        idle_.push_back(db);
    }
    cv_.notify_all();
}
