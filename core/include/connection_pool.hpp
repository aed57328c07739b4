#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

struct sqlite3;

// Fixed set of SQLite connections to one database. acquire() blocks until a
// connection is idle; the lease hands it back on destruction.
class ConnectionPool {
public:
    class Lease {
    public:
        Lease(ConnectionPool* pool, sqlite3* db) : pool_(pool), db_(db) {}
        Lease(Lease&& other) noexcept : pool_(other.pool_), db_(other.db_) { other.db_ = nullptr; }
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        Lease& operator=(Lease&&) = delete;
        ~Lease() { if (db_) pool_->release(db_); }

        sqlite3* get() const { return db_; }

    private:
        ConnectionPool* pool_;
        sqlite3* db_;
    };

    // ":memory:" always gets a single connection, since separate connections
    // would see separate databases.
    ConnectionPool(const std::string& db_path, std::size_t size);
    ~ConnectionPool();
    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    Lease acquire();
    std::size_t size() const { return all_.size(); }
    std::size_t idle();

private:
    void release(sqlite3* db);

    std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<sqlite3*> idle_;
    std::vector<sqlite3*> all_;
};
