#pragma once
// SqliteBackend: persistent storage in a single SQLite file
//
// Schema:
//   triples(id BLOB PRIMARY KEY, data BLOB NOT NULL)
//
// id is the 32-byte TripleId, data the canonical triple bytes. The database
// runs in WAL journal mode; flush() checkpoints the WAL into the main file.
// The path ":memory:" opens a private in-memory database (handy for tests).

#include "storage.hpp"
#include "log.hpp"
#include <sqlite3.h>
#include <mutex>

namespace nyaya {

class SqliteBackend : public StorageBackend {
public:
    explicit SqliteBackend(const std::string& path) : path_(path) {
        int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
        if (sqlite3_open_v2(path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
            std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
            if (db_) sqlite3_close(db_);
            db_ = nullptr;
            throw GraphError::unavailable("cannot open " + path + ": " + msg);
        }

        sqlite3_busy_timeout(db_, 5000);
        if (path != ":memory:") {
            exec("PRAGMA journal_mode=WAL");
            exec("PRAGMA synchronous=NORMAL");
        }
        exec("CREATE TABLE IF NOT EXISTS triples ("
             "id BLOB PRIMARY KEY, "
             "data BLOB NOT NULL)");

        log_debug("sqlite", "opened %s", path.c_str());
    }

    ~SqliteBackend() override {
        if (db_) sqlite3_close(db_);
    }

    SqliteBackend(const SqliteBackend&) = delete;
    SqliteBackend& operator=(const SqliteBackend&) = delete;

    void put(const TripleId& id, const Triple& triple) override {
        auto bytes = encode(triple);
        std::lock_guard lock(mutex_);
        Statement stmt(handle(), "INSERT OR REPLACE INTO triples (id, data) VALUES (?1, ?2)");
        stmt.bind_blob(1, id.bytes.data(), id.bytes.size());
        stmt.bind_blob(2, bytes.data(), bytes.size());
        if (stmt.step() != SQLITE_DONE) fail("put");
    }

    std::optional<Triple> get(const TripleId& id) const override {
        std::lock_guard lock(mutex_);
        Statement stmt(handle(), "SELECT data FROM triples WHERE id = ?1");
        stmt.bind_blob(1, id.bytes.data(), id.bytes.size());
        int rc = stmt.step();
        if (rc == SQLITE_DONE) return std::nullopt;
        if (rc != SQLITE_ROW) fail("get");
        return decode_triple(stmt.column_blob(0), stmt.column_bytes(0));
    }

    bool remove(const TripleId& id) override {
        std::lock_guard lock(mutex_);
        Statement stmt(handle(), "DELETE FROM triples WHERE id = ?1");
        stmt.bind_blob(1, id.bytes.data(), id.bytes.size());
        if (stmt.step() != SQLITE_DONE) fail("remove");
        return sqlite3_changes(db_) > 0;
    }

    bool exists(const TripleId& id) const override {
        std::lock_guard lock(mutex_);
        Statement stmt(handle(), "SELECT 1 FROM triples WHERE id = ?1");
        stmt.bind_blob(1, id.bytes.data(), id.bytes.size());
        int rc = stmt.step();
        if (rc != SQLITE_ROW && rc != SQLITE_DONE) fail("exists");
        return rc == SQLITE_ROW;
    }

    std::vector<Triple> iter_all() const override {
        std::lock_guard lock(mutex_);
        Statement stmt(handle(), "SELECT data FROM triples");
        std::vector<Triple> out;
        int rc;
        while ((rc = stmt.step()) == SQLITE_ROW) {
            try {
                out.push_back(decode_triple(stmt.column_blob(0), stmt.column_bytes(0)));
            } catch (const GraphError& e) {
                if (e.kind() != GraphErrorKind::Serialization) throw;
                log_warn("sqlite", "skipping undecodable row: %s", e.what());
            }
        }
        if (rc != SQLITE_DONE) fail("iter_all");
        return out;
    }

    size_t count() const override {
        std::lock_guard lock(mutex_);
        return static_cast<size_t>(scalar("SELECT COUNT(*) FROM triples"));
    }

    size_t size_bytes() const override {
        std::lock_guard lock(mutex_);
        int64_t pages = scalar("PRAGMA page_count");
        int64_t page_size = scalar("PRAGMA page_size");
        return static_cast<size_t>(pages * page_size);
    }

    void flush() override {
        std::lock_guard lock(mutex_);
        handle();
        if (path_ != ":memory:") exec("PRAGMA wal_checkpoint(TRUNCATE)");
    }

    void close() override {
        std::lock_guard lock(mutex_);
        if (!db_) return;
        if (sqlite3_close(db_) != SQLITE_OK) {
            throw GraphError::storage("close " + path_ + ": " + sqlite3_errmsg(db_));
        }
        db_ = nullptr;
        log_debug("sqlite", "closed %s", path_.c_str());
    }

    const char* name() const override { return "sqlite"; }

private:
    // RAII prepared statement
    class Statement {
    public:
        Statement(sqlite3* db, const char* sql) : db_(db) {
            if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
                throw GraphError::storage(std::string("prepare: ") + sqlite3_errmsg(db));
            }
        }
        ~Statement() { sqlite3_finalize(stmt_); }

        Statement(const Statement&) = delete;
        Statement& operator=(const Statement&) = delete;

        void bind_blob(int index, const void* data, size_t size) {
            if (sqlite3_bind_blob(stmt_, index, data, static_cast<int>(size), SQLITE_TRANSIENT) != SQLITE_OK) {
                throw GraphError::storage(std::string("bind: ") + sqlite3_errmsg(db_));
            }
        }

        int step() { return sqlite3_step(stmt_); }

        const uint8_t* column_blob(int col) const {
            return static_cast<const uint8_t*>(sqlite3_column_blob(stmt_, col));
        }
        size_t column_bytes(int col) const {
            return static_cast<size_t>(sqlite3_column_bytes(stmt_, col));
        }
        int64_t column_int(int col) const { return sqlite3_column_int64(stmt_, col); }

    private:
        sqlite3* db_;
        sqlite3_stmt* stmt_ = nullptr;
    };

    sqlite3* handle() const {
        if (!db_) throw GraphError::unavailable("sqlite backend is closed: " + path_);
        return db_;
    }

    void exec(const char* sql) const {
        char* err = nullptr;
        if (sqlite3_exec(handle(), sql, nullptr, nullptr, &err) != SQLITE_OK) {
            std::string msg = err ? err : "unknown";
            sqlite3_free(err);
            throw GraphError::storage(std::string(sql) + ": " + msg);
        }
    }

    int64_t scalar(const char* sql) const {
        Statement stmt(handle(), sql);
        if (stmt.step() != SQLITE_ROW) fail(sql);
        return stmt.column_int(0);
    }

    [[noreturn]] void fail(const std::string& op) const {
        throw GraphError::storage(op + ": " + sqlite3_errmsg(db_));
    }

    std::string path_;
    sqlite3* db_ = nullptr;
    mutable std::mutex mutex_;
};

} // namespace nyaya
