#include "../include/sqlite_store.hpp"
#include "../../common/include/errors.hpp"
#include <sqlite3.h>
#include <chrono>
#include <filesystem>

namespace {
void bind_text(sqlite3_stmt* st, int idx, const std::string& v) {
    sqlite3_bind_text(st, idx, v.c_str(), (int)v.size(), SQLITE_TRANSIENT);
}

void bind_blob(sqlite3_stmt* st, int idx, const std::string& v) {
    sqlite3_bind_blob(st, idx, v.data(), (int)v.size(), SQLITE_TRANSIENT);
}

std::string column_text(sqlite3_stmt* st, int idx) {
    const unsigned char* p = sqlite3_column_text(st, idx);
    return p ? std::string(reinterpret_cast<const char*>(p), (size_t)sqlite3_column_bytes(st, idx)) : std::string();
}

ErrorKind kind_for(int rc) {
    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return ErrorKind::Transient;
        case SQLITE_PERM:
        case SQLITE_READONLY:
        case SQLITE_AUTH:
            return ErrorKind::Unauthorized;
        case SQLITE_CONSTRAINT:
            return ErrorKind::Conflict;
        default:
            return ErrorKind::Unexpected;
    }
}

struct StmtReset {
    sqlite3_stmt* st;
    ~StmtReset() { sqlite3_reset(st); sqlite3_clear_bindings(st); }
};
}

SqliteStore::SqliteStore(const std::string& db_path) : db_path_(db_path) {
    if (db_path != ":memory:") {
        auto parent = std::filesystem::path(db_path).parent_path();
        std::error_code ec;
        if (!parent.empty()) std::filesystem::create_directories(parent, ec);
    }
    int rc = sqlite3_open_v2(db_path.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw StorageError(kind_for(rc), "Failed to open SQLite DB " + db_path + ": " + msg);
    }
    sqlite3_busy_timeout(db_, 5000);
    try {
        init();
        prepare_statements();
    } catch (...) {
        close_statements();
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteStore::~SqliteStore() {
    close_statements();
    if (db_) sqlite3_close(db_);
}

void SqliteStore::init() {
    exec("PRAGMA journal_mode=WAL;");
    exec("CREATE TABLE IF NOT EXISTS objects (\n"
         "  key TEXT PRIMARY KEY,\n"
         "  content_type TEXT NOT NULL,\n"
         "  sha256 TEXT NOT NULL,\n"
         "  size INTEGER NOT NULL,\n"
         "  bytes BLOB NOT NULL,\n"
         "  created_at INTEGER NOT NULL\n"
         ");");
}

void SqliteStore::exec(const std::string& sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : "unknown";
        sqlite3_free(err);
        throw StorageError(kind_for(rc), "SQLite error: " + msg);
    }
}

void SqliteStore::prepare_statements() {
    struct { const char* sql; sqlite3_stmt** out; } stmts[] = {
        {"SELECT content_type, sha256, size FROM objects WHERE key = ?;", &head_stmt_},
        {"INSERT INTO objects (key, content_type, sha256, size, bytes, created_at) VALUES (?, ?, ?, ?, ?, ?);", &insert_stmt_},
        {"SELECT content_type, sha256, size, bytes FROM objects WHERE key = ?;", &read_stmt_},
        {"SELECT COUNT(*) FROM objects;", &count_stmt_},
    };
    for (auto& s : stmts) {
        if (sqlite3_prepare_v2(db_, s.sql, -1, s.out, nullptr) != SQLITE_OK) fail("prepare failed");
    }
}

void SqliteStore::close_statements() {
    for (sqlite3_stmt** st : {&head_stmt_, &insert_stmt_, &read_stmt_, &count_stmt_}) {
        if (*st) sqlite3_finalize(*st);
        *st = nullptr;
    }
}

void SqliteStore::fail(const std::string& what) {
    throw StorageError(kind_for(sqlite3_errcode(db_)), what + ": " + sqlite3_errmsg(db_));
}

std::optional<ObjectInfo> SqliteStore::head(const std::string& key, const CancelToken&) {
    std::lock_guard<std::mutex> lock(mtx_);
    StmtReset reset{head_stmt_};
    bind_text(head_stmt_, 1, key);
    int rc = sqlite3_step(head_stmt_);
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) fail("head " + key);
    ObjectInfo info;
    info.content_type = column_text(head_stmt_, 0);
    info.sha256 = column_text(head_stmt_, 1);
    info.size = (std::size_t)sqlite3_column_int64(head_stmt_, 2);
    return info;
}

void SqliteStore::write(const std::string& key, const std::string& bytes, const std::string& content_type,
                        const std::string& sha256, const CancelToken&) {
    std::lock_guard<std::mutex> lock(mtx_);
    StmtReset reset{insert_stmt_};
    auto now = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    bind_text(insert_stmt_, 1, key);
    bind_text(insert_stmt_, 2, content_type);
    bind_text(insert_stmt_, 3, sha256);
    sqlite3_bind_int64(insert_stmt_, 4, (sqlite3_int64)bytes.size());
    bind_blob(insert_stmt_, 5, bytes);
    sqlite3_bind_int64(insert_stmt_, 6, (sqlite3_int64)now);
    if (sqlite3_step(insert_stmt_) != SQLITE_DONE) fail("write " + key);
}

std::optional<StoredObject> SqliteStore::read(const std::string& key, const CancelToken&) {
    std::lock_guard<std::mutex> lock(mtx_);
    StmtReset reset{read_stmt_};
    bind_text(read_stmt_, 1, key);
    int rc = sqlite3_step(read_stmt_);
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) fail("read " + key);
    StoredObject obj;
    obj.info.content_type = column_text(read_stmt_, 0);
    obj.info.sha256 = column_text(read_stmt_, 1);
    obj.info.size = (std::size_t)sqlite3_column_int64(read_stmt_, 2);
    const void* blob = sqlite3_column_blob(read_stmt_, 3);
    int n = sqlite3_column_bytes(read_stmt_, 3);
    if (blob && n > 0) obj.bytes.assign(static_cast<const char*>(blob), (size_t)n);
    return obj;
}

std::string SqliteStore::url_for(const std::string& key) const {
    return "sqlite://" + db_path_ + "#" + key;
}

std::size_t SqliteStore::count() {
    std::lock_guard<std::mutex> lock(mtx_);
    StmtReset reset{count_stmt_};
    if (sqlite3_step(count_stmt_) != SQLITE_ROW) fail("count");
    return (std::size_t)sqlite3_column_int64(count_stmt_, 0);
}
