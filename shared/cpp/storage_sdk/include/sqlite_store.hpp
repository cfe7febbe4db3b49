#pragma once
#include "object_store.hpp"
#include <mutex>
#include <string>

// Artifacts kept in a single SQLite file. Used for local deployments and as
// the store behind the storage tests.
class SqliteStore : public ObjectStore {
public:
    explicit SqliteStore(const std::string& db_path);
    ~SqliteStore() override;
    SqliteStore(const SqliteStore&) = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;

    std::string name() const override { return "sqlite"; }
    std::optional<ObjectInfo> head(const std::string& key, const CancelToken& cancel) override;
    void write(const std::string& key, const std::string& bytes, const std::string& content_type,
               const std::string& sha256, const CancelToken& cancel) override;
    std::optional<StoredObject> read(const std::string& key, const CancelToken& cancel) override;
    std::string url_for(const std::string& key) const override;

    std::size_t count();

private:
    void init();
    void exec(const std::string& sql);
    void prepare_statements();
    void close_statements();
    [[noreturn]] void fail(const std::string& what);

    std::string db_path_;
    std::mutex mtx_;
    struct sqlite3* db_ {nullptr};
    struct sqlite3_stmt* head_stmt_ {nullptr};
    struct sqlite3_stmt* insert_stmt_ {nullptr};
    struct sqlite3_stmt* read_stmt_ {nullptr};
    struct sqlite3_stmt* count_stmt_ {nullptr};
};
