#pragma once

#include "kvbackend.hpp"
#include <memory>
#include <mutex>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

namespace digest123{

// sqlite_backend - keys and values in a single table of an SQLite
// database:
//
//    digests(key TEXT PRIMARY KEY, value TEXT NOT NULL)
//
// The file (and the table) are created if they don't exist.  set is
// an INSERT OR REPLACE, and compact is a VACUUM.  Each operation is a
// single statement, executed under a mutex, so each one is atomic.
// Every SQLite failure throws a store_error carrying sqlite3_errmsg.
struct sqlite_backend : public kvbackend{
    explicit sqlite_backend(const std::string& path);
    ~sqlite_backend();
    bool get(const std::string& key, std::string* value) override;
    void set(const std::string& key, const std::string& value) override;
    void del(const std::string& key) override;
    std::vector<std::string> keys() override;
    void compact() override;
    std::ostream& report_stats(std::ostream& os) override;
private:
    struct db_closer{ void operator()(sqlite3* db) const; };
    struct stmt_finalizer{ void operator()(sqlite3_stmt* stmt) const; };
    using stmt_ptr = std::unique_ptr<sqlite3_stmt, stmt_finalizer>;

    std::string path;
    std::mutex mtx;
    // N.B.  The statements must be finalized before the db is closed,
    // so db has to be declared first.
    std::unique_ptr<sqlite3, db_closer> db;
    stmt_ptr get_stmt;
    stmt_ptr set_stmt;
    stmt_ptr del_stmt;
    stmt_ptr keys_stmt;
    stmt_ptr count_stmt;

    stmt_ptr prepare(const char *sql);
    void exec(const char *sql);
    void bind_text(sqlite3_stmt* stmt, int idx, const std::string& s);
    [[noreturn]] void fail(const std::string& what) const;
};

} // namespace digest123
