#include "digest123/sqlite_backend.hpp"
#include <dcore/diag.hpp>
#include <dcore/strutils.hpp>
#include <sqlite3.h>

using namespace dcore;

namespace{
auto _sqlite = diag_name("sqlite");

// Leave a prepared statement ready for its next use, no matter how we
// leave the scope.  The return value of sqlite3_reset repeats the
// result of the most recent sqlite3_step, which the caller has
// already checked.
struct reset_on_exit{
    sqlite3_stmt* stmt;
    ~reset_on_exit(){
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
    }
};
} // namespace <anon>

namespace digest123{

void
sqlite_backend::db_closer::operator()(sqlite3* p) const{
    sqlite3_close_v2(p);
}

void
sqlite_backend::stmt_finalizer::operator()(sqlite3_stmt* stmt) const{
    sqlite3_finalize(stmt);
}

sqlite_backend::sqlite_backend(const std::string& path_) :
    path(path_)
{
    sqlite3* raw = nullptr;
    int status = sqlite3_open_v2(path.c_str(), &raw,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE,
                                 nullptr);
    // Even on failure, sqlite3_open_v2 usually gives us a handle that
    // must be closed.
    db.reset(raw);
    if(status != SQLITE_OK)
        throw store_error("sqlite_backend: could not open " + path + ": " +
                          (raw ? sqlite3_errmsg(raw) : sqlite3_errstr(status)));
    if(sqlite3_busy_timeout(db.get(), 5000) != SQLITE_OK)
        fail("sqlite3_busy_timeout");
    exec("CREATE TABLE IF NOT EXISTS digests(key TEXT PRIMARY KEY, value TEXT NOT NULL)");
    get_stmt = prepare("SELECT value FROM digests WHERE key = ?1");
    set_stmt = prepare("INSERT OR REPLACE INTO digests(key, value) VALUES(?1, ?2)");
    del_stmt = prepare("DELETE FROM digests WHERE key = ?1");
    keys_stmt = prepare("SELECT key FROM digests");
    count_stmt = prepare("SELECT count(*) FROM digests");
    DIAG(_sqlite, "opened " << path);
}

sqlite_backend::~sqlite_backend(){}

void
sqlite_backend::fail(const std::string& what) const /*private*/{
    throw store_error("sqlite_backend(" + path + "): " + what + ": " + sqlite3_errmsg(db.get()));
}

sqlite_backend::stmt_ptr
sqlite_backend::prepare(const char *sql) /*private*/{
    sqlite3_stmt* stmt = nullptr;
    if(sqlite3_prepare_v2(db.get(), sql, -1, &stmt, nullptr) != SQLITE_OK){
        sqlite3_finalize(stmt);
        fail(std::string("prepare ") + sql);
    }
    return stmt_ptr(stmt);
}

void
sqlite_backend::exec(const char *sql) /*private*/{
    char *errmsg = nullptr;
    if(sqlite3_exec(db.get(), sql, nullptr, nullptr, &errmsg) != SQLITE_OK){
        std::string msg = errmsg ? errmsg : "unknown error";
        sqlite3_free(errmsg);
        throw store_error("sqlite_backend(" + path + "): " + sql + ": " + msg);
    }
}

void
sqlite_backend::bind_text(sqlite3_stmt* stmt, int idx, const std::string& s) /*private*/{
    if(sqlite3_bind_text(stmt, idx, s.data(), int(s.size()), SQLITE_TRANSIENT) != SQLITE_OK)
        fail("sqlite3_bind_text");
}

bool
sqlite_backend::get(const std::string& key, std::string* value){
    std::lock_guard<std::mutex> lg(mtx);
    reset_on_exit roe{get_stmt.get()};
    bind_text(get_stmt.get(), 1, key);
    switch(sqlite3_step(get_stmt.get())){
    case SQLITE_ROW:{
        auto p = reinterpret_cast<const char*>(sqlite3_column_text(get_stmt.get(), 0));
        auto n = sqlite3_column_bytes(get_stmt.get(), 0);
        value->assign(p ? p : "", size_t(n));
        DIAG(_sqlite>1, "get(" << key << ") -> " << *value);
        return true;
    }
    case SQLITE_DONE:
        DIAG(_sqlite>1, "get(" << key << ") -> miss");
        return false;
    default:
        fail("get(" + key + ")");
    }
}

void
sqlite_backend::set(const std::string& key, const std::string& value){
    std::lock_guard<std::mutex> lg(mtx);
    reset_on_exit roe{set_stmt.get()};
    bind_text(set_stmt.get(), 1, key);
    bind_text(set_stmt.get(), 2, value);
    if(sqlite3_step(set_stmt.get()) != SQLITE_DONE)
        fail("set(" + key + ")");
    DIAG(_sqlite>1, "set(" << key << ", " << value << ")");
}

void
sqlite_backend::del(const std::string& key){
    std::lock_guard<std::mutex> lg(mtx);
    reset_on_exit roe{del_stmt.get()};
    bind_text(del_stmt.get(), 1, key);
    if(sqlite3_step(del_stmt.get()) != SQLITE_DONE)
        fail("del(" + key + ")");
    DIAG(_sqlite>1, "del(" << key << ")");
}

std::vector<std::string>
sqlite_backend::keys(){
    std::lock_guard<std::mutex> lg(mtx);
    reset_on_exit roe{keys_stmt.get()};
    std::vector<std::string> ret;
    int status;
    while((status = sqlite3_step(keys_stmt.get())) == SQLITE_ROW){
        auto p = reinterpret_cast<const char*>(sqlite3_column_text(keys_stmt.get(), 0));
        auto n = sqlite3_column_bytes(keys_stmt.get(), 0);
        ret.emplace_back(p ? p : "", size_t(n));
    }
    if(status != SQLITE_DONE)
        fail("keys()");
    return ret;
}

void
sqlite_backend::compact(){
    std::lock_guard<std::mutex> lg(mtx);
    DIAG(_sqlite, "VACUUM " << path);
    exec("VACUUM");
}

std::ostream&
sqlite_backend::report_stats(std::ostream& os){
    std::lock_guard<std::mutex> lg(mtx);
    reset_on_exit roe{count_stmt.get()};
    if(sqlite3_step(count_stmt.get()) != SQLITE_ROW)
        fail("count(*)");
    return os << "sqlite_backend_entries: " << sqlite3_column_int64(count_stmt.get(), 0) << "\n";
}

} // namespace digest123
