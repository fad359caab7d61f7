#include "digest123/sqlite_backend.hpp"
#include "digest123/memory_backend.hpp"
#include "digest123/digest_store.hpp"
#include <dcore/envto.hpp>
#include <dcore/throwutils.hpp>
#include <dcore/ut.hpp>
#include <algorithm>
#include <sstream>
#include <stdlib.h>
#include <unistd.h>

using namespace digest123;
using namespace std::chrono;

namespace{
std::string tmpdir;
std::string dbpath;

void test_basics(){
    sqlite_backend be(dbpath);
    std::string v;
    CHECK(!be.get("a", &v));
    CHECK(be.keys().empty());
    be.set("a", "1,1,None,None,0,None,None");
    be.set("b", "bee");
    CHECK(be.get("a", &v));
    EQSTR(v, "1,1,None,None,0,None,None");
    be.set("b", "bumble bee");
    CHECK(be.get("b", &v));
    EQSTR(v, "bumble bee");
    // Values with embedded quotes and commas survive.
    be.set("q'uote", "it's, \"quoted\"");
    CHECK(be.get("q'uote", &v));
    EQSTR(v, "it's, \"quoted\"");

    auto ks = be.keys();
    std::sort(ks.begin(), ks.end());
    EQUAL(ks.size(), 3u);
    if(ks.size() == 3){
        EQSTR(ks[0], "a");
        EQSTR(ks[1], "b");
        EQSTR(ks[2], "q'uote");
    }

    be.del("a");
    be.del("a");        // no-op
    be.del("nothing");  // no-op
    CHECK(!be.get("a", &v));
    EQUAL(be.keys().size(), 2u);
    be.compact();
    std::ostringstream oss;
    be.report_stats(oss);
    EQSTR(oss.str(), "sqlite_backend_entries: 2\n");
}

void test_persistence(){
    // The previous test's records are still in the file.
    {
        sqlite_backend be(dbpath);
        std::string v;
        CHECK(be.get("b", &v));
        EQSTR(v, "bumble bee");
        CHECK(!be.get("a", &v));
        be.set("c", "sea");
    }
    sqlite_backend be(dbpath);
    std::string v;
    CHECK(be.get("c", &v));
    EQSTR(v, "sea");
}

void test_make_backend(){
    auto m = make_backend("memory:");
    CHECK(dynamic_cast<memory_backend*>(m.get()) != nullptr);
    auto s = make_backend("sqlite:" + dbpath);
    CHECK(dynamic_cast<sqlite_backend*>(s.get()) != nullptr);
    std::string v;
    CHECK(s->get("c", &v));
    THROWS(make_backend(""), std::invalid_argument);
    THROWS(make_backend("sqlite:"), std::invalid_argument);
    THROWS(make_backend("gdbm:/tmp/x"), std::invalid_argument);
    THROWS(make_backend("memory"), std::invalid_argument);
    // A directory that doesn't exist can't hold a database.
    THROWS(make_backend("sqlite:" + tmpdir + "/no/such/dir/x.db"), store_error);
    THROWS(sqlite_backend(tmpdir + "/no/such/dir/x.db"), store_error);
}

void test_store_on_sqlite(){
    auto t = timestamp(seconds(1700000000));
    auto clk = [&t](){ return t; };
    {
        digest_store store(make_backend("sqlite:" + dbpath), clk);
        auto r = store.report_digest("d1");
        EQUAL(r.report_count, 1u);
        t += seconds(2);
        r = store.report_digest("d1");
        EQUAL(r.report_count, 2u);
        store.whitelist_digest("d2");
        // The earlier tests left values that do not decode.
        record rec;
        CHECK(!store.get("b", &rec));
    }
    // Reopen.  The records persisted.
    t += hours(48);
    digest_store store(make_backend("sqlite:" + dbpath), clk);
    record rec;
    CHECK(store.get("d1", &rec));
    EQUAL(rec.report_count, 2u);
    CHECK(rec.report_entered == timestamp(seconds(1700000000)));
    CHECK(rec.report_updated == timestamp(seconds(1700000002)));
    store.report_digest("d3");
    CHECK(store.sweep_once(hours(24)));
    CHECK(!store.get("d1", &rec));
    CHECK(!store.get("d2", &rec));
    CHECK(store.get("d3", &rec));
    std::ostringstream oss;
    store.report_stats(oss);
    // d3, plus the three undecodable leftovers from the earlier tests.
    CHECK(oss.str().find("sqlite_backend_entries: 4\n") != std::string::npos);
    CHECK(oss.str().find("store_evictions: 2\n") != std::string::npos);
}

} // namespace <anon>

int main(int, char **){
    dcore::set_diag_names(dcore::envto<std::string>("Digest123DiagNames", ""));
    char tmpl[] = "/tmp/ut_sqlite_backend.XXXXXX";
    if(!mkdtemp(tmpl))
        throw dcore::se("mkdtemp");
    tmpdir = tmpl;
    dbpath = tmpdir + "/digests.db";
    test_basics();
    test_persistence();
    test_make_backend();
    test_store_on_sqlite();
    ::unlink(dbpath.c_str());
    // SQLite may leave a journal behind.
    ::unlink((dbpath + "-journal").c_str());
    ::rmdir(tmpdir.c_str());
    return utstatus();
}
