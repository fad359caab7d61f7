#include "digest123/digest_store.hpp"
#include "digest123/memory_backend.hpp"
#include "digest123/record_codec.hpp"
#include <dcore/envto.hpp>
#include <dcore/strutils.hpp>
#include <dcore/ut.hpp>
#include <atomic>
#include <condition_variable>
#include <limits>
#include <mutex>
#include <set>
#include <sstream>
#include <thread>
#include <vector>

using namespace digest123;
using namespace std::chrono;

namespace{

// A clock the test controls.
struct fake_clock{
    std::atomic<long long> us{seconds(1700000000).count() * 1000000LL};
    timestamp operator()() const { return timestamp(microseconds(us.load())); }
    void advance(microseconds d){ us += d.count(); }
};

// A memory_backend whose operations can be made to fail, either
// everywhere or for particular keys.
struct flaky_backend : public memory_backend{
    std::atomic<bool> fail_all{false};
    std::set<std::string> bad_keys;     // set before any concurrent use
    std::atomic<int> compactions{0};

    void check(const std::string& key){
        if(fail_all || bad_keys.count(key))
            throw store_error("flaky_backend: injected failure on " + key);
    }
    bool get(const std::string& key, std::string* value) override{
        check(key);
        return memory_backend::get(key, value);
    }
    void set(const std::string& key, const std::string& value) override{
        check(key);
        memory_backend::set(key, value);
    }
    void del(const std::string& key) override{
        check(key);
        memory_backend::del(key);
    }
    void compact() override{
        compactions++;
    }
};

struct fixture{
    fake_clock clk;
    flaky_backend* be;          // owned by store
    std::unique_ptr<digest_store> store;
    fixture(){
        auto b = std::make_unique<flaky_backend>();
        be = b.get();
        store = std::make_unique<digest_store>(std::move(b), [this](){ return clk(); });
    }
};

void test_report_and_whitelist(){
    fixture f;
    record r;
    CHECK(!f.store->get("k1", &r));

    auto t0 = f.clk();
    auto r1 = f.store->report_digest("k1");
    EQUAL(r1.report_count, 1u);
    CHECK(r1.report_entered == t0);
    CHECK(r1.report_updated == r1.report_entered);
    EQUAL(r1.whitelist_count, 0u);
    CHECK(!is_set(r1.whitelist_entered));
    CHECK(!is_set(r1.whitelist_updated));
    CHECK(f.store->get("k1", &r));
    CHECK(r == r1);

    f.clk.advance(seconds(10));
    auto r2 = f.store->report_digest("k1");
    EQUAL(r2.report_count, 2u);
    CHECK(r2.report_entered == t0);
    CHECK(r2.report_updated == t0 + seconds(10));
    CHECK(r2.report_updated > r1.report_updated);

    // Whitelisting a reported digest sets the whitelist pair.
    f.clk.advance(seconds(5));
    auto r3 = f.store->whitelist_digest("k1");
    EQUAL(r3.report_count, 2u);
    EQUAL(r3.whitelist_count, 1u);
    CHECK(r3.whitelist_entered == t0 + seconds(15));
    CHECK(r3.whitelist_updated == r3.whitelist_entered);
    CHECK(r3.report_updated == r2.report_updated);

    // A whitelist-only digest.
    auto w = f.store->whitelist_digest("k2");
    EQUAL(w.whitelist_count, 1u);
    EQUAL(w.report_count, 0u);
    CHECK(!is_set(w.report_entered));

    // Counts saturate.
    record big;
    big.report_count = std::numeric_limits<std::uint64_t>::max();
    big.report_entered = big.report_updated = t0;
    f.store->set("k3", big);
    auto rb = f.store->report_digest("k3");
    EQUAL(rb.report_count, std::numeric_limits<std::uint64_t>::max());
    CHECK(rb.report_updated == f.clk());
}

void test_set_get_del(){
    fixture f;
    record r;
    r.report_count = 5;
    r.report_entered = f.clk();
    r.report_updated = f.clk() + seconds(1);
    f.store->set("k", r);
    record got;
    CHECK(f.store->get("k", &got));
    CHECK(got == r);
    r.report_count = 6;
    f.store->set("k", r);
    CHECK(f.store->get("k", &got));
    EQUAL(got.report_count, 6u);

    f.store->del("k");
    CHECK(!f.store->get("k", &got));
    // Deleting what isn't there is fine.
    f.store->del("k");
    f.store->del("never-existed");
    CHECK(!f.store->get("never-existed", &got));
}

void test_malformed(){
    fixture f;
    f.be->memory_backend::set("junk", "this is not a record");
    f.be->memory_backend::set("v2", "2,1,None,None,0,None,None");
    record r;
    r.report_count = 99;
    CHECK(!f.store->get("junk", &r));
    CHECK(!f.store->get("v2", &r));
    // *r is untouched by a miss.
    EQUAL(r.report_count, 99u);
    // Neither get nor set lets updated precede entered.
    f.be->memory_backend::set("backwards", "1,2,2024-03-05 06:07:08,2024-03-05 06:07:07,0,None,None");
    CHECK(!f.store->get("backwards", &r));
    EQUAL(r.report_count, 99u);
    record backwards;
    backwards.whitelist_count = 1;
    backwards.whitelist_entered = f.clk();
    backwards.whitelist_updated = f.clk() - seconds(1);
    THROWS(f.store->set("backwards", backwards), std::invalid_argument);
    std::string raw;
    CHECK(f.be->memory_backend::get("backwards", &raw));
    EQSTR(raw, "1,2,2024-03-05 06:07:08,2024-03-05 06:07:07,0,None,None");
    // A report on an undecodable record starts over.
    auto nr = f.store->report_digest("junk");
    EQUAL(nr.report_count, 1u);
    CHECK(f.store->get("junk", &r));
    std::ostringstream oss;
    f.store->report_stats(oss);
    CHECK(oss.str().find("store_decode_errors: 4") != std::string::npos);
}

void test_store_error(){
    fixture f;
    f.store->report_digest("k");
    f.be->fail_all = true;
    record r;
    THROWS(f.store->get("k", &r), store_error);
    THROWS(f.store->set("k", r), store_error);
    THROWS(f.store->del("k"), store_error);
    THROWS(f.store->report_digest("k"), store_error);
    THROWS(f.store->whitelist_digest("k"), store_error);
    f.be->fail_all = false;
    CHECK(f.store->get("k", &r));
    EQUAL(r.report_count, 1u);
}

void test_sweep(){
    fixture f;
    auto t0 = f.clk();
    const auto max_age = seconds(24*3600);
    // Old: both updated timestamps well before max_age.
    record old;
    old.report_count = 1;
    old.report_entered = t0 - hours(24*3);
    old.report_updated = t0 - hours(24*2);
    old.whitelist_count = 1;
    old.whitelist_entered = t0 - hours(24*3);
    old.whitelist_updated = t0 - hours(24*3);
    f.store->set("old", old);
    // Fresh because of the whitelist pair alone.
    record mixed = old;
    mixed.whitelist_updated = t0 - hours(1);
    f.store->set("mixed", mixed);
    // Fresh.
    f.store->report_digest("fresh");
    record fresh;
    CHECK(f.store->get("fresh", &fresh));
    // Exactly max_age old is not *more* than max_age.
    record edge;
    edge.report_count = 1;
    edge.report_entered = edge.report_updated = t0 - max_age;
    f.store->set("edge", edge);
    // Undecodable records are left alone.
    f.be->memory_backend::set("junk", "junk");
    // A key that fails in the backend doesn't stop the sweep.
    f.store->set("bad", old);
    f.be->bad_keys.insert("bad");

    CHECK(f.store->sweep_once(max_age));
    record r;
    CHECK(!f.store->get("old", &r));
    CHECK(f.store->get("mixed", &r));
    CHECK(r == mixed);
    CHECK(f.store->get("fresh", &r));
    CHECK(r == fresh);
    CHECK(f.store->get("edge", &r));
    std::string raw;
    CHECK(f.be->memory_backend::get("junk", &raw));
    CHECK(f.be->memory_backend::get("bad", &raw));
    EQUAL(f.be->compactions.load(), 1);

    // Sweeping again changes nothing.
    CHECK(f.store->sweep_once(max_age));
    CHECK(f.store->get("fresh", &r));
    CHECK(r == fresh);
    EQUAL(f.be->compactions.load(), 2);

    // Time passes and everything is stale.
    f.be->bad_keys.clear();
    f.clk.advance(hours(24*2));
    CHECK(f.store->sweep_once(max_age));
    EQUAL(f.be->keys().size(), 1u);     // just the junk
    std::ostringstream oss;
    f.store->report_stats(oss);
    CHECK(oss.str().find("store_evictions: 5") != std::string::npos);
    CHECK(oss.str().find("store_sweep_errors: 5") != std::string::npos);
}

void test_reorganizing(){
    fixture f;
    // Non-positive max_age schedules nothing.
    f.store->start_reorganizing(seconds(0), seconds(1));
    CHECK(!f.store->reorganizing());
    f.store->start_reorganizing(seconds(-5));
    CHECK(!f.store->reorganizing());
    THROWS(f.store->start_reorganizing(seconds(10), seconds(0)), std::invalid_argument);

    record old;
    old.report_count = 1;
    old.report_entered = old.report_updated = f.clk() - hours(48);
    f.store->set("old", old);
    f.store->report_digest("fresh");
    // With an hour between sweeps, anything evicted within a couple
    // of seconds was evicted by the sweep that starts things off.
    f.store->start_reorganizing(hours(24), hours(1));
    CHECK(f.store->reorganizing());
    record r;
    for(int i=0; i<40 && f.store->get("old", &r); ++i)
        std::this_thread::sleep_for(milliseconds(50));
    CHECK(!f.store->get("old", &r));
    CHECK(f.store->get("fresh", &r));
    // The next sweep is an hour away.
    f.store->set("old2", old);
    std::this_thread::sleep_for(milliseconds(300));
    CHECK(f.store->get("old2", &r));
    f.store->stop_reorganizing();
    CHECK(!f.store->reorganizing());
    // Stopping twice is fine.
    f.store->stop_reorganizing();

    // Restarting sweeps right away, too.
    f.store->start_reorganizing(hours(24), hours(1));
    for(int i=0; i<40 && f.store->get("old2", &r); ++i)
        std::this_thread::sleep_for(milliseconds(50));
    CHECK(!f.store->get("old2", &r));
    f.store->stop_reorganizing();

    // The destructor stops a running sweep schedule.
    f.store->start_reorganizing(seconds(60), hours(1));
    CHECK(f.store->reorganizing());
}

void test_concurrent_reports(){
    fixture f;
    const int nthreads = 8;
    const int nreports = 500;
    std::vector<std::thread> threads;
    for(int t=0; t<nthreads; ++t){
        threads.emplace_back([&f, t](){
                for(int i=0; i<nreports; ++i){
                    f.store->report_digest("shared");
                    if(i%2)
                        f.store->whitelist_digest("shared");
                    f.store->report_digest(dcore::fmt("own-%d", t));
                }
            });
    }
    // Sweep concurrently.  Nothing is old enough to be evicted.
    for(int i=0; i<5; ++i)
        f.store->sweep_once(hours(1));
    for(auto& th : threads)
        th.join();
    record r;
    CHECK(f.store->get("shared", &r));
    EQUAL(r.report_count, std::uint64_t(nthreads*nreports));
    EQUAL(r.whitelist_count, std::uint64_t(nthreads*nreports/2));
    for(int t=0; t<nthreads; ++t){
        CHECK(f.store->get(dcore::fmt("own-%d", t), &r));
        EQUAL(r.report_count, std::uint64_t(nreports));
    }
}

void test_single_flight(){
    // A backend whose keys() blocks until released, so one sweep is
    // certainly in progress while we start another.
    struct slow_backend : public memory_backend{
        std::mutex m;
        std::condition_variable cv;
        bool entered = false;
        bool release = false;
        std::vector<std::string> keys() override{
            std::unique_lock<std::mutex> lk(m);
            entered = true;
            cv.notify_all();
            cv.wait(lk, [this]{ return release; });
            return memory_backend::keys();
        }
    };
    auto b = std::make_unique<slow_backend>();
    auto sb = b.get();
    digest_store store(std::move(b));
    std::atomic<bool> first_result{false};
    std::thread th([&]{ first_result = store.sweep_once(seconds(60)); });
    {
        std::unique_lock<std::mutex> lk(sb->m);
        sb->cv.wait(lk, [sb]{ return sb->entered; });
    }
    CHECK(!store.sweep_once(seconds(60)));
    {
        std::lock_guard<std::mutex> lg(sb->m);
        sb->release = true;
    }
    sb->cv.notify_all();
    th.join();
    CHECK(first_result.load());
    std::ostringstream oss;
    store.report_stats(oss);
    CHECK(oss.str().find("store_sweeps_skipped: 1") != std::string::npos);
    CHECK(oss.str().find("store_sweeps: 1\n") != std::string::npos);
}

} // namespace <anon>

int main(int, char **){
    dcore::set_diag_names(dcore::envto<std::string>("Digest123DiagNames", ""));
    test_report_and_whitelist();
    test_set_get_del();
    test_malformed();
    test_store_error();
    test_sweep();
    test_reorganizing();
    test_concurrent_reports();
    test_single_flight();
    return utstatus();
}
