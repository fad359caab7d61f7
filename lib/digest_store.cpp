#include "digest123/digest_store.hpp"
#include "digest123/record_codec.hpp"
#include <dcore/complaints.hpp>
#include <dcore/diag.hpp>
#include <dcore/strutils.hpp>
#include <limits>
#include <vector>

using namespace dcore;
using namespace std::chrono;

namespace{
auto _store = diag_name("store");
auto _sweep = diag_name("sweep");

// Count one more report (or whitelist) at time t.
void bump(std::uint64_t& count, digest123::timestamp& entered, digest123::timestamp& updated, digest123::timestamp t){
    if(count < std::numeric_limits<std::uint64_t>::max())
        ++count;
    if(!digest123::is_set(entered))
        entered = t;
    // Don't let a clock that steps backwards break updated >= entered.
    updated = std::max(t, entered);
}
} // namespace <anon>

namespace digest123{

timestamp
digest_store::system_now(){
    return time_point_cast<microseconds>(system_clock::now());
}

digest_store::digest_store(std::unique_ptr<kvbackend> backend_, clock_fn now_) :
    backend(std::move(backend_)),
    now(std::move(now_))
{
    if(!backend)
        throw std::invalid_argument("digest_store: null backend");
    if(!now)
        throw std::invalid_argument("digest_store: null clock");
}

digest_store::~digest_store(){
    // Like stop_reorganizing, but quietly.
    std::lock_guard<std::mutex> lg(reorg_mtx);
    sweeper.reset();
}

std::mutex&
digest_store::stripe(const std::string& key) /*private*/{
    return stripes[std::hash<std::string>{}(key) % NSTRIPES];
}

bool
digest_store::get_locked(const std::string& key, record* rec) /*private*/{
    stats.store_gets++;
    std::string raw;
    if(!backend->get(key, &raw)){
        stats.store_misses++;
        DIAG(_store, "get(" << key << ") miss");
        return false;
    }
    try{
        *rec = decode(raw);
    }catch(decode_error& e){
        stats.store_decode_errors++;
        stats.store_misses++;
        complain(LOG_WARNING, e, "digest_store: treating undecodable record for " + key + " as a miss");
        return false;
    }
    stats.store_hits++;
    DIAG(_store, "get(" << key << ") -> " << *rec);
    return true;
}

bool
digest_store::get(const std::string& key, record* rec){
    std::lock_guard<std::mutex> lg(stripe(key));
    return get_locked(key, rec);
}

void
digest_store::set(const std::string& key, const record& rec){
    // get would refuse to decode it.
    if(!rec.consistent())
        throw std::invalid_argument("digest_store::set(" + key + "): a *_updated timestamp precedes its *_entered: " + encode(rec));
    auto encoded = encode(rec);
    std::lock_guard<std::mutex> lg(stripe(key));
    backend->set(key, encoded);
    stats.store_sets++;
    DIAG(_store, "set(" << key << ", " << encoded << ")");
}

void
digest_store::del(const std::string& key){
    std::lock_guard<std::mutex> lg(stripe(key));
    backend->del(key);
    stats.store_dels++;
    DIAG(_store, "del(" << key << ")");
}

template <typename Bump>
record
digest_store::read_modify_write(const std::string& key, Bump b) /*private*/{
    std::lock_guard<std::mutex> lg(stripe(key));
    record r;
    if(!get_locked(key, &r))
        DIAG(_store, "read_modify_write(" << key << "): new record");
    b(r, now());
    backend->set(key, encode(r));
    stats.store_sets++;
    DIAG(_store, "read_modify_write(" << key << ") -> " << r);
    return r;
}

record
digest_store::report_digest(const std::string& key){
    auto ret = read_modify_write(key, [](record& r, timestamp t){
            bump(r.report_count, r.report_entered, r.report_updated, t);
        });
    stats.store_reports++;
    return ret;
}

record
digest_store::whitelist_digest(const std::string& key){
    auto ret = read_modify_write(key, [](record& r, timestamp t){
            bump(r.whitelist_count, r.whitelist_entered, r.whitelist_updated, t);
        });
    stats.store_whitelists++;
    return ret;
}

bool
digest_store::sweep_once(seconds max_age){
    std::unique_lock<std::mutex> lk(sweep_mtx, std::try_to_lock);
    if(!lk.owns_lock()){
        stats.store_sweeps_skipped++;
        complain(LOG_INFO, "digest_store::sweep_once: a sweep is already running.  Skipping this one.");
        return false;
    }
    auto t0 = now();
    // If we can't even get the keys, there's nothing to do but
    // let the caller know.
    auto keys = backend->keys();
    size_t nevicted = 0;
    size_t nerrors = 0;
    for(const auto& k : keys){
        try{
            std::lock_guard<std::mutex> lg(stripe(k));
            std::string raw;
            stats.store_sweep_keys++;
            if(!backend->get(k, &raw))
                continue;       // deleted since we took the snapshot
            auto r = decode(raw);
            auto age = t0 - r.last_updated();
            if(age > max_age){
                DIAG(_sweep, "evicting " << k << " age " << dur2dbl(age) << "s: " << raw);
                backend->del(k);
                stats.store_evictions++;
                nevicted++;
            }else{
                DIAG(_sweep>1, "keeping " << k << " age " << dur2dbl(age) << "s");
            }
        }catch(std::exception& e){
            stats.store_sweep_errors++;
            nerrors++;
            complain(LOG_WARNING, e, "digest_store::sweep_once: skipping " + k);
        }
    }
    try{
        backend->compact();
        stats.store_compactions++;
    }catch(std::exception& e){
        stats.store_sweep_errors++;
        nerrors++;
        complain(LOG_WARNING, e, "digest_store::sweep_once: compact failed");
    }
    stats.store_sweeps++;
    complain((nevicted || nerrors) ? LOG_NOTICE : LOG_INFO,
             fmt("digest_store::sweep_once: visited %zu records.  Evicted %zu older than %llds.  %zu errors.",
                 keys.size(), nevicted, (long long)max_age.count(), nerrors));
    return true;
}

void
digest_store::start_reorganizing(seconds max_age, seconds interval){
    std::lock_guard<std::mutex> lg(reorg_mtx);
    // Replacing the old periodic waits for any sweep in progress.
    sweeper.reset();
    if(max_age.count() <= 0){
        log_notice(fmt("digest_store: max_age=%lld.  Records will not be evicted.", (long long)max_age.count()));
        return;
    }
    if(interval.count() <= 0)
        throw std::invalid_argument(fmt("digest_store::start_reorganizing: interval must be positive, not %lld", (long long)interval.count()));
    log_notice(fmt("digest_store: evicting records older than %llds every %llds",
                   (long long)max_age.count(), (long long)interval.count()));
    // periodic makes its first call right away, so a freshly started
    // daemon sweeps immediately.
    sweeper = std::make_unique<periodic>([this, max_age, interval]() -> seconds {
            try{
                sweep_once(max_age);
            }catch(std::exception& e){
                // We're the thread's entry point.  If we rethrow, the
                // periodic stops for good.  Complain and try again
                // next time.
                stats.store_sweep_errors++;
                complain(LOG_ERR, e, "digest_store: sweep failed.  Will try again in " + std::to_string(interval.count()) + "s");
            }
            return interval;
        });
}

void
digest_store::stop_reorganizing(){
    std::lock_guard<std::mutex> lg(reorg_mtx);
    if(sweeper){
        sweeper.reset();
        log_notice("digest_store: stopped evicting records");
    }
}

bool
digest_store::reorganizing() const{
    std::lock_guard<std::mutex> lg(reorg_mtx);
    return bool(sweeper);
}

std::ostream&
digest_store::report_stats(std::ostream& os){
    os << stats;
    os << "store_reorganizing: " << reorganizing() << "\n";
    return backend->report_stats(os);
}

} // namespace digest123
