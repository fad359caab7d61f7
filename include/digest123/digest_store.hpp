#pragma once

#include "kvbackend.hpp"
#include "record.hpp"
#include <dcore/periodic.hpp>
#include <dcore/stats.hpp>
#include <atomic>
#include <array>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>

// digest_store: digest -> record, on top of a kvbackend.
//
// get(key, &rec) - false if the key isn't there, *or* if the stored
//   value doesn't decode.  (Decode failures are logged and counted,
//   and the value is left where it is.)
// set(key, rec) - encode and overwrite.  Last writer wins.  Throws
//   std::invalid_argument if !rec.consistent().
// del(key) - a no-op if the key isn't there.
// report_digest(key), whitelist_digest(key) - read-modify-write.  If
//   the key is absent (or undecodable) a new record is created with
//   the relevant count equal to 1 and the relevant entered/updated
//   pair set to now.  Otherwise the count is incremented (saturating)
//   and *_updated is set to now.  *_entered is only set if it was
//   unset.  Returns the record that was written.
//
// Backend failures in any of the above propagate as store_error.
//
// Concurrency: a key's read-modify-write, set, del and the sweep's
// decision about it all hold the same "stripe" mutex (one of
// NSTRIPES, chosen by hashing the key).  So two concurrent reports of
// the same digest both count, and a sweep that races with a report
// either deletes the old record before the report (which then creates
// a new one) or sees the report's fresh record and keeps it.
//
// The eviction sweep:
//
// start_reorganizing(max_age, interval) - starts a dcore::periodic
//   thread that calls sweep_once(max_age) right away, and then every
//   'interval'.  If max_age isn't positive, nothing is
//   started.  Calling it again replaces the old schedule.
// stop_reorganizing() - stops it.  If a sweep is running, waits for it
//   to finish.  The destructor does the same.
// sweep_once(max_age) - visit every key and delete the records whose
//   last_updated() is more than max_age before now.  Then compact()
//   the backend.  A failure on one key is logged and the sweep moves
//   on to the next.  Only one sweep runs at a time:  if another is in
//   progress, sweep_once returns false immediately.

namespace digest123{

class digest_store{
public:
    using clock_fn = std::function<timestamp()>;
    static timestamp system_now();

    explicit digest_store(std::unique_ptr<kvbackend> backend, clock_fn now = system_now);
    ~digest_store();
    digest_store(const digest_store&) = delete;
    digest_store& operator=(const digest_store&) = delete;

    bool get(const std::string& key, record* rec);
    void set(const std::string& key, const record& rec);
    void del(const std::string& key);
    record report_digest(const std::string& key);
    record whitelist_digest(const std::string& key);

    void start_reorganizing(std::chrono::seconds max_age,
                            std::chrono::seconds interval = std::chrono::hours(24));
    void stop_reorganizing();
    bool reorganizing() const;
    bool sweep_once(std::chrono::seconds max_age);

    std::ostream& report_stats(std::ostream& os);

    static constexpr size_t NSTRIPES = 64;

private:
    std::unique_ptr<kvbackend> backend;
    clock_fn now;
    std::array<std::mutex, NSTRIPES> stripes;
    std::mutex sweep_mtx;
    mutable std::mutex reorg_mtx;
    std::unique_ptr<dcore::periodic> sweeper;

    std::mutex& stripe(const std::string& key);
    // Call with the key's stripe held.
    bool get_locked(const std::string& key, record* rec);
    template <typename Bump>
    record read_modify_write(const std::string& key, Bump bump);

#define DIGEST_STORE_STATISTICS \
    STATISTIC(store_gets)       \
    STATISTIC(store_hits)       \
    STATISTIC(store_misses)     \
    STATISTIC(store_decode_errors) \
    STATISTIC(store_sets)       \
    STATISTIC(store_dels)       \
    STATISTIC(store_reports)    \
    STATISTIC(store_whitelists) \
    STATISTIC(store_sweeps)     \
    STATISTIC(store_sweeps_skipped) \
    STATISTIC(store_sweep_keys) \
    STATISTIC(store_evictions)  \
    STATISTIC(store_sweep_errors) \
    STATISTIC(store_compactions)
#define STATS_STRUCT_TYPENAME digest_store_statistics_t
#define STATS_MACRO_NAME DIGEST_STORE_STATISTICS
#include <dcore/stats_struct_builder>
#undef DIGEST_STORE_STATISTICS
    digest_store_statistics_t stats;
};

} // namespace digest123
