#pragma once

#include <chrono>
#include <algorithm>
#include <cstdint>
#include <ostream>

namespace digest123{

// Record timestamps have microsecond resolution, which is exactly
// what the text encoding can represent.  The clock's epoch means
// "never set".
using timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::microseconds>;

constexpr timestamp unset_timestamp{};

inline bool is_set(timestamp t){ return t != unset_timestamp; }

// The counters and timestamps tracked for one digest.  In a
// consistent() record, a pair with its entered set has
// entered <= updated.  The store neither writes nor returns any other
// kind.
struct record{
    std::uint64_t report_count = 0;
    timestamp report_entered{};
    timestamp report_updated{};
    std::uint64_t whitelist_count = 0;
    timestamp whitelist_entered{};
    timestamp whitelist_updated{};

    // The later of the two *_updated timestamps.  It's what the sweep
    // compares against max_age.
    timestamp last_updated() const{
        return std::max(report_updated, whitelist_updated);
    }

    // False if either pair has its entered set and an updated that
    // comes before it.
    bool consistent() const{
        return pair_consistent(report_entered, report_updated) &&
            pair_consistent(whitelist_entered, whitelist_updated);
    }
    static bool pair_consistent(timestamp entered, timestamp updated){
        return !is_set(entered) || updated >= entered;
    }

    bool operator==(const record& rhs) const{
        return report_count == rhs.report_count &&
            report_entered == rhs.report_entered &&
            report_updated == rhs.report_updated &&
            whitelist_count == rhs.whitelist_count &&
            whitelist_entered == rhs.whitelist_entered &&
            whitelist_updated == rhs.whitelist_updated;
    }
    bool operator!=(const record& rhs) const { return !(*this == rhs); }
};

// Inserts the encoded form (see record_codec.hpp).
std::ostream& operator<<(std::ostream& os, const record& r);

} // namespace digest123
