#include "digest123/record_codec.hpp"
#include <dcore/strutils.hpp>
#include <dcore/svto.hpp>
#include <exception>
#include <ctime>

using namespace dcore;

namespace{

const std::string_view none_token = "None";

// Parse exactly n decimal digits starting at s[pos].  Returns -1 if
// any of them isn't a digit.
int digits(std::string_view s, size_t pos, size_t n){
    int ret = 0;
    for(size_t i=pos; i<pos+n; ++i){
        if(s[i] < '0' || s[i] > '9')
            return -1;
        ret = 10*ret + (s[i] - '0');
    }
    return ret;
}

std::uint64_t parse_count(std::string_view sv, const char *name) try {
    return svto<std::uint64_t>(sv);
 }catch(std::exception&){
    std::throw_with_nested(digest123::decode_error(str("decode: bad", name + std::string(":"), "'" + std::string(sv) + "'")));
 }

} // namespace <anon>

namespace digest123{

std::string
format_timestamp(timestamp t){
    if(!is_set(t))
        return std::string(none_token);
    auto us = t.time_since_epoch().count();
    auto secs = us / 1000000;
    auto micros = us % 1000000;
    if(micros < 0){
        micros += 1000000;
        secs -= 1;
    }
    time_t tt = secs;
    struct tm tm;
    if(::gmtime_r(&tt, &tm) == nullptr)
        throw std::out_of_range("format_timestamp: gmtime_r failed");
    int year = tm.tm_year + 1900;
    if(year < 1 || year > 9999)
        throw std::out_of_range(fmt("format_timestamp: year %d is not representable", year));
    return fmt("%04d-%02d-%02d %02d:%02d:%02d.%06d",
               year, tm.tm_mon+1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, int(micros));
}

timestamp
parse_timestamp(std::string_view sv){
    if(sv == none_token)
        return unset_timestamp;
    // 0123456789012345678901234
    // YYYY-MM-DD HH:MM:SS.ffffff
    auto bad = [sv](const char *why){
        return decode_error(str("parse_timestamp:", why + std::string(":"), "'" + std::string(sv) + "'"));
    };
    if(sv.size() != 19 && sv.size() != 26)
        throw bad("wrong length");
    if(sv[4] != '-' || sv[7] != '-' || sv[10] != ' ' || sv[13] != ':' || sv[16] != ':')
        throw bad("wrong punctuation");
    int micros = 0;
    if(sv.size() == 26){
        if(sv[19] != '.')
            throw bad("wrong punctuation");
        micros = digits(sv, 20, 6);
    }
    struct tm tm = {};
    tm.tm_year = digits(sv, 0, 4);
    tm.tm_mon = digits(sv, 5, 2);
    tm.tm_mday = digits(sv, 8, 2);
    tm.tm_hour = digits(sv, 11, 2);
    tm.tm_min = digits(sv, 14, 2);
    tm.tm_sec = digits(sv, 17, 2);
    if(micros < 0 || tm.tm_year < 1 || tm.tm_mon < 1 || tm.tm_mday < 1 ||
       tm.tm_hour < 0 || tm.tm_min < 0 || tm.tm_sec < 0)
        throw bad("not a number");
    tm.tm_year -= 1900;
    tm.tm_mon -= 1;
    struct tm want = tm;
    time_t tt = ::timegm(&tm);
    // timegm "normalizes" out-of-range fields, e.g., Feb 30 becomes
    // Mar 2.  We don't want that.
    if(tm.tm_year != want.tm_year || tm.tm_mon != want.tm_mon || tm.tm_mday != want.tm_mday ||
       tm.tm_hour != want.tm_hour || tm.tm_min != want.tm_min || tm.tm_sec != want.tm_sec)
        throw bad("field out of range");
    return timestamp(std::chrono::seconds(tt) + std::chrono::microseconds(micros));
}

std::string
encode(const record& r){
    return str_sep(",", 1,
                   r.report_count, format_timestamp(r.report_entered), format_timestamp(r.report_updated),
                   r.whitelist_count, format_timestamp(r.whitelist_entered), format_timestamp(r.whitelist_updated));
}

record
decode(std::string_view bytes){
    auto fields = svsplit_exact(bytes, ",");
    if(fields.empty() || fields[0] != "1")
        throw decode_error("decode: unrecognized format version in '" + std::string(bytes) + "'");
    if(fields.size() != 7)
        throw decode_error(fmt("decode: expected 7 fields, got %zu in '%.*s'", fields.size(), int(bytes.size()), bytes.data()));
    record r;
    r.report_count = parse_count(fields[1], "report_count");
    r.report_entered = parse_timestamp(fields[2]);
    r.report_updated = parse_timestamp(fields[3]);
    r.whitelist_count = parse_count(fields[4], "whitelist_count");
    r.whitelist_entered = parse_timestamp(fields[5]);
    r.whitelist_updated = parse_timestamp(fields[6]);
    if(!r.consistent())
        throw decode_error("decode: a *_updated timestamp precedes its *_entered in '" + std::string(bytes) + "'");
    return r;
}

std::ostream&
operator<<(std::ostream& os, const record& r){
    return os << encode(r);
}

} // namespace digest123
