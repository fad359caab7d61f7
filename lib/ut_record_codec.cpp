#include "digest123/record_codec.hpp"
#include <dcore/envto.hpp>
#include <dcore/exnest.hpp>
#include <dcore/ut.hpp>
#include <limits>

using namespace digest123;
using namespace std::chrono;

namespace{
// 2024-03-05 06:07:08.000009 UTC
const timestamp t1 = timestamp(seconds(1709618828) + microseconds(9));

void expect_decode_error(const std::string& s){
    bool caught = false;
    try{
        decode(s);
    }catch(decode_error& e){
        caught = true;
        for(auto& w : dcore::exnest_whats(e))
            DIAG(_ut, "expected decode_error: " << w);
    }
    if(caught){
        utpass++;
    }else{
        utfail++;
        std::cerr << "FAILED: decode(\"" << s << "\") did not throw decode_error\n";
    }
}
} // namespace <anon>

int main(int, char **){
    dcore::set_diag_names(dcore::envto<std::string>("Digest123DiagNames", ""));

    EQSTR(format_timestamp(t1), "2024-03-05 06:07:08.000009");
    EQSTR(format_timestamp(unset_timestamp), "None");
    CHECK(parse_timestamp("2024-03-05 06:07:08.000009") == t1);
    CHECK(parse_timestamp("None") == unset_timestamp);
    // The form without microseconds.
    CHECK(parse_timestamp("2024-03-05 06:07:08") == t1 - microseconds(9));
    THROWS(parse_timestamp("2024-02-30 00:00:00"), decode_error);
    THROWS(parse_timestamp("2024-03-05T06:07:08"), decode_error);
    THROWS(parse_timestamp("2024-03-05 6:07:08.000009"), decode_error);
    THROWS(parse_timestamp("2024-03-05 06:07:08.0000x9"), decode_error);
    THROWS(parse_timestamp(""), decode_error);
    // Lexical order is time order.
    CHECK(format_timestamp(t1) < format_timestamp(t1 + microseconds(1)));
    CHECK(format_timestamp(t1 + seconds(1)) < format_timestamp(t1 + hours(24*400)));

    record r;
    r.report_count = 3;
    r.report_entered = t1;
    r.report_updated = t1 + hours(1);
    EQSTR(encode(r), "1,3,2024-03-05 06:07:08.000009,2024-03-05 07:07:08.000009,0,None,None");
    CHECK(decode(encode(r)) == r);

    // Round trips, including the extremes.
    record r2;
    CHECK(decode(encode(r2)) == r2);
    r2.report_count = std::numeric_limits<std::uint64_t>::max();
    r2.whitelist_count = 1;
    r2.whitelist_entered = t1 - hours(24*365*30);
    r2.whitelist_updated = t1 + microseconds(999990);
    CHECK(decode(encode(r2)) == r2);
    // Something older than the epoch still works.
    r2.report_entered = timestamp(seconds(-86400) + microseconds(1));
    r2.report_updated = r2.report_entered;
    EQSTR(format_timestamp(r2.report_entered), "1969-12-31 00:00:00.000001");
    CHECK(decode(encode(r2)) == r2);

    // What an older server wrote:  no microseconds when they were zero.
    auto old = decode("1,7,2020-01-01 00:00:00,2020-01-02 12:00:00.500000,2,2020-01-03 00:00:00,2020-01-03 00:00:00");
    EQUAL(old.report_count, 7u);
    EQUAL(old.whitelist_count, 2u);
    EQSTR(format_timestamp(old.report_updated), "2020-01-02 12:00:00.500000");

    expect_decode_error("");
    expect_decode_error("2,3,None,None,0,None,None");
    expect_decode_error("1,3,None,None,0,None");
    expect_decode_error("1,3,None,None,0,None,None,extra");
    expect_decode_error("1,-3,None,None,0,None,None");
    expect_decode_error("1,three,None,None,0,None,None");
    expect_decode_error("1,3,None,None,0,None,yesterday");
    expect_decode_error("1,99999999999999999999999,None,None,0,None,None");
    // Updated before entered.
    expect_decode_error("1,1,2024-03-05 06:07:08,2024-03-05 06:07:07.999999,0,None,None");
    expect_decode_error("1,0,None,None,1,2024-03-05 06:07:08,None");
    // A pair with only its updated half is tolerated.
    auto half = decode("1,1,None,2024-03-05 06:07:08,0,None,None");
    CHECK(!is_set(half.report_entered));
    CHECK(half.consistent());

    std::ostringstream oss;
    oss << r;
    EQSTR(oss.str(), encode(r));

    return utstatus();
}
