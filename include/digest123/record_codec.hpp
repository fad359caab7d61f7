#pragma once

#include "record.hpp"
#include <stdexcept>
#include <string>
#include <string_view>

// The stored form of a record is a single line of text:
//
//   1,<report_count>,<report_entered>,<report_updated>,<whitelist_count>,<whitelist_entered>,<whitelist_updated>
//
// The leading 1 is a format version.  Counts are decimal.  Timestamps
// are UTC, formatted as "YYYY-MM-DD HH:MM:SS.ffffff", which sorts
// lexically in time order.  An unset timestamp is "None".  decode
// also accepts timestamps without the ".ffffff" (as older servers
// wrote them when the microseconds were zero).

namespace digest123{

struct decode_error : public std::runtime_error{
    explicit decode_error(const std::string& what) : std::runtime_error(what){}
};

std::string encode(const record& r);

// Throws decode_error if the version isn't 1, if there aren't exactly
// seven fields, if any field doesn't parse, or if the result isn't
// record::consistent().
record decode(std::string_view bytes);

std::string format_timestamp(timestamp t);
// Throws decode_error.
timestamp parse_timestamp(std::string_view sv);

} // namespace digest123
