#pragma once

#include <dcore/log_channel.hpp>
#include <atomic>
#include <exception>
#include <string>
#include <vector>
#include <syslog.h>

// How to complain?  Use one of:
//
//   complain(string)
//   complain(priority, string)
//   complain(exception, string)
//   complain(priority, exception, string)
//
// There's no printf-style overload.  Use fmt() or str() from
// strutils.hpp to build the string.
//
//   log_notice(string) is shorthand for complain(LOG_NOTICE, string).
//
// Complaints that satisfy the level limit are forwarded to a
// log_channel (%stderr until set_complaint_destination is called).
// If the diag name "complaints" is set, they are also sent to the
// diag stream.  All functions are thread-safe.
//
// The 'priority' is passed, unchanged, to the log channel.  As in
// syslog, it's the bitwise-or of an optional facility and a level,
// e.g., LOG_ERR or LOG_WARNING|LOG_LOCAL2.  complain(string) and
// complain(exception, string) use LOG_ERR.
//
// When an exception argument is present, it is recursively
// "un-nested", and each line of each nested exception's what() is
// logged separately.
//
// Every complaint gets a sequence number, and each part of a
// multi-part complaint (i.e., a nested exception) gets a
// sub-sequence number.  Messages are prefixed with:
//
//     L[seqno.subseq]
//
// so that interleaved complaints from different threads can be teased
// apart later.  L is a one-character indicator of the level:
// emer'G', 'A'lert, 'C'rit, 'E'rr, 'W'arning, 'N'otice, 'I'nfo or
// 'D'ebug.
//
// Level limiting:
//
//     set_complaint_level(int level)
//
// is roughly setlogmask(LOG_UPTO(level)), but it acts before any
// formatting or un-nesting, so complain(LOG_DEBUG, ...) is cheap when
// the level is lower.  The default is LOG_DEBUG, i.e., everything is
// delivered.

namespace dcore{

extern std::atomic<int> _complaint_level;
void _do_complaint(int priority, const std::vector<std::string>& vs);
std::vector<std::string> _whatnest(int priority, const std::string& pfx, const std::exception* ep);

void set_complaint_destination(const std::string& dest, int mode = 0666);
void reopen_complaint_destination();
std::string get_complaint_destination();

inline void set_complaint_level(int level){ _complaint_level.store(level); }
inline int get_complaint_level(){ return _complaint_level.load(); }

inline bool _complaint_enabled(int priority){
    return (priority & 0x7) <= _complaint_level.load(std::memory_order_relaxed);
}

inline void complain(int priority, const std::string& msg){
    if(_complaint_enabled(priority))
        _do_complaint(priority, _whatnest(priority, msg, nullptr));
}

inline void complain(int priority, const std::exception& e, const std::string& msg){
    if(_complaint_enabled(priority))
        _do_complaint(priority, _whatnest(priority, msg, &e));
}

inline void complain(const std::string& msg){
    complain(LOG_ERR, msg);
}

inline void complain(const std::exception& e, const std::string& msg){
    complain(LOG_ERR, e, msg);
}

inline void log_notice(const std::string& msg){
    complain(LOG_NOTICE, msg);
}

} // namespace dcore
