#pragma once

// log_channel - a sink for pre-formatted log records, chosen by name:
//
//   filename           append to the file, created with 'mode' if
//                      necessary
//   %stderr            file descriptor 2
//   %none, or ""       discard everything
//   %syslog[%A[%B]]    syslog(3).  A and B are a LOG_<level> and/or a
//                      LOG_<facility>, in either order.  The defaults
//                      are LOG_NOTICE and LOG_USER.
//
// A newline is added to file and stderr records that lack one.
// reopen() opens the same name again, for use after logrotate.
//
// send, open and reopen are thread-safe.

#include <string>
#include <string_view>
#include <mutex>

namespace dcore{

class log_channel{
public:
    log_channel() = default;
    log_channel(const std::string& dest, int mode){ open(dest, mode); }
    log_channel(const log_channel&) = delete;
    log_channel& operator=(const log_channel&) = delete;
    ~log_channel();

    void open(const std::string& dest, int mode = 0666);
    void reopen();
    // level only matters for %syslog.  -1 means the level given in
    // the destination.
    void send(int level, std::string_view sv) const;
    void send(std::string_view sv) const { send(-1, sv); }
    std::string destination() const;

private:
    enum class sink { none, syslog, fd };
    mutable std::mutex mtx;
    sink kind = sink::none;
    int fd = -1;
    bool own_fd = false;        // close fd when we're done with it
    int syslog_facility = 0;
    int syslog_level = 0;
    std::string dest_name;
    int dest_mode = 0;

    void open_locked(const std::string& dest, int mode);
    void close_locked();
    void parse_syslog_dest(std::string_view dest);
};

} // namespace dcore
