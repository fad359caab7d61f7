#include "dcore/log_channel.hpp"
#include "dcore/syslog_number.hpp"
#include "dcore/strutils.hpp"
#include "dcore/throwutils.hpp"
#include <stdexcept>
#include <fcntl.h>
#include <unistd.h>
#include <sys/uio.h>
#include <syslog.h>

namespace dcore{

log_channel::~log_channel(){
    std::lock_guard<std::mutex> lg(mtx);
    if(own_fd)
        ::close(fd);
}

void log_channel::open(const std::string& dest, int mode){
    std::lock_guard<std::mutex> lg(mtx);
    open_locked(dest, mode);
}

void log_channel::reopen(){
    std::lock_guard<std::mutex> lg(mtx);
    open_locked(dest_name, dest_mode);
}

std::string log_channel::destination() const{
    std::lock_guard<std::mutex> lg(mtx);
    return dest_name;
}

void log_channel::close_locked() /* private */{
    int oldfd = fd;
    bool owned = own_fd;
    kind = sink::none;
    fd = -1;
    own_fd = false;
    if(owned && ::close(oldfd) != 0)
        throw se("log_channel: close failed on " + dest_name);
}

void log_channel::open_locked(const std::string& dest, int mode) /* private */{
    // Whatever happens below, the old sink is gone.
    close_locked();
    dest_name = dest;
    dest_mode = mode;
    if(dest.empty() || dest == "%none")
        return;
    if(startswith(dest, "%syslog")){
        parse_syslog_dest(dest);
        kind = sink::syslog;
    }else if(dest == "%stderr"){
        fd = STDERR_FILENO;
        kind = sink::fd;
    }else if(dest[0] == '%'){
        throw std::invalid_argument("log_channel: unknown destination: " + dest);
    }else{
        int newfd = ::open(dest.c_str(), O_CLOEXEC|O_WRONLY|O_APPEND|O_CREAT, mode);
        if(newfd < 0)
            throw se("log_channel: could not open " + dest);
        fd = newfd;
        own_fd = true;
        kind = sink::fd;
    }
}

void log_channel::send(int level, std::string_view sv) const {
    if(sv.empty())
        return;
    std::lock_guard<std::mutex> lg(mtx);
    switch(kind){
    case sink::none:
        return;
    case sink::syslog:{
        // Only the level bits of 'level' are used.
        int lev = (level < 0) ? syslog_level : (level & LOG_PRIMASK);
        ::syslog(syslog_facility | lev, "%.*s", int(sv.size()), sv.data());
        return;
    }
    case sink::fd:{
        struct iovec iov[2] = {{const_cast<char*>(sv.data()), sv.size()},
                               {const_cast<char*>("\n"), 1}};
        int iovcnt = (sv.back() == '\n') ? 1 : 2;
        if(::writev(fd, iov, iovcnt) < 0)
            throw se("log_channel::send: writev failed on " + dest_name);
        return;
    }
    }
}

// "%syslog", "%syslog%LOG_INFO", "%syslog%LOG_DAEMON%LOG_ERR", ...
void log_channel::parse_syslog_dest(std::string_view dest) /* private */{
    syslog_facility = LOG_USER;
    syslog_level = LOG_NOTICE;
    auto rest = dest.substr(sizeof("%syslog") - 1);
    if(rest.empty())
        return;
    if(rest[0] != '%')
        throw std::invalid_argument("log_channel: expected %syslog%<level-or-facility>, not " + std::string(dest));
    auto args = svsplit_exact(rest, "%", 1);
    if(args.size() > 2)
        throw std::invalid_argument("log_channel: at most a level and a facility may follow %syslog in " + std::string(dest));
    for(auto arg : args){
        int n = syslog_number(std::string(arg));
        if((n & LOG_PRIMASK) == n)
            syslog_level = n;
        else
            syslog_facility = n;
    }
}

} // namespace dcore
