// digest123d - hosts the digest store and the authority for a
// spam-signature server.  It loads the accounts and access files,
// opens the store, runs the eviction sweep, and waits for signals:
//
//   SIGHUP           re-read the accounts and access files
//   SIGUSR1          reopen the log destination (after log rotation)
//   SIGINT, SIGTERM, SIGQUIT   stop the sweep and exit
//
// Every --heartbeat seconds it logs the store and authority
// statistics at LOG_INFO.
#include "digest123/authority.hpp"
#include "digest123/digest_store.hpp"
#include "digest123/kvbackend.hpp"
#include <dcore/autoclosers.hpp>
#include <dcore/complaints.hpp>
#include <dcore/diag.hpp>
#include <dcore/strutils.hpp>
#include <dcore/syslog_number.hpp>
#include <dcore/throwutils.hpp>
#include <gflags/gflags.h>
#include <event2/event.h>
#include <fstream>
#include <sstream>
#include <vector>
#include <signal.h>
#include <unistd.h>
#include <syslog.h>

#define PROGNAME "digest123d"

using namespace dcore;
using namespace digest123;

DEFINE_string(accounts_file, "/etc/digest123/accounts", "server accounts, one 'username : key' per line.  If it doesn't exist, only the anonymous user is served");
DEFINE_string(access_file, "/etc/digest123/access", "access rules, one 'operations : users : allow|deny' per line.  If it doesn't exist, anonymous may check, report, ping, pong and info");
DEFINE_string(store, "sqlite:/var/lib/digest123/digests.db", "where to keep the digest records:  memory: or sqlite:<path>");
DEFINE_int64(max_age, 7776000, "the sweep evicts records not reported or whitelisted in this many seconds.  Zero or negative disables the sweep");
DEFINE_uint64(sweep_interval, 86400, "number of seconds between sweeps");
DEFINE_uint64(heartbeat, 60, "number of seconds between each heartbeat to the log");
DEFINE_string(log_destination, "%stderr", "destination for log records.  Format:  \"filename\" or \"%syslog%LOG_facility\" or \"%stderr\" or \"%none\"");
DEFINE_string(log_min_level, "LOG_NOTICE", "only send complaints of this severity level or higher to the log_destination");
DEFINE_string(diag_names, "", "string passed to diag_names");
DEFINE_string(diag_destination, "", "file to append diag output to");
DEFINE_string(pidfile, "", "name of the file in which to write our pid");

namespace{
auto _proc = diag_name("proc");

std::unique_ptr<authority> the_authority;
std::unique_ptr<digest_store> the_store;
std::vector<event*> events2befreed;

void setup_common(int *argcp, char ***argvp){
    gflags::SetUsageMessage("Usage: " PROGNAME " [--options]");
    gflags::ParseCommandLineFlags(argcp, argvp, true);

    if(FLAGS_sweep_interval == 0)
        throw se(EINVAL, "--sweep_interval must be positive");
    if(FLAGS_heartbeat == 0)
        throw se(EINVAL, "--heartbeat must be positive");

    // N.B.  glibc's openlog(...,0) leaves the default facility alone
    // if it was previously set, and sets it to LOG_USER if it wasn't.
    openlog(PROGNAME, LOG_PID|LOG_NDELAY, 0);
    auto level = syslog_number(FLAGS_log_min_level);
    set_complaint_destination(FLAGS_log_destination, 0666);
    set_complaint_level(level);

    if(!FLAGS_diag_names.empty()){
        set_diag_names(FLAGS_diag_names);
        if(!FLAGS_diag_destination.empty())
            set_diag_destination(FLAGS_diag_destination);
        DIAG(true, "diags:\n" << get_diag_names() << "\n");
    }

    if(!FLAGS_pidfile.empty()){
        std::ofstream ofs(FLAGS_pidfile.c_str());
        ofs << ::getpid() << "\n";
        ofs.close();
        if(!ofs)
            throw se("Could not write to pidfile " + FLAGS_pidfile);
    }
}

void teardown_common(){
    for(auto e : events2befreed)
        event_free(e);
    events2befreed.clear();
    gflags::ShutDownCommandLineFlags();
}

void heartbeat(){
    std::ostringstream oss;
    the_store->report_stats(oss);
    the_authority->report_stats(oss);
    auto lines = svsplit_exact(oss.str(), "\n");
    std::string s = "heartbeat:";
    for(auto l : lines)
        if(!l.empty())
            s += " " + std::string(l) + ";";
    complain(LOG_INFO, s);
}

void add_event(struct event_base *eb, evutil_socket_t fd, short what, event_callback_fn cb, void *arg, const struct timeval *tv){
    auto e = event_new(eb, fd, what, cb, arg);
    if(e == nullptr)
        throw se(errno, "event_new failed");
    events2befreed.push_back(e);
    if(event_add(e, tv) < 0)
        throw se(errno, "event_add failed");
}

void setup_evtimersig(struct event_base *eb){
    auto stopcb = [] (evutil_socket_t signum, short, void *arg) -> void {
        auto b = static_cast<struct event_base *>(arg);
        try{
            complain(LOG_NOTICE, fmt("Caught signal %d.  calling event_base_loopbreak", int(signum)));
        }catch(std::exception& e){
            complain(e, "caught exception in stopcb");
        }
        event_base_loopbreak(b);
    };
    for(auto sig : {SIGINT, SIGTERM, SIGQUIT})
        add_event(eb, sig, EV_SIGNAL, stopcb, eb, nullptr);

    auto timecb = [] (evutil_socket_t, short, void *) -> void {
        try{
            heartbeat();
        }catch(std::exception& e){
            complain(e, "caught exception in timecb");
        }
    };
    const struct timeval hb{time_t(FLAGS_heartbeat), 0};
    add_event(eb, -1, EV_PERSIST, timecb, nullptr, &hb);

    // SIGHUP re-reads the accounts and the access rules.  If that
    // fails, we keep serving with the old ones.
    auto sighup = [] (evutil_socket_t, short, void *) -> void {
        try{
            complain(LOG_NOTICE, "SIGHUP caught.  Reloading " + FLAGS_accounts_file + " and " + FLAGS_access_file);
            the_authority->reload();
        }catch(std::exception& e){
            complain(e, "Error caught while handling SIGHUP.  Continuing with the previous accounts and access rules");
        }
    };
    add_event(eb, SIGHUP, EV_SIGNAL|EV_PERSIST, sighup, nullptr, nullptr);

    auto sigusr1 = [] (evutil_socket_t, short, void *) -> void {
        try{
            complain(LOG_NOTICE, "SIGUSR1 caught.  reopening logs (including this one).");
            reopen_complaint_destination();
            complain(LOG_NOTICE, "SIGUSR1 caught.  reopened log " + FLAGS_log_destination);
        }catch(std::exception& ex){
            complain(ex, "Error caught while handling SIGUSR1");
        }
    };
    add_event(eb, SIGUSR1, EV_SIGNAL|EV_PERSIST, sigusr1, nullptr, nullptr);
}

} // namespace <anon>

int main(int argc, char **argv) try
{
    setup_common(&argc, &argv);

    auto ebac = make_autocloser(event_base_new(), event_base_free);
    if(!ebac)
        throw se(errno, "event_base_new failed");

    the_authority = std::make_unique<authority>(FLAGS_accounts_file, FLAGS_access_file);
    try{
        the_store = std::make_unique<digest_store>(make_backend(FLAGS_store));
    }catch(std::exception&){
        std::throw_with_nested(std::runtime_error("could not open the store: " + FLAGS_store));
    }
    the_store->start_reorganizing(std::chrono::seconds(FLAGS_max_age),
                                  std::chrono::seconds(FLAGS_sweep_interval));
    setup_evtimersig(ebac);

    log_notice(str(PROGNAME, "started.  store:", FLAGS_store, "pid:", ::getpid()));
    if(event_base_dispatch(ebac) < 0)
        complain(LOG_ERR, fmt("event_base_dispatch returned error %d", errno));

    the_store->stop_reorganizing();
    heartbeat();
    log_notice(PROGNAME " shutting down");
    DIAG(_proc, "finished main");
    teardown_common();
    the_store.reset();
    the_authority.reset();
    return 0;
 }catch(std::exception& e){
    complain(e, "Shutting down because of exception caught in main");
    return 1;
 }
