// Syslog delivery can't be checked from here.  We only check that
// the %syslog forms are accepted or rejected.

#include <dcore/log_channel.hpp>
#include <dcore/strutils.hpp>
#include <dcore/ut.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <cstdio>
#include <unistd.h>
#include <syslog.h>

using dcore::log_channel;

namespace{
std::string slurp(const std::string& fname){
    std::ifstream ifs(fname);
    std::ostringstream oss;
    oss << ifs.rdbuf();
    return oss.str();
}
}

int main(int, char **){
    std::string fname = dcore::fmt("/tmp/ut_log_channel.%d", int(::getpid()));
    std::string rotated = fname + ".1";
    ::unlink(fname.c_str());
    ::unlink(rotated.c_str());

    log_channel lc(fname, 0600);
    EQSTR(lc.destination(), fname);
    lc.send("no newline");
    lc.send("has a newline\n");
    lc.send("");
    lc.send(LOG_ERR, "level is ignored for files");
    EQSTR(slurp(fname), "no newline\nhas a newline\nlevel is ignored for files\n");

    // After logrotate moves the file, reopen starts a new one.
    CHECK(::rename(fname.c_str(), rotated.c_str()) == 0);
    lc.send("still the old file");
    lc.reopen();
    lc.send("the new file");
    EQSTR(slurp(fname), "the new file\n");
    EQSTR(slurp(rotated), "no newline\nhas a newline\nlevel is ignored for files\nstill the old file\n");

    lc.open("%none");
    lc.send("discarded");
    lc.open("");
    lc.send("discarded too");
    EQSTR(slurp(fname), "the new file\n");

    lc.open("%syslog");
    lc.open("%syslog%LOG_INFO");
    lc.open("%syslog%LOG_DAEMON%LOG_ERR");
    EQSTR(lc.destination(), "%syslog%LOG_DAEMON%LOG_ERR");
    THROWS(lc.open("%syslog%LOG_BOGUS"), std::invalid_argument);
    THROWS(lc.open("%syslog%"), std::invalid_argument);
    THROWS(lc.open("%syslogLOG_INFO"), std::invalid_argument);
    THROWS(lc.open("%syslog%LOG_INFO%LOG_USER%LOG_ERR"), std::invalid_argument);
    THROWS(lc.open("%stdout"), std::invalid_argument);
    THROWS(lc.open("%whatever"), std::invalid_argument);
    // A failed open leaves nothing open.
    lc.send("nowhere");
    THROWS(lc.open("/nonexistent-dir/ut_log_channel"), std::system_error);

    ::unlink(fname.c_str());
    ::unlink(rotated.c_str());
    return utstatus();
}
