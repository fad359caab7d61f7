#pragma once
#include <stdexcept>
#include <string>
#include <syslog.h>

namespace dcore{

// syslog_number("LOG_WARNING") -> LOG_WARNING.  Accepts the level
// names (LOG_EMERG through LOG_DEBUG) and the facility names that
// make sense for a daemon.  Anything else throws.
inline int syslog_number(const std::string& s){
    static const struct { const char *name; int value; } symbols[] = {
#define DCORE_SYSLOG_SYMBOL(sym) {#sym, sym}
        DCORE_SYSLOG_SYMBOL(LOG_EMERG),
        DCORE_SYSLOG_SYMBOL(LOG_ALERT),
        DCORE_SYSLOG_SYMBOL(LOG_CRIT),
        DCORE_SYSLOG_SYMBOL(LOG_ERR),
        DCORE_SYSLOG_SYMBOL(LOG_WARNING),
        DCORE_SYSLOG_SYMBOL(LOG_NOTICE),
        DCORE_SYSLOG_SYMBOL(LOG_INFO),
        DCORE_SYSLOG_SYMBOL(LOG_DEBUG),
        DCORE_SYSLOG_SYMBOL(LOG_DAEMON),
        DCORE_SYSLOG_SYMBOL(LOG_MAIL),
        DCORE_SYSLOG_SYMBOL(LOG_USER),
        DCORE_SYSLOG_SYMBOL(LOG_LOCAL0),
        DCORE_SYSLOG_SYMBOL(LOG_LOCAL1),
        DCORE_SYSLOG_SYMBOL(LOG_LOCAL2),
        DCORE_SYSLOG_SYMBOL(LOG_LOCAL3),
        DCORE_SYSLOG_SYMBOL(LOG_LOCAL4),
        DCORE_SYSLOG_SYMBOL(LOG_LOCAL5),
        DCORE_SYSLOG_SYMBOL(LOG_LOCAL6),
        DCORE_SYSLOG_SYMBOL(LOG_LOCAL7),
#undef DCORE_SYSLOG_SYMBOL
    };
    for(const auto& sym : symbols)
        if(s == sym.name)
            return sym.value;
    throw std::invalid_argument("syslog_number: unrecognized syslog symbol: " + s);
}

} // namespace dcore
