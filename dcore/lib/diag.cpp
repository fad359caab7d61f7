#include "dcore/diag.hpp"
#include "dcore/strutils.hpp"
#include <chrono>
#include <iomanip>
#include <cstdlib>
#include <cstdio>
#include <ctime>
#include <unistd.h>
#include <sys/syscall.h>

namespace dcore{

diag_t::diag_t() :
    logchan("%stderr", 0),
    thenames(new std::map<std::string, std::atomic<int>>)
{
    const char *p;
    set_diag_names( (p=::getenv("DCORE_DIAG_NAMES")) ? p : "");
    set_diag_opts( (p=::getenv("DCORE_DIAG_OPTS")) ? p : ""); // calls set_opt_defaults
    set_diag_destination( (p=::getenv("DCORE_DIAG_DESTINATION")) ? p : "%stderr");
}

diag_ref
diag_t::diag_name(const std::string& name, int initial_value){
    std::lock_guard<std::mutex> lg(names_mtx);
    // try_emplace leaves a pre-existing value alone.  It was
    // probably set by set_diag_names before anybody asked for it.
    auto pr = thenames->try_emplace(name, initial_value);
    return diag_ref(&pr.first->second);
}

void
diag_t::set_diag_names(const std::string& str, bool clear_before_set){
    if(clear_before_set){
        std::lock_guard<std::mutex> lg(names_mtx);
        for(auto& kv : *thenames)
            kv.second = 0;
    }
    for(auto tok : svsplit_exact(str, ":")){
        tok = sv_strip(tok);
        if(tok.empty())
            continue;
        std::string skey;
        int lev = 1;
        auto idx = tok.find('=');
        if(idx != std::string_view::npos){
            skey = std::string(tok.substr(0, idx));
            // If there's a parse error?  Leave lev=1
            std::string val(tok.substr(idx+1));
            std::sscanf(val.c_str(), "%d", &lev);
        }else{
            skey = std::string(tok);
        }
        diag_name(skey) = lev;
    }
}

std::string
diag_t::get_diag_names(bool showall){
    std::lock_guard<std::mutex> lg(names_mtx);
    const char *sep = "";
    std::ostringstream oss;
    for(const auto& kv : *thenames){
        int v = kv.second.load();
        if(showall || v != 0){
            oss << sep << kv.first << "=" << v;
            sep = ":";
        }
    }
    return oss.str();
}

void
diag_t::set_diag_destination(const std::string& dest, int mode){
    std::lock_guard<std::recursive_mutex> lk(_diag_mtx);
    logchan.open(dest, mode);
}

void
diag_t::set_opt_defaults() /*private*/{
    opt_tstamp = false;
    opt_tid = false;
    opt_srcfile = false;
    opt_srcline = false;
    opt_func = true;
    opt_why = true;
}

void
diag_t::set_diag_opts(const std::string& s, bool restore_defaults_before_set){
    std::lock_guard<std::recursive_mutex> lk(_diag_mtx);
    if(restore_defaults_before_set)
        set_opt_defaults();
    for(auto tok : svsplit_exact(s, ":")){
        bool negate = startswith(tok, "no");
        if(negate)
            tok.remove_prefix(2);
        if(tok == "tstamp")
            opt_tstamp = !negate;
        else if(tok == "tid")
            opt_tid = !negate;
        else if(tok == "srcfile")
            opt_srcfile = !negate;
        else if(tok == "srcline")
            opt_srcline = !negate;
        else if(tok == "func")
            opt_func = !negate;
        else if(tok == "why")
            opt_why = !negate;
    }
}

std::ostream&
diag_t::_diag_before(const char* k, const char *file, int line, const char *func){
    if(opt_tstamp){
        using namespace std::chrono;
        auto now_musec = duration_cast<microseconds>( system_clock::now().time_since_epoch() ).count();
        time_t now_timet = now_musec/1000000;
        auto musec = now_musec%1000000;
        struct tm now_tm;
        if(::localtime_r(&now_timet, &now_tm)){
            auto oldfill = os.fill('0');
            // E.g., "19:09:51.779321 "
            os << std::setw(2)  << now_tm.tm_hour << ':' << std::setw(2) << now_tm.tm_min << ":" << std::setw(2) << now_tm.tm_sec << "." << std::setw(6) << musec << ' ';
            os.fill(oldfill);
        }
    }
    if(opt_tid)
        os << '[' << ::syscall(SYS_gettid) << "] ";
    if(opt_srcfile){
        std::string_view f(file);
        auto slash = f.rfind('/');
        os << ((slash == std::string_view::npos) ? f : f.substr(slash+1));
    }
    if(opt_srcline)
        os << ':' << line << ' ';
    if(opt_func)
        os << func << "() ";
    if(opt_why)
        os << "[" << k << "] ";
    return os;
}

void
diag_t::_diag_after(){
    auto s = os.str();
    os.str({});
    os.clear();
    logchan.send(s);
}

} // namespace dcore
