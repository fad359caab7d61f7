#include "dcore/complaints.hpp"
#include "dcore/diag.hpp"
#include "dcore/exnest.hpp"
#include "dcore/strutils.hpp"
#include <algorithm>
#include <mutex>

static auto _complaints = dcore::diag_name("complaints");
static std::mutex mtx; // keeps the parts of a multi-part complaint together

namespace dcore{
std::atomic<int> _complaint_level{LOG_DEBUG};

static log_channel& the_channel(){
    // If complain("foo") is called before set_complaint_destination(...),
    // then "foo" will come out on stderr.  Leaked to avoid destructor
    // ordering problems at exit.
    static log_channel *p = new log_channel("%stderr", 0);
    return *p;
}

void
set_complaint_destination(const std::string& dest, int mode){
    the_channel().open(dest, mode);
}

void
reopen_complaint_destination(){
    the_channel().reopen();
}

std::string
get_complaint_destination(){
    return the_channel().destination();
}

void
_do_complaint(int priority, const std::vector<std::string>& vs){
    std::lock_guard<std::mutex> lgd(mtx);
    for(const auto& s : vs){
        DIAG(_complaints, s);
        the_channel().send(priority & 0x7, s);
    }
}

static std::atomic<int> seq_atomic;

std::vector<std::string>
_whatnest(int priority, const std::string& pfx, const std::exception* ep){
    // level keys:  emerG, Alert, Crit, Err, Warning, Notice, Info, Debug
    char levkey = "GACEWNID"[priority&0x7];
    int seq = seq_atomic++;
    std::vector<std::string> ret;
    ret.push_back(fmt("%c[%d.0] %s", levkey, seq, pfx.c_str()));
    if(ep){
        int i=1;
        for(const auto& w : exnest_whats(*ep)){
            // If what() has newlines, expand them into separate elements of ret.
            std::string_view sv(w);
            while(!sv.empty()){
                auto nl = sv.find('\n');
                auto line = sv.substr(0, nl);
                ret.push_back(fmt("%c[%d.%d] %.*s", levkey, seq, i++, int(line.size()), line.data()));
                if(nl == std::string_view::npos)
                    break;
                sv.remove_prefix(nl+1);
            }
        }
    }
    return ret;
}

} // namespace dcore
