#pragma once

/* diag - tools for inserting developer diagnostics into code.

  Basic Usage:

   #include <dcore/diag.hpp>
   ...
   static auto _store = dcore::diag_name("store");
   ...
   DIAG(_store, "anything " << formatable << " using operator<<");
   DIAG(_store>1, "only if you're *very* interested in the store");

  DIAG is a macro, carefully constructed so that the second argument
  is *not evaluated* if the first is false.  So it's safe in tight
  loops, as long as the first argument is quick to evaluate.  A
  diag_ref (returned by diag_name) is quick: it's a relaxed load of an
  atomic int.

  Names are controlled by strings, so they can be set on the command
  line or in the environment:

    dcore::set_diag_names("store:acl=2");

  sets "store" to 1 and "acl" to 2 (and, by default, everything else
  to 0).  The constructor of the_diag() singleton does the equivalent
  of:

    set_diag_names(getenv("DCORE_DIAG_NAMES"));
    set_diag_opts(getenv("DCORE_DIAG_OPTS"));
    set_diag_destination(getenv("DCORE_DIAG_DESTINATION") or "%stderr");

  Destinations are log_channel names (see log_channel.hpp).

  Options (colon separated, optionally prefixed by "no"):
    tstamp  - microsecond timestamp        (default off)
    tid     - thread id                    (default off)
    srcfile - basename of __FILE__         (default off)
    srcline - __LINE__                     (default off)
    func    - __func__                     (default on)
    why     - the stringified first arg    (default on)

  Library code may be called during static initialization, so it
  should call diag_name at function scope rather than file scope.
*/

#include <dcore/log_channel.hpp>
#include <sstream>
#include <string>
#include <atomic>
#include <mutex>
#include <map>

#ifdef NODIAG
#define DIAGloc(BOOL, _file, _line, _func, _expr)
#else

#ifdef __GNUC__
#define __diag_unlikely(x) __builtin_expect(x, 0)
#else
#define __diag_unlikely(x) x
#endif

#define DIAGloc(BOOL, _file, _line, _func, _expr) do{                   \
        if( __diag_unlikely(bool(BOOL)) ){                              \
            dcore::diag_t& td = dcore::the_diag();                      \
            std::lock_guard<std::recursive_mutex> __diag_lg(td._diag_mtx); \
            td._diag_before( #BOOL , _file, _line, _func) << _expr;     \
            td._diag_after();                                           \
        }                                                               \
    }while(0)

#endif /* NODIAG */

#define DIAG(BOOL, expr)                        \
    DIAGloc(BOOL, __FILE__, __LINE__, __func__, expr)

#define DIAGf(BOOL, ...) \
    DIAGloc(BOOL, __FILE__, __LINE__, __func__, dcore::fmt(__VA_ARGS__))

namespace dcore{

// diag_ref - a cheap handle on one of the_diag()'s named integers.
// The integers live as long as the program, so diag_refs can be
// copied freely.
class diag_ref{
    std::atomic<int>* p;
public:
    explicit diag_ref(std::atomic<int>* p_) : p(p_){}
    operator int() const { return p->load(std::memory_order_relaxed); }
    diag_ref& operator=(int v){ p->store(v, std::memory_order_relaxed); return *this; }
};

struct diag_t{
    diag_ref diag_name(const std::string& name, int initial_value = 0);
    // set_diag_names: str is a colon-separated list of
    // key[=decimal_value] tokens, each of which sets the diagnostic
    // level of 'key' to the given decimal value (1 if the value is
    // unspecified).
    void set_diag_names(const std::string& str, bool clear_before_set = true);
    // get_diag_names:  the "inverse" of set_diag_names.
    std::string get_diag_names(bool showall = false);
    void set_diag_destination(const std::string& dest, int mode = 0666);
    void set_diag_opts(const std::string& opts, bool restore_defaults_before_set = true);

    bool opt_tstamp;
    bool opt_tid;
    bool opt_srcfile;
    bool opt_srcline;
    bool opt_func;
    bool opt_why;

    // private - do not call or modify.  They're only public because
    // the DIAG macro needs them.
    std::recursive_mutex _diag_mtx;
    std::ostream& _diag_before(const char* k, const char *file, int line, const char *func);
    void _diag_after();

    friend diag_t& the_diag();
private:
    diag_t();
    void set_opt_defaults();
    std::ostringstream os;
    log_channel logchan;
    std::mutex names_mtx;
    // thenames is a bare, new'ed pointer.  It leaks, intentionally, to
    // avoid the static destructor fiasco when everything gets torn
    // down.
    std::map<std::string, std::atomic<int>>* thenames;
};

inline diag_t& the_diag(){
    static diag_t _the_diag;
    return _the_diag;
}

inline diag_ref diag_name(const std::string& s, int initial_value = 0){ return the_diag().diag_name(s, initial_value); }
inline void set_diag_names(const std::string& s, bool clear_before_set = true){ the_diag().set_diag_names(s, clear_before_set); }
inline std::string get_diag_names(bool showall = false){ return the_diag().get_diag_names(showall); }
inline void set_diag_destination(const std::string& dest, int mode = 0666){ the_diag().set_diag_destination(dest, mode); }
inline void set_diag_opts(const std::string& opts, bool restore_defaults_before_set = true){ the_diag().set_diag_opts(opts, restore_defaults_before_set); }

} // namespace dcore
