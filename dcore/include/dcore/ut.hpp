#pragma once
#include <iostream>
#include <dcore/diag.hpp>

// Unit test macros.  Each EQUAL, NOTEQUAL, CHECK, THROWS or EQSTR
// counts a pass or a failure.  Failures are reported on std::cerr
// and passes with DIAG(_ut, ...).  main should end with
//
//    return utstatus();

namespace {
static auto _ut = dcore::diag_name("ut");
static unsigned utfail = 0, utpass = 0;

#define EQUAL(x, y) if ((x) != (y)) { utfail++; std::cerr << "FAILED " #x " " << (x) << " != " #y " " << (y) << std::endl; } else {utpass++; DIAG(_ut, "PASSED " #x " " << (x) << " == " #y " " << (y));}
#define NOTEQUAL(x, y) if ((x) == (y)) { utfail++; std::cerr << "FAILED " #x " " << (x) << " == " #y " " << (y) << std::endl; } else {utpass++; DIAG(_ut, "PASSED " #x " " << (x) << " != " #y " " << (y));}
#define CHECK(expr) if(expr) { utpass++; DIAG(_ut, "PASSED " #expr " is true");} else {utfail++; std::cerr << "FAILED " << #expr << " is false\n";}

// THROWS(expr, ExceptionType) passes if evaluating expr throws an
// ExceptionType (or something derived from it).
#define THROWS(expr, EXTYPE) do{ bool _threw = false; try{ (void)(expr); }catch(EXTYPE&){ _threw = true; } \
        if(_threw){ utpass++; DIAG(_ut, "PASSED " #expr " threw " #EXTYPE); }                       \
        else{ utfail++; std::cerr << "FAILED " #expr " did not throw " #EXTYPE "\n"; } }while(0)

#define EQSTR(x, y) _EQSTR(x, y, #x)
inline void _EQSTR(const std::string& x, const std::string& y, const char *xexpr){
    if ((x) != (y)) {
        utfail++;
        std::cerr << "FAILED " << xexpr << "-> '" << x << "' != " << (y) << std::endl;
    } else {
        utpass++; DIAG(_ut, "PASSED " << xexpr << "-> '" << x << "' == '" << y << "'");
    }
}

// 0 if nothing failed, otherwise 1.  With verbose, a one-line
// summary goes to std::cout.
inline int utstatus(bool verbose = true) {
    if (verbose) {
        std::cout << (utfail == 0 ? "OK, All " : "ERROR ");
        std::cout << utpass << " tests passed, " << utfail << " failed." << std::endl;
    }
    return utfail == 0 ? 0 : 1;
}

} // namespace <anon>
