#include <dcore/complaints.hpp>
#include <dcore/strutils.hpp>
#include <dcore/ut.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <cstdio>
#include <unistd.h>

using dcore::complain;
using dcore::set_complaint_destination;
using dcore::set_complaint_level;
using dcore::log_notice;

void throws_a_nested_error(){
    try{
        throw std::runtime_error("innermost");
    }catch(std::exception&){
        std::throw_with_nested(std::runtime_error("line 1 of commentary\nline 2 of commentary"));
    }
}

std::string slurp(const std::string& fname){
    std::ifstream ifs(fname);
    std::ostringstream oss;
    oss << ifs.rdbuf();
    return oss.str();
}

int main(int, char **){
    std::string fname = dcore::fmt("/tmp/ut_complaints.%d", int(::getpid()));
    ::unlink(fname.c_str());
    set_complaint_destination(fname, 0600);
    EQSTR(dcore::get_complaint_destination(), fname);

    complain("a complaint at the default level");
    set_complaint_level(LOG_NOTICE);
    complain(LOG_INFO, "suppressed by the level limit");
    log_notice("a notice");
    try{
        throws_a_nested_error();
    }catch(std::exception& e){
        complain(LOG_WARNING, e, "caught a nested error");
    }
    set_complaint_destination("%none", 0);

    std::string contents = slurp(fname);
    auto lines = dcore::svsplit_exact(contents, "\n");
    // Trailing newline leaves an empty last element.
    EQUAL(lines.size(), 7u);
    if(lines.size() == 7){
        CHECK(dcore::startswith(lines[0], "E["));
        CHECK(dcore::endswith(lines[0], ".0] a complaint at the default level"));
        CHECK(dcore::startswith(lines[1], "N["));
        CHECK(dcore::endswith(lines[1], "a notice"));
        CHECK(dcore::startswith(lines[2], "W["));
        CHECK(dcore::endswith(lines[2], ".0] caught a nested error"));
        CHECK(dcore::endswith(lines[3], ".1] line 1 of commentary"));
        CHECK(dcore::endswith(lines[4], ".2] line 2 of commentary"));
        CHECK(dcore::endswith(lines[5], ".3] innermost"));
    }
    CHECK(slurp(fname).find("suppressed") == std::string::npos);
    ::unlink(fname.c_str());
    return utstatus();
}
