#pragma once

#include <dcore/strutils.hpp>
#include <dcore/throwutils.hpp>
#include <fstream>
#include <istream>
#include <string>
#include <string_view>
#include <sys/stat.h>
#include <errno.h>

// Shared plumbing for the line-oriented account and access files.

namespace digest123{
namespace detail{

// open_config_file - returns false if path doesn't exist.  Otherwise
// opens ifs and returns true, or throws a system_error if the file
// exists but can't be opened.
inline bool open_config_file(const std::string& path, std::ifstream& ifs){
    struct stat sb;
    if(::stat(path.c_str(), &sb) != 0){
        if(errno == ENOENT)
            return false;
        throw dcore::se("stat(" + path + ")");
    }
    ifs.open(path);
    if(!ifs)
        throw dcore::se("could not open " + path);
    return true;
}

// for_each_config_line - call f(line, lineno) for every line that
// isn't blank or a comment.  The line is whitespace-stripped.  Line
// numbers start at 1.
template <typename F>
void for_each_config_line(std::istream& is, const std::string& srcname, F&& f){
    std::string line;
    int lineno = 0;
    while(std::getline(is, line)){
        ++lineno;
        auto sv = dcore::sv_strip(line);
        if(sv.empty() || sv[0] == '#')
            continue;
        f(sv, lineno);
    }
    if(is.bad())
        throw dcore::se(EIO, "error reading " + srcname);
}

} // namespace detail
} // namespace digest123
