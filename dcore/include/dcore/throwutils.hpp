#pragma once

#include <dcore/strutils.hpp>
#include <system_error>
#include <string>
#include <errno.h>

namespace dcore {

// se(eno, msg) - a std::system_error in the system_category.
// se(msg) - the same, with the current value of errno.
//
//     if(::rmdir(d) < 0)
//         throw se("rmdir(" + d + ")");
inline std::system_error se(int eno, const std::string& msg){
    return std::system_error(eno, std::system_category(), msg);
}

inline std::system_error se(const std::string& msg){
    return se(errno, msg);
}

// strfunargs("f", 1, "x") -> "f(1, x)"
template <typename ... Args>
std::string
strfunargs(const std::string& name, Args ... args){
    return name + "(" + str_sep(", ", args...) + ")";
}

} // namespace dcore
