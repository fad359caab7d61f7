#pragma once
#include <dcore/svto.hpp>
#include <dcore/throwutils.hpp>
#include <cstdlib>
#include <string>

// envto<T>(name, dflt) - the environment variable 'name', converted
//    to a T with svto.  dflt if it isn't set.
// envto<T>(name) - same, but throws a system_error(EINVAL) if it
//    isn't set.
//
// envto<std::string> returns the value verbatim.  Whitespace is
// significant.

namespace dcore {

template <typename T>
T envto(const char *name, const T& dflt){
    const char *e = ::getenv(name);
    return e ? svto<T>(e) : dflt;
}

template <typename T>
T envto(const char *name){
    const char *e = ::getenv(name);
    if(!e)
        throw se(EINVAL, strfunargs("envto", name) + ": not set");
    return svto<T>(e);
}

template<>
inline std::string envto<std::string>(const char *name, const std::string& dflt){
    const char *e = ::getenv(name);
    return e ? std::string(e) : dflt;
}

} // namespace dcore
