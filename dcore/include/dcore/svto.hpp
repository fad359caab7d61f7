#pragma once

// svto<Type>(string_view sv) - convert the text in sv to a Type.
//
// Leading and trailing whitespace is permitted.  Anything else that
// isn't consumed by the conversion is an error, as is an empty (or
// all-whitespace) argument.  Errors are reported by throwing
// std::invalid_argument (or std::out_of_range if the value doesn't
// fit in the Type).
//
// Integers are converted with std::from_chars, so there's no locale
// dependence and no silent wrap-around:  svto<unsigned>("-1") throws.
// A leading '+' is tolerated.  bools may be spelled 0, 1, true or
// false.  svto<std::string> returns the stripped text.

#include <dcore/strutils.hpp>
#include <charconv>
#include <string_view>
#include <string>
#include <stdexcept>
#include <type_traits>
#include <cstdlib>
#include <cerrno>

namespace dcore{

namespace detail{
inline std::string_view svto_prep(std::string_view sv){
    auto s = sv_strip(sv);
    if(s.empty())
        throw std::invalid_argument("svto: no non-whitespace characters to convert");
    return s;
}
} // namespace detail

template <typename T>
std::enable_if_t<std::is_integral<T>::value && !std::is_same<T, bool>::value, T>
svto(std::string_view sv){
    auto s = detail::svto_prep(sv);
    if(s[0] == '+')
        s.remove_prefix(1);
    if(std::is_unsigned<T>::value && !s.empty() && s[0] == '-')
        throw std::invalid_argument("svto: negative value for unsigned type: " + std::string(sv));
    T ret;
    auto [ptr, ec] = std::from_chars(s.data(), s.data()+s.size(), ret);
    if(ec == std::errc::result_out_of_range)
        throw std::out_of_range("svto: out of range: " + std::string(sv));
    if(ec != std::errc() || ptr != s.data()+s.size())
        throw std::invalid_argument("svto: not an integer: " + std::string(sv));
    return ret;
}

template <typename T>
std::enable_if_t<std::is_floating_point<T>::value, T>
svto(std::string_view sv){
    std::string s(detail::svto_prep(sv));
    char *end;
    errno = 0;
    auto ret = std::strtold(s.c_str(), &end);
    if(end != s.c_str() + s.size())
        throw std::invalid_argument("svto: not a floating point number: " + s);
    if(errno == ERANGE)
        throw std::out_of_range("svto: out of range: " + s);
    return T(ret);
}

template <typename T>
std::enable_if_t<std::is_same<T, bool>::value, T>
svto(std::string_view sv){
    auto s = tolower(detail::svto_prep(sv));
    if(s == "1" || s == "true")
        return true;
    if(s == "0" || s == "false")
        return false;
    throw std::invalid_argument("svto<bool>: expected 0, 1, true or false, got: " + s);
}

template <typename T>
std::enable_if_t<std::is_same<T, std::string>::value, T>
svto(std::string_view sv){
    return std::string(detail::svto_prep(sv));
}

} // namespace dcore
