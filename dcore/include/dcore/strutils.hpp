#pragma once
// String helpers used throughout dcore and digest123.

#include <string_view>
#include <sstream>
#include <vector>
#include <string>
#include <stdexcept>
#include <algorithm>
#include <iterator>
#include <cstdarg>
#include <cstdio>

namespace dcore {

inline bool startswith(std::string_view s, std::string_view pfx){
    return s.size() >= pfx.size() && s.substr(0, pfx.size()) == pfx;
}

inline bool endswith(std::string_view s, std::string_view suf){
    return s.size() >= suf.size() && s.substr(s.size() - suf.size()) == suf;
}

// The strip family removes leading and/or trailing whitespace (the
// six characters isspace matches in the C locale).  The sv_ versions
// return views into their argument.
inline constexpr std::string_view whitespace_chars = " \t\n\v\f\r";

inline std::string_view sv_lstrip(std::string_view s){
    auto b = s.find_first_not_of(whitespace_chars);
    return (b == s.npos) ? std::string_view{} : s.substr(b);
}

inline std::string_view sv_rstrip(std::string_view s){
    auto e = s.find_last_not_of(whitespace_chars);
    return (e == s.npos) ? std::string_view{} : s.substr(0, e+1);
}

inline std::string_view sv_strip(std::string_view s){
    return sv_rstrip(sv_lstrip(s));
}

inline std::string lstrip(std::string_view s) { return std::string(sv_lstrip(s)); }
inline std::string rstrip(std::string_view s) { return std::string(sv_rstrip(s)); }
inline std::string strip(std::string_view s) { return std::string(sv_strip(s)); }

// tolower - ASCII-only.  The config files we read are ASCII, and
// we don't want the answer to depend on the process' locale.
inline std::string tolower(std::string_view s){
    std::string ret(s);
    std::transform(ret.begin(), ret.end(), ret.begin(),
                   [](unsigned char c){ return (c>='A' && c<='Z') ? char(c - 'A' + 'a') : char(c); });
    return ret;
}

// svsplit_exact(s, delim, start) - the pieces of s[start:] between
// occurrences of delim.  N+1 pieces for N delimiters, so leading,
// trailing and adjacent delimiters produce empty pieces.
//   svsplit_exact("a::b:", ":") -> {"a", "", "b", ""}
inline std::vector<std::string_view>
svsplit_exact(std::string_view s, std::string_view delim, size_t start = 0){
    if(delim.empty())
        throw std::invalid_argument("svsplit_exact: empty delimiter");
    std::vector<std::string_view> v;
    while(start <= s.size()){
        auto next = s.find(delim, start);
        v.push_back(s.substr(start, next-start));
        if(next == std::string_view::npos)
            break;
        start = next+delim.size();
    }
    return v;
}

// svsplit_any(s, delims, start) - like svsplit_exact, except that the
// separator is any run of one or more characters from delims.  A
// leading run produces an empty first piece, and a trailing run an
// empty last piece.  Nothing is returned only if start > s.size().
//   svsplit_any(" a  b ", " ") -> {"", "a", "b", ""}
// See svwords for the version that discards the empties.
inline std::vector<std::string_view>
svsplit_any(std::string_view s, std::string_view delims, size_t start = 0){
    std::vector<std::string_view> v;
    while(start <= s.size()){
        auto d = s.find_first_of(delims, start);
        v.push_back(s.substr(start, d-start));
        if(d == std::string_view::npos)
            break;
        start = s.find_first_not_of(delims, d);
        if(start == std::string_view::npos){
            v.push_back({});
            break;
        }
    }
    return v;
}

// svwords - whitespace-separated words, with no empty strings.
inline std::vector<std::string_view>
svwords(std::string_view s){
    std::vector<std::string_view> ret;
    for(auto w : svsplit_any(s, whitespace_chars))
        if(!w.empty())
            ret.push_back(w);
    return ret;
}

// str(a, b, c) - a, b and c inserted into an ostringstream,
//     separated by single spaces.
// str_sep(sep, a, b, c) - the same, separated by sep.
// strbe(sep, coll), strbe(sep, b, e) - the elements of a collection
//     (or an iterator range), separated by sep (default " ").
//
//     throw std::runtime_error(str("bad value:", v, "at line", lineno));
//     os << "{" << strbe(", ", names) << "}";
template <typename ... Types>
std::string
str_sep(const char *sep, Types const& ... values){
    std::ostringstream oss;
    const char *s = "";
    ((oss << s << values, s = sep), ...);
    return oss.str();
}

template <typename ... Types>
std::string
str(Types const& ... values){
    return str_sep(" ", values ...);
}

template <typename ITER>
std::string
strbe(const char *sep, ITER b, ITER e){
    std::ostringstream oss;
    for(const char *s = ""; b!=e; ++b, s = sep)
        oss << s << *b;
    return oss.str();
}

template <typename COLL>
std::string
strbe(const char *sep, const COLL& coll){
    return strbe(sep, std::begin(coll), std::end(coll));
}

template <typename COLL>
std::string
strbe(const COLL& coll){
    return strbe(" ", coll);
}

// fmt, vfmt - printf-style formatting into a std::string.
//     fmt("%s:%d", host.c_str(), port)
inline std::string
vfmt(const char *fmt, va_list va){
    va_list ap;
    va_copy(ap, va);
    int n = vsnprintf(nullptr, 0, fmt, ap);
    va_end(ap);
    if(n < 0)
        throw std::runtime_error("vfmt: vsnprintf failed");
    // vsnprintf writes a NUL after n chars.  std::string has room for it.
    std::string ret(size_t(n), '\0');
    va_copy(ap, va);
    int n2 = vsnprintf(&ret[0], ret.size()+1, fmt, ap);
    va_end(ap);
    if(n2 != n)
        throw std::runtime_error("vfmt: vsnprintf changed its mind about the length");
    return ret;
}

inline std::string fmt(const char *fmt, ...)
    __attribute__ ((__format__ (__printf__, 1, 2)));
inline std::string fmt(const char *fmt, ...){
    va_list ap;
    va_start(ap, fmt);
    auto ret = vfmt(fmt, ap);
    va_end(ap);
    return ret;
}

} // namespace dcore
