#pragma once

#include <chrono>
#include <type_traits>

namespace dcore{

// Seconds, as a double.  Handy in log messages.
template <class Rep, class Period>
double dur2dbl(const std::chrono::duration<Rep, Period>& dur){
    return std::chrono::duration<double>(dur).count();
}

// is_duration<T>::value is true iff T is a std::chrono::duration.
template <class T>
struct is_duration : std::false_type{};

template<class Rep, class Period>
struct is_duration<std::chrono::duration<Rep, Period>> : std::true_type{};

// time_point_plus(tp, dur) - like tp + dur, but the result keeps tp's
// Duration type rather than the common_type of the two.  So
// steady_clock::now() + duration<float>(1.5) doesn't quietly become a
// float-based time_point.
template <class Clk, class Dur, class Rep, class Period>
inline std::chrono::time_point<Clk, Dur>
time_point_plus(const std::chrono::time_point<Clk, Dur>& tp, const std::chrono::duration<Rep, Period>& dur){
    return tp + std::chrono::duration_cast<Dur>(dur);
}

} // namespace dcore
