#pragma once

// autocloser_t<T, D> is a unique_ptr<T, D> with an operator pointer(),
// so it can be passed almost anywhere a T* is expected.  It's an RAII
// wrapper around C handles that need to be "closed", freed or
// destroyed, e.g.,
//
//     auto eb = make_autocloser(event_base_new(), event_base_free);
//     if(!eb)
//         throw se("event_base_new failed");
//     event_base_dispatch(eb);    // operator pointer
//
// eb's deleter (event_base_free) is called when eb goes out of scope.
// As with unique_ptr, the deleter is not called on a null pointer.

#include <memory>
#include <type_traits>

namespace dcore {

template<typename T, typename D>
class autocloser_t : public std::unique_ptr<T, D>{
    typedef typename std::unique_ptr<T, D> uP;
public :
    typedef typename uP::pointer pointer;
    autocloser_t(pointer v, D d) : uP(v, d) {}
    autocloser_t(autocloser_t&&) = default;
    autocloser_t& operator=(autocloser_t&&) = default;
    operator pointer() const { return uP::get(); }
};

// make_autocloser(p, closefn) - closefn is anything callable with a
// T*, typically a C function like event_free or fclose.
template <typename T, typename CloseFn>
auto make_autocloser(T* p, CloseFn closefn){
    auto d = [closefn](T* q){ closefn(q); };
    return autocloser_t<T, decltype(d)>(p, d);
}

} // namespace dcore
