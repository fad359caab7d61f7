#pragma once

#include <cstddef>
#include <memory>
#include <new>
#include <string>
#include <string_view>
#include <vector>
#include <sodium.h>

namespace digest123{

// sodium_allocator is a std::allocator that uses sodium_allocarray
// and sodium_free "under the hood".  It's the allocator for vectors
// that hold key material (see secret_t below).  The memory is on
// guarded, non-swappable pages and is zeroed when it's freed.
//
// Beware: it's much slower than new, and it burns 3 or 4 pages of
// memory for every allocation.  Fine for a few hundred account keys.
// Don't use it for anything bulky.
//
// Based on https://howardhinnant.github.io/allocator_boilerplate.html

template <class T>
class sodium_allocator
{
public:
    using value_type    = T;

    sodium_allocator() noexcept {}
    template <class U> sodium_allocator(sodium_allocator<U> const&) noexcept {}

    value_type*
    allocate(std::size_t n)
    {
        // sodium_init is idempotent and thread-safe, but sodium_allocarray
        // must not be called before it.
        static const int init_status = sodium_init();
        if(init_status < 0)
            throw std::bad_alloc();
        auto p = static_cast<value_type*>(sodium_allocarray(n,  sizeof(value_type)));
        if(!p)
            throw std::bad_alloc();
        return p;
    }

    void
    deallocate(value_type* p, std::size_t) noexcept
    {
        sodium_free(p);
    }
};

template <class T, class U>
bool
operator==(sodium_allocator<T> const&, sodium_allocator<U> const&) noexcept
{
    return true;
}

template <class T, class U>
bool
operator!=(sodium_allocator<T> const& x, sodium_allocator<U> const& y) noexcept
{
    return !(x == y);
}

// A secret is a vector<unsigned char> with the sodium_allocator.
using secret_t = std::vector<unsigned char, sodium_allocator<unsigned char>>;
// Collections of secrets (e.g., the server's accounts) map to a
// shared_ptr to a secret.  A thread wishing to use a secret should
// copy the mapped value into its own secret_sp and find the bytes at
// sp->data().  The shared_ptr guarantees that the secret outlives any
// reloaded map, and the secret bytes are never copied elsewhere.
using secret_sp = std::shared_ptr<secret_t>;

// secret_from_hex - decode hex digits into a new secret.  Throws
// std::invalid_argument if hex contains anything other than an even
// number of hex digits.  An empty hex string is an empty secret.
secret_sp secret_from_hex(std::string_view hex);

// secret_from_text - copy the bytes of an opaque textual key into a
// new secret.
secret_sp secret_from_text(std::string_view text);

// secret_equal - constant-time comparison (sodium_memcmp).  Secrets
// of different lengths are unequal.  A null secret_sp only equals
// another null secret_sp.
bool secret_equal(const secret_sp& a, const secret_sp& b);

} // namespace digest123
