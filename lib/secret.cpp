#include "digest123/secret.hpp"
#include <stdexcept>
#include <algorithm>

namespace digest123{

secret_sp
secret_from_hex(std::string_view hex){
    size_t vmaxsz = (hex.size()+1)/2;
    secret_sp v( std::make_shared<secret_t>(vmaxsz) );
    size_t binlen = 0;
    const char *hexend = nullptr;
    int status = sodium_hex2bin(v->data(), v->size(),
                                hex.data(), hex.size(),
                                nullptr, &binlen, &hexend);
    if(status != 0)
        throw std::invalid_argument("secret_from_hex: sodium_hex2bin failure");
    // Strict!  No trailing slop.
    if(hexend != hex.data() + hex.size())
        throw std::invalid_argument("secret_from_hex: non-hex characters in key material");
    v->resize(binlen);
    return v;
}

secret_sp
secret_from_text(std::string_view text){
    secret_sp v( std::make_shared<secret_t>(text.size()) );
    std::copy(text.begin(), text.end(), v->begin());
    return v;
}

bool
secret_equal(const secret_sp& a, const secret_sp& b){
    if(!a || !b)
        return !a && !b;
    if(a->size() != b->size())
        return false;
    if(a->empty())
        return true;
    return sodium_memcmp(a->data(), b->data(), a->size()) == 0;
}

} // namespace digest123
