#include "digest123/account.hpp"
#include <dcore/strutils.hpp>
#include <algorithm>
#include <stdexcept>
#include <tuple>

using namespace dcore;

namespace digest123{

const std::string anonymous_user = "anonymous";

bool
legal_username(std::string_view name){
    if(name.empty())
        return false;
    return std::all_of(name.begin(), name.end(),
                       [](unsigned char ch){ return ch > ' ' && ch != ':' && ch != 0x7f; });
}

account::account(std::string username, secret_sp salt, secret_sp key) :
    username_(std::move(username)),
    salt_(salt ? std::move(salt) : std::make_shared<secret_t>()),
    key_(std::move(key))
{
    if(!legal_username(username_))
        throw std::invalid_argument("account: illegal username: '" + username_ + "'");
    if(!key_ || key_->empty())
        throw std::invalid_argument("account: empty key for username: " + username_);
}

std::ostream&
operator<<(std::ostream& os, const account& a){
    return os << "account{" << a.username() << " salt:" << a.salt()->size() << "B key:" << a.key()->size() << "B}";
}

std::ostream&
operator<<(std::ostream& os, const server_address& a){
    return os << a.host << ":" << a.port;
}

std::pair<secret_sp, secret_sp>
key_from_hexstr(std::string_view keymaterial){
    auto parts = svsplit_exact(sv_strip(keymaterial), ",");
    if(parts.size() != 2)
        throw std::invalid_argument("key_from_hexstr: expected salthex,keyhex");
    return {secret_from_hex(sv_strip(parts[0])), secret_from_hex(sv_strip(parts[1]))};
}

} // namespace digest123
