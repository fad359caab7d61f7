#pragma once

#include "secret.hpp"
#include <string>
#include <string_view>
#include <utility>
#include <tuple>
#include <ostream>

namespace digest123{

// The identity assigned to callers that don't authenticate.
extern const std::string anonymous_user;

// legal_username - non-empty, no whitespace, no ':' (the field
// separator in every account and access file), no control characters.
bool legal_username(std::string_view name);

// An account is the client's view of a username and its key material.
// The constructor throws std::invalid_argument if the username isn't
// legal or if there's no key.  The salt may be empty.  Once
// constructed, an account is never modified.
class account{
public:
    account(std::string username, secret_sp salt, secret_sp key);
    const std::string& username() const { return username_; }
    const secret_sp& salt() const { return salt_; }
    const secret_sp& key() const { return key_; }
private:
    std::string username_;
    secret_sp salt_;
    secret_sp key_;
};

// Prints the username and the key lengths.  Never the key bytes.
std::ostream& operator<<(std::ostream& os, const account& a);

struct server_address{
    std::string host;
    unsigned short port;
    bool operator<(const server_address& rhs) const{
        return std::tie(host, port) < std::tie(rhs.host, rhs.port);
    }
    bool operator==(const server_address& rhs) const{
        return host == rhs.host && port == rhs.port;
    }
};

std::ostream& operator<<(std::ostream& os, const server_address& a);

// key_from_hexstr - split "salthex,keyhex" at the comma and decode
// each half.  Either half may be empty, in which case the
// corresponding secret is empty (but not null).  Throws
// std::invalid_argument if there's no comma or if either half isn't
// valid hex.
std::pair<secret_sp, secret_sp> key_from_hexstr(std::string_view keymaterial);

} // namespace digest123
