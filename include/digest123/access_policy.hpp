#pragma once

#include <istream>
#include <map>
#include <ostream>
#include <set>
#include <string>
#include <string_view>
#include <vector>

// The access file, one rule per line:
//
//     operations : users : allow|deny
//
// 'operations' is a whitespace-separated list of commands or the
// keyword 'all' (check, report, ping, pong, info and whitelist).
// 'users' is a whitespace-separated list of usernames or the keyword
// 'all', meaning every user in the server's accounts file.  The
// unauthenticated user is called "anonymous", and 'all' only includes
// it if it's in the accounts file.  The file is case-insensitive.
//
// Rules are applied from top to bottom:  an 'allow' adds the
// operations to each user's permitted set, and a 'deny' removes them.
// So the last rule that mentions a (user, command) pair decides.
// There's an implicit final rule:
//
//     all : all : deny
//
// i.e., anything that wasn't allowed is denied.
//
// If there is no access file, the anonymous user may check, report,
// ping, pong and info, and nobody may do anything else.

namespace digest123{

// The complete command vocabulary, i.e., what 'all' means in the
// operations field.
const std::set<std::string>& all_commands();

struct access_rule{
    std::set<std::string> commands;
    bool all_users = false;
    std::set<std::string> users;   // empty if all_users
    bool allow = false;
};

std::ostream& operator<<(std::ostream& os, const access_rule& r);

// compiled_acl - username -> set of permitted commands.  It's a value:
// it can't be changed after it's constructed.  A username that isn't
// in the map has no permissions.
class compiled_acl{
public:
    using permission_map = std::map<std::string, std::set<std::string>>;
    compiled_acl() = default;
    explicit compiled_acl(permission_map perms) : perms_(std::move(perms)){}

    bool allows(const std::string& username, const std::string& command) const;
    // The empty set if username isn't in the map.
    const std::set<std::string>& permissions(const std::string& username) const;
    // For iteration/diagnostics.
    const permission_map& entries() const { return perms_; }

    bool operator==(const compiled_acl& rhs) const { return perms_ == rhs.perms_; }
    bool operator!=(const compiled_acl& rhs) const { return !(*this == rhs); }
private:
    permission_map perms_;
};

// E.g., "{anonymous: check info ping pong report; bob: check}"
std::ostream& operator<<(std::ostream& os, const compiled_acl& acl);

// Parse one (non-blank, non-comment) line.  Returns false, leaving
// *rule untouched, if the line doesn't have exactly three fields or
// if the last field isn't 'allow' or 'deny'.  Case-insensitive.
bool parse_access_rule(std::string_view line, access_rule* rule);

// The fold.  known_users is what 'all' means in the users field.
compiled_acl compile_acl(const std::vector<access_rule>& rules, const std::set<std::string>& known_users);

// What you get when there's no access file.
compiled_acl default_acl();

compiled_acl load_access_file(const std::string& path, const std::set<std::string>& known_users);
compiled_acl load_access_file(std::istream& is, const std::set<std::string>& known_users,
                              const std::string& srcname = "<stream>");

inline bool query(const compiled_acl& acl, const std::string& username, const std::string& command){
    return acl.allows(username, command);
}

} // namespace digest123
