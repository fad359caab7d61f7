#pragma once

#include "account.hpp"
#include <istream>
#include <map>
#include <set>
#include <string>

// Loaders for the two account files.
//
// Server accounts, one per line:
//
//     username : key
//
// Client accounts, one per line:
//
//     host : port : username : salthex,keyhex
//
// In both, fields are whitespace-trimmed, and blank lines and lines
// whose first non-blank character is '#' are ignored.  A malformed
// line is complained about (LOG_WARNING) and skipped.  It never stops
// the rest of the file from loading.  A file that does not exist
// is not an error:  the loaders log a notice and return an empty map.
// Any other failure to open or read the file throws.
//
// The std::istream overloads do the parsing.  'srcname' is only
// used in log messages.

namespace digest123{

using server_accounts = std::map<std::string, secret_sp>;
using client_accounts = std::map<server_address, account>;

server_accounts load_server_accounts(const std::string& path);
server_accounts load_server_accounts(std::istream& is, const std::string& srcname = "<stream>");

client_accounts load_client_accounts(const std::string& path);
client_accounts load_client_accounts(std::istream& is, const std::string& srcname = "<stream>");

// The usernames in a server_accounts map.  This is the universe that
// 'all' expands to in the access file.
std::set<std::string> known_users(const server_accounts& accts);

} // namespace digest123
