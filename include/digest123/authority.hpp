#pragma once

#include "access_policy.hpp"
#include "credential_store.hpp"
#include <memory>
#include <mutex>
#include <ostream>
#include <string>

// authority: what the transport asks before it executes a command.
//
// authenticate(username) - the user's secret, or nullptr if there's
//   no such account.  (The anonymous user has no account, so it gets
//   nullptr unless somebody put "anonymous" in the accounts file.)
//
// authorize(username, command) - whether the compiled ACL lets
//   username execute command.
//
// reload() - re-read the accounts and access files, and install the
//   result.  Readers see either the old snapshot or the new one,
//   never a mixture.  If reload throws, the old snapshot stays.
//
// All member functions are thread-safe.

namespace digest123{

class authority{
public:
    struct snapshot{
        server_accounts accounts;
        compiled_acl acl;
    };

    authority(std::string accounts_file, std::string access_file);

    secret_sp authenticate(const std::string& username) const;
    bool authorize(const std::string& username, const std::string& command) const;
    void reload();
    std::shared_ptr<const snapshot> current() const;
    std::ostream& report_stats(std::ostream& os) const;

private:
    std::string accounts_file;
    std::string access_file;
    mutable std::mutex mtx;
    std::shared_ptr<const snapshot> snap;
    unsigned long long nreloads = 0;

    std::shared_ptr<const snapshot> load() const;
};

} // namespace digest123
