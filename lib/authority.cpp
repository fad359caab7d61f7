#include "digest123/authority.hpp"
#include <dcore/complaints.hpp>
#include <dcore/diag.hpp>

using namespace dcore;

namespace{
auto _authority = diag_name("authority");
}

namespace digest123{

authority::authority(std::string accounts_file_, std::string access_file_) :
    accounts_file(std::move(accounts_file_)),
    access_file(std::move(access_file_)),
    snap(load())
{}

std::shared_ptr<const authority::snapshot>
authority::load() const /*private*/{
    auto s = std::make_shared<snapshot>();
    s->accounts = load_server_accounts(accounts_file);
    s->acl = load_access_file(access_file, known_users(s->accounts));
    return s;
}

std::shared_ptr<const authority::snapshot>
authority::current() const{
    std::lock_guard<std::mutex> lg(mtx);
    return snap;
}

secret_sp
authority::authenticate(const std::string& username) const{
    auto s = current();
    auto p = s->accounts.find(username);
    DIAG(_authority, "authenticate(" << username << ") -> " << (p == s->accounts.end() ? "no account" : "ok"));
    return p == s->accounts.end() ? nullptr : p->second;
}

bool
authority::authorize(const std::string& username, const std::string& command) const{
    bool ret = current()->acl.allows(username, command);
    DIAG(_authority, "authorize(" << username << ", " << command << ") -> " << ret);
    return ret;
}

void
authority::reload(){
    // Build the new snapshot without holding the lock.  If anything
    // throws, the old one stays in place.
    auto s = load();
    std::lock_guard<std::mutex> lg(mtx);
    snap = std::move(s);
    nreloads++;
    complain(LOG_NOTICE, str("authority: reloaded", accounts_file, "and", access_file,
                             "(" + std::to_string(snap->accounts.size()), "accounts)"));
}

std::ostream&
authority::report_stats(std::ostream& os) const{
    std::lock_guard<std::mutex> lg(mtx);
    return os << "authority_accounts: " << snap->accounts.size() << "\n"
              << "authority_acl_users: " << snap->acl.entries().size() << "\n"
              << "authority_reloads: " << nreloads << "\n";
}

} // namespace digest123
