#include "digest123/access_policy.hpp"
#include "digest123/account.hpp"
#include "digest123/detail/config_file.hpp"
#include <dcore/complaints.hpp>
#include <dcore/diag.hpp>
#include <dcore/strutils.hpp>
#include <algorithm>
#include <fstream>

using namespace dcore;

namespace{
auto _acl = diag_name("acl");

const std::set<std::string> empty_set;
}

namespace digest123{

const std::set<std::string>&
all_commands(){
    static const std::set<std::string> cmds = {"check", "report", "ping", "pong", "info", "whitelist"};
    return cmds;
}

std::ostream&
operator<<(std::ostream& os, const access_rule& r){
    os << strbe(r.commands) << " : ";
    if(r.all_users)
        os << "all";
    else
        os << strbe(r.users);
    return os << " : " << (r.allow ? "allow" : "deny");
}

bool
compiled_acl::allows(const std::string& username, const std::string& command) const{
    auto p = perms_.find(username);
    return p != perms_.end() && p->second.count(command) != 0;
}

const std::set<std::string>&
compiled_acl::permissions(const std::string& username) const{
    auto p = perms_.find(username);
    return p == perms_.end() ? empty_set : p->second;
}

std::ostream&
operator<<(std::ostream& os, const compiled_acl& acl){
    os << "{";
    const char *sep = "";
    for(const auto& kv : acl.entries()){
        os << sep << kv.first << ":";
        for(const auto& c : kv.second)
            os << " " << c;
        sep = "; ";
    }
    return os << "}";
}

bool
parse_access_rule(std::string_view line, access_rule* rule){
    auto lc = dcore::tolower(line);
    auto parts = svsplit_exact(lc, ":");
    if(parts.size() != 3)
        return false;
    auto ops = sv_strip(parts[0]);
    auto users = sv_strip(parts[1]);
    auto verdict = sv_strip(parts[2]);
    access_rule r;
    if(verdict == "allow")
        r.allow = true;
    else if(verdict == "deny")
        r.allow = false;
    else
        return false;
    if(ops == "all"){
        r.commands = all_commands();
    }else{
        for(auto w : svwords(ops))
            r.commands.emplace(w);
    }
    if(users == "all"){
        r.all_users = true;
    }else{
        for(auto w : svwords(users))
            r.users.emplace(w);
    }
    *rule = std::move(r);
    return true;
}

compiled_acl
compile_acl(const std::vector<access_rule>& rules, const std::set<std::string>& known_users){
    compiled_acl::permission_map perms;
    for(const auto& r : rules){
        const auto& users = r.all_users ? known_users : r.users;
        for(const auto& u : users){
            auto& granted = perms[u];
            if(r.allow){
                DIAG(_acl, "granting " << strbe(",", r.commands) << " to " << u);
                granted.insert(r.commands.begin(), r.commands.end());
            }else{
                DIAG(_acl, "revoking " << strbe(",", r.commands) << " from " << u);
                for(const auto& c : r.commands)
                    granted.erase(c);
            }
        }
    }
    return compiled_acl(std::move(perms));
}

compiled_acl
default_acl(){
    return compiled_acl(compiled_acl::permission_map{{anonymous_user, {"check", "report", "ping", "pong", "info"}}});
}

compiled_acl
load_access_file(std::istream& is, const std::set<std::string>& known_users, const std::string& srcname){
    std::vector<access_rule> rules;
    detail::for_each_config_line(is, srcname, [&](std::string_view line, int lineno){
        access_rule r;
        if(!parse_access_rule(line, &r)){
            complain(LOG_WARNING, fmt("%s:%d: invalid access line: '%.*s'", srcname.c_str(), lineno, int(line.size()), line.data()));
            return;
        }
        rules.push_back(std::move(r));
    });
    auto acl = compile_acl(rules, known_users);
    complain(LOG_INFO, str("ACL from", srcname + ":", acl));
    return acl;
}

compiled_acl
load_access_file(const std::string& path, const std::set<std::string>& known_users){
    std::ifstream ifs;
    if(!detail::open_config_file(path, ifs)){
        log_notice("access file " + path + " does not exist.  Using default ACL: the " + anonymous_user + " user may use the check, report, ping, pong and info commands.");
        return default_acl();
    }
    return load_access_file(ifs, known_users, path);
}

} // namespace digest123
