#include "digest123/credential_store.hpp"
#include "digest123/detail/config_file.hpp"
#include <dcore/complaints.hpp>
#include <dcore/diag.hpp>
#include <dcore/strutils.hpp>
#include <dcore/svto.hpp>
#include <fstream>

using namespace dcore;

namespace{
auto _accounts = diag_name("accounts");
}

namespace digest123{

server_accounts
load_server_accounts(std::istream& is, const std::string& srcname){
    server_accounts ret;
    detail::for_each_config_line(is, srcname, [&](std::string_view line, int lineno){
        auto parts = svsplit_exact(line, ":");
        if(parts.size() != 2){
            complain(LOG_WARNING, fmt("%s:%d: invalid accounts line: expected 'username : key'", srcname.c_str(), lineno));
            return;
        }
        // Anything goes for the username, even an empty one.  Only
        // the field count makes a line invalid.
        std::string user(sv_strip(parts[0]));
        auto key = sv_strip(parts[1]);
        DIAG(_accounts, "creating an account for " << user);
        ret[user] = secret_from_text(key);
    });
    // Don't log the keys, just the usernames.
    complain(LOG_INFO, "accounts from " + srcname + ": " + strbe(",", known_users(ret)));
    return ret;
}

server_accounts
load_server_accounts(const std::string& path){
    std::ifstream ifs;
    if(!detail::open_config_file(path, ifs)){
        log_notice("accounts file " + path + " does not exist.  Only the " + anonymous_user + " user will be available.");
        return {};
    }
    return load_server_accounts(ifs, path);
}

client_accounts
load_client_accounts(std::istream& is, const std::string& srcname){
    client_accounts ret;
    detail::for_each_config_line(is, srcname, [&](std::string_view line, int lineno){
        auto parts = svsplit_exact(line, ":");
        if(parts.size() != 4){
            complain(LOG_WARNING, fmt("%s:%d: invalid client account line: wrong number of parts", srcname.c_str(), lineno));
            return;
        }
        try{
            server_address addr{std::string(sv_strip(parts[0])), 0};
            auto port = svto<int>(parts[1]);
            if(port < 1 || port > 65535)
                throw std::out_of_range(str("port", port, "is not in 1..65535"));
            addr.port = static_cast<unsigned short>(port);
            auto [salt, key] = key_from_hexstr(parts[3]);
            if(salt->empty() && key->empty()){
                complain(LOG_WARNING, fmt("%s:%d: invalid client account line: salt and key are both empty", srcname.c_str(), lineno));
                return;
            }
            account acct(std::string(sv_strip(parts[2])), salt, key);
            DIAG(_accounts, "client account for " << addr << ": " << acct);
            ret.insert_or_assign(addr, std::move(acct));
        }catch(std::exception& e){
            complain(LOG_WARNING, e, fmt("%s:%d: invalid client account line", srcname.c_str(), lineno));
        }
    });
    return ret;
}

client_accounts
load_client_accounts(const std::string& path){
    std::ifstream ifs;
    if(!detail::open_config_file(path, ifs)){
        complain(LOG_WARNING, "client accounts file " + path + " does not exist.  All commands will be sent as the " + anonymous_user + " user.");
        return {};
    }
    return load_client_accounts(ifs, path);
}

std::set<std::string>
known_users(const server_accounts& accts){
    std::set<std::string> ret;
    for(const auto& kv : accts)
        ret.insert(kv.first);
    return ret;
}

} // namespace digest123
