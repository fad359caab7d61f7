#include "digest123/authority.hpp"
#include "digest123/credential_store.hpp"
#include <dcore/envto.hpp>
#include <dcore/strutils.hpp>
#include <dcore/throwutils.hpp>
#include <dcore/ut.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <unistd.h>

using namespace digest123;

namespace{
std::string tmpdir;

std::string write_file(const std::string& name, const std::string& contents){
    auto path = tmpdir + "/" + name;
    std::ofstream ofs(path);
    ofs << contents;
    ofs.close();
    if(!ofs)
        throw dcore::se("could not write " + path);
    return path;
}

bool same_bytes(const secret_sp& s, const std::string& want){
    return s && std::string(s->begin(), s->end()) == want;
}

void test_server_accounts(){
    std::istringstream iss("# username : key\n"
                           "\n"
                           "alice : alicekey\n"
                           "onlyonepart\n"
                           "too : many : parts\n"
                           "  bob:bobkey  \n"
                           "odd user : oddkey\n"
                           " : namelesskey\n"
                           "alice : newalicekey\n");
    auto accts = load_server_accounts(iss, "ut_credentials");
    EQUAL(accts.size(), 4u);
    CHECK(accts.count("onlyonepart") == 0);
    CHECK(same_bytes(accts["alice"], "newalicekey"));
    CHECK(same_bytes(accts["bob"], "bobkey"));
    // Server-side usernames aren't vetted.  Two fields is enough.
    CHECK(same_bytes(accts["odd user"], "oddkey"));
    CHECK(same_bytes(accts[""], "namelesskey"));
    auto ku = known_users(accts);
    EQSTR(dcore::strbe(",", ku), ",alice,bob,odd user");

    // No file:  no accounts.
    auto none = load_server_accounts("/nonexistent/digest123/accounts");
    EQUAL(none.size(), 0u);
}

void test_client_accounts(){
    std::istringstream iss("# host : port : username : salt,key\n"
                           "public.example.com : 24441 : alice : 0a0b,0c0d0e\n"
                           "public.example.com : 24442 : alice : ,ff\n"
                           "too : few : parts\n"
                           "h : notaport : alice : 00,11\n"
                           "h : 0 : alice : 00,11\n"
                           "h : 70000 : alice : 00,11\n"
                           "h : 1 : alice : ,\n"
                           "h : 2 : alice : nocomma\n"
                           "h : 3 : alice : zz,11\n"
                           "h : 4 : alice : 00,abc\n"
                           "h : 5 :  : 00,11\n"
                           "h : 6 : alice : 00,\n"
                           "public.example.com : 24441 : bob : 01,02\n");
    auto accts = load_client_accounts(iss, "ut_client_accounts");
    EQUAL(accts.size(), 2u);
    auto p = accts.find(server_address{"public.example.com", 24441});
    CHECK(p != accts.end());
    if(p != accts.end()){
        // The later line for the same address wins.
        EQSTR(p->second.username(), "bob");
        EQUAL(p->second.salt()->size(), 1u);
        EQUAL(p->second.key()->size(), 1u);
        EQUAL(int((*p->second.key())[0]), 2);
    }
    p = accts.find(server_address{"public.example.com", 24442});
    CHECK(p != accts.end());
    if(p != accts.end()){
        EQUAL(p->second.salt()->size(), 0u);
        EQUAL(int((*p->second.key())[0]), 0xff);
    }

    auto none = load_client_accounts("/nonexistent/digest123/client_accounts");
    EQUAL(none.size(), 0u);

    auto [salt, key] = key_from_hexstr("0a0b,0c0d0e");
    EQUAL(salt->size(), 2u);
    EQUAL(key->size(), 3u);
    THROWS(key_from_hexstr("0a0b"), std::invalid_argument);
    THROWS(key_from_hexstr("0a0b,0c,0d"), std::invalid_argument);
    THROWS(account("", nullptr, secret_from_hex("00")), std::invalid_argument);
    THROWS(account("a:b", nullptr, secret_from_hex("00")), std::invalid_argument);
    THROWS(account("alice", nullptr, secret_from_hex("")), std::invalid_argument);
    account a("alice", nullptr, secret_from_hex("0001"));
    EQUAL(a.salt()->size(), 0u);
    EQSTR(dcore::str(a), "account{alice salt:0B key:2B}");
    CHECK(secret_equal(secret_from_hex("0001"), a.key()));
    CHECK(!secret_equal(secret_from_hex("0002"), a.key()));
    CHECK(!secret_equal(secret_from_hex("000100"), a.key()));
}

void test_authority(){
    auto accounts = write_file("accounts", "alice : alicekey\n");
    auto access = tmpdir + "/access";   // doesn't exist yet
    authority auth(accounts, access);
    CHECK(same_bytes(auth.authenticate("alice"), "alicekey"));
    CHECK(!auth.authenticate("bob"));
    CHECK(!auth.authenticate(anonymous_user));
    // The default ACL.
    CHECK(auth.authorize("anonymous", "report"));
    CHECK(!auth.authorize("anonymous", "whitelist"));
    CHECK(!auth.authorize("alice", "check"));

    auto before = auth.current();
    // Readers holding the old snapshot keep it.
    auto alicekey = auth.authenticate("alice");

    write_file("accounts", "alice : newkey\nbob : bobkey\n");
    write_file("access", "all : all : allow\nwhitelist : bob : deny\n");
    auth.reload();
    CHECK(same_bytes(auth.authenticate("alice"), "newkey"));
    CHECK(same_bytes(auth.authenticate("bob"), "bobkey"));
    CHECK(auth.authorize("alice", "whitelist"));
    CHECK(auth.authorize("bob", "report"));
    CHECK(!auth.authorize("bob", "whitelist"));
    CHECK(!auth.authorize("anonymous", "check"));
    CHECK(same_bytes(alicekey, "alicekey"));
    CHECK(before->acl.allows("anonymous", "check"));
    CHECK(before != auth.current());

    std::ostringstream oss;
    auth.report_stats(oss);
    CHECK(oss.str().find("authority_reloads: 1") != std::string::npos);

    // A reload that fails leaves the old snapshot in place.  'sub'
    // doesn't exist at first, so sub/access is just missing.  Once
    // 'sub' is a plain file, stat(sub/access) fails with ENOTDIR.
    authority auth2(accounts, tmpdir + "/sub/access");
    CHECK(auth2.authorize("anonymous", "check"));
    auto good = auth2.current();
    write_file("sub", "not a directory\n");
    THROWS(auth2.reload(), std::system_error);
    CHECK(good == auth2.current());
    CHECK(auth2.authorize("anonymous", "check"));
    THROWS(authority(accounts, tmpdir + "/sub/access"), std::system_error);
}
} // namespace <anon>

int main(int, char **){
    dcore::set_diag_names(dcore::envto<std::string>("Digest123DiagNames", ""));
    char templ[] = "/tmp/ut_credentials.XXXXXX";
    if(!::mkdtemp(templ))
        throw dcore::se("mkdtemp");
    tmpdir = templ;

    test_server_accounts();
    test_client_accounts();
    test_authority();

    ::unlink((tmpdir + "/accounts").c_str());
    ::unlink((tmpdir + "/access").c_str());
    ::unlink((tmpdir + "/sub").c_str());
    ::rmdir(tmpdir.c_str());
    return utstatus();
}
