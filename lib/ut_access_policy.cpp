#include "digest123/access_policy.hpp"
#include <dcore/envto.hpp>
#include <dcore/strutils.hpp>
#include <dcore/ut.hpp>
#include <sstream>

using namespace digest123;

namespace{
compiled_acl from_text(const std::string& text, const std::set<std::string>& known){
    std::istringstream iss(text);
    return load_access_file(iss, known, "ut_access_policy");
}
}

int main(int, char **){
    dcore::set_diag_names(dcore::envto<std::string>("Digest123DiagNames", ""));
    const std::set<std::string> known = {"alice", "bob"};

    // Later lines win, one (user, command) pair at a time.
    auto acl = from_text("all : bob : allow\n"
                         "report : bob : deny\n", known);
    CHECK(!query(acl, "bob", "report"));
    CHECK(query(acl, "bob", "check"));
    CHECK(query(acl, "bob", "whitelist"));
    CHECK(!query(acl, "alice", "check"));

    // ... and the other way around.
    acl = from_text("report : bob : deny\n"
                    "all : bob : allow\n", known);
    CHECK(query(acl, "bob", "report"));

    // The same fold, without the parser.
    access_rule r1, r2;
    CHECK(parse_access_rule("all : bob : allow", &r1));
    CHECK(parse_access_rule("report : bob : deny", &r2));
    EQUAL(r1.commands.size(), 6u);
    CHECK(r1.allow);
    CHECK(!r2.allow);
    auto folded = compile_acl({r1, r2}, known);
    CHECK(folded == from_text("all : bob : allow\nreport : bob : deny\n", known));
    // Determinism.
    CHECK(compile_acl({r1, r2}, known) == compile_acl({r1, r2}, known));
    EQSTR(dcore::str(r2), "report : bob : deny");

    // 'all' users means the known users.  Not anonymous.
    acl = from_text("check ping : all : allow\n", known);
    CHECK(query(acl, "alice", "check"));
    CHECK(query(acl, "bob", "ping"));
    CHECK(!query(acl, "anonymous", "check"));
    CHECK(!query(acl, "carol", "check"));
    // Unless anonymous is a known user.
    acl = from_text("check : all : allow\n", {"anonymous", "alice"});
    CHECK(query(acl, "anonymous", "check"));

    // Case-insensitive, comments and blank lines ignored, bad lines
    // skipped without stopping the rest.
    acl = from_text("# a comment\n"
                    "\n"
                    "CHECK Report : Anonymous Alice : ALLOW\n"
                    "this line has no colons\n"
                    "check : alice : maybe\n"
                    "check : alice : deny : extra\n"
                    "   \t\n"
                    "info : alice : allow\n", known);
    CHECK(query(acl, "anonymous", "check"));
    CHECK(query(acl, "anonymous", "report"));
    CHECK(query(acl, "alice", "check"));
    CHECK(query(acl, "alice", "info"));
    CHECK(!query(acl, "anonymous", "info"));
    EQUAL(acl.permissions("alice").size(), 3u);
    EQUAL(acl.permissions("nobody").size(), 0u);

    access_rule untouched;
    untouched.allow = true;
    CHECK(!parse_access_rule("check : alice : maybe", &untouched));
    CHECK(!parse_access_rule("check : alice", &untouched));
    CHECK(untouched.allow);

    // Deny of something never allowed is harmless.
    acl = from_text("whitelist : bob : deny\n", known);
    CHECK(!query(acl, "bob", "whitelist"));
    EQUAL(acl.permissions("bob").size(), 0u);

    // An empty file allows nothing.
    acl = from_text("", known);
    CHECK(!query(acl, "anonymous", "check"));

    // No file at all:  the default.
    acl = load_access_file("/nonexistent/digest123/access", known);
    CHECK(acl == default_acl());
    CHECK(query(acl, "anonymous", "report"));
    CHECK(query(acl, "anonymous", "check"));
    CHECK(query(acl, "anonymous", "pong"));
    CHECK(!query(acl, "anonymous", "whitelist"));
    CHECK(!query(acl, "alice", "check"));

    // Introspection.
    EQSTR(dcore::str(default_acl()), "{anonymous: check info ping pong report}");
    EQUAL(default_acl().entries().size(), 1u);
    CHECK(all_commands().count("whitelist") == 1);

    return utstatus();
}
