// Test strutils.hpp

#include <dcore/strutils.hpp>
#include <dcore/ut.hpp>

using dcore::str;
using dcore::strbe;
using dcore::fmt;
using dcore::startswith;
using dcore::endswith;
using dcore::lstrip;
using dcore::rstrip;
using dcore::strip;
using dcore::svsplit_exact;
using dcore::svsplit_any;
using dcore::svwords;

using namespace std;

int main(int, char **){
    CHECK(startswith("abcdef", "abc"));
    CHECK(!startswith("ab", "abc"));
    CHECK(startswith("abc", ""));
    CHECK(endswith("abcdef", "def"));
    CHECK(!endswith("ef", "def"));

    EQSTR(lstrip("  \t x y "), "x y ");
    EQSTR(rstrip("  x y \n"), "  x y");
    EQSTR(strip("\r\n x y \t"), "x y");
    EQSTR(strip("   "), "");
    EQSTR(dcore::tolower("MixEd Case 123"), "mixed case 123");

    auto v = svsplit_exact("a,b,,c,", ",");
    EQUAL(v.size(), 5u);
    EQSTR(std::string(v[0]), "a");
    EQSTR(std::string(v[2]), "");
    EQSTR(std::string(v[3]), "c");
    EQSTR(std::string(v[4]), "");

    v = svsplit_exact("no delimiter here", ":");
    EQUAL(v.size(), 1u);

    v = svsplit_any("a  b\tc ", " \t");
    EQUAL(v.size(), 4u);
    EQSTR(std::string(v[2]), "c");
    EQSTR(std::string(v[3]), "");

    v = svwords("  check\t report  ping\n");
    EQUAL(v.size(), 3u);
    EQSTR(std::string(v[0]), "check");
    EQSTR(std::string(v[2]), "ping");
    EQUAL(svwords(" \t ").size(), 0u);

    EQSTR(str("x", 1, 2.5), "x 1 2.5");
    EQSTR(dcore::str_sep(",", "a", "b", 3), "a,b,3");
    std::vector<int> vi = {1, 2, 3};
    EQSTR(strbe(vi), "1 2 3");
    EQSTR(strbe(":", vi), "1:2:3");
    EQSTR(fmt("%d-%s", 42, "x"), "42-x");
    std::string big(2000, 'z');
    EQUAL(fmt("%s", big.c_str()).size(), 2000u);

    return utstatus();
}
