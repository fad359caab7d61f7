#include <dcore/svto.hpp>
#include <dcore/envto.hpp>
#include <dcore/ut.hpp>
#include <cstdlib>

using dcore::svto;
using dcore::envto;

int main(int, char **){
    EQUAL(svto<int>(" 42 "), 42);
    EQUAL(svto<int>("-7"), -7);
    EQUAL(svto<unsigned>("+65535"), 65535u);
    EQUAL(svto<long>("9000000000"), 9000000000L);
    THROWS(svto<unsigned>("-1"), std::invalid_argument);
    THROWS(svto<int>("12abc"), std::invalid_argument);
    THROWS(svto<int>(""), std::invalid_argument);
    THROWS(svto<short>("70000"), std::out_of_range);
    EQUAL(svto<double>("2.5"), 2.5);
    THROWS(svto<double>("2.5x"), std::invalid_argument);
    CHECK(svto<bool>("TRUE"));
    CHECK(!svto<bool>("0"));
    THROWS(svto<bool>("maybe"), std::invalid_argument);
    EQSTR(svto<std::string>("  word "), "word");

    ::setenv("DCORE_UT_SVTO_INT", "17", 1);
    EQUAL(envto<int>("DCORE_UT_SVTO_INT", 3), 17);
    ::unsetenv("DCORE_UT_SVTO_INT");
    EQUAL(envto<int>("DCORE_UT_SVTO_INT", 3), 3);
    THROWS(envto<int>("DCORE_UT_SVTO_INT"), std::system_error);
    EQSTR(envto<std::string>("DCORE_UT_SVTO_INT", "dflt"), "dflt");

    return utstatus();
}
