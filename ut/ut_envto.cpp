#include <uuid123/envto.hpp>
#include "ut.hpp"
#include <cstdint>
#include <cstdlib>
#include <string>

using uuid123::envto;
using uuid123::svto;

int main(int, char **) {
    const char *testname = "_UT_ENVTO_TEST_";
    const char *testval = "hello world";
    ::setenv(testname, testval, 1);
    auto xenv = envto<std::string>(testname);
    EQSTR (xenv, testval);

    ::unsetenv(testname);
    EQSTR(envto<std::string>(testname, "dflt"), "dflt");
    EQUAL(envto<int>(testname, -1), -1);
    THROWS(envto<int>(testname), std::system_error);

    ::setenv(testname, "42", 1);
    EQUAL(envto<int>(testname, -1), 42);
    ::setenv(testname, "0x10", 1);
    EQUAL(envto<uint64_t>(testname), 16);
    ::setenv(testname, " 17 ", 1);
    EQUAL(envto<uint64_t>(testname), 17);
    ::setenv(testname, "17x", 1);
    THROWS(envto<uint64_t>(testname), std::invalid_argument);
    ::setenv(testname, "-1", 1);
    THROWS(envto<uint64_t>(testname), std::invalid_argument);
    EQUAL(envto<int>(testname), -1);
    THROWS(svto<unsigned>("  -0x10"), std::invalid_argument);
    ::setenv(testname, "seventeen", 1);
    THROWS(envto<int>(testname, 3), std::invalid_argument);

    EQUAL(svto<uint64_t>("18446744073709551615"), UINT64_MAX);
    EQUAL(svto<double>("2.5"), 2.5);
    THROWS(svto<int>(""), std::invalid_argument);
    return utstatus();
}
