#include <uuid123/diag.hpp>
#include <uuid123/uuid.hpp>
#include "ut.hpp"
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>

using uuid123::diag_name;
using uuid123::get_diag_names;
using uuid123::set_diag_names;

auto _foo = diag_name("foo");
auto _bar = diag_name("bar", 2);

int side_effects = 0;
int touch(){
    return ++side_effects;
}

std::string slurp(const std::string& fname){
    std::ifstream ifs(fname);
    std::ostringstream oss;
    oss << ifs.rdbuf();
    return oss.str();
}

int main(int, char **){
    set_diag_names("");
    EQSTR(get_diag_names(), "");
    set_diag_names("foo=3:baz");
    EQUAL(int(_foo), 3);
    EQUAL(int(_bar), 0);
    // A name mentioned before anyone declared it is declared anyway.
    EQUAL(int(diag_name("baz")), 1);
    EQSTR(get_diag_names(), "baz=1:foo=3");
    set_diag_names("bar=4", false);
    EQSTR(get_diag_names(), "bar=4:baz=1:foo=3");
    CHECK(get_diag_names(true).find("ut=0") != std::string::npos);
    _bar = 0;
    EQUAL(int(diag_name("bar")), 0);

    // The expression isn't evaluated unless the name is on.
    set_diag_names("");
    DIAG(_foo, "touched " << touch());
    EQUAL(side_effects, 0);
    set_diag_names("foo");
    std::string fname = "ut_diag." + std::to_string(::getpid()) + ".out";
    ::unlink(fname.c_str());
    uuid123::set_diag_destination(fname);
    DIAG(_foo, "touched " << touch());
    DIAG(_foo>1, "not at level 1 " << touch());
    EQUAL(side_effects, 1);

    uuid123::set_diag_opts("nofunc");
    EQSTR(uuid123::get_diag_opts(), "notstamp:nofunc:why:newline");
    DIAG(_foo, "nil is " << uuid123::uuid());
    uuid123::set_diag_destination("%none");
    DIAG(_foo, "discarded");
    uuid123::set_diag_opts("");
    EQSTR(uuid123::get_diag_opts(), "notstamp:func:why:newline");

    auto contents = slurp(fname);
    std::cout << contents;
    CHECK(contents.find("main() [_foo] touched 1\n") != std::string::npos);
    CHECK(contents.find("not at level 1") == std::string::npos);
    CHECK(contents.find("[_foo] nil is 00000000-0000-0000-0000-000000000000\n") != std::string::npos);
    CHECK(contents.find("main() [_foo] nil") == std::string::npos);
    CHECK(contents.find("discarded") == std::string::npos);
    ::unlink(fname.c_str());

    THROWS(uuid123::set_diag_destination("/nonexistent-directory/x/y"), std::system_error);
    uuid123::set_diag_destination("%stderr");
    set_diag_names("");
    return utstatus();
}
