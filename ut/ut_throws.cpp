// THROWS counts exactly one pass or one failure per use, whatever
// the expression throws.
#include "ut.hpp"
#include <stdexcept>

int throws_int(){
    throw 42;
}

int throws_runtime_error(){
    throw std::runtime_error("not an invalid_argument");
}

int throws_invalid_argument(){
    throw std::invalid_argument("expected");
}

int main(int, char **){
    THROWS(throws_invalid_argument(), std::invalid_argument);
    THROWS(throws_invalid_argument(), std::logic_error);
    EQUAL(utpass, 2u);
    EQUAL(utfail, 0u);

    // Three deliberate failures.  They're reported on stderr, then
    // taken back out of the tally.
    unsigned pass0 = utpass, fail0 = utfail;
    std::cerr << "Three FAILED lines follow.  They are expected.\n";
    THROWS(throws_int(), std::invalid_argument);
    THROWS(throws_runtime_error(), std::invalid_argument);
    THROWS(0, std::invalid_argument);
    unsigned npass = utpass - pass0, nfail = utfail - fail0;
    utfail = fail0;
    EQUAL(npass, 0u);
    EQUAL(nfail, 3u);
    return utstatus();
}
