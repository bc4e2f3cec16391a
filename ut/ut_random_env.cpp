// The default active source comes from the environment.  This has to
// be its own executable:  the environment is consulted only once,
// the first time active_random_source() is called.
#include <uuid123/random_source.hpp>
#include <uuid123/uuid_gen.hpp>
#include "ut.hpp"
#include <cstdlib>

using namespace uuid123;

int main(int, char **){
    ::setenv("UUID123_RANDOM_SOURCE", "fast", 1);
    ::setenv("UUID123_FAST_SEED", "0x1234", 1);

    auto rs = active_random_source();
    EQSTR(rs->name(), "fast");
    // The same sequence as a fast_random_source with the same seed.
    fast_random_source expected(0x1234);
    for(int i=0; i<10; ++i)
        EQUAL(random_uuid(), random_uuid(expected));

    // Once it's chosen, changing the environment has no effect.
    ::setenv("UUID123_RANDOM_SOURCE", "secure", 1);
    CHECK(active_random_source() == rs);

    // But make_random_source is unaffected by the environment.
    EQSTR(make_random_source("secure")->name(), "secure");
    return utstatus();
}
