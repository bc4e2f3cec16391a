#include "uuid123/random_source.hpp"
#include "uuid123/diag.hpp"
#include "uuid123/envto.hpp"
#include "uuid123/intutils.hpp"
#include "uuid123/throwutils.hpp"
#include <sodium.h>
#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <string>

using namespace uuid123;

namespace{

// sodium_init returns 0 on success, 1 if it was already initialized
// and -1 on failure.  It's safe to call from multiple threads.
void require_libsodium(){
    static bool libsodium_initialized = (sodium_init() != -1);
    if(!libsodium_initialized)
        throw std::runtime_error("secure_random_source:  sodium_init failed");
}

std::shared_ptr<random_source>& the_handle(){
    static std::shared_ptr<random_source> h;
    return h;
}

std::shared_ptr<random_source> make_default_random_source(){
    static auto _random = diag_name("random");
    auto kind = envto<std::string>("UUID123_RANDOM_SOURCE", "secure");
    if(kind == "fast" && ::getenv("UUID123_FAST_SEED")){
        auto seed = envto<uint64_t>("UUID123_FAST_SEED");
        DIAG(_random, "default random source: fast, UUID123_FAST_SEED=" << seed);
        return std::make_shared<fast_random_source>(seed);
    }
    DIAG(_random, "default random source: " << kind);
    return make_random_source(kind);
}

} // namespace <anon>

namespace uuid123{

secure_random_source::secure_random_source(){
    require_libsodium();
}

void
secure_random_source::fill(void *p, size_t len) /*static*/{
    require_libsodium();
    randombytes_buf(p, len);
}

random_source::result_type
secure_random_source::generate(){
    result_type ret;
    fill(ret.data(), ret.size());
    return ret;
}

fast_random_source::fast_random_source() :
    ctr(0)
{
    secure_random_source srs;
    unsigned char kbytes[16];
    srs.fill(kbytes, sizeof(kbytes));
    prf = threefry2x64<>({load_be<uint64_t>(kbytes), load_be<uint64_t>(kbytes+8)});
}

fast_random_source::fast_random_source(uint64_t seed) :
    prf({seed, 0}),
    ctr(0)
{}

random_source::result_type
fast_random_source::generate(){
    // ctr[0] counts, ctr[1] is a fixed tag.
    static constexpr uint64_t domain = UINT64_C(0x7575696431323300); // "uuid123\0"
    auto r = prf({ctr.fetch_add(1, std::memory_order_relaxed), domain});
    result_type ret;
    store_be(ret.data(), r[0]);
    store_be(ret.data()+8, r[1]);
    return ret;
}

std::shared_ptr<random_source> make_random_source(const std::string& kind){
    if(kind == "secure")
        return std::make_shared<secure_random_source>();
    if(kind == "fast")
        return std::make_shared<fast_random_source>();
    throw std::invalid_argument(strfunargs("make_random_source", kind) + ": expected \"secure\" or \"fast\"");
}

std::shared_ptr<random_source> active_random_source(){
    auto p = std::atomic_load(&the_handle());
    if(p)
        return p;
    // First use.  If two threads get here at once, they both build a
    // default source, but only one of them is installed, and both
    // callers return the installed one.
    auto fresh = make_default_random_source();
    std::shared_ptr<random_source> expected;
    if(std::atomic_compare_exchange_strong(&the_handle(), &expected, fresh))
        return fresh;
    return expected;
}

void set_active_random_source(std::shared_ptr<random_source> p){
    static auto _random = diag_name("random");
    if(!p)
        throw std::invalid_argument("set_active_random_source:  null random_source");
    DIAG(_random, "set_active_random_source(" << p->name() << ")");
    std::atomic_store(&the_handle(), std::move(p));
}

} // namespace uuid123
