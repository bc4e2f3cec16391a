#pragma once

#include <uuid123/threefry.hpp>
#include <array>
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace uuid123{

// random_source - anything that can produce 16 random bytes.  The
// generators in uuid_gen.hpp take a random_source& explicitly, or,
// in their no-argument forms, use the active_random_source().
//
// Implementations must be safe to call concurrently from multiple
// threads.  Both implementations here are.
struct random_source{
    typedef std::array<unsigned char, 16> result_type;
    virtual result_type generate() = 0;
    // e.g., "secure" or "fast".  For diagnostics.
    virtual std::string name() const = 0;
    virtual ~random_source() = default;
};

// secure_random_source - libsodium's randombytes_buf, i.e., the
// kernel's CSPRNG (getrandom(2) on Linux).  This is the default.
//
// The constructor throws a std::runtime_error if libsodium could not
// be initialized.
struct secure_random_source : public random_source{
    secure_random_source();
    result_type generate() override;
    std::string name() const override { return "secure"; }
    // fill - len bytes at p.  Also used to key fast_random_sources.
    // It needs no secure_random_source object, and throws the same
    // std::runtime_error as the constructor if libsodium can't be
    // initialized.
    static void fill(void *p, size_t len);
};

// fast_random_source - threefry2x64 applied to an atomic counter.
// It's much faster than the secure source, and with an explicit seed,
// it's reproducible:  two fast_random_sources constructed with the
// same seed produce the same sequence of results.  It is NOT
// cryptographically strong.  Use it for tests and for bulk
// generation of ids that don't need to be unguessable.
struct fast_random_source : public random_source{
    // Keyed from the secure source.
    fast_random_source();
    // Keyed from 'seed'.  Reproducible.
    explicit fast_random_source(uint64_t seed);
    result_type generate() override;
    std::string name() const override { return "fast"; }
private:
    threefry2x64<> prf;
    std::atomic<uint64_t> ctr;
};

// The process-wide active source.  The handle is an atomically
// loaded and stored shared_ptr, so swapping is safe even while other
// threads are generating.  A generator that loaded the old source
// keeps it alive until it's done with it.
//
// If set_active_random_source has never been called, the first call
// to active_random_source() creates one according to the
// environment:
//
//   UUID123_RANDOM_SOURCE=secure|fast  (default secure)
//   UUID123_FAST_SEED=<uint64>         (seed for the fast source.  If
//                                       unset, it's keyed randomly.)
//
// A malformed value is reported with a std::invalid_argument.
std::shared_ptr<random_source> active_random_source();

// Throws std::invalid_argument if p is null.
void set_active_random_source(std::shared_ptr<random_source> p);

// make_random_source - "secure" or "fast", as in UUID123_RANDOM_SOURCE.
// Throws std::invalid_argument for any other kind.
std::shared_ptr<random_source> make_random_source(const std::string& kind);

} // namespace uuid123
