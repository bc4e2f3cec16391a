#include <uuid123/threefry.hpp>
#include "ut.hpp"
#include <cstdint>

using uuid123::threefry2x64;

// The KAT vectors are cut-and-pasted from the kat_vectors file
// in the original Random123 distribution.
template <unsigned R>
void dokat(uint64_t c0, uint64_t c1, uint64_t k0, uint64_t k1, uint64_t a0, uint64_t a1){
    threefry2x64<R> prf({k0, k1});
    auto r = prf({c0, c1});
    EQUAL(r[0], a0);
    EQUAL(r[1], a1);
    auto key = prf.getkey();
    EQUAL(key[0], k0);
    EQUAL(key[1], k1);
}

int main(int, char **){
    dokat<13>(0, 0, 0, 0, 0xf167b032c3b480bd, 0xe91f9fee4b7a6fb5);
    dokat<13>(~0ull, ~0ull, ~0ull, ~0ull, 0xccdec5c917a874b1, 0x4df53abca26ceb01);
    dokat<13>(0x243f6a8885a308d3, 0x13198a2e03707344, 0xa4093822299f31d0, 0x082efa98ec4e6c89, 0xc3aac71561042993, 0x3fe7ae8801aff316);
    dokat<20>(0, 0, 0, 0, 0xc2b6e3a8c2c69865, 0x6f81ed42f350084d);
    dokat<20>(~0ull, ~0ull, ~0ull, ~0ull, 0xe02cb7c4d95d277a, 0xd06633d0893b8b68);
    dokat<20>(0x243f6a8885a308d3, 0x13198a2e03707344, 0xa4093822299f31d0, 0x082efa98ec4e6c89, 0x263c7d30bb0f0af1, 0x56be8361d3311526);

    // The default is 20 rounds, and a default-constructed prf has
    // the zero key.
    threefry2x64<> dflt;
    auto r = dflt({0, 0});
    EQUAL(r[0], 0xc2b6e3a8c2c69865);
    EQUAL(r[1], 0x6f81ed42f350084d);
    return utstatus();
}
