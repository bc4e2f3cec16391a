/** @page LICENSE
Copyright 2010-2017, D. E. Shaw Research.
All rights reserved.

Redistribution and use in source and binary forms, with or without
modification, are permitted provided that the following conditions are
met:

* Redistributions of source code must retain the above copyright
  notice, this list of conditions, and the following disclaimer.

* Redistributions in binary form must reproduce the above copyright
  notice, this list of conditions, and the following disclaimer in the
  documentation and/or other materials provided with the distribution.

* Neither the name of D. E. Shaw Research nor the names of its
  contributors may be used to endorse or promote products derived from
  this software without specific prior written permission.

THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS
"AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT
LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR
A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT
OWNER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,
SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT
LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE,
DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY
THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
(INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
*/
#pragma once

#include <uuid123/intutils.hpp>  // for rotl
#include <array>
#include <cstdint>

// threefry2x64<R> - the Threefry-2x64 counter-based pseudo-random
// function of Salmon et al, "Parallel Random Numbers:  As Easy as 1,
// 2, 3".  It's a keyed bijection on pairs of 64-bit words:
//
//    threefry2x64<> f(key);
//    ctr_type out = f(ctr);
//
// Encrypting successive counters with a fixed key gives a stream that
// is Crush-Resistant at R=20 (the default) and that can be split
// across threads with nothing more than an atomic counter.  It is NOT
// a cryptographic generator.  Never use it for keys, nonces or any
// identifier that must be unguessable.
namespace uuid123{

struct threefry2x64_constants{
    static constexpr uint64_t KS_PARITY = UINT64_C(0x1BD11BDAA9FC1A22);
    static constexpr unsigned Rotations(unsigned r){
        switch(r%8){
        case 0: return 16;
        case 1: return 42;
        case 2: return 12;
        case 3: return 31;
        case 4: return 16;
        case 5: return 32;
        case 6: return 24;
        default: return 21;
        }
    }
};

template <unsigned R=20>
struct threefry2x64{
    typedef std::array<uint64_t, 2> ctr_type;
    typedef std::array<uint64_t, 2> key_type;

    threefry2x64() : k{} {}
    explicit threefry2x64(key_type _k) : k(_k) {}

    key_type getkey() const { return k; }

    ctr_type operator()(ctr_type c) const {
        uint64_t ks[3];
        ks[2] = threefry2x64_constants::KS_PARITY;
        uint64_t c0, c1;
        ks[0] = k[0]; ks[2] ^= k[0]; c0 = c[0] + k[0];
        ks[1] = k[1]; ks[2] ^= k[1]; c1 = c[1] + k[1];
        // Inject the key every four rounds.
        for(unsigned r=0; r<R; ){
            round(c0, c1, r);
            ++r;
            if((r&3)==0)
                keymix(c0, c1, ks, r);
        }
        return {c0, c1};
    }

private:
    static void round(uint64_t& c0, uint64_t& c1, unsigned r){
        c0 += c1; c1 = rotl(c1, threefry2x64_constants::Rotations(r)); c1 ^= c0;
    }
    static void keymix(uint64_t& c0, uint64_t& c1, const uint64_t* ks, unsigned r){
        unsigned r4 = r>>2;
        c0 += ks[r4%3];
        c1 += ks[(r4+1)%3] + r4;
    }

    key_type k;
};

} // namespace uuid123
