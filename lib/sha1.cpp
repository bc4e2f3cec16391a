#include "uuid123/sha1.hpp"
#include "uuid123/diag.hpp"
#include "uuid123/intutils.hpp"
#include <cstdint>
#include <cstring>

using namespace uuid123;

namespace{

const size_t BLOCKBYTES = 64;

// The round constants, one for each group of twenty rounds.
const uint32_t K0 = 0x5A827999;
const uint32_t K1 = 0x6ED9EBA1;
const uint32_t K2 = 0x8F1BBCDC;
const uint32_t K3 = 0xCA62C1D6;

// compress - fold one 64-byte block into the state.
void compress(uint32_t h[5], const unsigned char *block){
    uint32_t w[80];
    for(int i=0; i<16; ++i)
        w[i] = load_be<uint32_t>(block + 4*i);
    for(int i=16; i<80; ++i)
        w[i] = rotl(w[i-3] ^ w[i-8] ^ w[i-14] ^ w[i-16], 1);

    uint32_t a = h[0], b = h[1], c = h[2], d = h[3], e = h[4];
    for(int i=0; i<80; ++i){
        uint32_t f, k;
        if(i < 20){
            f = (b & c) | (~b & d);             // Ch
            k = K0;
        }else if(i < 40){
            f = b ^ c ^ d;                      // Parity
            k = K1;
        }else if(i < 60){
            f = (b & c) | (b & d) | (c & d);    // Maj
            k = K2;
        }else{
            f = b ^ c ^ d;                      // Parity
            k = K3;
        }
        uint32_t tmp = rotl(a, 5) + f + e + k + w[i];
        e = d;
        d = c;
        c = rotl(b, 30);
        b = a;
        a = tmp;
    }
    h[0] += a;
    h[1] += b;
    h[2] += c;
    h[3] += d;
    h[4] += e;
}

} // namespace <anon>

namespace uuid123{

std::array<unsigned char, 20> sha1(const void *vp, size_t len){
    static auto _sha1 = diag_name("sha1");
    auto p = static_cast<const unsigned char*>(vp);
    uint32_t h[5] = {0x67452301, 0xEFCDAB89, 0x98BADCFE, 0x10325476, 0xC3D2E1F0};

    size_t nfull = len/BLOCKBYTES;
    for(size_t i=0; i<nfull; ++i)
        compress(h, p + i*BLOCKBYTES);

    // The tail:  whatever is left over, a single 0x80 byte, zeros up
    // to 56 mod 64, and the length in bits as a big-endian 64-bit
    // integer.  That's one block if the leftovers fit in 55 bytes,
    // otherwise two.
    unsigned char tail[2*BLOCKBYTES] = {};
    size_t left = len - nfull*BLOCKBYTES;
    if(left)
        ::memcpy(tail, p + nfull*BLOCKBYTES, left);
    tail[left] = 0x80;
    size_t tailbytes = (left < BLOCKBYTES-8) ? BLOCKBYTES : 2*BLOCKBYTES;
    store_be(tail + tailbytes - 8, uint64_t(len)*8);
    for(size_t off=0; off<tailbytes; off+=BLOCKBYTES)
        compress(h, tail + off);

    std::array<unsigned char, 20> ret;
    for(int i=0; i<5; ++i)
        store_be(ret.data() + 4*i, h[i]);
    DIAG(_sha1, "sha1 of " << len << " bytes in " << nfull + tailbytes/BLOCKBYTES << " blocks");
    return ret;
}

} // namespace uuid123
