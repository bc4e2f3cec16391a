#include "uuid123/md5.hpp"
#include "uuid123/diag.hpp"
#include "uuid123/intutils.hpp"
#include <cstdint>
#include <cstring>

using namespace uuid123;

namespace{

const size_t BLOCKBYTES = 64;

// K[i] = floor(abs(sin(i+1)) * 2^32), RFC 1321 section 3.4.
const uint32_t K[64] = {
    0xd76aa478, 0xe8c7b756, 0x242070db, 0xc1bdceee,
    0xf57c0faf, 0x4787c62a, 0xa8304613, 0xfd469501,
    0x698098d8, 0x8b44f7af, 0xffff5bb1, 0x895cd7be,
    0x6b901122, 0xfd987193, 0xa679438e, 0x49b40821,
    0xf61e2562, 0xc040b340, 0x265e5a51, 0xe9b6c7aa,
    0xd62f105d, 0x02441453, 0xd8a1e681, 0xe7d3fbc8,
    0x21e1cde6, 0xc33707d6, 0xf4d50d87, 0x455a14ed,
    0xa9e3e905, 0xfcefa3f8, 0x676f02d9, 0x8d2a4c8a,
    0xfffa3942, 0x8771f681, 0x6d9d6122, 0xfde5380c,
    0xa4beea44, 0x4bdecfa9, 0xf6bb4b60, 0xbebfbc70,
    0x289b7ec6, 0xeaa127fa, 0xd4ef3085, 0x04881d05,
    0xd9d4d039, 0xe6db99e5, 0x1fa27cf8, 0xc4ac5665,
    0xf4292244, 0x432aff97, 0xab9423a7, 0xfc93a039,
    0x655b59c3, 0x8f0ccc92, 0xffeff47d, 0x85845dd1,
    0x6fa87e4f, 0xfe2ce6e0, 0xa3014314, 0x4e0811a1,
    0xf7537e82, 0xbd3af235, 0x2ad7d2bb, 0xeb86d391
};

// Per-round left-rotation amounts.  Each group of sixteen rounds
// cycles through four of them.
const unsigned S[4][4] = {
    {7, 12, 17, 22},
    {5,  9, 14, 20},
    {4, 11, 16, 23},
    {6, 10, 15, 21}
};

void compress(uint32_t h[4], const unsigned char *block){
    uint32_t m[16];
    for(int i=0; i<16; ++i)
        m[i] = load_le<uint32_t>(block + 4*i);

    uint32_t a = h[0], b = h[1], c = h[2], d = h[3];
    for(int i=0; i<64; ++i){
        uint32_t f;
        int g;
        switch(i/16){
        case 0:
            f = (b & c) | (~b & d);
            g = i;
            break;
        case 1:
            f = (d & b) | (~d & c);
            g = (5*i + 1)%16;
            break;
        case 2:
            f = b ^ c ^ d;
            g = (3*i + 5)%16;
            break;
        default:
            f = c ^ (b | ~d);
            g = (7*i)%16;
            break;
        }
        f += a + K[i] + m[g];
        a = d;
        d = c;
        c = b;
        b += rotl(f, S[i/16][i%4]);
    }
    h[0] += a;
    h[1] += b;
    h[2] += c;
    h[3] += d;
}

} // namespace <anon>

namespace uuid123{

std::array<unsigned char, 16> md5(const void *vp, size_t len){
    static auto _md5 = diag_name("md5");
    auto p = static_cast<const unsigned char*>(vp);
    uint32_t h[4] = {0x67452301, 0xefcdab89, 0x98badcfe, 0x10325476};

    size_t nfull = len/BLOCKBYTES;
    for(size_t i=0; i<nfull; ++i)
        compress(h, p + i*BLOCKBYTES);

    // Same padding as SHA-1, except that the bit length is
    // little-endian.
    unsigned char tail[2*BLOCKBYTES] = {};
    size_t left = len - nfull*BLOCKBYTES;
    if(left)
        ::memcpy(tail, p + nfull*BLOCKBYTES, left);
    tail[left] = 0x80;
    size_t tailbytes = (left < BLOCKBYTES-8) ? BLOCKBYTES : 2*BLOCKBYTES;
    store_le(tail + tailbytes - 8, uint64_t(len)*8);
    for(size_t off=0; off<tailbytes; off+=BLOCKBYTES)
        compress(h, tail + off);

    std::array<unsigned char, 16> ret;
    for(int i=0; i<4; ++i)
        store_le(ret.data() + 4*i, h[i]);
    DIAG(_md5, "md5 of " << len << " bytes in " << nfull + tailbytes/BLOCKBYTES << " blocks");
    return ret;
}

} // namespace uuid123
