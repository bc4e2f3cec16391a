#include <uuid123/sha1.hpp>
#include <uuid123/strutils.hpp>
#include "ut.hpp"
#include <string>

using uuid123::sha1;
using uuid123::hexstr;

int main(int, char **){
    // FIPS 180-1 / RFC 3174 test vectors
    EQSTR(hexstr(sha1("")), "da39a3ee5e6b4b0d3255bfef95601890afd80709");
    EQSTR(hexstr(sha1("abc")), "a9993e364706816aba3e25717850c26c9cd0d89d");
    EQSTR(hexstr(sha1("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq")),
          "84983e441c3bd26ebaae4aa1f95129e5e54670f1");
    EQSTR(hexstr(sha1("The quick brown fox jumps over the lazy dog")),
          "2fd4e1c67a2d28fced849ee1bb76e7391b93eb12");
    std::string million(1000000, 'a');
    EQSTR(hexstr(sha1(million)), "34aa973cd4c4daa4f61eeb2bdbad27316534016f");

    // The pointer and str_view forms agree.
    std::string s = "namespace and name";
    CHECK(sha1(s.data(), s.size()) == sha1(s));

    // Lengths on either side of the one-block/two-block tail boundary
    // (55 and 56 bytes) and the block boundary (63, 64, 65).  The
    // digests must all differ, and must not depend on anything but
    // the bytes.
    std::string prev;
    for(size_t len : {54, 55, 56, 57, 63, 64, 65, 119, 120}){
        std::string msg(len, 'x');
        auto h = hexstr(sha1(msg));
        EQUAL(h.size(), 40u);
        NOTEQUAL(h, prev);
        EQSTR(hexstr(sha1(std::string(len, 'x'))), h);
        prev = h;
    }
    return utstatus();
}
