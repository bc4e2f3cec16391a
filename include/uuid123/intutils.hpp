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

// intutils.hpp - integer utilities used by the hash functions and
// the random sources:

//   rotl(u, n) - rotate u left by n.  Templated over unsigned integral
//                 types for u.  n must be >0 and < the number of bits
//                 in decltype(u)
//
//   popcount(u) - number of set bits in an unsigned u.
//
//   load_be<Uint>(p), store_be(p, u) - read/write an unsigned
//                 integer from/to the sizeof(Uint) bytes at p, most
//                 significant byte first, regardless of the host's
//                 byte order.
//
//   load_le<Uint>(p), store_le(p, u) - the same, least significant
//                 byte first.

#include <cstdint>
#include <limits>
#include <type_traits>

namespace uuid123{

// rotl - rotate left by s
//  We expect the compiler to turn this into a single 'rol'
//  instruction.  Gcc, clang and icc do.
//  WARNING - behavior is undefined when s==0 or s>=number of digits
//   in Uint.  DO NOT CALL IT WITH s==0 OR s>=#UintBits.
template <typename Uint>
constexpr Uint rotl(Uint x, unsigned s){
    static_assert(std::is_unsigned<Uint>::value, "uuid123::rotl<Uint>:  Uint must be an unsigned integral type");
    return (x<<s) | (x>>(std::numeric_limits<Uint>::digits-s));
}

template <class T>
inline constexpr
typename std::enable_if<std::is_unsigned<T>::value, int>::type popcount(T v) noexcept{
#if __GNUC__
    static_assert(std::numeric_limits<unsigned long long>::digits >= std::numeric_limits<T>::digits, "popcount:  type too long for __builtin_popcountll");
    return __builtin_popcountll(v);
#else
    int n = 0;
    for( ; v; v &= v-1)
        ++n;
    return n;
#endif
}

// The byte-at-a-time loops below are recognized by gcc and clang and
// turned into a load (plus a bswap where necessary).
template <typename Uint>
inline Uint load_be(const unsigned char* p){
    static_assert(std::is_unsigned<Uint>::value, "uuid123::load_be<Uint>:  Uint must be unsigned");
    Uint ret = 0;
    for(unsigned i=0; i<sizeof(Uint); ++i)
        ret = Uint(ret<<8) | p[i];
    return ret;
}

template <typename Uint>
inline void store_be(unsigned char* p, Uint u){
    static_assert(std::is_unsigned<Uint>::value, "uuid123::store_be<Uint>:  Uint must be unsigned");
    for(unsigned i=sizeof(Uint); i>0; --i){
        p[i-1] = static_cast<unsigned char>(u & 0xff);
        u >>= 8;
    }
}

template <typename Uint>
inline Uint load_le(const unsigned char* p){
    static_assert(std::is_unsigned<Uint>::value, "uuid123::load_le<Uint>:  Uint must be unsigned");
    Uint ret = 0;
    for(unsigned i=sizeof(Uint); i>0; --i)
        ret = Uint(ret<<8) | p[i-1];
    return ret;
}

template <typename Uint>
inline void store_le(unsigned char* p, Uint u){
    static_assert(std::is_unsigned<Uint>::value, "uuid123::store_le<Uint>:  Uint must be unsigned");
    for(unsigned i=0; i<sizeof(Uint); ++i){
        p[i] = static_cast<unsigned char>(u & 0xff);
        u >>= 8;
    }
}

} // namespace uuid123
