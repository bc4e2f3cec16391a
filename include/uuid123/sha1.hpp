#pragma once

#include <uuid123/str_view.hpp>
#include <array>
#include <cstddef>

namespace uuid123{

// sha1 - the 20-byte SHA-1 digest (RFC 3174, FIPS 180-1) of the len
// bytes at p.
//
// This is here for version 5 (name-based) uuids, which are defined in
// terms of SHA-1.  SHA-1 is broken as a cryptographic hash.  Don't use
// it for anything that needs collision resistance.
std::array<unsigned char, 20> sha1(const void *p, size_t len);

inline std::array<unsigned char, 20> sha1(str_view sv){
    return sha1(sv.data(), sv.size());
}

} // namespace uuid123
