#pragma once

#include <uuid123/str_view.hpp>
#include <array>
#include <cstddef>

namespace uuid123{

// md5 - the 16-byte MD5 digest (RFC 1321) of the len bytes at p.
//
// Only for version 3 (name-based) uuids.  MD5 is not collision
// resistant.
std::array<unsigned char, 16> md5(const void *p, size_t len);

inline std::array<unsigned char, 16> md5(str_view sv){
    return md5(sv.data(), sv.size());
}

} // namespace uuid123
