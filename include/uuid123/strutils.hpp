#pragma once
// various convenient string handling utilities

#include <uuid123/str_view.hpp>
#include <sstream>
#include <string>
#include <cstddef>

namespace uuid123 {

// hexlownibble - the lower-case hex digit for the low four bits of c.
inline char hexlownibble(unsigned c){
    return "0123456789abcdef"[c&0xf];
}

// hexval - the value of the hex digit c, or -1 if c is not one of
// [0-9a-fA-F].
inline int hexval(char c){
    if(c >= '0' && c <= '9')
        return c - '0';
    if(c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if(c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

// hexstr - lower-case hex, two digits per byte, no separators.
inline std::string hexstr(const void *vp, size_t len){
    auto p = static_cast<const unsigned char*>(vp);
    std::string ret(2*len, '\0');
    for(size_t i=0; i<len; ++i){
        ret[2*i]   = hexlownibble(p[i]>>4);
        ret[2*i+1] = hexlownibble(p[i]);
    }
    return ret;
}

template <typename ByteContainer>
std::string hexstr(const ByteContainer& c){
    return hexstr(c.data(), c.size());
}

// str_sep - stream-insert all the values into a string, with 'sep'
//   between them.  E.g.,
//
//      str_sep(", ", "version", 3, 'x')  -> "version, 3, x"
//
// str - str_sep with a single space as the separator.
//
// See also 'strfunargs' in throwutils.hpp.
template <typename ... Types>
std::string
str_sep(const char *sep, Types const& ... values){
    std::ostringstream oss;
    const char *s = "";
    ((oss << s << values, s = sep), ...);
    return oss.str();
}

template <typename ... Types>
std::string
str(Types const& ... values){
    return str_sep(" ", values ...);
}

} // namespace uuid123
