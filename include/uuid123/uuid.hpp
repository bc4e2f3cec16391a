#pragma once

#include <uuid123/str_view.hpp>
#include <uuid123/throwutils.hpp>
#include <array>
#include <chrono>
#include <cstdint>
#include <cstddef>
#include <functional>
#include <iosfwd>
#include <string>
#include <vector>

namespace uuid123{

// uuid - an RFC 4122 universally unique identifier.
//
// The 128 bits are held as two 64-bit halves:  msb is bytes 0-7 of
// the big-endian binary form and lsb is bytes 8-15.  In RFC 4122
// terms:
//
//    msb = time_low(32) | time_mid(16) | time_hi_and_version(16)
//    lsb = clock_seq_hi_and_reserved(8) | clock_seq_low(8) | node(48)
//
// The version is the top nibble of time_hi_and_version (bits 12-15
// of msb, the first hex digit of the third group in the text form).
// The variant is in the top bits of clock_seq_hi_and_reserved.
//
// A uuid is a value.  Once constructed, it never changes.  Factories
// for the generated versions (1, 3, 4 and 5) are in uuid_gen.hpp.
// The factories here construct from existing bits, bytes or text.
class uuid{
public:
    typedef std::array<unsigned char, 16> bytes_type;

    // the nil uuid, 00000000-0000-0000-0000-000000000000
    constexpr uuid() : hi(0), lo(0) {}

    // No validation.  If the caller wants version() and variant() to
    // mean anything, the caller sets the bits.
    static constexpr uuid from_bits(uint64_t msb, uint64_t lsb){
        return uuid(msb, lsb);
    }

    // from_fields - assemble a uuid from its RFC 4122 fields.
    // clock_seq_and_node is clock_seq_low(8) | node(48).
    static constexpr uuid from_fields(uint32_t time_low, uint16_t time_mid, uint16_t time_hi_and_version,
                                      uint8_t clock_seq_hi_and_reserved, uint64_t clock_seq_low_and_node){
        return uuid((uint64_t(time_low)<<32) | (uint64_t(time_mid)<<16) | time_hi_and_version,
                    (uint64_t(clock_seq_hi_and_reserved)<<56) | (clock_seq_low_and_node & UINT64_C(0x00ffffffffffffff)));
    }

    // from_bytes - the 16 bytes are big-endian, most significant
    // first.  The pointer and vector forms throw std::invalid_argument
    // unless there are exactly 16 bytes.
    static uuid from_bytes(const bytes_type& b);
    static uuid from_bytes(const unsigned char *p, size_t len);
    static uuid from_bytes(const std::vector<unsigned char>& v){
        return from_bytes(v.data(), v.size());
    }

    // from_string - hyphens are removed, wherever they are.  What's left
    // must be exactly 32 hex digits, in either case.  Otherwise, throw
    // an invalid_format.
    static uuid from_string(str_view text);

    // is_valid - true if 'text' is 8-4-4-4-12 hex digits separated by
    // hyphens, or if it's 32 hex digits after removing hyphens.  Either
    // case.  Never throws.
    static bool is_valid(str_view text) noexcept;

    uint64_t msb() const { return hi; }
    uint64_t lsb() const { return lo; }
    bool is_nil() const { return hi == 0 && lo == 0; }

    bytes_type to_bytes() const;
    // e.g., 550e8400-e29b-41d4-a716-446655440000.  Always lower case.
    std::string str() const;
    // e.g., 550e8400e29b41d4a716446655440000.  Always lower case.
    std::string compact_str() const;

    int version() const { return int((hi >> 12) & 0xf); }
    // 0 - NCS backward compatibility (0xx)
    // 2 - RFC 4122 (10x)
    // 6 - Microsoft backward compatibility (110)
    // 7 - reserved (111)
    int variant() const;

    // The version 1 fields.  They throw an unsupported unless
    // version()==1.
    //
    // timestamp - 100ns ticks since 1582-10-15T00:00:00Z
    uint64_t timestamp() const;
    // clock_sequence - 14 bits
    unsigned clock_sequence() const;
    // node - 48 bits
    uint64_t node() const;
    // unix_time - the timestamp as a system_clock time_point.
    std::chrono::system_clock::time_point unix_time() const;

    // -1, 0 or 1, as *this is less than, equal to or greater than
    // rhs.  The halves are compared as unsigned integers, msb first,
    // which is also the lexicographic order of to_bytes() and str().
    int compare_to(const uuid& rhs) const {
        if(hi != rhs.hi)
            return hi < rhs.hi ? -1 : 1;
        if(lo != rhs.lo)
            return lo < rhs.lo ? -1 : 1;
        return 0;
    }

    size_t hash() const {
        return std::hash<uint64_t>()(hi) ^ std::hash<uint64_t>()(lo);
    }

    friend bool operator==(const uuid& a, const uuid& b){ return a.hi == b.hi && a.lo == b.lo; }
    friend bool operator!=(const uuid& a, const uuid& b){ return !(a == b); }
    friend bool operator<(const uuid& a, const uuid& b){ return a.compare_to(b) < 0; }
    friend bool operator>(const uuid& a, const uuid& b){ return a.compare_to(b) > 0; }
    friend bool operator<=(const uuid& a, const uuid& b){ return a.compare_to(b) <= 0; }
    friend bool operator>=(const uuid& a, const uuid& b){ return a.compare_to(b) >= 0; }

private:
    constexpr uuid(uint64_t msb, uint64_t lsb) : hi(msb), lo(lsb) {}
    void require_version1(const char *what) const;
    uint64_t hi;
    uint64_t lo;
};

// Inserts str().
std::ostream& operator<<(std::ostream& os, const uuid& u);

// The RFC 4122 appendix C namespaces for name-based uuids.
constexpr uuid namespace_dns  = uuid::from_fields(0x6ba7b810, 0x9dad, 0x11d1, 0x80, 0xb400c04fd430c8);
constexpr uuid namespace_url  = uuid::from_fields(0x6ba7b811, 0x9dad, 0x11d1, 0x80, 0xb400c04fd430c8);
constexpr uuid namespace_oid  = uuid::from_fields(0x6ba7b812, 0x9dad, 0x11d1, 0x80, 0xb400c04fd430c8);
constexpr uuid namespace_x500 = uuid::from_fields(0x6ba7b814, 0x9dad, 0x11d1, 0x80, 0xb400c04fd430c8);

} // namespace uuid123

namespace std{
template <>
struct hash<uuid123::uuid>{
    size_t operator()(const uuid123::uuid& u) const { return u.hash(); }
};
} // namespace std
