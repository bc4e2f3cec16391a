#include "uuid123/uuid.hpp"
#include "uuid123/diag.hpp"
#include "uuid123/intutils.hpp"
#include "uuid123/strutils.hpp"
#include "uuid123/throwutils.hpp"
#include <ostream>
#include <string>

using namespace uuid123;

namespace{

// 100ns ticks from the uuid epoch (1582-10-15T00:00:00Z) to the unix
// epoch (1970-01-01T00:00:00Z):  12219292800 seconds.
const uint64_t UUID_EPOCH_OFFSET = UINT64_C(0x01B21DD213814000);

// Where the hyphens go in the canonical form:
// 01234567-9012-4567-9012-456789012345
bool hyphen_at(size_t i){
    return i==8 || i==13 || i==18 || i==23;
}

// Scan the hex digits of 'text', skipping hyphens, into the 16 bytes
// at b.  Returns the number of hex digits found, or -1 if there's a
// character that is neither a hex digit nor a hyphen.  Stops
// storing, but keeps counting, after 32 digits.
int scanhex(str_view text, unsigned char *b){
    int ndigits = 0;
    for(char c : text){
        if(c == '-')
            continue;
        int v = hexval(c);
        if(v < 0)
            return -1;
        if(ndigits < 32){
            if(ndigits%2 == 0)
                b[ndigits/2] = (unsigned char)(v<<4);
            else
                b[ndigits/2] |= (unsigned char)v;
        }
        ++ndigits;
    }
    return ndigits;
}

} // namespace <anon>

namespace uuid123{

uuid
uuid::from_bytes(const bytes_type& b) /*static*/{
    return uuid(load_be<uint64_t>(b.data()), load_be<uint64_t>(b.data()+8));
}

uuid
uuid::from_bytes(const unsigned char *p, size_t len) /*static*/{
    if(len != 16)
        throw std::invalid_argument(strfunargs("uuid::from_bytes", "p", len) + ": a uuid is exactly 16 bytes");
    return uuid(load_be<uint64_t>(p), load_be<uint64_t>(p+8));
}

uuid
uuid::from_string(str_view text) /*static*/{
    static auto _uuid = diag_name("uuid");
    if(text.empty())
        throw invalid_format("uuid::from_string():  empty string");
    bytes_type b;
    int ndigits = scanhex(text, b.data());
    if(ndigits != 32){
        DIAG(_uuid, "rejecting '" << text << "': " << ndigits << " hex digits");
        if(ndigits < 0)
            throw invalid_format(strfunargs("uuid::from_string", text) + ": non-hex character");
        throw invalid_format(strfunargs("uuid::from_string", text) + ": expected 32 hex digits, got " + std::to_string(ndigits));
    }
    return from_bytes(b);
}

bool
uuid::is_valid(str_view text) noexcept /*static*/{
    if(text.empty())
        return false;
    // The canonical form:  exactly 36 characters, with hyphens in the
    // right places and hex digits everywhere else.
    if(text.size() == 36){
        bool canonical = true;
        for(size_t i=0; i<36 && canonical; ++i)
            canonical = hyphen_at(i) ? text[i]=='-' : hexval(text[i])>=0;
        if(canonical)
            return true;
    }
    // Otherwise, anything that is 32 hex digits once the hyphens are
    // gone.
    bytes_type scratch;
    return scanhex(text, scratch.data()) == 32;
}

uuid::bytes_type
uuid::to_bytes() const{
    bytes_type ret;
    store_be(ret.data(), hi);
    store_be(ret.data()+8, lo);
    return ret;
}

std::string
uuid::str() const{
    auto b = to_bytes();
    std::string ret(36, '\0');  // exactly 36 bytes.  No more.  No less
    char *p = &ret[0];
    for(size_t i=0; i<16; ++i){
        if(i==4 || i==6 || i==8 || i==10)
            *p++ = '-';
        *p++ = hexlownibble(b[i]>>4);
        *p++ = hexlownibble(b[i]);
    }
    return ret;
}

std::string
uuid::compact_str() const{
    return hexstr(to_bytes());
}

int
uuid::variant() const{
    unsigned v = unsigned(lo >> 61);
    if((v & 4) == 0)
        return 0;
    if((v & 2) == 0)
        return 2;
    if((v & 1) == 0)
        return 6;
    return 7;
}

void
uuid::require_version1(const char *what) const{
    if(version() != 1)
        throw unsupported(std::string("uuid::") + what + "():  only version 1 uuids have a " + what + ".  "
                          + str() + " is version " + std::to_string(version()));
}

uint64_t
uuid::timestamp() const{
    require_version1("timestamp");
    uint64_t time_low = hi >> 32;
    uint64_t time_mid = (hi >> 16) & 0xffff;
    uint64_t time_hi = hi & 0x0fff;
    return (time_hi << 48) | (time_mid << 32) | time_low;
}

unsigned
uuid::clock_sequence() const{
    require_version1("clock_sequence");
    return unsigned((lo >> 48) & 0x3fff);
}

uint64_t
uuid::node() const{
    require_version1("node");
    return lo & UINT64_C(0xffffffffffff);
}

std::chrono::system_clock::time_point
uuid::unix_time() const{
    using namespace std::chrono;
    // Signed:  a v1 timestamp can be before 1970.
    int64_t ticks = int64_t(timestamp()) - int64_t(UUID_EPOCH_OFFSET);
    // duration<int64_t, 100ns>
    typedef duration<int64_t, std::ratio<1, 10000000>> uuid_ticks;
    return system_clock::time_point(duration_cast<system_clock::duration>(uuid_ticks(ticks)));
}

std::ostream& operator<<(std::ostream& os, const uuid& u){
    return os << u.str();
}

} // namespace uuid123
