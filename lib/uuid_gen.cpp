#include "uuid123/uuid_gen.hpp"
#include "uuid123/diag.hpp"
#include "uuid123/intutils.hpp"
#include "uuid123/md5.hpp"
#include "uuid123/sha1.hpp"
#include "uuid123/throwutils.hpp"
#include <algorithm>
#include <vector>

using namespace uuid123;

namespace{

// 100ns ticks from 1582-10-15T00:00:00Z to 1970-01-01T00:00:00Z.
const int64_t UUID_EPOCH_OFFSET = INT64_C(0x01B21DD213814000);

// The 60-bit v1 timestamp covers 1582-10-15T00:00:00Z through
// some time in 5236, in milliseconds relative to the unix epoch.
const int64_t MIN_V1_MS = -UUID_EPOCH_OFFSET/10000;
const int64_t MAX_V1_MS = ((INT64_C(1)<<60) - 1 - UUID_EPOCH_OFFSET)/10000;

// Stamp the version into the high nibble of byte 6 and the RFC 4122
// variant (0b10xx) into byte 8.
void stamp(uuid::bytes_type& b, int version){
    b[6] = (unsigned char)((b[6]&0x0f) | (version<<4));
    b[8] = (b[8]&0x3f) | 0x80;
}

} // namespace <anon>

namespace uuid123{

uuid random_uuid(random_source& rs){
    static auto _uuid = diag_name("uuid");
    auto b = rs.generate();
    stamp(b, 4);
    auto ret = uuid::from_bytes(b);
    DIAG(_uuid>1, "random_uuid(" << rs.name() << ") -> " << ret);
    return ret;
}

uuid random_uuid(){
    return random_uuid(*active_random_source());
}

uuid time_based_uuid(random_source& rs, std::chrono::system_clock::time_point now){
    static auto _uuid = diag_name("uuid");
    using namespace std::chrono;
    // millisecond resolution, then 10000 ticks per millisecond.
    int64_t now_ms = duration_cast<milliseconds>(now.time_since_epoch()).count();
    if(now_ms < MIN_V1_MS || now_ms > MAX_V1_MS)
        throw std::invalid_argument(strfunargs("time_based_uuid", rs.name(), now_ms) + ": outside the range of a version 1 timestamp");
    uint64_t ts = uint64_t(now_ms*10000 + UUID_EPOCH_OFFSET);

    auto r = rs.generate();
    unsigned clock_seq = ((unsigned(r[0])<<8) | r[1]) & 0x3fff;
    uint64_t node = load_be<uint64_t>(r.data()) & UINT64_C(0xffffffffffff);

    uint64_t time_low = ts & 0xffffffff;
    uint64_t time_mid = (ts >> 32) & 0xffff;
    uint64_t time_hi_and_version = ((ts >> 48) & 0x0fff) | 0x1000;
    uint64_t clock_seq_hi_and_reserved = ((clock_seq >> 8) | 0x80) & 0xff;
    uint64_t clock_seq_low = clock_seq & 0xff;

    auto ret = uuid::from_bits((time_low << 32) | (time_mid << 16) | time_hi_and_version,
                               (clock_seq_hi_and_reserved << 56) | (clock_seq_low << 48) | node);
    DIAG(_uuid>1, "time_based_uuid(" << rs.name() << ", " << now_ms << "ms) -> " << ret);
    return ret;
}

uuid time_based_uuid(random_source& rs){
    return time_based_uuid(rs, std::chrono::system_clock::now());
}

uuid time_based_uuid(){
    return time_based_uuid(*active_random_source());
}

uuid name_based_uuid(const uuid& ns, const void *name, size_t len, int version){
    static auto _uuid = diag_name("uuid");
    if(version != 3 && version != 5)
        throw std::invalid_argument(strfunargs("name_based_uuid", ns, "name", len, version) + ": version must be 3 or 5");
    auto nsbytes = ns.to_bytes();
    std::vector<unsigned char> input;
    input.reserve(nsbytes.size() + len);
    input.insert(input.end(), nsbytes.begin(), nsbytes.end());
    auto p = static_cast<const unsigned char*>(name);
    input.insert(input.end(), p, p+len);

    uuid::bytes_type b;
    if(version == 5){
        auto h = sha1(input.data(), input.size());
        std::copy(h.begin(), h.begin()+b.size(), b.begin());
    }else{
        b = md5(input.data(), input.size());
    }
    stamp(b, version);
    auto ret = uuid::from_bytes(b);
    DIAG(_uuid>1, "name_based_uuid(" << ns << ", " << len << " bytes, v" << version << ") -> " << ret);
    return ret;
}

} // namespace uuid123
