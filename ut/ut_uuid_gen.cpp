#include <uuid123/uuid_gen.hpp>
#include <uuid123/intutils.hpp>
#include "ut.hpp"
#include <chrono>
#include <set>
#include <string>
#include <vector>

using uuid123::uuid;
using namespace std::chrono;

const uint64_t UUID_EPOCH_OFFSET = 0x01B21DD213814000;

void test_random(){
    auto u = uuid123::random_uuid().str();
    std::cout << u << "\n";
    CHECK(u[14] == '4'); // Version 4
    CHECK(u[19] == '8' || u[19]=='9' || u[19] == 'a' || u[19] == 'b'); // Variant 1
    EQUAL(u.size(), 36);

    auto v = uuid123::random_uuid().str();
    std::cout << v << "\n";
    CHECK(v[14] == '4');
    CHECK(v[19] == '8' || v[19]=='9' || v[19] == 'a' || v[19] == 'b');
    EQUAL(v.size(), 36);

    // Hyphens in the right place, and at least 40 bits changed
    // between u and v.
    // Hyphens 8   13   18   23
    // 01234567-9012-4567-9012-456789012345
    for(size_t i : {8, 13, 18, 23}){
        EQUAL(u[i], '-');
        EQUAL(v[i], '-');
    }
    auto uu = uuid::from_string(u);
    auto vv = uuid::from_string(v);
    int sum = uuid123::popcount(uu.msb()^vv.msb()) + uuid123::popcount(uu.lsb()^vv.lsb());
    CHECK(sum > 40);

    // With an explicit source.
    uuid123::fast_random_source frs(19);
    std::set<uuid> seen;
    for(int i=0; i<1000; ++i){
        auto w = uuid123::random_uuid(frs);
        EQUAL(w.version(), 4);
        EQUAL(w.variant(), 2);
        seen.insert(w);
    }
    EQUAL(seen.size(), 1000);

    // Everything but the version and variant bits comes from the
    // source.
    uuid123::fast_random_source a(7), b(7);
    auto r = a.generate();
    auto w = uuid123::random_uuid(b);
    auto wb = w.to_bytes();
    for(size_t i=0; i<16; ++i){
        if(i == 6){
            EQUAL(wb[i]&0x0f, r[i]&0x0f);
        }else if(i == 8){
            EQUAL(wb[i]&0x3f, r[i]&0x3f);
        }else{
            EQUAL(int(wb[i]), int(r[i]));
        }
    }
}

void test_time_based(){
    const int64_t ms = 1700000000123;
    system_clock::time_point tp{milliseconds(ms)};
    uuid123::fast_random_source frs(42);
    auto u = uuid123::time_based_uuid(frs, tp);
    EQUAL(u.version(), 1);
    EQUAL(u.variant(), 2);
    EQUAL(u.timestamp(), uint64_t(ms)*10000 + UUID_EPOCH_OFFSET);
    CHECK(u.unix_time() == tp);

    // The clock sequence and the node are the first 8 bytes of
    // one result from the source.
    uuid123::fast_random_source same(42);
    auto r = same.generate();
    EQUAL(u.clock_sequence(), ((unsigned(r[0])<<8) | r[1]) & 0x3fff);
    EQUAL(u.node(), uuid123::load_be<uint64_t>(r.data()) & 0xffffffffffff);
    // ... and the next call draws them afresh.
    auto u2 = uuid123::time_based_uuid(frs, tp);
    EQUAL(u2.timestamp(), u.timestamp());
    NOTEQUAL(u2, u);

    // Sub-millisecond parts of the time are dropped.
    auto u3 = uuid123::time_based_uuid(frs, tp + microseconds(999));
    EQUAL(u3.timestamp(), u.timestamp());

    // Before 1970 is fine, as long as it's after 1582.
    system_clock::time_point tp1901{milliseconds(INT64_C(-2177452800000))};
    auto old = uuid123::time_based_uuid(frs, tp1901);
    EQUAL(old.version(), 1);
    EQUAL(old.timestamp(), UUID_EPOCH_OFFSET - UINT64_C(2177452800000)*10000);
    CHECK(old.unix_time() == tp1901);

    // The ends of the 60-bit timestamp range, and just beyond them.
    // system_clock may be too fine-grained to get there (with
    // nanoseconds it spans 1677 to 2262), so only check what the
    // clock can represent.
    const int64_t min_ms = -int64_t(UUID_EPOCH_OFFSET/10000);
    const int64_t max_ms = int64_t(((UINT64_C(1)<<60) - 1 - UUID_EPOCH_OFFSET)/10000);
    const int64_t clock_min_ms = duration_cast<milliseconds>(system_clock::duration::min()).count();
    const int64_t clock_max_ms = duration_cast<milliseconds>(system_clock::duration::max()).count();
    if(clock_min_ms < min_ms){
        auto first = uuid123::time_based_uuid(frs, system_clock::time_point{milliseconds(min_ms)});
        EQUAL(first.timestamp(), 0);
        THROWS(uuid123::time_based_uuid(frs, system_clock::time_point{milliseconds(min_ms - 1)}), std::invalid_argument);
    }
    if(clock_max_ms > max_ms){
        auto last = uuid123::time_based_uuid(frs, system_clock::time_point{milliseconds(max_ms)});
        EQUAL(last.timestamp(), uint64_t(max_ms)*10000 + UUID_EPOCH_OFFSET);
        THROWS(uuid123::time_based_uuid(frs, system_clock::time_point{milliseconds(max_ms + 1)}), std::invalid_argument);
    }
    // Whatever the clock's range, its extremes that fit are packed
    // exactly.
    for(auto tpx : {system_clock::time_point::min(), system_clock::time_point::max()}){
        int64_t xms = duration_cast<milliseconds>(tpx.time_since_epoch()).count();
        if(xms < min_ms || xms > max_ms){
            THROWS(uuid123::time_based_uuid(frs, tpx), std::invalid_argument);
        }else{
            auto x = uuid123::time_based_uuid(frs, tpx);
            EQUAL(x.version(), 1);
            EQUAL(x.timestamp(), uint64_t(xms*10000 + int64_t(UUID_EPOCH_OFFSET)));
        }
    }

    // 'now', with the active source.  The timestamps don't go
    // backwards, and they're near the current time.
    auto before = duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
    uint64_t prev = 0;
    for(int i=0; i<100; ++i){
        auto t = uuid123::time_based_uuid();
        EQUAL(t.version(), 1);
        EQUAL(t.variant(), 2);
        CHECK(t.timestamp() >= prev);
        prev = t.timestamp();
    }
    auto after = duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
    CHECK(prev >= uint64_t(before)*10000 + UUID_EPOCH_OFFSET);
    CHECK(prev <= uint64_t(after)*10000 + UUID_EPOCH_OFFSET);
}

void test_name_based(){
    auto& dns = uuid123::namespace_dns;
    EQSTR(uuid123::name_based_uuid(dns, "python.org", 3).str(), "6fa459ea-ee8a-3ca4-894e-db77e160355e");
    EQSTR(uuid123::name_based_uuid(dns, "python.org", 5).str(), "886313e1-3b8a-5372-9b90-0c9aee199e5d");
    // version 5 is the default.
    EQSTR(uuid123::name_based_uuid(dns, "python.org").str(), "886313e1-3b8a-5372-9b90-0c9aee199e5d");
    std::vector<unsigned char> name = {'p', 'y', 't', 'h', 'o', 'n', '.', 'o', 'r', 'g'};
    EQSTR(uuid123::name_based_uuid(dns, name).str(), "886313e1-3b8a-5372-9b90-0c9aee199e5d");
    EQSTR(uuid123::name_based_uuid(dns, name.data(), name.size(), 3).str(), "6fa459ea-ee8a-3ca4-894e-db77e160355e");

    auto ex = uuid123::name_based_uuid(dns, "example.com");
    EQUAL(ex.version(), 5);
    EQUAL(ex.variant(), 2);

    // Deterministic
    std::string s = "www.example.com";
    for(int version : {3, 5}){
        auto a = uuid123::name_based_uuid(uuid123::namespace_url, s, version);
        auto b = uuid123::name_based_uuid(uuid123::namespace_url, s, version);
        EQUAL(a, b);
        EQUAL(a.version(), version);
        EQUAL(a.variant(), 2);
        // Different names or different namespaces give different uuids.
        NOTEQUAL(a, uuid123::name_based_uuid(uuid123::namespace_url, s + ".", version));
        NOTEQUAL(a, uuid123::name_based_uuid(uuid123::namespace_dns, s, version));
        // An empty name is still a name.
        auto e = uuid123::name_based_uuid(uuid123::namespace_oid, "", version);
        EQUAL(e.version(), version);
        NOTEQUAL(e, uuid123::name_based_uuid(uuid123::namespace_x500, "", version));
    }
    NOTEQUAL(uuid123::name_based_uuid(dns, s, 3), uuid123::name_based_uuid(dns, s, 5));

    THROWS(uuid123::name_based_uuid(dns, "python.org", 4), std::invalid_argument);
    THROWS(uuid123::name_based_uuid(dns, "python.org", 1), std::invalid_argument);
    THROWS(uuid123::name_based_uuid(dns, "python.org", 0), std::invalid_argument);
}

int main(int, char **){
    test_random();
    test_time_based();
    test_name_based();
    return utstatus();
}
