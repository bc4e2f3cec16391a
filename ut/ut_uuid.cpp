#include <uuid123/uuid.hpp>
#include <uuid123/strutils.hpp>
#include "ut.hpp"
#include <map>
#include <sstream>
#include <unordered_set>
#include <vector>

using uuid123::uuid;
using uuid123::str_view;

void test_text(){
    auto u = uuid::from_bits(0x550e8400e29b41d4, 0xa716446655440000);
    EQSTR(u.str(), "550e8400-e29b-41d4-a716-446655440000");
    EQSTR(u.compact_str(), "550e8400e29b41d4a716446655440000");
    EQUAL(u.str().size(), 36);
    EQUAL(u.version(), 4);
    EQUAL(u.variant(), 2);
    std::ostringstream oss;
    oss << u;
    EQSTR(oss.str(), u.str());

    // hyphenated, compact, upper and mixed case all parse to the same
    // thing, and str() is always lower case.
    CHECK(uuid::from_string("550e8400-e29b-41d4-a716-446655440000") == u);
    CHECK(uuid::from_string("550e8400e29b41d4a716446655440000") == u);
    CHECK(uuid::from_string("550E8400-E29B-41D4-A716-446655440000") == u);
    CHECK(uuid::from_string("550e8400-E29B-41d4-A716-446655440000") == u);
    EQSTR(uuid::from_string("550E8400E29B41D4A716446655440000").str(), u.str());
    // Hyphens are dropped wherever they are.
    CHECK(uuid::from_string("550e-8400e29b41d4a716446655440000--") == u);

    THROWS(uuid::from_string(""), uuid123::invalid_format);
    THROWS(uuid::from_string("invalid"), uuid123::invalid_format);
    THROWS(uuid::from_string("550e8400-e29b-41d4-a716"), uuid123::invalid_format);
    THROWS(uuid::from_string("550e8400-e29b-41d4-a716-44665544000g"), uuid123::invalid_format);
    THROWS(uuid::from_string("550e8400-e29b-41d4-a716-4466554400000"), uuid123::invalid_format);
    THROWS(uuid::from_string(" 550e8400-e29b-41d4-a716-446655440000"), uuid123::invalid_format);
    // An invalid_format is an invalid_argument.
    THROWS(uuid::from_string("xyzzy"), std::invalid_argument);

    CHECK(uuid::is_valid("550e8400-e29b-41d4-a716-446655440000"));
    CHECK(uuid::is_valid("550E8400-E29B-41D4-A716-446655440000"));
    CHECK(uuid::is_valid("550e8400e29b41d4a716446655440000"));
    CHECK(!uuid::is_valid(""));
    CHECK(!uuid::is_valid("invalid"));
    CHECK(!uuid::is_valid("not-a-uuid"));
    CHECK(!uuid::is_valid("550e8400-e29b-41d4-a716"));
    CHECK(!uuid::is_valid("550e8400-e29b-41d4-a716-44665544000g"));
    CHECK(!uuid::is_valid("550e8400-e29b-41d4-a716-4466554400000"));
    CHECK(!uuid::is_valid("550e8400e29b41d4a71644665544000"));

    // The nil uuid
    uuid nil;
    CHECK(nil.is_nil());
    CHECK(!u.is_nil());
    EQSTR(nil.str(), "00000000-0000-0000-0000-000000000000");
    CHECK(uuid::from_string("00000000000000000000000000000000") == nil);
    EQUAL(nil.version(), 0);
    EQUAL(nil.variant(), 0);
}

void test_bytes(){
    auto u = uuid::from_string("550e8400-e29b-41d4-a716-446655440000");
    uuid::bytes_type expected = {0x55, 0x0e, 0x84, 0x00, 0xe2, 0x9b, 0x41, 0xd4,
                                 0xa7, 0x16, 0x44, 0x66, 0x55, 0x44, 0x00, 0x00};
    CHECK(u.to_bytes() == expected);
    EQSTR(uuid123::hexstr(u.to_bytes()), u.compact_str());
    CHECK(uuid::from_bytes(expected) == u);
    std::vector<unsigned char> v(expected.begin(), expected.end());
    CHECK(uuid::from_bytes(v) == u);
    CHECK(uuid::from_bytes(v.data(), v.size()) == u);

    v.push_back(0);
    THROWS(uuid::from_bytes(v), std::invalid_argument);
    v.resize(15);
    THROWS(uuid::from_bytes(v), std::invalid_argument);
    v.clear();
    THROWS(uuid::from_bytes(v), std::invalid_argument);

    EQUAL(u.msb(), 0x550e8400e29b41d4);
    EQUAL(u.lsb(), 0xa716446655440000);
}

void test_version_variant(){
    // The version is whatever is in the nibble, even if it's not one
    // we know how to generate.
    for(uint64_t ver=0; ver<16; ++ver){
        auto u = uuid::from_bits(0x0123456789ab0def | (ver<<12), 0x8000000000000000);
        EQUAL(u.version(), int(ver));
    }
    EQUAL(uuid::from_bits(0, 0x0000000000000000).variant(), 0);
    EQUAL(uuid::from_bits(0, 0x7fffffffffffffff).variant(), 0);
    EQUAL(uuid::from_bits(0, 0x8000000000000000).variant(), 2);
    EQUAL(uuid::from_bits(0, 0xbfffffffffffffff).variant(), 2);
    EQUAL(uuid::from_bits(0, 0xc000000000000000).variant(), 6);
    EQUAL(uuid::from_bits(0, 0xdfffffffffffffff).variant(), 6);
    EQUAL(uuid::from_bits(0, 0xe000000000000000).variant(), 7);
    EQUAL(uuid::from_bits(0, 0xffffffffffffffff).variant(), 7);
}

void test_order_and_hash(){
    auto a = uuid::from_bits(1, 0xffffffffffffffff);
    auto b = uuid::from_bits(2, 0);
    auto c = uuid::from_bits(2, 1);
    // Unsigned comparison:  the top bit set is bigger, not negative.
    auto d = uuid::from_bits(0x8000000000000000, 0);

    EQUAL(a.compare_to(b), -1);
    EQUAL(b.compare_to(a), 1);
    EQUAL(b.compare_to(c), -1);
    EQUAL(c.compare_to(c), 0);
    EQUAL(c.compare_to(d), -1);
    CHECK(a < b && b < c && c < d);
    CHECK(d > a && d >= d && a <= a);
    CHECK(a != b);
    CHECK(uuid::from_bits(2, 1) == c);

    // The order agrees with the order of the text.
    std::vector<uuid> v = {d, c, a, b};
    std::map<uuid, std::string> m;
    for(auto& u : v)
        m[u] = u.str();
    std::string prev;
    for(auto& kv : m){
        CHECK(prev < kv.second);
        prev = kv.second;
    }

    // Equal uuids hash equally, through hash() or std::hash.
    auto c2 = uuid::from_string(c.str());
    EQUAL(c.hash(), c2.hash());
    EQUAL(std::hash<uuid>()(c), std::hash<uuid>()(c2));
    std::unordered_set<uuid> s = {a, b, c, d, c2};
    EQUAL(s.size(), 4);
    CHECK(s.count(uuid::from_bits(1, 0xffffffffffffffff)) == 1);
}

void test_namespaces(){
    EQSTR(uuid123::namespace_dns.str(),  "6ba7b810-9dad-11d1-80b4-00c04fd430c8");
    EQSTR(uuid123::namespace_url.str(),  "6ba7b811-9dad-11d1-80b4-00c04fd430c8");
    EQSTR(uuid123::namespace_oid.str(),  "6ba7b812-9dad-11d1-80b4-00c04fd430c8");
    EQSTR(uuid123::namespace_x500.str(), "6ba7b814-9dad-11d1-80b4-00c04fd430c8");
    for(auto& ns : {uuid123::namespace_dns, uuid123::namespace_url, uuid123::namespace_oid, uuid123::namespace_x500}){
        EQUAL(ns.version(), 1);
        EQUAL(ns.variant(), 2);
    }
    // They're version 1, so they have all the version 1 fields.
    auto& dns = uuid123::namespace_dns;
    EQUAL(dns.timestamp(), 0x1d19dad6ba7b810);
    EQUAL(dns.clock_sequence(), 0xb4);
    EQUAL(dns.node(), 0x00c04fd430c8);

    constexpr uuid fromfields = uuid::from_fields(0x550e8400, 0xe29b, 0x41d4, 0xa7, 0x16446655440000);
    EQSTR(fromfields.str(), "550e8400-e29b-41d4-a716-446655440000");
}

void test_unsupported(){
    auto v4 = uuid::from_string("550e8400-e29b-41d4-a716-446655440000");
    THROWS(v4.timestamp(), uuid123::unsupported);
    THROWS(v4.clock_sequence(), uuid123::unsupported);
    THROWS(v4.node(), uuid123::unsupported);
    THROWS(v4.unix_time(), uuid123::unsupported);
    THROWS(uuid().timestamp(), uuid123::unsupported);
}

int main(int, char **){
    test_text();
    test_bytes();
    test_version_variant();
    test_order_and_hash();
    test_namespaces();
    test_unsupported();
    return utstatus();
}
