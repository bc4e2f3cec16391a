#pragma once

#include <uuid123/uuid.hpp>
#include <uuid123/random_source.hpp>
#include <uuid123/str_view.hpp>
#include <chrono>
#include <cstddef>
#include <vector>

// Generators for RFC 4122 uuids.  See RFC4122/DCE 1.1.
//
// Each generator that needs randomness comes in two flavors:  one
// that takes a random_source& and one that uses the process-wide
// active_random_source() (see random_source.hpp).  E.g.,
//
//     auto u = uuid123::random_uuid();          // active source
//
//     uuid123::fast_random_source frs(42);
//     auto v = uuid123::random_uuid(frs);       // reproducible
//
// Every uuid generated here has variant()==2 (RFC 4122).

namespace uuid123{

// random_uuid - Version 4.  122 random bits from the source.
uuid random_uuid(random_source& rs);
uuid random_uuid();

// time_based_uuid - Version 1.  The timestamp is 'now' (millisecond
// resolution) in 100ns ticks since 1582-10-15T00:00:00Z.  The clock
// sequence (14 bits) and the node (48 bits) are random - the node is
// never the hardware address.
//
// N.B.  RFC 4122 wants the clock sequence to persist from one call to
// the next, and to be incremented when the clock goes backwards.
// Here it's drawn afresh every time, so two uuids generated in the
// same millisecond differ in their random bits, not in their
// timestamps, and sorting by timestamp can't break the tie.
//
// Throws std::invalid_argument if 'now' is before 1582-10-15 or too
// late to fit in 60 bits of 100ns ticks (the year 5236).
uuid time_based_uuid(random_source& rs, std::chrono::system_clock::time_point now);
uuid time_based_uuid(random_source& rs);
uuid time_based_uuid();

// name_based_uuid - Version 3 (MD5) or 5 (SHA-1) of the namespace's
// 16 bytes followed by the name's bytes.  Deterministic:  the same
// namespace, name and version always give the same uuid, and the
// same one that any other RFC 4122 implementation gives.
//
// Throws std::invalid_argument if version is neither 3 nor 5.
uuid name_based_uuid(const uuid& ns, const void *name, size_t len, int version);

// The name's bytes, as is.  For a std::string or a literal holding
// UTF-8 text, that's the UTF-8 encoding.
inline uuid name_based_uuid(const uuid& ns, str_view name, int version = 5){
    return name_based_uuid(ns, name.data(), name.size(), version);
}

inline uuid name_based_uuid(const uuid& ns, const std::vector<unsigned char>& name, int version = 5){
    return name_based_uuid(ns, name.data(), name.size(), version);
}

} // namespace uuid123
