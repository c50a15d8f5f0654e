#pragma once
#include "genrs.hpp"
#include <string>
#include <optional>
#include <cstdint>

namespace uuid {

// 100 ns intervals between 1582-10-15 (Gregorian reform) and the Unix epoch.
static constexpr uint64_t kGregorianOffset = 0x01B21DD213814000ULL;

// ── Construction ──────────────────────────────────────────────────────────────

// Time-based UUID from the current clock, a random 14-bit clock sequence and
// a random node id with the multicast bit set (no MAC address is read).
Uuid make_v1();

// Packs explicit v1 fields per RFC 4122 §4.2. ticks is truncated to 60 bits,
// clock_seq to 14 bits; node is used as given.
Uuid make_v1(uint64_t ticks, uint16_t clock_seq, const uint8_t node[6]);

// MD5(ns || name), version 3.
Uuid make_v3(const Uuid& ns, const std::string& name);

// 16 CSPRNG bytes, version 4.
Uuid make_v4();

// SHA-1(ns || name) truncated to 16 bytes, version 5.
Uuid make_v5(const Uuid& ns, const std::string& name);

// Dispatch on req.version. V3/V5 throw GenError{MissingNamespaceOrName}
// unless both ns and name are present.
Uuid generate(const UuidRequest& req);

// ── Text form ─────────────────────────────────────────────────────────────────

// Canonical lowercase 8-4-4-4-12.
std::string to_string(const Uuid& u);

// Accepts hyphenated, simple (32 digits), braced and urn:uuid: forms in either
// case. Throws GenError{InvalidNamespace} otherwise.
Uuid parse(const std::string& text);

// RFC 4122 Appendix C namespaces: "dns", "url", "oid", "x500".
std::optional<Uuid> well_known_namespace(const std::string& alias);

// A well-known alias or UUID text.
Uuid parse_namespace(const std::string& text);

// "v1", "v3", "v4" or "v5".
// Throws GenError{UnsupportedUuidVersion} for anything else.
UuidVersion parse_version(const std::string& s);

// ── Field inspection ──────────────────────────────────────────────────────────

int      version_of(const Uuid& u);
bool     is_rfc4122_variant(const Uuid& u);
uint64_t v1_timestamp(const Uuid& u);
uint16_t v1_clock_seq(const Uuid& u);

} // namespace uuid
