#include "uuid.hpp"
#include "random.hpp"
#include <openssl/evp.h>
#include <chrono>
#include <cstdio>
#include <cstring>

bool Uuid::operator==(const Uuid& o) const {
    return std::memcmp(bytes, o.bytes, sizeof(bytes)) == 0;
}

namespace uuid {

// ── Bit twiddling ─────────────────────────────────────────────────────────────

static void set_version_and_variant(Uuid& u, int version) {
    u.bytes[6] = static_cast<uint8_t>((u.bytes[6] & 0x0F) | (version << 4));
    u.bytes[8] = static_cast<uint8_t>((u.bytes[8] & 0x3F) | 0x80);  // variant = 10xxxxxx
}

// ── Name-based (v3 / v5) ──────────────────────────────────────────────────────

static Uuid hash_based(const EVP_MD* md, int version,
                       const Uuid& ns, const std::string& name)
{
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) throw GenError(ErrorKind::DigestFailure, "EVP_MD_CTX_new failed");

    auto cleanup = [&]{ EVP_MD_CTX_free(ctx); };

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int  digest_len = 0;

    if (EVP_DigestInit_ex(ctx, md, nullptr) != 1) {
        cleanup(); throw GenError(ErrorKind::DigestFailure, "EVP_DigestInit_ex failed");
    }
    if (EVP_DigestUpdate(ctx, ns.bytes, sizeof(ns.bytes)) != 1 ||
        EVP_DigestUpdate(ctx, name.data(), name.size()) != 1) {
        cleanup(); throw GenError(ErrorKind::DigestFailure, "EVP_DigestUpdate failed");
    }
    if (EVP_DigestFinal_ex(ctx, digest, &digest_len) != 1) {
        cleanup(); throw GenError(ErrorKind::DigestFailure, "EVP_DigestFinal_ex failed");
    }
    cleanup();

    if (digest_len < 16)
        throw GenError(ErrorKind::DigestFailure, "digest shorter than 16 bytes");

    Uuid u;
    std::memcpy(u.bytes, digest, 16);
    set_version_and_variant(u, version);
    return u;
}

Uuid make_v3(const Uuid& ns, const std::string& name) {
    return hash_based(EVP_md5(), 3, ns, name);
}

Uuid make_v5(const Uuid& ns, const std::string& name) {
    return hash_based(EVP_sha1(), 5, ns, name);
}

// ── Random (v4) ───────────────────────────────────────────────────────────────

Uuid make_v4() {
    Uuid u;
    rng::fill(u.bytes, sizeof(u.bytes));
    set_version_and_variant(u, 4);
    return u;
}

// ── Time-based (v1) ───────────────────────────────────────────────────────────

Uuid make_v1(uint64_t ticks, uint16_t clock_seq, const uint8_t node[6]) {
    uint32_t time_low = static_cast<uint32_t>(ticks & 0xFFFFFFFFULL);
    uint16_t time_mid = static_cast<uint16_t>((ticks >> 32) & 0xFFFF);
    uint16_t time_hi  = static_cast<uint16_t>((ticks >> 48) & 0x0FFF);

    Uuid u;
    u.bytes[0] = static_cast<uint8_t>(time_low >> 24);
    u.bytes[1] = static_cast<uint8_t>(time_low >> 16);
    u.bytes[2] = static_cast<uint8_t>(time_low >>  8);
    u.bytes[3] = static_cast<uint8_t>(time_low);
    u.bytes[4] = static_cast<uint8_t>(time_mid >> 8);
    u.bytes[5] = static_cast<uint8_t>(time_mid);
    u.bytes[6] = static_cast<uint8_t>(time_hi >> 8);
    u.bytes[7] = static_cast<uint8_t>(time_hi);
    u.bytes[8] = static_cast<uint8_t>((clock_seq >> 8) & 0x3F);
    u.bytes[9] = static_cast<uint8_t>(clock_seq);
    std::memcpy(u.bytes + 10, node, 6);

    set_version_and_variant(u, 1);
    return u;
}

static uint64_t gregorian_ticks_now() {
    using ticks_100ns = std::chrono::duration<int64_t, std::ratio<1, 10000000>>;
    auto since_unix = std::chrono::duration_cast<ticks_100ns>(
        std::chrono::system_clock::now().time_since_epoch());
    return kGregorianOffset + static_cast<uint64_t>(since_unix.count());
}

Uuid make_v1() {
    // One CSPRNG call: 2 bytes clock sequence, 6 bytes node
    uint8_t rnd[8];
    rng::fill(rnd, sizeof(rnd));

    uint16_t clock_seq = static_cast<uint16_t>(((rnd[0] << 8) | rnd[1]) & 0x3FFF);
    uint8_t  node[6];
    std::memcpy(node, rnd + 2, 6);
    node[0] |= 0x01;  // multicast bit marks a non-hardware node id

    return make_v1(gregorian_ticks_now(), clock_seq, node);
}

// ── Dispatch ──────────────────────────────────────────────────────────────────

Uuid generate(const UuidRequest& req) {
    switch (req.version) {
        case UuidVersion::V1: return make_v1();
        case UuidVersion::V4: return make_v4();
        case UuidVersion::V3:
        case UuidVersion::V5: {
            if (!req.ns || !req.name) {
                int v = static_cast<int>(req.version);
                throw GenError(ErrorKind::MissingNamespaceOrName,
                               "UUID v" + std::to_string(v) +
                               " requires both --namespace and --name");
            }
            return req.version == UuidVersion::V3 ? make_v3(*req.ns, *req.name)
                                                  : make_v5(*req.ns, *req.name);
        }
    }
    throw GenError(ErrorKind::UnsupportedUuidVersion, "Unsupported UUID version");
}

// ── Text form ─────────────────────────────────────────────────────────────────

std::string to_string(const Uuid& u) {
    const uint8_t* b = u.bytes;
    char buf[37];
    std::snprintf(buf, sizeof(buf),
        "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
        b[0], b[1], b[2],  b[3],
        b[4], b[5],
        b[6], b[7],
        b[8], b[9],
        b[10], b[11], b[12], b[13], b[14], b[15]);
    return std::string(buf);
}

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

Uuid parse(const std::string& text) {
    auto invalid = [&]() {
        return GenError(ErrorKind::InvalidNamespace,
                        "invalid UUID '" + text + "'");
    };

    std::string s = text;
    if (s.size() > 9 && s.compare(0, 9, "urn:uuid:") == 0)
        s = s.substr(9);
    else if (s.size() >= 2 && s.front() == '{' && s.back() == '}')
        s = s.substr(1, s.size() - 2);

    std::string digits;
    if (s.size() == 36) {
        for (size_t i = 0; i < s.size(); ++i) {
            bool dash_pos = (i == 8 || i == 13 || i == 18 || i == 23);
            if (dash_pos) {
                if (s[i] != '-') throw invalid();
            } else {
                digits += s[i];
            }
        }
    } else if (s.size() == 32) {
        digits = s;
    } else {
        throw invalid();
    }

    Uuid u;
    for (size_t i = 0; i < 16; ++i) {
        int hi = hex_value(digits[2 * i]);
        int lo = hex_value(digits[2 * i + 1]);
        if (hi < 0 || lo < 0) throw invalid();
        u.bytes[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return u;
}

std::optional<Uuid> well_known_namespace(const std::string& alias) {
    // 6ba7b81X-9dad-11d1-80b4-00c04fd430c8, X selects the namespace
    uint8_t selector;
    if      (alias == "dns")  selector = 0x10;
    else if (alias == "url")  selector = 0x11;
    else if (alias == "oid")  selector = 0x12;
    else if (alias == "x500") selector = 0x14;
    else return std::nullopt;

    Uuid u = parse("6ba7b800-9dad-11d1-80b4-00c04fd430c8");
    u.bytes[3] = selector;
    return u;
}

Uuid parse_namespace(const std::string& text) {
    if (auto ns = well_known_namespace(text))
        return *ns;
    return parse(text);
}

UuidVersion parse_version(const std::string& s) {
    if (s == "v1") return UuidVersion::V1;
    if (s == "v3") return UuidVersion::V3;
    if (s == "v4") return UuidVersion::V4;
    if (s == "v5") return UuidVersion::V5;
    throw GenError(ErrorKind::UnsupportedUuidVersion,
                   "unsupported UUID version '" + s + "' (must be v1, v3, v4, or v5)");
}

// ── Field inspection ──────────────────────────────────────────────────────────

int version_of(const Uuid& u) {
    return u.bytes[6] >> 4;
}

bool is_rfc4122_variant(const Uuid& u) {
    return (u.bytes[8] & 0xC0) == 0x80;
}

uint64_t v1_timestamp(const Uuid& u) {
    const uint8_t* b = u.bytes;
    uint64_t time_low = (uint64_t)b[0] << 24 | (uint64_t)b[1] << 16 |
                        (uint64_t)b[2] <<  8 | (uint64_t)b[3];
    uint64_t time_mid = (uint64_t)b[4] << 8 | b[5];
    uint64_t time_hi  = ((uint64_t)b[6] & 0x0F) << 8 | b[7];
    return time_hi << 48 | time_mid << 32 | time_low;
}

uint16_t v1_clock_seq(const Uuid& u) {
    return static_cast<uint16_t>(((u.bytes[8] & 0x3F) << 8) | u.bytes[9]);
}

} // namespace uuid
