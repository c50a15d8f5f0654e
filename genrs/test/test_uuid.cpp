#include "uuid.hpp"
#include <chrono>
#include <iostream>
#include <string>

static bool fail(const std::string& msg) {
    std::cerr << "FAIL: " << msg << "\n";
    return false;
}

static bool check(bool cond, const std::string& msg) {
    if (!cond) return fail(msg);
    return true;
}

// Canonical shape, version nibble at index 14, variant char at index 19
static bool well_formed(const std::string& s, char version) {
    if (s.size() != 36) return false;
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (c != '-') return false;
        } else if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
            return false;
        }
    }
    char variant = s[19];
    return s[14] == version &&
           (variant == '8' || variant == '9' || variant == 'a' || variant == 'b');
}

template <typename F>
static bool throws_kind(ErrorKind kind, F fn) {
    try {
        fn();
    } catch (const GenError& e) {
        return e.kind() == kind;
    }
    return false;
}

static const char* kDns = "6ba7b810-9dad-11d1-80b4-00c04fd430c8";

int main() {
    bool ok = true;

    Uuid dns = uuid::parse(kDns);

    // ── Name-based known answers ──────────────────────────────────────────────
    ok &= check(uuid::to_string(uuid::make_v3(dns, "python.org")) ==
                "6fa459ea-ee8a-3ca4-894e-db77e160355e", "v3(dns, python.org)");
    ok &= check(uuid::to_string(uuid::make_v5(dns, "python.org")) ==
                "886313e1-3b8a-5372-9b90-0c9aee199e5d", "v5(dns, python.org)");
    ok &= check(uuid::to_string(uuid::make_v5(dns, "example")) ==
                "7cb48787-6d91-5b9f-bc60-f30298ea5736", "v5(dns, example)");
    ok &= check(uuid::to_string(uuid::make_v5(dns, "")) ==
                "4ebd0208-8328-5d69-8c44-ec50939c0967", "v5(dns, empty name)");

    // Determinism and v3/v5 separation
    ok &= check(uuid::make_v3(dns, "example") == uuid::make_v3(dns, "example"), "v3 repeatable");
    ok &= check(uuid::make_v5(dns, "example") == uuid::make_v5(dns, "example"), "v5 repeatable");
    ok &= check(uuid::make_v3(dns, "example") != uuid::make_v5(dns, "example"), "v3 != v5");
    ok &= check(uuid::make_v5(dns, "a") != uuid::make_v5(dns, "b"), "v5 depends on name");

    // ── Well-known namespaces ─────────────────────────────────────────────────
    ok &= check(uuid::to_string(*uuid::well_known_namespace("dns")) == kDns, "dns namespace");
    ok &= check(uuid::to_string(*uuid::well_known_namespace("url")) ==
                "6ba7b811-9dad-11d1-80b4-00c04fd430c8", "url namespace");
    ok &= check(uuid::to_string(*uuid::well_known_namespace("oid")) ==
                "6ba7b812-9dad-11d1-80b4-00c04fd430c8", "oid namespace");
    ok &= check(uuid::to_string(*uuid::well_known_namespace("x500")) ==
                "6ba7b814-9dad-11d1-80b4-00c04fd430c8", "x500 namespace");
    ok &= check(!uuid::well_known_namespace("ldap"), "no ldap namespace");
    ok &= check(uuid::to_string(uuid::make_v3(uuid::parse_namespace("url"), "https://example.com")) ==
                "68794df6-5e20-385f-ab08-bb73f8a433cb", "v3(url, https://example.com)");

    // ── Parsing ───────────────────────────────────────────────────────────────
    ok &= check(uuid::parse("6BA7B810-9DAD-11D1-80B4-00C04FD430C8") == dns, "parse upper case");
    ok &= check(uuid::parse("6ba7b8109dad11d180b400c04fd430c8") == dns, "parse simple form");
    ok &= check(uuid::parse("{6ba7b810-9dad-11d1-80b4-00c04fd430c8}") == dns, "parse braced form");
    ok &= check(uuid::parse("urn:uuid:6ba7b810-9dad-11d1-80b4-00c04fd430c8") == dns, "parse urn form");

    const char* bad[] = {
        "not-a-uuid",
        "",
        "6ba7b810-9dad-11d1-80b4-00c04fd430c",      // short
        "6ba7b810-9dad-11d1-80b4-00c04fd430c8a",    // long
        "6ba7b810x9dad-11d1-80b4-00c04fd430c8",     // bad separator
        "6ba7b810-9dad-11d1-80b4-00c04fd430cg",     // bad digit
        "{6ba7b810-9dad-11d1-80b4-00c04fd430c8",    // unbalanced brace
    };
    for (const char* s : bad) {
        ok &= check(throws_kind(ErrorKind::InvalidNamespace, [&]{ uuid::parse(s); }),
                    std::string("parse rejects '") + s + "'");
    }

    // ── Version tokens ────────────────────────────────────────────────────────
    ok &= check(uuid::parse_version("v1") == UuidVersion::V1, "parse_version v1");
    ok &= check(uuid::parse_version("v3") == UuidVersion::V3, "parse_version v3");
    ok &= check(uuid::parse_version("v4") == UuidVersion::V4, "parse_version v4");
    ok &= check(uuid::parse_version("v5") == UuidVersion::V5, "parse_version v5");
    for (const char* s : { "v2", "v6", "v7", "", "x", "3", "4", "V5", " v4", "v4 " }) {
        ok &= check(throws_kind(ErrorKind::UnsupportedUuidVersion, [&]{ uuid::parse_version(s); }),
                    std::string("parse_version rejects '") + s + "'");
    }

    // ── Version and variant bits through generate() ───────────────────────────
    struct Case { UuidVersion v; char nibble; };
    const Case cases[] = {
        { UuidVersion::V1, '1' }, { UuidVersion::V3, '3' },
        { UuidVersion::V4, '4' }, { UuidVersion::V5, '5' },
    };
    for (const auto& c : cases) {
        UuidRequest req;
        req.version = c.v;
        req.ns      = dns;
        req.name    = "example";
        Uuid u = uuid::generate(req);
        std::string s = uuid::to_string(u);
        ok &= check(well_formed(s, c.nibble), "well-formed v" + std::string(1, c.nibble) + ": " + s);
        ok &= check(uuid::version_of(u) == c.nibble - '0', "version_of v" + std::string(1, c.nibble));
        ok &= check(uuid::is_rfc4122_variant(u), "variant v" + std::string(1, c.nibble));
    }

    // v4 over many draws: fixed bits always set, values never repeat
    {
        Uuid prev = uuid::make_v4();
        for (int i = 0; i < 64; ++i) {
            Uuid u = uuid::make_v4();
            ok &= check(well_formed(uuid::to_string(u), '4'), "v4 draw well-formed");
            ok &= check(u != prev, "v4 draws differ");
            prev = u;
        }
    }

    // ── Missing inputs for name-based versions ────────────────────────────────
    {
        UuidRequest req;
        req.version = UuidVersion::V3;
        req.name    = "example";
        ok &= check(throws_kind(ErrorKind::MissingNamespaceOrName, [&]{ uuid::generate(req); }),
                    "v3 without namespace");

        req.version = UuidVersion::V5;
        req.ns      = dns;
        req.name.reset();
        ok &= check(throws_kind(ErrorKind::MissingNamespaceOrName, [&]{ uuid::generate(req); }),
                    "v5 without name");
    }

    // ── v1 field packing ──────────────────────────────────────────────────────
    {
        const uint8_t node[6] = { 0x01, 0x02, 0x03, 0x04, 0x05, 0x06 };
        Uuid u = uuid::make_v1(0x0123456789ABCDEFULL, 0x3ABC, node);
        ok &= check(uuid::to_string(u) == "89abcdef-4567-1123-babc-010203040506",
                    "v1 packing: " + uuid::to_string(u));
        ok &= check(uuid::v1_timestamp(u) == 0x0123456789ABCDEFULL, "v1 timestamp read-back");
        ok &= check(uuid::v1_clock_seq(u) == 0x3ABC, "v1 clock sequence read-back");

        // Bits above 60 and 14 are dropped
        Uuid t = uuid::make_v1(0xF123456789ABCDEFULL, 0xFABC, node);
        ok &= check(t == u, "v1 truncates timestamp and clock sequence");
    }

    // v1 from the clock: timestamp near now, node marked multicast
    {
        using ticks_100ns = std::chrono::duration<int64_t, std::ratio<1, 10000000>>;
        uint64_t now = uuid::kGregorianOffset + static_cast<uint64_t>(
            std::chrono::duration_cast<ticks_100ns>(
                std::chrono::system_clock::now().time_since_epoch()).count());

        Uuid u = uuid::make_v1();
        uint64_t ts = uuid::v1_timestamp(u);
        uint64_t diff = ts > now ? ts - now : now - ts;
        ok &= check(diff < 10ULL * 10000000ULL, "v1 timestamp within 10 s of now");
        ok &= check((u.bytes[10] & 0x01) == 0x01, "v1 node multicast bit set");
    }

    if (ok) {
        std::cout << "PASS\n";
        return 0;
    }
    return 1;
}
