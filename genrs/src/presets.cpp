#include "presets.hpp"
#include <cerrno>
#include <cstdlib>
#include <string>

// ── Preset table ──────────────────────────────────────────────────────────────

static const PresetInfo kPresets[] = {
    { KeyPreset::Aes128,     "aes128",    16, "AES-128"         },
    { KeyPreset::Aes192,     "aes192",    24, "AES-192"         },
    { KeyPreset::Aes256,     "aes256",    32, "AES-256"         },
    { KeyPreset::HmacSha256, "hmac256",   32, "HMAC-SHA256"     },
    { KeyPreset::HmacSha512, "hmac512",   64, "HMAC-SHA512"     },
    { KeyPreset::Jwt256,     "jwt256",    32, "JWT-256"         },
    { KeyPreset::Jwt512,     "jwt512",    64, "JWT-512"         },
    { KeyPreset::ApiKey128,  "apikey128", 16, "API Key 128-bit" },
    { KeyPreset::ApiKey256,  "apikey256", 32, "API Key 256-bit" },
};

static const size_t kPresetCount = sizeof(kPresets) / sizeof(kPresets[0]);

namespace preset {

const PresetInfo* table(size_t& count) {
    count = kPresetCount;
    return kPresets;
}

const PresetInfo* find(const std::string& name) {
    for (const auto& p : kPresets) {
        if (name == p.name)
            return &p;
    }
    return nullptr;
}

const PresetInfo& info(KeyPreset p) {
    for (const auto& entry : kPresets) {
        if (entry.preset == p)
            return entry;
    }
    throw GenError(ErrorKind::UnknownPreset, "Unknown preset");
}

KeyPreset parse(const std::string& name) {
    const PresetInfo* p = find(name);
    if (!p) {
        std::string valid;
        for (const auto& entry : kPresets) {
            if (!valid.empty()) valid += ", ";
            valid += entry.name;
        }
        throw GenError(ErrorKind::UnknownPreset,
                       "unknown preset '" + name + "' (must be one of " + valid + ")");
    }
    return p->preset;
}

// ── Length resolution ─────────────────────────────────────────────────────────

size_t resolve_length(std::optional<KeyPreset> p, long long explicit_length) {
    if (p)
        return info(*p).bytes;

    if (explicit_length <= 0)
        throw GenError(ErrorKind::InvalidLength,
                       "invalid length " + std::to_string(explicit_length) +
                       " (must be a positive number of bytes)");
    if (explicit_length > kMaxKeyLength)
        throw GenError(ErrorKind::InvalidLength,
                       "invalid length " + std::to_string(explicit_length) +
                       " (maximum is " + std::to_string(kMaxKeyLength) + " bytes)");
    return static_cast<size_t>(explicit_length);
}

long long parse_length(const std::string& s) {
    const char* begin = s.c_str();
    char* end = nullptr;

    // strtoll would skip leading whitespace and take a sign
    if (s.empty() || s[0] < '0' || s[0] > '9')
        throw GenError(ErrorKind::InvalidLength,
                       "invalid length '" + s + "' (must be a positive integer)");

    errno = 0;
    long long v = std::strtoll(begin, &end, 10);

    if (end != begin + s.size() || errno == ERANGE)
        throw GenError(ErrorKind::InvalidLength,
                       "invalid length '" + s + "' (must be a positive integer)");

    // Range checks share resolve_length's messages
    resolve_length(std::nullopt, v);
    return v;
}

} // namespace preset
