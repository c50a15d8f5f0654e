#pragma once
#include "genrs.hpp"
#include <string>
#include <optional>
#include <cstddef>

// Upper bound on --length. Keeps a typo from asking the CSPRNG for gigabytes.
static constexpr long long kMaxKeyLength = 1 << 20;

struct PresetInfo {
    KeyPreset   preset;
    const char* name;           // CLI token, e.g. "hmac256"
    size_t      bytes;
    const char* description;    // e.g. "HMAC-SHA256"
};

namespace preset {

// The full table, in CLI listing order.
const PresetInfo* table(size_t& count);

// nullptr if name is not a preset.
const PresetInfo* find(const std::string& name);

const PresetInfo& info(KeyPreset p);

// Throws GenError{UnknownPreset} if name is not a preset.
KeyPreset parse(const std::string& name);

// Preset length if one is given, otherwise explicit_length.
// Throws GenError{InvalidLength} if explicit_length <= 0 or above kMaxKeyLength.
size_t resolve_length(std::optional<KeyPreset> p, long long explicit_length);

// Parse a --length token. Throws GenError{InvalidLength} on anything but a
// decimal integer in [1, kMaxKeyLength].
long long parse_length(const std::string& s);

} // namespace preset
