#pragma once
#include "genrs.hpp"
#include "presets.hpp"
#include <string>

struct KeyReport {
    const PresetInfo* preset = nullptr;     // null when --length was used
    EncodingFormat    format = EncodingFormat::Hex;
    size_t            bytes  = 0;
    std::string       value;
};

struct UuidReport {
    UuidVersion                version = UuidVersion::V4;
    std::optional<Uuid>        ns;
    std::optional<std::string> name;
    std::string                value;
};

// Serialize a generated key or UUID as a single YAML document.
std::string emit_key_yaml(const KeyReport& report);
std::string emit_uuid_yaml(const UuidReport& report);
