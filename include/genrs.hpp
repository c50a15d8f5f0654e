#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <optional>
#include <stdexcept>

enum class EncodingFormat { Hex, Base64 };

enum class KeyPreset {
    Aes128, Aes192, Aes256,
    HmacSha256, HmacSha512,
    Jwt256, Jwt512,
    ApiKey128, ApiKey256
};

enum class UuidVersion { V1 = 1, V3 = 3, V4 = 4, V5 = 5 };

enum class ErrorKind {
    InvalidLength,
    UnknownPreset,
    UnknownFormat,
    UnknownMode,
    UnsupportedUuidVersion,
    MissingNamespaceOrName,
    InvalidNamespace,
    RandomSourceUnavailable,
    DigestFailure
};

// Every user-facing failure is a GenError; kind() selects the exit code.
class GenError : public std::runtime_error {
public:
    GenError(ErrorKind kind, const std::string& msg)
        : std::runtime_error(msg), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

// Name of an error kind, e.g. "InvalidNamespace".
const char* error_kind_name(ErrorKind kind);

struct KeyRequest {
    long long                length   = 32;     // ignored when preset is set
    EncodingFormat           encoding = EncodingFormat::Hex;
    std::optional<KeyPreset> preset;
};

struct Uuid {
    uint8_t bytes[16] = {};     // network byte order

    bool operator==(const Uuid& o) const;
    bool operator!=(const Uuid& o) const { return !(*this == o); }
};

struct UuidRequest {
    UuidVersion                version = UuidVersion::V4;
    std::optional<Uuid>        ns;      // required for V3/V5
    std::optional<std::string> name;    // required for V3/V5
};
