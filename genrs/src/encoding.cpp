#include "encoding.hpp"
#include <openssl/evp.h>
#include <stdexcept>
#include <climits>

static const char kHexDigits[] = "0123456789abcdef";

std::string hex_encode(const uint8_t* data, size_t len) {
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out += kHexDigits[data[i] >> 4];
        out += kHexDigits[data[i] & 0x0F];
    }
    return out;
}

std::string base64_encode(const uint8_t* data, size_t len) {
    if (len > static_cast<size_t>(INT_MAX / 4 * 3))
        throw std::length_error("base64_encode: input too large");

    // EVP_EncodeBlock output: ceil(n/3)*4 bytes + null terminator
    std::vector<unsigned char> out((len + 2) / 3 * 4 + 1);
    int n = EVP_EncodeBlock(out.data(), data, static_cast<int>(len));
    return std::string(reinterpret_cast<char*>(out.data()), static_cast<size_t>(n));
}

std::vector<uint8_t> base64_decode(const std::string& encoded) {
    if (encoded.empty()) return {};
    if (encoded.size() % 4 != 0)
        throw std::invalid_argument("Invalid base64 length");
    if (encoded.size() > static_cast<size_t>(INT_MAX))
        throw std::invalid_argument("base64 input too large");

    std::vector<uint8_t> out(encoded.size() / 4 * 3);
    int n = EVP_DecodeBlock(out.data(),
                            reinterpret_cast<const unsigned char*>(encoded.data()),
                            static_cast<int>(encoded.size()));
    if (n < 0)
        throw std::invalid_argument("Invalid base64 character");

    // EVP_DecodeBlock counts the padding positions as zero bytes
    size_t pad = 0;
    if (encoded[encoded.size() - 1] == '=') ++pad;
    if (encoded[encoded.size() - 2] == '=') ++pad;
    out.resize(static_cast<size_t>(n) - pad);
    return out;
}

std::string encode_key(const std::vector<uint8_t>& key, EncodingFormat format) {
    switch (format) {
        case EncodingFormat::Hex:    return hex_encode(key.data(), key.size());
        case EncodingFormat::Base64: return base64_encode(key.data(), key.size());
    }
    throw GenError(ErrorKind::UnknownFormat, "Unknown encoding format");
}

EncodingFormat parse_format(const std::string& s) {
    if (s == "hex")    return EncodingFormat::Hex;
    if (s == "base64") return EncodingFormat::Base64;
    throw GenError(ErrorKind::UnknownFormat,
                   "unknown format '" + s + "' (must be hex or base64)");
}

const char* format_name(EncodingFormat format) {
    return format == EncodingFormat::Base64 ? "base64" : "hex";
}
