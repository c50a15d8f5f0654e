#pragma once
#include "genrs.hpp"
#include <string>
#include <vector>
#include <cstdint>

// Lowercase hex, two digits per byte, no separators.
std::string hex_encode(const uint8_t* data, size_t len);

// RFC 4648 standard alphabet with '=' padding.
std::string base64_encode(const uint8_t* data, size_t len);

// Inverse of base64_encode. Throws std::invalid_argument on malformed input.
std::vector<uint8_t> base64_decode(const std::string& encoded);

std::string encode_key(const std::vector<uint8_t>& key, EncodingFormat format);

// "hex" | "base64". Throws GenError{UnknownFormat} otherwise.
EncodingFormat parse_format(const std::string& s);
const char*    format_name(EncodingFormat format);
