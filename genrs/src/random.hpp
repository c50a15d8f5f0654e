#pragma once
#include <vector>
#include <cstdint>
#include <cstddef>

namespace rng {

// n bytes from the OS CSPRNG (OpenSSL RAND_bytes).
// Throws GenError{RandomSourceUnavailable} if the generator fails.
std::vector<uint8_t> random_bytes(size_t n);

// Fill an existing buffer in place. Same failure contract as random_bytes.
void fill(uint8_t* out, size_t n);

} // namespace rng
