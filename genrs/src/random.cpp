#include "random.hpp"
#include "genrs.hpp"
#include <openssl/rand.h>
#include <openssl/err.h>
#include <climits>
#include <string>

namespace rng {

void fill(uint8_t* out, size_t n) {
    if (n == 0) return;
    if (n > static_cast<size_t>(INT_MAX))
        throw GenError(ErrorKind::RandomSourceUnavailable,
                       "random request too large: " + std::to_string(n) + " bytes");

    if (RAND_bytes(out, static_cast<int>(n)) != 1) {
        unsigned long code = ERR_get_error();
        char reason[256] = "unknown error";
        if (code != 0)
            ERR_error_string_n(code, reason, sizeof(reason));
        throw GenError(ErrorKind::RandomSourceUnavailable,
                       std::string("RAND_bytes failed: ") + reason);
    }
}

std::vector<uint8_t> random_bytes(size_t n) {
    std::vector<uint8_t> out(n);
    fill(out.data(), n);
    return out;
}

} // namespace rng
