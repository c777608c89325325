#include "utils/crypto.hpp"
#include <openssl/rand.h>
#include <openssl/err.h>
#include <array>
#include <stdexcept>

namespace arbexec {
namespace crypto {

std::string to_hex(const uint8_t* data, size_t len) {
    static constexpr char digits[] = "0123456789abcdef";

    std::string out(len * 2, '0');
    for (size_t i = 0; i < len; i++) {
        out[2 * i] = digits[data[i] >> 4];
        out[2 * i + 1] = digits[data[i] & 0x0f];
    }
    return out;
}

void fill_random(uint8_t* buf, size_t len) {
    if (len == 0) return;
    if (RAND_bytes(buf, static_cast<int>(len)) != 1) {
        char reason[256];
        ERR_error_string_n(ERR_get_error(), reason, sizeof(reason));
        throw std::runtime_error(std::string("RAND_bytes failed: ") + reason);
    }
}

std::string connection_id() {
    std::array<uint8_t, 4> raw{};
    fill_random(raw.data(), raw.size());
    return to_hex(raw.data(), raw.size());
}

} // namespace crypto
} // namespace arbexec
