#pragma once

#include <string>
#include <cstddef>
#include <cstdint>

namespace arbexec {
namespace crypto {

/**
 * Lowercase hex of a byte range.
 */
std::string to_hex(const uint8_t* data, size_t len);

/**
 * Fill buf from OpenSSL's CSPRNG. Throws std::runtime_error if the
 * generator is not seeded.
 */
void fill_random(uint8_t* buf, size_t len);

/**
 * 8 hex chars tagging every log line of one TCP connection.
 */
std::string connection_id();

} // namespace crypto
} // namespace arbexec
