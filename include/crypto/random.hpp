#ifndef XFER_CRYPTO_RANDOM_HPP
#define XFER_CRYPTO_RANDOM_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "crypto/crypto_error.hpp"

namespace xfer::crypto {

// Fills a buffer of the given length from the OpenSSL CSPRNG.
// Throws RandomError if the generator is not seeded.
std::vector<uint8_t> random_bytes(std::size_t length);

// Lowercase hex encoding of `length` random bytes (2 * length characters)
std::string random_hex(std::size_t length);

// RFC 4122 version 4 UUID in canonical 8-4-4-4-12 form
std::string generate_uuid();

} // namespace xfer::crypto

#endif // XFER_CRYPTO_RANDOM_HPP
