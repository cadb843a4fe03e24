#include "crypto/random.hpp"
#include <openssl/err.h>
#include <openssl/rand.h>
#include <iomanip>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace xfer::crypto {

std::vector<uint8_t> random_bytes(std::size_t length) {
  std::vector<uint8_t> bytes(length);
  if (length == 0) {
    return bytes;
  }

  if (RAND_bytes(bytes.data(), static_cast<int>(length)) != 1) {
    unsigned long err = ERR_get_error();
    char err_buf[256];
    ERR_error_string_n(err, err_buf, sizeof(err_buf));
    BOOST_LOG_TRIVIAL(error) << "Random: RAND_bytes failed: " << err_buf;
    throw RandomError(err_buf);
  }
  return bytes;
}

std::string random_hex(std::size_t length) {
  auto bytes = random_bytes(length);

  std::stringstream ss;
  for (uint8_t byte : bytes) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  }
  return ss.str();
}

std::string generate_uuid() {
  auto bytes = random_bytes(16);

  // Stamp version (4) and variant (10xx) bits
  bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
  bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);

  std::stringstream ss;
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      ss << '-';
    }
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(bytes[i]);
  }
  return ss.str();
}

} // namespace xfer::crypto
