#ifndef XFER_CRYPTO_ERROR_HPP
#define XFER_CRYPTO_ERROR_HPP

#include <stdexcept>
#include <string>

namespace xfer::crypto {

class CryptoError : public std::runtime_error {
public:
    explicit CryptoError(const std::string& message) 
        : std::runtime_error(message) {}
};

class RandomError : public CryptoError {
public:
    explicit RandomError(const std::string& message) 
        : CryptoError("Random generator error: " + message) {}
};

} // namespace xfer::crypto

#endif // XFER_CRYPTO_ERROR_HPP
