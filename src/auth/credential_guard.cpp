#include "auth/credential_guard.hpp"
#include <openssl/crypto.h>
#include <stdexcept>
#include <boost/log/trivial.hpp>
#include "crypto/random.hpp"

namespace xfer {
namespace auth {

CredentialGuard::CredentialGuard(std::string secret) : secret_(std::move(secret)) {
  if (secret_.empty()) {
    BOOST_LOG_TRIVIAL(error) << "Credential guard: Refusing to start with an empty secret";
    throw std::invalid_argument("Credential guard: secret must not be empty");
  }
  BOOST_LOG_TRIVIAL(debug) << "Credential guard: Initialized with " << secret_.size() << "-character secret";
}

AuthResult CredentialGuard::authorize(std::string_view presented_token) const {
  if (presented_token.empty() || presented_token.size() != secret_.size()) {
    BOOST_LOG_TRIVIAL(debug) << "Credential guard: Denied request";
    return AuthResult::Denied;
  }

  if (CRYPTO_memcmp(presented_token.data(), secret_.data(), secret_.size()) != 0) {
    BOOST_LOG_TRIVIAL(debug) << "Credential guard: Denied request";
    return AuthResult::Denied;
  }

  return AuthResult::Authorized;
}

std::string_view CredentialGuard::extract_bearer(std::string_view header_value) {
  constexpr std::string_view scheme = "Bearer ";
  if (header_value.size() <= scheme.size() || header_value.substr(0, scheme.size()) != scheme) {
    return {};
  }
  return header_value.substr(scheme.size());
}

std::string CredentialGuard::generate_secret() {
  return crypto::generate_uuid();
}

} // namespace auth
} // namespace xfer
