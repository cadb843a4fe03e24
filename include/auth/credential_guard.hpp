#ifndef XFER_AUTH_CREDENTIAL_GUARD_HPP
#define XFER_AUTH_CREDENTIAL_GUARD_HPP

#include <string>
#include <string_view>

namespace xfer {
namespace auth {

enum class AuthResult {
  Authorized,
  Denied
};

// Validates presented tokens against the single process-wide secret.
// The secret never changes after construction.
class CredentialGuard {
public:
  // ---- CONSTRUCTOR ----
  explicit CredentialGuard(std::string secret);


  // ---- AUTHORIZATION ----
  // Constant-time comparison of the presented token against the secret.
  // An empty token is always denied.
  AuthResult authorize(std::string_view presented_token) const;
  bool is_authorized(std::string_view presented_token) const {
    return authorize(presented_token) == AuthResult::Authorized;
  }


  // ---- TOKEN EXTRACTION ----
  // Returns the token of an "Authorization: Bearer <token>" header value,
  // or an empty view when the header is absent or uses another scheme
  static std::string_view extract_bearer(std::string_view header_value);


  // ---- SECRET MANAGEMENT ----
  // Produces a fresh random secret for processes started without one
  static std::string generate_secret();

  const std::string& secret() const { return secret_; }

private:
  const std::string secret_;
};

} // namespace auth
} // namespace xfer

#endif // XFER_AUTH_CREDENTIAL_GUARD_HPP
