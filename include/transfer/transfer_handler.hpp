#ifndef XFER_TRANSFER_HANDLER_HPP
#define XFER_TRANSFER_HANDLER_HPP

#include <cstdint>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>
#include "auth/credential_guard.hpp"
#include "registry/file_registry.hpp"
#include "store/blob_store.hpp"
#include "transfer/body_reader.hpp"
#include "transfer/transfer_error.hpp"

namespace xfer {
namespace transfer {

// Result of a successful download lookup: the record plus an open stream
// over its blob, `record.size_bytes` long
struct DownloadTicket {
  registry::FileRecord record;
  store::BlobStream blob;
};

// Orchestrates upload, list, download and delete over the registry and the
// blob store, keeping the two aligned. Every operation authorizes first and
// reports failures as TransferError.
class TransferHandler {
public:
  // Source of new file ids
  using IdGenerator = std::function<std::string()>;

  // ---- CONSTRUCTOR ----
  // An empty `id_generator` selects crypto::generate_uuid
  TransferHandler(const auth::CredentialGuard& guard,
                  registry::FileRegistry& registry,
                  store::BlobStore& blob_store,
                  std::uintmax_t max_upload_bytes,
                  IdGenerator id_generator = {});


  // ---- OPERATIONS ----
  // Decodes a multipart/form-data body, stores the first part named "file"
  // and registers it. `declared_length` is the request Content-Length.
  registry::FileRecord upload(std::string_view token,
                              std::string_view content_type,
                              std::optional<std::uintmax_t> declared_length,
                              BodyReader& body);
  // Browser form upload. The key is `query_token` when non-empty, otherwise
  // an "api_key" field that must precede the "file" part.
  registry::FileRecord upload_form(std::string_view query_token,
                                   std::string_view content_type,
                                   std::optional<std::uintmax_t> declared_length,
                                   BodyReader& body);
  std::vector<registry::FileRecord> list(std::string_view token) const;
  DownloadTicket download(std::string_view token, const std::string& id) const;
  void remove(std::string_view token, const std::string& id);


  // ---- GETTERS ----
  std::uintmax_t max_upload_bytes() const { return max_upload_bytes_; }

  // Read/write granularity for request and response bodies
  static constexpr std::size_t TRANSFER_CHUNK_SIZE = 64 * 1024;
  // Largest "api_key" form field accepted
  static constexpr std::size_t MAX_FORM_KEY_SIZE = 1024;

private:
  // ---- PARAMETERS ----
  const auth::CredentialGuard& guard_;
  registry::FileRegistry& registry_;
  store::BlobStore& blob_store_;
  const std::uintmax_t max_upload_bytes_;
  IdGenerator id_generator_;
  // Exclusive for publish+insert and lookup+remove, shared for readers
  mutable std::shared_mutex mutex_;


  // ---- HELPERS ----
  // Shared upload path; without `token` the key is read from the form
  registry::FileRecord receive_upload(std::optional<std::string_view> token,
                                      std::string_view content_type,
                                      std::optional<std::uintmax_t> declared_length,
                                      BodyReader& body);
  // Throws Unauthorized unless the token matches the secret
  void require_authorized(std::string_view token, const char* operation) const;
};

} // namespace transfer
} // namespace xfer

#endif // XFER_TRANSFER_HANDLER_HPP
