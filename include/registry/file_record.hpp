#ifndef XFER_REGISTRY_FILE_RECORD_HPP
#define XFER_REGISTRY_FILE_RECORD_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include "store/blob_store.hpp"

namespace xfer {
namespace registry {

// Metadata for one stored blob. Never mutated after insertion.
struct FileRecord {
  std::string id;
  std::string display_name;
  std::uintmax_t size_bytes{0};
  std::chrono::system_clock::time_point created_at;
  // Backing blob, server-internal
  store::BlobHandle blob;
};

} // namespace registry
} // namespace xfer

#endif // XFER_REGISTRY_FILE_RECORD_HPP
