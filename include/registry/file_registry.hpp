#ifndef XFER_REGISTRY_FILE_REGISTRY_HPP
#define XFER_REGISTRY_FILE_REGISTRY_HPP

#include <list>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>
#include "registry/file_record.hpp"

namespace xfer {
namespace registry {

class DuplicateIdError : public std::runtime_error {
public:
  explicit DuplicateIdError(const std::string& id)
    : std::runtime_error("File registry: Duplicate id: " + id) {}
};

// In-memory, insertion-ordered set of FileRecords keyed by id
class FileRegistry {
public:
  FileRegistry() = default;
  FileRegistry(const FileRegistry&) = delete;
  FileRegistry& operator=(const FileRegistry&) = delete;


  // ---- MUTATIONS ----
  // Appends a record, throws DuplicateIdError if the id is already present
  void insert(FileRecord record);
  // Returns false if no record has this id
  bool remove(const std::string& id);


  // ---- QUERIES ----
  // Snapshot of every record in insertion order
  std::vector<FileRecord> list() const;
  std::optional<FileRecord> lookup(const std::string& id) const;
  bool contains(const std::string& id) const;
  std::size_t size() const;

private:
  mutable std::mutex mutex_;
  std::list<FileRecord> records_;
  std::unordered_map<std::string, std::list<FileRecord>::iterator> index_;
};

} // namespace registry
} // namespace xfer

#endif // XFER_REGISTRY_FILE_REGISTRY_HPP
