#include "registry/file_registry.hpp"
#include <boost/log/trivial.hpp>

namespace xfer {
namespace registry {

void FileRegistry::insert(FileRecord record) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (index_.count(record.id) != 0) {
    BOOST_LOG_TRIVIAL(error) << "File registry: Rejected duplicate id: " << record.id;
    throw DuplicateIdError(record.id);
  }

  std::string id = record.id;
  auto it = records_.insert(records_.end(), std::move(record));
  index_.emplace(std::move(id), it);
  BOOST_LOG_TRIVIAL(debug) << "File registry: Inserted " << it->id << " (" << records_.size() << " records)";
}

bool FileRegistry::remove(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto found = index_.find(id);
  if (found == index_.end()) {
    BOOST_LOG_TRIVIAL(debug) << "File registry: Remove of unknown id: " << id;
    return false;
  }

  records_.erase(found->second);
  index_.erase(found);
  BOOST_LOG_TRIVIAL(debug) << "File registry: Removed " << id << " (" << records_.size() << " records)";
  return true;
}

std::vector<FileRecord> FileRegistry::list() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::vector<FileRecord>(records_.begin(), records_.end());
}

std::optional<FileRecord> FileRegistry::lookup(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);

  auto found = index_.find(id);
  if (found == index_.end()) {
    return std::nullopt;
  }
  return *found->second;
}

bool FileRegistry::contains(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return index_.count(id) != 0;
}

std::size_t FileRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.size();
}

} // namespace registry
} // namespace xfer
