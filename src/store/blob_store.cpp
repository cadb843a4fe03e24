#include "store/blob_store.hpp"
#include <system_error>
#include <vector>
#include <boost/log/trivial.hpp>
#include "crypto/random.hpp"

namespace xfer {
namespace store {

//==============================================
// BLOB WRITER
//==============================================

BlobWriter::BlobWriter(std::string key, std::filesystem::path partial_path, std::filesystem::path final_path)
  : key_(std::move(key))
  , partial_path_(std::move(partial_path))
  , final_path_(std::move(final_path)) {
  file_.open(partial_path_, std::ios::binary | std::ios::trunc);
  if (!file_) {
    BOOST_LOG_TRIVIAL(error) << "Blob store: Failed to create partial file: " << partial_path_.string();
    throw StoreError("Blob store: Failed to create file: " + partial_path_.string());
  }
  active_ = true;
  BOOST_LOG_TRIVIAL(debug) << "Blob store: Opened writer for key: " << key_;
}

BlobWriter::BlobWriter(BlobWriter&& other) noexcept
  : key_(std::move(other.key_))
  , partial_path_(std::move(other.partial_path_))
  , final_path_(std::move(other.final_path_))
  , file_(std::move(other.file_))
  , bytes_written_(other.bytes_written_)
  , active_(other.active_) {
  other.active_ = false;
}

BlobWriter& BlobWriter::operator=(BlobWriter&& other) noexcept {
  if (this != &other) {
    discard();
    key_ = std::move(other.key_);
    partial_path_ = std::move(other.partial_path_);
    final_path_ = std::move(other.final_path_);
    file_ = std::move(other.file_);
    bytes_written_ = other.bytes_written_;
    active_ = other.active_;
    other.active_ = false;
  }
  return *this;
}

BlobWriter::~BlobWriter() {
  discard();
}

void BlobWriter::append(const char* data, std::size_t length) {
  if (!active_) {
    throw StoreError("Blob store: Write to inactive writer");
  }
  if (length == 0) {
    return;
  }

  file_.write(data, static_cast<std::streamsize>(length));
  if (!file_) {
    BOOST_LOG_TRIVIAL(error) << "Blob store: Write failed for key: " << key_
                             << " after " << bytes_written_ << " bytes";
    throw StoreError("Blob store: Failed to write blob data");
  }
  bytes_written_ += length;
}

BlobHandle BlobWriter::commit() {
  if (!active_) {
    throw StoreError("Blob store: Commit on inactive writer");
  }

  file_.flush();
  file_.close();
  if (file_.fail()) {
    BOOST_LOG_TRIVIAL(error) << "Blob store: Failed to flush partial file for key: " << key_;
    throw StoreError("Blob store: Failed to flush blob data");
  }

  // Publish atomically so readers never observe a half-written blob
  std::error_code ec;
  std::filesystem::rename(partial_path_, final_path_, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Blob store: Failed to publish key " << key_ << ": " << ec.message();
    throw StoreError("Blob store: Failed to publish blob: " + ec.message());
  }

  active_ = false;
  BOOST_LOG_TRIVIAL(info) << "Blob store: Successfully stored " << bytes_written_ << " bytes with key: " << key_;
  return BlobHandle{key_};
}

void BlobWriter::discard() noexcept {
  if (!active_) {
    return;
  }
  active_ = false;

  file_.close();
  std::error_code ec;
  std::filesystem::remove(partial_path_, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "Blob store: Failed to discard partial file "
                               << partial_path_.string() << ": " << ec.message();
  } else {
    BOOST_LOG_TRIVIAL(debug) << "Blob store: Discarded partial write for key: " << key_;
  }
}


//==============================================
// CONSTRUCTOR
//==============================================

BlobStore::BlobStore(const std::filesystem::path& base_path) : base_path_(base_path) {
  BOOST_LOG_TRIVIAL(info) << "Blob store: Initializing with base path: " << base_path_.string();
  check_directory_exists(base_path_);
  purge_partials();
  BOOST_LOG_TRIVIAL(debug) << "Blob store: Directory created/verified at: " << base_path_.string();
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

BlobHandle BlobStore::write(std::istream& data) {
  if (!data.good()) {
    BOOST_LOG_TRIVIAL(error) << "Blob store: Invalid input stream provided";
    throw StoreError("Blob store: Invalid input stream");
  }

  BlobWriter writer = open_writer();
  std::vector<char> buffer(CHUNK_SIZE);

  // Read input stream in chunks and write to the partial file
  while (data.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || data.gcount() > 0) {
    writer.append(buffer.data(), static_cast<std::size_t>(data.gcount()));
  }

  if (data.bad()) {
    BOOST_LOG_TRIVIAL(error) << "Blob store: Input stream failed mid-write";
    throw StoreError("Blob store: Input stream failed");
  }

  return writer.commit();
}

BlobWriter BlobStore::open_writer() {
  std::string key = crypto::random_hex(KEY_BYTES);
  std::filesystem::path final_path = base_path_ / key;
  std::filesystem::path partial_path = base_path_ / (key + PARTIAL_SUFFIX);
  return BlobWriter(std::move(key), std::move(partial_path), std::move(final_path));
}

BlobStream BlobStore::read(const BlobHandle& handle) const {
  BOOST_LOG_TRIVIAL(debug) << "Blob store: Opening blob: " << handle.key;

  std::filesystem::path file_path = resolve_path(handle);
  std::error_code ec;
  std::uintmax_t size = std::filesystem::file_size(file_path, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Blob store: Blob not found: " << file_path.string();
    throw StoreError("Blob store: Blob not found: " + handle.key);
  }

  auto stream = std::make_unique<std::ifstream>(file_path, std::ios::binary);
  if (!*stream) {
    BOOST_LOG_TRIVIAL(error) << "Blob store: Failed to open blob: " << file_path.string();
    throw StoreError("Blob store: Failed to open blob: " + handle.key);
  }

  return BlobStream{std::move(stream), size};
}

bool BlobStore::remove(const BlobHandle& handle) {
  BOOST_LOG_TRIVIAL(info) << "Blob store: Removing blob with key: " << handle.key;

  std::filesystem::path file_path = resolve_path(handle);
  std::error_code ec;
  bool removed = std::filesystem::remove(file_path, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Blob store: Failed to remove blob " << handle.key << ": " << ec.message();
    throw StoreError("Blob store: Failed to remove blob: " + ec.message());
  }

  if (!removed) {
    BOOST_LOG_TRIVIAL(warning) << "Blob store: No blob to remove for key: " << handle.key;
    return false;
  }

  BOOST_LOG_TRIVIAL(info) << "Blob store: Successfully removed blob with key: " << handle.key;
  return true;
}

void BlobStore::clear() {
  BOOST_LOG_TRIVIAL(info) << "Blob store: Clearing blobs at: " << base_path_.string();
  check_directory_exists(base_path_);

  // Only files the store itself names are touched; anything else in the
  // directory belongs to the operator
  std::size_t removed = 0;
  std::error_code ec;
  for (const auto& entry : std::filesystem::directory_iterator(base_path_, ec)) {
    const std::string name = entry.path().filename().string();
    if (!entry.is_regular_file() || !(is_valid_key(name) || is_partial_name(name))) {
      continue;
    }
    std::error_code remove_ec;
    std::filesystem::remove(entry.path(), remove_ec);
    if (remove_ec) {
      BOOST_LOG_TRIVIAL(error) << "Blob store: Failed to remove " << name << ": " << remove_ec.message();
      throw StoreError("Blob store: Failed to clear store: " + remove_ec.message());
    }
    ++removed;
  }
  if (ec) {
    throw StoreError("Blob store: Failed to clear store: " + ec.message());
  }
  BOOST_LOG_TRIVIAL(info) << "Blob store: Cleared " << removed << " file(s)";
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool BlobStore::has(const BlobHandle& handle) const {
  if (!is_valid_key(handle.key)) {
    return false;
  }
  return std::filesystem::is_regular_file(base_path_ / handle.key);
}

std::uintmax_t BlobStore::size(const BlobHandle& handle) const {
  std::filesystem::path file_path = resolve_path(handle);
  std::error_code ec;
  std::uintmax_t size = std::filesystem::file_size(file_path, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Blob store: Blob not found: " << file_path.string();
    throw StoreError("Blob store: Blob not found: " + handle.key);
  }
  return size;
}

std::size_t BlobStore::count() const {
  std::size_t total = 0;
  for (const auto& entry : std::filesystem::directory_iterator(base_path_)) {
    if (entry.is_regular_file() && is_valid_key(entry.path().filename().string())) {
      ++total;
    }
  }
  return total;
}


//==============================================
// UTILITY METHODS
//==============================================

void BlobStore::check_directory_exists(const std::filesystem::path& path) const {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec || !std::filesystem::is_directory(path)) {
    BOOST_LOG_TRIVIAL(error) << "Blob store: Cannot use directory " << path.string()
                             << (ec ? ": " + ec.message() : std::string());
    throw StoreError("Blob store: Cannot create directory: " + path.string());
  }
}

void BlobStore::purge_partials() {
  std::size_t purged = 0;
  for (const auto& entry : std::filesystem::directory_iterator(base_path_)) {
    if (entry.is_regular_file() && is_partial_name(entry.path().filename().string())) {
      std::error_code ec;
      if (std::filesystem::remove(entry.path(), ec)) {
        ++purged;
      }
    }
  }
  if (purged > 0) {
    BOOST_LOG_TRIVIAL(warning) << "Blob store: Purged " << purged << " partial file(s) from an earlier run";
  }
}

std::filesystem::path BlobStore::resolve_path(const BlobHandle& handle) const {
  if (!is_valid_key(handle.key)) {
    BOOST_LOG_TRIVIAL(error) << "Blob store: Rejected malformed key: " << handle.key;
    throw StoreError("Blob store: Malformed blob key");
  }
  return base_path_ / handle.key;
}

bool BlobStore::is_partial_name(const std::string& name) {
  const std::string suffix = PARTIAL_SUFFIX;
  return name.size() > suffix.size() &&
         name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0 &&
         is_valid_key(name.substr(0, name.size() - suffix.size()));
}

bool BlobStore::is_valid_key(const std::string& key) {
  if (key.size() != KEY_BYTES * 2) {
    return false;
  }
  for (char c : key) {
    if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
      return false;
    }
  }
  return true;
}

} // namespace store
} // namespace xfer
