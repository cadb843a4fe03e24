#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <istream>
#include <memory>
#include <stdexcept>
#include <string>

namespace xfer {
namespace store {

// Opaque reference to a published blob. Only the store creates keys.
struct BlobHandle {
  std::string key;

  bool operator==(const BlobHandle& other) const { return key == other.key; }
  bool operator!=(const BlobHandle& other) const { return key != other.key; }
};

// Readable view of a published blob, length known up front
struct BlobStream {
  std::unique_ptr<std::istream> stream;
  std::uintmax_t size{0};
};

class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

// Incremental writer for a single blob. Bytes go to "<key>.part" and only
// become reachable through a handle once commit() renames the file.
// Destroying an uncommitted writer deletes the partial file.
class BlobWriter {
public:
  BlobWriter(const BlobWriter&) = delete;
  BlobWriter& operator=(const BlobWriter&) = delete;
  BlobWriter(BlobWriter&& other) noexcept;
  BlobWriter& operator=(BlobWriter&& other) noexcept;
  ~BlobWriter();

  // Appends bytes to the partial file, throws StoreError on I/O failure
  void append(const char* data, std::size_t length);
  // Flushes, closes and atomically publishes the blob
  BlobHandle commit();
  // Drops the partial file without publishing
  void discard() noexcept;

  std::uintmax_t bytes_written() const { return bytes_written_; }
  bool active() const { return active_; }

private:
  friend class BlobStore;
  BlobWriter(std::string key, std::filesystem::path partial_path, std::filesystem::path final_path);

  std::string key_;
  std::filesystem::path partial_path_;
  std::filesystem::path final_path_;
  std::ofstream file_;
  std::uintmax_t bytes_written_{0};
  bool active_{false};
};

class BlobStore {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Creates the directory if needed and drops partial files left behind by
  // an interrupted process
  explicit BlobStore(const std::filesystem::path& base_path);


  // ---- CORE STORAGE OPERATIONS ----
  // Consumes the stream fully and publishes it under a fresh key
  BlobHandle write(std::istream& data);
  // Starts an incremental write under a fresh key
  BlobWriter open_writer();
  // Opens a published blob for reading, throws StoreError if it is missing
  BlobStream read(const BlobHandle& handle) const;
  // Returns false if no blob exists for the handle, throws StoreError on I/O errors
  bool remove(const BlobHandle& handle);
  // Removes every blob and partial file; other entries in the directory are left alone
  void clear();


  // ---- QUERY OPERATIONS ----
  bool has(const BlobHandle& handle) const;
  std::uintmax_t size(const BlobHandle& handle) const;
  // Number of published blobs
  std::size_t count() const;

  const std::filesystem::path& base_path() const { return base_path_; }

  // Suffix used for in-progress writes
  static constexpr const char* PARTIAL_SUFFIX = ".part";
  // Random bytes per key (hex-encoded to twice this length)
  static constexpr std::size_t KEY_BYTES = 16;
  // Chunk size for stream copies
  static constexpr std::size_t CHUNK_SIZE = 64 * 1024;

private:
  // ---- PARAMETERS ----
  // Directory holding every blob
  std::filesystem::path base_path_;


  // ---- UTILITY METHODS ----
  void check_directory_exists(const std::filesystem::path& path) const;
  // Removes "<key>.part" files left by an earlier process
  void purge_partials();
  // Maps a handle to its file, rejecting keys the store could not have issued
  std::filesystem::path resolve_path(const BlobHandle& handle) const;
  static bool is_valid_key(const std::string& key);
  // "<valid key>.part"
  static bool is_partial_name(const std::string& name);
};

} // namespace store
} // namespace xfer
