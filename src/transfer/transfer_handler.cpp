#include "transfer/transfer_handler.hpp"
#include <chrono>
#include <mutex>
#include <boost/log/trivial.hpp>
#include "crypto/random.hpp"
#include "network/multipart_parser.hpp"
#include "utils/filename.hpp"

namespace xfer {
namespace transfer {

//==============================================
// CONSTRUCTOR
//==============================================

TransferHandler::TransferHandler(const auth::CredentialGuard& guard,
                                 registry::FileRegistry& registry,
                                 store::BlobStore& blob_store,
                                 std::uintmax_t max_upload_bytes,
                                 IdGenerator id_generator)
  : guard_(guard)
  , registry_(registry)
  , blob_store_(blob_store)
  , max_upload_bytes_(max_upload_bytes)
  , id_generator_(id_generator ? std::move(id_generator) : IdGenerator(crypto::generate_uuid)) {
  BOOST_LOG_TRIVIAL(info) << "Transfer handler: Initialized with upload limit of " << max_upload_bytes_ << " bytes";
}


//==============================================
// UPLOAD
//==============================================

registry::FileRecord TransferHandler::upload(std::string_view token,
                                             std::string_view content_type,
                                             std::optional<std::uintmax_t> declared_length,
                                             BodyReader& body) {
  return receive_upload(token, content_type, declared_length, body);
}

registry::FileRecord TransferHandler::upload_form(std::string_view query_token,
                                                  std::string_view content_type,
                                                  std::optional<std::uintmax_t> declared_length,
                                                  BodyReader& body) {
  std::optional<std::string_view> token;
  if (!query_token.empty()) {
    token = query_token;
  }
  return receive_upload(token, content_type, declared_length, body);
}

registry::FileRecord TransferHandler::receive_upload(std::optional<std::string_view> token,
                                                     std::string_view content_type,
                                                     std::optional<std::uintmax_t> declared_length,
                                                     BodyReader& body) {
  bool authorized = false;
  if (token) {
    require_authorized(*token, "upload");
    authorized = true;
  }

  if (declared_length && *declared_length > max_upload_bytes_) {
    BOOST_LOG_TRIVIAL(warning) << "Transfer handler: Rejected upload of " << *declared_length
                               << " bytes (limit " << max_upload_bytes_ << ")";
    throw TransferError(ErrorKind::PayloadTooLarge, "File too large");
  }

  auto boundary = network::MultipartParser::boundary_from_content_type(content_type);
  if (!boundary) {
    BOOST_LOG_TRIVIAL(warning) << "Transfer handler: Upload without multipart body (Content-Type: "
                               << content_type << ")";
    throw TransferError(ErrorKind::BadRequest, "No file part in the request");
  }

  // Generated up front so a generator failure cannot strand a published blob
  std::string id;
  try {
    id = id_generator_();
  } catch (const crypto::CryptoError& e) {
    BOOST_LOG_TRIVIAL(error) << "Transfer handler: Failed to generate file id: " << e.what();
    throw TransferError(ErrorKind::StorageFault, "Error saving file");
  }

  std::optional<store::BlobWriter> writer;
  std::string display_name;
  bool in_file_part = false;
  bool in_key_part = false;
  std::string form_key;

  network::MultipartParser parser(*boundary);
  parser.on_part_begin([&](const network::PartHeaders& headers) {
    in_file_part = false;
    if (!authorized && headers.name == "api_key" && !headers.filename) {
      in_key_part = true;
      form_key.clear();
      return;
    }
    if (writer || headers.name != "file" || !headers.filename) {
      return;
    }
    if (!authorized) {
      // Nothing is written before the key has been checked
      require_authorized({}, "upload");
    }

    if (headers.filename->empty()) {
      throw TransferError(ErrorKind::BadRequest, "No file selected");
    }
    display_name = utils::sanitize_filename(*headers.filename);
    if (display_name.empty()) {
      BOOST_LOG_TRIVIAL(warning) << "Transfer handler: Filename sanitized to nothing: " << *headers.filename;
      throw TransferError(ErrorKind::BadRequest, "Invalid filename");
    }

    writer.emplace(blob_store_.open_writer());
    in_file_part = true;
  });
  parser.on_part_data([&](const char* data, std::size_t length) {
    if (in_file_part) {
      writer->append(data, length);
    } else if (in_key_part) {
      if (form_key.size() + length > MAX_FORM_KEY_SIZE) {
        throw TransferError(ErrorKind::BadRequest, "api_key field too large");
      }
      form_key.append(data, length);
    }
  });
  parser.on_part_end([&]() {
    in_file_part = false;
    if (in_key_part) {
      in_key_part = false;
      require_authorized(form_key, "upload");
      authorized = true;
    }
  });

  std::vector<char> buffer(TRANSFER_CHUNK_SIZE);
  try {
    for (;;) {
      std::size_t n = body.read_some(buffer.data(), buffer.size());
      if (n == 0) {
        break;
      }
      parser.feed(buffer.data(), n);
    }
    parser.finish();
  } catch (const network::MultipartError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Transfer handler: Malformed upload body: " << e.what();
    throw TransferError(ErrorKind::BadRequest, "Malformed multipart body");
  } catch (const store::StoreError& e) {
    BOOST_LOG_TRIVIAL(error) << "Transfer handler: Blob write failed during upload: " << e.what();
    throw TransferError(ErrorKind::StorageFault, "Error saving file");
  }

  if (!authorized) {
    require_authorized({}, "upload");
  }
  if (!writer) {
    BOOST_LOG_TRIVIAL(warning) << "Transfer handler: Upload body has no file part";
    throw TransferError(ErrorKind::BadRequest, "No file part in the request");
  }

  std::unique_lock<std::shared_mutex> lock(mutex_);

  store::BlobHandle handle;
  std::uintmax_t size = 0;
  try {
    handle = writer->commit();
    size = blob_store_.size(handle);
  } catch (const store::StoreError& e) {
    BOOST_LOG_TRIVIAL(error) << "Transfer handler: Failed to publish upload " << id << ": " << e.what();
    if (!handle.key.empty()) {
      try {
        blob_store_.remove(handle);
      } catch (const store::StoreError& cleanup) {
        BOOST_LOG_TRIVIAL(error) << "Transfer handler: Cleanup of blob " << handle.key << " failed: " << cleanup.what();
      }
    }
    throw TransferError(ErrorKind::StorageFault, "Error saving file");
  }

  registry::FileRecord record{id, display_name, size, std::chrono::system_clock::now(), handle};
  try {
    registry_.insert(record);
  } catch (const registry::DuplicateIdError& e) {
    BOOST_LOG_TRIVIAL(error) << "Transfer handler: " << e.what() << ", discarding blob " << handle.key;
    try {
      blob_store_.remove(handle);
    } catch (const store::StoreError& cleanup) {
      BOOST_LOG_TRIVIAL(error) << "Transfer handler: Cleanup of blob " << handle.key << " failed: " << cleanup.what();
    }
    throw TransferError(ErrorKind::StorageFault, "Error saving file");
  }

  BOOST_LOG_TRIVIAL(info) << "Transfer handler: Stored " << record.display_name << " as " << record.id
                          << " (" << record.size_bytes << " bytes)";
  return record;
}


//==============================================
// LIST
//==============================================

std::vector<registry::FileRecord> TransferHandler::list(std::string_view token) const {
  require_authorized(token, "list");

  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto records = registry_.list();
  BOOST_LOG_TRIVIAL(debug) << "Transfer handler: Listing " << records.size() << " files";
  return records;
}


//==============================================
// DOWNLOAD
//==============================================

DownloadTicket TransferHandler::download(std::string_view token, const std::string& id) const {
  require_authorized(token, "download");

  std::shared_lock<std::shared_mutex> lock(mutex_);

  auto record = registry_.lookup(id);
  if (!record) {
    BOOST_LOG_TRIVIAL(info) << "Transfer handler: Download of unknown id: " << id;
    throw TransferError(ErrorKind::NotFound, "File not found");
  }

  store::BlobStream blob;
  try {
    blob = blob_store_.read(record->blob);
  } catch (const store::StoreError& e) {
    BOOST_LOG_TRIVIAL(error) << "Transfer handler: Consistency fault on download of " << id
                             << ": record exists but blob " << record->blob.key << " is unreadable: " << e.what();
    throw TransferError(ErrorKind::StorageFault, "Error downloading file");
  }

  if (blob.size != record->size_bytes) {
    BOOST_LOG_TRIVIAL(error) << "Transfer handler: Consistency fault on download of " << id
                             << ": recorded size " << record->size_bytes << " but blob holds " << blob.size;
    throw TransferError(ErrorKind::StorageFault, "Error downloading file");
  }

  BOOST_LOG_TRIVIAL(info) << "Transfer handler: Serving " << id << " (" << record->size_bytes << " bytes)";
  return DownloadTicket{std::move(*record), std::move(blob)};
}


//==============================================
// DELETE
//==============================================

void TransferHandler::remove(std::string_view token, const std::string& id) {
  require_authorized(token, "delete");

  std::unique_lock<std::shared_mutex> lock(mutex_);

  auto record = registry_.lookup(id);
  if (!record) {
    BOOST_LOG_TRIVIAL(info) << "Transfer handler: Delete of unknown id: " << id;
    throw TransferError(ErrorKind::NotFound, "File not found");
  }

  // Blob first: a failed removal leaves both record and blob for diagnosis
  bool removed = false;
  try {
    removed = blob_store_.remove(record->blob);
  } catch (const store::StoreError& e) {
    BOOST_LOG_TRIVIAL(error) << "Transfer handler: Failed to remove blob of " << id << ": " << e.what();
    throw TransferError(ErrorKind::StorageFault, "Error deleting file");
  }

  if (!removed) {
    BOOST_LOG_TRIVIAL(error) << "Transfer handler: Consistency fault on delete of " << id
                             << ": record exists but blob " << record->blob.key << " is missing";
    throw TransferError(ErrorKind::StorageFault, "Error deleting file");
  }

  registry_.remove(id);
  BOOST_LOG_TRIVIAL(info) << "Transfer handler: Deleted " << id;
}


//==============================================
// HELPERS
//==============================================

void TransferHandler::require_authorized(std::string_view token, const char* operation) const {
  if (guard_.authorize(token) == auth::AuthResult::Denied) {
    BOOST_LOG_TRIVIAL(warning) << "Transfer handler: Unauthorized " << operation << " request";
    throw TransferError(ErrorKind::Unauthorized, "Unauthorized");
  }
}

} // namespace transfer
} // namespace xfer
