#include "network/router.hpp"
#include <boost/log/trivial.hpp>
#include "utils/format.hpp"

namespace xfer {
namespace network {

namespace {

constexpr std::string_view UPLOAD_PATH = "/api/upload";
constexpr std::string_view FORM_UPLOAD_PATH = "/upload-web";
constexpr std::string_view FILES_PATH = "/api/files";
constexpr std::string_view FILES_PREFIX = "/api/files/";
constexpr std::string_view API_DOWNLOAD_PREFIX = "/api/download/";
constexpr std::string_view LINK_DOWNLOAD_PREFIX = "/download/";
constexpr std::string_view LINK_DELETE_PREFIX = "/delete/";

std::string_view to_std(boost::beast::string_view sv) {
  return std::string_view(sv.data(), sv.size());
}

bool starts_with(std::string_view text, std::string_view prefix) {
  return text.size() >= prefix.size() && text.substr(0, prefix.size()) == prefix;
}

// Remainder of `path` after `prefix` when it names exactly one segment
std::optional<std::string> single_segment(std::string_view path, std::string_view prefix) {
  if (!starts_with(path, prefix)) {
    return std::nullopt;
  }
  std::string_view rest = path.substr(prefix.size());
  if (rest.empty() || rest.find('/') != std::string_view::npos) {
    return std::nullopt;
  }
  return std::string(rest);
}

nlohmann::json record_to_json(const registry::FileRecord& record) {
  return {
    {"id", record.id},
    {"filename", record.display_name},
    {"size", record.size_bytes},
    {"timestamp", utils::format_timestamp(record.created_at)}
  };
}

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace


//==============================================
// CONSTRUCTOR
//==============================================

Router::Router(transfer::TransferHandler& handler) : handler_(handler) {
  BOOST_LOG_TRIVIAL(debug) << "Router: Initialized";
}


//==============================================
// DISPATCH
//==============================================

Reply Router::route(const RequestHead& req,
                    transfer::BodyReader& body,
                    std::optional<std::uintmax_t> content_length) {
  std::string_view target = to_std(req.target());
  std::size_t query_pos = target.find('?');
  std::string path = url_decode(target.substr(0, query_pos), false);
  auto query = parse_query(query_pos == std::string_view::npos ? std::string_view() : target.substr(query_pos + 1));
  const http::verb method = req.method();

  BOOST_LOG_TRIVIAL(debug) << "Router: " << req.method_string() << " " << path;

  auto method_not_allowed = [&req](const char* allow) -> Reply {
    auto res = make_json_response(http::status::method_not_allowed, {{"error", "Method not allowed"}}, req);
    res.set(http::field::allow, allow);
    return res;
  };

  try {
    if (path == UPLOAD_PATH) {
      if (method != http::verb::post) return method_not_allowed("POST");
      return handle_upload(req, body, content_length);
    }

    if (path == FORM_UPLOAD_PATH) {
      if (method != http::verb::post) return method_not_allowed("POST");
      return handle_form_upload(req, body, content_length, query["api_key"]);
    }

    if (path == FILES_PATH) {
      if (method != http::verb::get) return method_not_allowed("GET");
      return handle_list(req);
    }

    if (auto id = single_segment(path, FILES_PREFIX)) {
      if (method != http::verb::delete_) return method_not_allowed("DELETE");
      return handle_api_delete(req, *id);
    }

    if (auto id = single_segment(path, API_DOWNLOAD_PREFIX)) {
      if (method != http::verb::get) return method_not_allowed("GET");
      return handle_api_download(req, *id);
    }

    if (auto id = single_segment(path, LINK_DOWNLOAD_PREFIX)) {
      if (method != http::verb::get) return method_not_allowed("GET");
      return handle_link_download(req, *id, query["api_key"]);
    }

    if (auto id = single_segment(path, LINK_DELETE_PREFIX)) {
      if (method != http::verb::get) return method_not_allowed("GET");
      return handle_link_delete(req, *id, query["api_key"]);
    }

    return make_json_response(http::status::not_found, {{"error", "Not found"}}, req);
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Router: Unhandled error on " << req.method_string() << " " << path << ": " << e.what();
    return make_json_response(http::status::internal_server_error, {{"error", "Internal server error"}}, req);
  }
}


//==============================================
// API ROUTES (JSON)
//==============================================

Reply Router::handle_upload(const RequestHead& req, transfer::BodyReader& body,
                            std::optional<std::uintmax_t> content_length) {
  try {
    auto record = handler_.upload(bearer_token(req),
                                  to_std(req[http::field::content_type]),
                                  content_length,
                                  body);
    return make_json_response(http::status::ok, {
      {"message", "File uploaded successfully"},
      {"id", record.id},
      {"file_id", record.id},
      {"filename", record.display_name},
      {"size", record.size_bytes}
    }, req);
  } catch (const transfer::TransferError& e) {
    return json_error(e, req);
  }
}

Reply Router::handle_list(const RequestHead& req) {
  try {
    auto records = handler_.list(bearer_token(req));
    nlohmann::json files = nlohmann::json::array();
    for (const auto& record : records) {
      files.push_back(record_to_json(record));
    }
    return make_json_response(http::status::ok, {{"files", files}}, req);
  } catch (const transfer::TransferError& e) {
    return json_error(e, req);
  }
}

Reply Router::handle_api_download(const RequestHead& req, const std::string& id) {
  try {
    return make_download_reply(handler_.download(bearer_token(req), id), req);
  } catch (const transfer::TransferError& e) {
    return json_error(e, req);
  }
}

Reply Router::handle_api_delete(const RequestHead& req, const std::string& id) {
  try {
    handler_.remove(bearer_token(req), id);
    return make_json_response(http::status::ok, {{"message", "File deleted successfully"}}, req);
  } catch (const transfer::TransferError& e) {
    return json_error(e, req);
  }
}


//==============================================
// BROWSER-LINK ROUTES (TEXT)
//==============================================

Reply Router::handle_form_upload(const RequestHead& req, transfer::BodyReader& body,
                                 std::optional<std::uintmax_t> content_length, const std::string& api_key) {
  try {
    auto record = handler_.upload_form(api_key,
                                       to_std(req[http::field::content_type]),
                                       content_length,
                                       body);
    return make_text_response(http::status::ok, "File uploaded successfully: " + record.id, req);
  } catch (const transfer::TransferError& e) {
    return make_text_response(status_for(e.kind()), e.what(), req);
  }
}

Reply Router::handle_link_download(const RequestHead& req, const std::string& id, const std::string& api_key) {
  try {
    return make_download_reply(handler_.download(api_key, id), req);
  } catch (const transfer::TransferError& e) {
    return make_text_response(status_for(e.kind()), e.what(), req);
  }
}

Reply Router::handle_link_delete(const RequestHead& req, const std::string& id, const std::string& api_key) {
  try {
    handler_.remove(api_key, id);
    return make_text_response(http::status::ok, "File deleted successfully", req);
  } catch (const transfer::TransferError& e) {
    return make_text_response(status_for(e.kind()), e.what(), req);
  }
}


//==============================================
// RESPONSE BUILDERS
//==============================================

http::response<http::string_body> Router::make_json_response(http::status status, const nlohmann::json& body,
                                                             const RequestHead& req) {
  http::response<http::string_body> res{status, req.version()};
  res.set(http::field::content_type, "application/json");
  res.keep_alive(req.keep_alive());
  res.body() = body.dump();
  res.prepare_payload();
  return res;
}

http::response<http::string_body> Router::make_text_response(http::status status, const std::string& body,
                                                             const RequestHead& req) {
  http::response<http::string_body> res{status, req.version()};
  res.set(http::field::content_type, "text/plain");
  res.keep_alive(req.keep_alive());
  res.body() = body;
  res.prepare_payload();
  return res;
}

http::status Router::status_for(transfer::ErrorKind kind) {
  switch (kind) {
    case transfer::ErrorKind::Unauthorized: return http::status::forbidden;
    case transfer::ErrorKind::BadRequest: return http::status::bad_request;
    case transfer::ErrorKind::NotFound: return http::status::not_found;
    case transfer::ErrorKind::PayloadTooLarge: return http::status::payload_too_large;
    case transfer::ErrorKind::StorageFault: return http::status::internal_server_error;
    default: return http::status::internal_server_error;
  }
}


//==============================================
// TARGET PARSING
//==============================================

std::string Router::url_decode(std::string_view text, bool plus_as_space) {
  std::string decoded;
  decoded.reserve(text.size());

  for (std::size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (c == '%' && i + 2 < text.size() && hex_value(text[i + 1]) >= 0 && hex_value(text[i + 2]) >= 0) {
      decoded.push_back(static_cast<char>(hex_value(text[i + 1]) * 16 + hex_value(text[i + 2])));
      i += 2;
    } else if (c == '+' && plus_as_space) {
      decoded.push_back(' ');
    } else {
      decoded.push_back(c);
    }
  }
  return decoded;
}

std::map<std::string, std::string> Router::parse_query(std::string_view query) {
  std::map<std::string, std::string> params;

  while (!query.empty()) {
    std::size_t amp = query.find('&');
    std::string_view pair = query.substr(0, amp);
    query = amp == std::string_view::npos ? std::string_view() : query.substr(amp + 1);

    if (pair.empty()) {
      continue;
    }
    std::size_t eq = pair.find('=');
    std::string key = url_decode(pair.substr(0, eq), true);
    std::string value = eq == std::string_view::npos ? std::string() : url_decode(pair.substr(eq + 1), true);
    // First occurrence wins
    params.emplace(std::move(key), std::move(value));
  }
  return params;
}


//==============================================
// HELPERS
//==============================================

std::string_view Router::bearer_token(const RequestHead& req) {
  auto found = req.find(http::field::authorization);
  if (found == req.end()) {
    return {};
  }
  return auth::CredentialGuard::extract_bearer(to_std(found->value()));
}

StreamReply Router::make_download_reply(transfer::DownloadTicket ticket, const RequestHead& req) {
  StreamReply reply;
  reply.header.result(http::status::ok);
  reply.header.version(req.version());
  reply.header.set(http::field::content_type, "application/octet-stream");
  reply.header.set(http::field::content_disposition, "attachment; filename=" + ticket.record.display_name);
  reply.header.content_length(ticket.record.size_bytes);
  reply.header.keep_alive(req.keep_alive());
  reply.body = std::move(ticket.blob.stream);
  reply.length = ticket.record.size_bytes;
  return reply;
}

Reply Router::json_error(const transfer::TransferError& e, const RequestHead& req) {
  return make_json_response(status_for(e.kind()), {{"error", e.what()}}, req);
}

} // namespace network
} // namespace xfer
