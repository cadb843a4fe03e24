#include "network/multipart_parser.hpp"
#include <algorithm>
#include <cctype>
#include <boost/log/trivial.hpp>

namespace xfer {
namespace network {

namespace {

constexpr std::string_view CRLF = "\r\n";
constexpr std::string_view HEADER_END = "\r\n\r\n";
// Longest boundary allowed by RFC 2046
constexpr std::size_t MAX_BOUNDARY_LENGTH = 70;

std::string to_lower(std::string_view text) {
  std::string lowered(text);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lowered;
}

std::string_view trim(std::string_view text) {
  const char* whitespace = " \t";
  std::size_t begin = text.find_first_not_of(whitespace);
  if (begin == std::string_view::npos) {
    return {};
  }
  std::size_t end = text.find_last_not_of(whitespace);
  return text.substr(begin, end - begin + 1);
}

// Index of the first ';' outside a quoted string, or npos
std::size_t find_unquoted_semicolon(std::string_view text, std::size_t from) {
  bool quoted = false;
  for (std::size_t i = from; i < text.size(); ++i) {
    char c = text[i];
    if (quoted && c == '\\') {
      ++i;
    } else if (c == '"') {
      quoted = !quoted;
    } else if (c == ';' && !quoted) {
      return i;
    }
  }
  return std::string_view::npos;
}

std::string unquote(std::string_view value) {
  value = trim(value);
  if (value.size() < 2 || value.front() != '"' || value.back() != '"') {
    return std::string(value);
  }

  std::string result;
  result.reserve(value.size() - 2);
  for (std::size_t i = 1; i + 1 < value.size(); ++i) {
    if (value[i] == '\\' && i + 2 < value.size()) {
      ++i;
    }
    result.push_back(value[i]);
  }
  return result;
}

} // namespace


//==============================================
// HEADER HELPERS
//==============================================

std::map<std::string, std::string> parse_header_params(std::string_view value) {
  std::map<std::string, std::string> params;

  std::size_t pos = find_unquoted_semicolon(value, 0);
  while (pos != std::string_view::npos) {
    std::size_t next = find_unquoted_semicolon(value, pos + 1);
    std::string_view param = value.substr(pos + 1, next == std::string_view::npos ? std::string_view::npos : next - pos - 1);

    std::size_t eq = param.find('=');
    if (eq != std::string_view::npos) {
      std::string key = to_lower(trim(param.substr(0, eq)));
      if (!key.empty()) {
        params[key] = unquote(param.substr(eq + 1));
      }
    }
    pos = next;
  }
  return params;
}

std::string header_value_token(std::string_view value) {
  std::size_t end = find_unquoted_semicolon(value, 0);
  return to_lower(trim(value.substr(0, end)));
}

std::optional<std::string> MultipartParser::boundary_from_content_type(std::string_view content_type) {
  if (header_value_token(content_type) != "multipart/form-data") {
    return std::nullopt;
  }

  auto params = parse_header_params(content_type);
  auto found = params.find("boundary");
  if (found == params.end() || found->second.empty() || found->second.size() > MAX_BOUNDARY_LENGTH) {
    return std::nullopt;
  }
  return found->second;
}


//==============================================
// CONSTRUCTOR
//==============================================

MultipartParser::MultipartParser(std::string boundary)
  : delimiter_("\r\n--" + boundary) {
  if (boundary.empty() || boundary.size() > MAX_BOUNDARY_LENGTH) {
    throw MultipartError("Multipart: Invalid boundary length");
  }
  // A leading CRLF lets the first boundary, which may open the body without
  // one, be found with the same delimiter search as every later boundary
  buffer_.assign(CRLF);
}


//==============================================
// INPUT
//==============================================

void MultipartParser::feed(const char* data, std::size_t length) {
  if (state_ == State::Epilogue || length == 0) {
    return;
  }
  buffer_.append(data, length);
  process();
}

void MultipartParser::finish() {
  if (state_ != State::Epilogue) {
    BOOST_LOG_TRIVIAL(debug) << "Multipart: Body ended before closing boundary";
    throw MultipartError("Multipart: Body ended before closing boundary");
  }
}

void MultipartParser::process() {
  for (;;) {
    switch (state_) {
      case State::Preamble: {
        std::size_t pos = buffer_.find(delimiter_);
        if (pos == std::string::npos) {
          // Keep just enough to complete a delimiter split across chunks
          if (buffer_.size() >= delimiter_.size()) {
            buffer_.erase(0, buffer_.size() - (delimiter_.size() - 1));
          }
          return;
        }
        buffer_.erase(0, pos + delimiter_.size());
        state_ = State::AfterBoundary;
        break;
      }

      case State::AfterBoundary: {
        if (buffer_.size() < 2) {
          return;
        }
        if (buffer_[0] == '-' && buffer_[1] == '-') {
          buffer_.clear();
          state_ = State::Epilogue;
          return;
        }
        std::size_t crlf = buffer_.find(CRLF);
        if (crlf == std::string::npos) {
          if (buffer_.size() > MAX_BOUNDARY_LENGTH) {
            throw MultipartError("Multipart: Malformed boundary line");
          }
          return;
        }
        // Only transport padding may sit between the boundary and its CRLF
        for (std::size_t i = 0; i < crlf; ++i) {
          if (buffer_[i] != ' ' && buffer_[i] != '\t') {
            throw MultipartError("Multipart: Malformed boundary line");
          }
        }
        buffer_.erase(0, crlf + CRLF.size());
        state_ = State::Headers;
        break;
      }

      case State::Headers: {
        if (buffer_.size() < CRLF.size()) {
          return;
        }
        std::string_view block;
        std::size_t consumed = 0;
        if (buffer_.compare(0, CRLF.size(), CRLF) == 0) {
          consumed = CRLF.size();
        } else {
          std::size_t end = buffer_.find(HEADER_END);
          if (end == std::string::npos) {
            if (buffer_.size() > MAX_HEADER_SIZE) {
              throw MultipartError("Multipart: Part header block too large");
            }
            return;
          }
          block = std::string_view(buffer_).substr(0, end);
          consumed = end + HEADER_END.size();
        }

        PartHeaders headers = parse_headers(block);
        buffer_.erase(0, consumed);
        state_ = State::Data;
        if (on_part_begin_) {
          on_part_begin_(headers);
        }
        break;
      }

      case State::Data: {
        std::size_t pos = buffer_.find(delimiter_);
        if (pos == std::string::npos) {
          if (buffer_.size() >= delimiter_.size()) {
            std::size_t safe = buffer_.size() - (delimiter_.size() - 1);
            if (on_part_data_) {
              on_part_data_(buffer_.data(), safe);
            }
            buffer_.erase(0, safe);
          }
          return;
        }
        if (pos > 0 && on_part_data_) {
          on_part_data_(buffer_.data(), pos);
        }
        buffer_.erase(0, pos + delimiter_.size());
        state_ = State::AfterBoundary;
        if (on_part_end_) {
          on_part_end_();
        }
        break;
      }

      case State::Epilogue:
        buffer_.clear();
        return;
    }
  }
}

PartHeaders MultipartParser::parse_headers(std::string_view block) const {
  PartHeaders headers;
  std::string last_name;

  while (!block.empty()) {
    std::size_t eol = block.find(CRLF);
    std::string_view line = block.substr(0, eol);
    block = eol == std::string_view::npos ? std::string_view() : block.substr(eol + CRLF.size());

    if (line.empty()) {
      continue;
    }

    // Folded continuation line
    if ((line.front() == ' ' || line.front() == '\t') && !last_name.empty()) {
      headers.fields[last_name] += " " + std::string(trim(line));
      continue;
    }

    std::size_t colon = line.find(':');
    if (colon == std::string_view::npos || colon == 0) {
      throw MultipartError("Multipart: Malformed part header");
    }
    last_name = to_lower(trim(line.substr(0, colon)));
    headers.fields[last_name] = std::string(trim(line.substr(colon + 1)));
  }

  auto disposition = headers.fields.find("content-disposition");
  if (disposition != headers.fields.end()) {
    auto params = parse_header_params(disposition->second);
    auto name = params.find("name");
    if (name != params.end()) {
      headers.name = name->second;
    }
    auto filename = params.find("filename");
    if (filename != params.end()) {
      headers.filename = filename->second;
    }
  }

  return headers;
}

} // namespace network
} // namespace xfer
