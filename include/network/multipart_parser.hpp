#ifndef XFER_NETWORK_MULTIPART_PARSER_HPP
#define XFER_NETWORK_MULTIPART_PARSER_HPP

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace xfer {
namespace network {

class MultipartError : public std::runtime_error {
public:
  explicit MultipartError(const std::string& message) : std::runtime_error(message) {}
};

// Headers of one multipart/form-data part
struct PartHeaders {
  // Header names lowercased, values trimmed
  std::map<std::string, std::string> fields;
  // "name" parameter of Content-Disposition
  std::string name;
  // "filename" parameter of Content-Disposition; engaged but empty when the
  // browser sent filename=""
  std::optional<std::string> filename;
};

// Incremental multipart/form-data decoder. Bytes are pushed with feed() in
// chunks of any size; part data is handed to the callbacks as soon as it can
// no longer be the start of a delimiter, so memory use stays bounded by the
// chunk size plus the header limit regardless of part size.
class MultipartParser {
public:
  using PartBeginFn = std::function<void(const PartHeaders&)>;
  using PartDataFn = std::function<void(const char*, std::size_t)>;
  using PartEndFn = std::function<void()>;

  // ---- CONSTRUCTOR ----
  explicit MultipartParser(std::string boundary);


  // ---- CALLBACKS ----
  void on_part_begin(PartBeginFn fn) { on_part_begin_ = std::move(fn); }
  void on_part_data(PartDataFn fn) { on_part_data_ = std::move(fn); }
  void on_part_end(PartEndFn fn) { on_part_end_ = std::move(fn); }


  // ---- INPUT ----
  // Consumes a chunk of the body, throws MultipartError on malformed input.
  // Exceptions thrown by callbacks propagate unchanged.
  void feed(const char* data, std::size_t length);
  // Signals end of body, throws MultipartError if the closing delimiter
  // was never seen
  void finish();

  bool done() const { return state_ == State::Epilogue; }


  // ---- HEADER HELPERS ----
  // Extracts the boundary of a "multipart/form-data; boundary=..." value
  static std::optional<std::string> boundary_from_content_type(std::string_view content_type);

  // Upper bound on one part's header block
  static constexpr std::size_t MAX_HEADER_SIZE = 16 * 1024;

private:
  enum class State {
    Preamble,
    AfterBoundary,
    Headers,
    Data,
    Epilogue
  };

  // Runs the state machine over buffer_ until it needs more input
  void process();
  PartHeaders parse_headers(std::string_view block) const;

  State state_{State::Preamble};
  // "\r\n--" + boundary
  std::string delimiter_;
  std::string buffer_;

  PartBeginFn on_part_begin_;
  PartDataFn on_part_data_;
  PartEndFn on_part_end_;
};

// Parses the ";"-separated parameters that follow the first token of a header
// value such as Content-Disposition or Content-Type. Keys are lowercased and
// quoted values unescaped.
std::map<std::string, std::string> parse_header_params(std::string_view value);

// First token of such a header value, lowercased and trimmed
std::string header_value_token(std::string_view value);

} // namespace network
} // namespace xfer

#endif // XFER_NETWORK_MULTIPART_PARSER_HPP
