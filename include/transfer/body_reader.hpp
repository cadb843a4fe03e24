#ifndef XFER_TRANSFER_BODY_READER_HPP
#define XFER_TRANSFER_BODY_READER_HPP

#include <cstddef>
#include <istream>

namespace xfer {
namespace transfer {

// Pull-style source of request body bytes
class BodyReader {
public:
  virtual ~BodyReader() = default;

  // Reads up to `capacity` bytes into `buffer`, returns 0 at end of body
  virtual std::size_t read_some(char* buffer, std::size_t capacity) = 0;
};

// Serves a body held in any std::istream
class StreamBodyReader : public BodyReader {
public:
  explicit StreamBodyReader(std::istream& input) : input_(input) {}

  std::size_t read_some(char* buffer, std::size_t capacity) override {
    input_.read(buffer, static_cast<std::streamsize>(capacity));
    return static_cast<std::size_t>(input_.gcount());
  }

private:
  std::istream& input_;
};

} // namespace transfer
} // namespace xfer

#endif // XFER_TRANSFER_BODY_READER_HPP
