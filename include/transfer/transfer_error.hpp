#ifndef XFER_TRANSFER_ERROR_HPP
#define XFER_TRANSFER_ERROR_HPP

#include <stdexcept>
#include <string>

namespace xfer {
namespace transfer {

enum class ErrorKind {
    Unauthorized,
    BadRequest,
    NotFound,
    PayloadTooLarge,
    StorageFault
};

inline const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Unauthorized: return "Unauthorized";
        case ErrorKind::BadRequest: return "Bad request";
        case ErrorKind::NotFound: return "Not found";
        case ErrorKind::PayloadTooLarge: return "Payload too large";
        case ErrorKind::StorageFault: return "Storage fault";
        default: return "Undefined error";
    }
}

// Failure of a transfer operation; the message is safe to show to clients
class TransferError : public std::runtime_error {
public:
    TransferError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace transfer
} // namespace xfer

#endif // XFER_TRANSFER_ERROR_HPP
