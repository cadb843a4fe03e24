#pragma once

#include <string>
#include <string_view>

namespace xfer {
namespace utils {

// Reduces a client-supplied filename to a safe display name:
//   - accented Latin-1 letters (UTF-8) become their ASCII base letter
//   - only the last path component survives ('/' and '\\' are separators)
//   - control characters are dropped
//   - runs of whitespace become a single '_'
//   - anything outside [A-Za-z0-9._-] is dropped
//   - leading and trailing '.' and '_' are stripped
// The result may be empty, callers decide how to treat that.
std::string sanitize_filename(std::string_view input);

} // namespace utils
} // namespace xfer
