#include "utils/filename.hpp"

namespace xfer {
namespace utils {

namespace {

bool is_allowed(unsigned char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')
      || c == '.' || c == '_' || c == '-';
}

bool is_space(unsigned char c) {
  return c == ' ' || c == '\t' || c == '\v' || c == '\f';
}

// ASCII base letter of U+00C0..U+00FF after canonical decomposition,
// 0 where the character has none (Æ, Ð, ×, Ø, Þ, ß and lower-case forms)
constexpr char LATIN1_BASE[64] = {
  'A', 'A', 'A', 'A', 'A', 'A', 0,   'C', 'E', 'E', 'E', 'E', 'I', 'I', 'I', 'I',
  0,   'N', 'O', 'O', 'O', 'O', 'O', 0,   0,   'U', 'U', 'U', 'U', 'Y', 0,   0,
  'a', 'a', 'a', 'a', 'a', 'a', 0,   'c', 'e', 'e', 'e', 'e', 'i', 'i', 'i', 'i',
  0,   'n', 'o', 'o', 'o', 'o', 'o', 0,   0,   'u', 'u', 'u', 'u', 'y', 0,   'y',
};

// Rewrites two-byte UTF-8 Latin-1 letters to their ASCII base and a
// no-break space to ' '; other non-ASCII bytes pass through untouched
std::string fold_latin1(std::string_view raw) {
  std::string folded;
  folded.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    unsigned char c = static_cast<unsigned char>(raw[i]);
    unsigned char next = i + 1 < raw.size() ? static_cast<unsigned char>(raw[i + 1]) : 0;
    if (c == 0xC3 && (next & 0xC0) == 0x80) {
      char base = LATIN1_BASE[next & 0x3F];
      if (base) {
        folded.push_back(base);
      }
      ++i;
    } else if (c == 0xC2 && next == 0xA0) {
      folded.push_back(' ');
      ++i;
    } else {
      folded.push_back(static_cast<char>(c));
    }
  }
  return folded;
}

} // namespace

std::string sanitize_filename(std::string_view input) {
  const std::string folded = fold_latin1(input);
  std::string_view raw = folded;

  // Keep only the final path component
  std::size_t last_sep = raw.find_last_of("/\\");
  if (last_sep != std::string_view::npos) {
    raw.remove_prefix(last_sep + 1);
  }

  std::string cleaned;
  cleaned.reserve(raw.size());
  bool pending_space = false;

  for (unsigned char c : raw) {
    if (is_space(c)) {
      pending_space = true;
      continue;
    }
    if (c < 0x20 || c == 0x7F) {
      continue;
    }
    if (!is_allowed(c)) {
      continue;
    }
    if (pending_space && !cleaned.empty()) {
      cleaned.push_back('_');
    }
    pending_space = false;
    cleaned.push_back(static_cast<char>(c));
  }

  std::size_t begin = cleaned.find_first_not_of("._");
  if (begin == std::string::npos) {
    return {};
  }
  std::size_t end = cleaned.find_last_not_of("._");
  return cleaned.substr(begin, end - begin + 1);
}

} // namespace utils
} // namespace xfer
