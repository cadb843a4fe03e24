#include "utils/format.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace xfer {
namespace utils {

std::string format_timestamp(std::chrono::system_clock::time_point when) {
  std::time_t t = std::chrono::system_clock::to_time_t(when);
  std::tm local{};
  localtime_r(&t, &local);

  std::stringstream ss;
  ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
  return ss.str();
}

std::string format_kb(std::uintmax_t bytes) {
  std::stringstream ss;
  ss << std::fixed << std::setprecision(1) << static_cast<double>(bytes) / 1024.0 << " KB";
  return ss.str();
}

} // namespace utils
} // namespace xfer
