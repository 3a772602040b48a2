#include "format.hpp"

#include <array>
#include <iomanip>
#include <sstream>

namespace offline::util {

std::string FormatBytes(uint64_t bytes) {
  if (bytes == 0) return "0 B";

  static constexpr std::array<const char*, 4> kUnits = {"B", "KB", "MB", "GB"};

  double      value = static_cast<double>(bytes);
  std::size_t unit  = 0;
  while (value >= 1024.0 && unit + 1 < kUnits.size()) {
    value /= 1024.0;
    ++unit;
  }

  std::ostringstream out;
  out << std::fixed << std::setprecision(2) << value;

  // trim trailing zeros: "1.50" -> "1.5", "2.00" -> "2"
  auto text = out.str();
  text.erase(text.find_last_not_of('0') + 1);
  if (!text.empty() && text.back() == '.') text.pop_back();

  return text + " " + kUnits[unit];
}

} // namespace offline::util
