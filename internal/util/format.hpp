#pragma once

#include <cstdint>
#include <string>

namespace offline::util {

// Human readable byte count: "0 B", "512 B", "1.5 KB", "50 MB".
std::string FormatBytes(uint64_t bytes);

} // namespace offline::util
