#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace uplimit {

// Parses a human readable number of bytes into an integral number of bytes.
// Accepted suffixes: k/K (1000), M, G, T, optionally followed by 'i' for binary multiples (Ki = 1024) and by a
// trailing 'B'. Several terms may be concatenated ("1Mi512Ki").
// Examples: "4096" -> 4096, "4k" -> 4000, "4Ki" -> 4096, "4MiB" -> 4194304.
// Throws std::invalid_argument for empty or malformed input, negative or overflowing values.
int64_t ParseNumberOfBytes(std::string_view sizeStr);

// Returns a compact human readable representation of given number of bytes with binary units,
// keeping at most nbSignificantUnits units (for instance 1050000 -> "1Mi1Ki" with 2 units).
std::string BytesToStr(int64_t numberOfBytes, int nbSignificantUnits = 2);

}  // namespace uplimit
