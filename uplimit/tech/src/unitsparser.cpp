#include "uplimit/unitsparser.hpp"

#include <charconv>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "uplimit/stringconv.hpp"

namespace uplimit {

int64_t ParseNumberOfBytes(std::string_view sizeStr) {
  if (sizeStr.empty()) {
    throw std::invalid_argument("Empty number of bytes");
  }
  int64_t totalNbBytes = 0;
  while (!sizeStr.empty()) {
    auto endDigitPos = sizeStr.find_first_not_of("0123456789");
    if (endDigitPos == std::string_view::npos) {
      endDigitPos = sizeStr.size();
    }
    if (endDigitPos == 0) {
      throw std::invalid_argument("Number of bytes should start with a digit");
    }
    int64_t nbBytes = StringToIntegral<int64_t>(sizeStr.substr(0, endDigitPos));
    sizeStr.remove_prefix(endDigitPos);

    int64_t multiplier = 1;
    if (!sizeStr.empty()) {
      bool iMultiplier = 1UL < sizeStr.size() && sizeStr[1UL] == 'i';
      int64_t multiplierBase = iMultiplier ? 1024L : 1000L;
      switch (sizeStr.front()) {
        case '.':
          throw std::invalid_argument("Decimal number not accepted for number of bytes parsing");
        case 'T':  // NOLINT(bugprone-branch-clone)
          multiplier *= multiplierBase;
          [[fallthrough]];
        case 'G':
          multiplier *= multiplierBase;
          [[fallthrough]];
        case 'M':
          multiplier *= multiplierBase;
          [[fallthrough]];
        case 'K':
          [[fallthrough]];
        case 'k':
          multiplier *= multiplierBase;
          break;
        case 'B':
          break;
        default:
          throw std::invalid_argument("Invalid suffix for number of bytes parsing");
      }
      if (sizeStr.front() == 'B') {
        sizeStr.remove_prefix(1UL);
      } else {
        sizeStr.remove_prefix(1UL + static_cast<std::string_view::size_type>(iMultiplier));
        if (!sizeStr.empty() && sizeStr.front() == 'B') {
          sizeStr.remove_prefix(1UL);
        }
      }
    }
    if (nbBytes > (std::numeric_limits<int64_t>::max() - totalNbBytes) / multiplier) {
      throw std::invalid_argument("Number of bytes is too large");
    }
    totalNbBytes += nbBytes * multiplier;
  }

  return totalNbBytes;
}

namespace {
constexpr std::pair<int64_t, std::string_view> kBytesUnits[] = {{static_cast<int64_t>(1024) * 1024 * 1024 * 1024, "Ti"},
                                                                {static_cast<int64_t>(1024) * 1024 * 1024, "Gi"},
                                                                {static_cast<int64_t>(1024) * 1024, "Mi"},
                                                                {static_cast<int64_t>(1024), "Ki"},
                                                                {static_cast<int64_t>(1), ""}};
}

std::string BytesToStr(int64_t numberOfBytes, int nbSignificantUnits) {
  if (numberOfBytes == 0) {
    return "0";
  }

  std::string ret;

  if (numberOfBytes < 0) {
    ret.push_back('-');
    numberOfBytes = -numberOfBytes;
  }

  for (int unitPos = 0; numberOfBytes > 0 && nbSignificantUnits > 0; ++unitPos) {
    int64_t nbUnits = numberOfBytes / kBytesUnits[unitPos].first;

    if (nbUnits != 0) {
      numberOfBytes %= kBytesUnits[unitPos].first;

      char buf[std::numeric_limits<int64_t>::digits10 + 1];
      auto [ptr, errc] = std::to_chars(buf, buf + sizeof(buf), nbUnits);
      if (errc != std::errc()) {
        throw std::invalid_argument("Unable to encode integral into string");
      }
      ret.append(buf, ptr);
      ret.append(kBytesUnits[unitPos].second);

      --nbSignificantUnits;
    }
  }

  return ret;
}

}  // namespace uplimit
