#include "uplimit/declared-length.hpp"

#include <charconv>
#include <cstddef>
#include <string_view>
#include <system_error>

#include "uplimit/string-trim.hpp"

namespace uplimit {

DeclaredLength ParseContentLength(std::string_view headerValue) noexcept {
  headerValue = TrimOws(headerValue);
  std::size_t len = 0;
  const char* endPtr = headerValue.data() + headerValue.size();
  const auto [ptr, err] = std::from_chars(headerValue.data(), endPtr, len);
  if (headerValue.empty() || err != std::errc() || ptr != endPtr) {
    return {DeclaredLength::Status::Malformed, 0};
  }
  return {DeclaredLength::Status::Valid, len};
}

}  // namespace uplimit
