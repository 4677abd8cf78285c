#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace uplimit {

// Body length announced by the client. It is a hint only and is never trusted for correctness.
struct DeclaredLength {
  enum class Status : std::uint8_t {
    Absent,     // no usable declared length (no Content-Length, or Transfer-Encoding present)
    Malformed,  // Content-Length present but not a single non-negative decimal number
    Valid
  };

  Status status{Status::Absent};
  std::size_t value{0};  // meaningful only when status is Valid

  [[nodiscard]] bool isValid() const noexcept { return status == Status::Valid; }

  bool operator==(const DeclaredLength&) const noexcept = default;
};

// Parses a Content-Length header value (leading and trailing OWS ignored).
// Lists of values (from duplicated headers) are reported as Malformed, as well as signs, empty values and numbers
// that do not fit in std::size_t.
[[nodiscard]] DeclaredLength ParseContentLength(std::string_view headerValue) noexcept;

}  // namespace uplimit
