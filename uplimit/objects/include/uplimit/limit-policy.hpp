#pragma once

#include <cstddef>

namespace uplimit {

// Immutable maximum request body size, in bytes.
// Zero is a valid limit: no request may carry a nonempty body.
// A LimitPolicy has no mutable state and can be shared freely between concurrent requests.
class LimitPolicy {
 public:
  explicit constexpr LimitPolicy(std::size_t maxBytes) noexcept : _maxBytes(maxBytes) {}

  [[nodiscard]] constexpr std::size_t maxBytes() const noexcept { return _maxBytes; }

  // Tells whether a body of nbBytes fits in this policy.
  [[nodiscard]] constexpr bool allows(std::size_t nbBytes) const noexcept { return nbBytes <= _maxBytes; }

  constexpr bool operator==(const LimitPolicy&) const noexcept = default;

 private:
  std::size_t _maxBytes;
};

}  // namespace uplimit
