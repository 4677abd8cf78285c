#pragma once

#include <cstddef>

#include "uplimit/exception.hpp"

namespace uplimit {

// Raised when a request body is larger than the configured maximum.
// It is the single error kind of the body limit, whether the violation was detected from the declared
// length before reading anything, or while streaming the body.
class PayloadTooLarge : public exception {
 public:
  PayloadTooLarge(std::size_t size, std::size_t limit);

  // Size that triggered the violation: the declared length, or the number of bytes received so far including
  // the chunk that crossed the limit.
  [[nodiscard]] std::size_t size() const noexcept { return _size; }

  // The configured maximum.
  [[nodiscard]] std::size_t limit() const noexcept { return _limit; }

 private:
  std::size_t _size;
  std::size_t _limit;
};

}  // namespace uplimit
