#pragma once

#include <cstddef>
#include <cstring>
#include <exception>
#include <format>
#include <utility>

namespace uplimit {

// Base exception of uplimit.
// The message is stored inline, so constructing and copying an exception never allocates.
// Messages longer than kMsgMaxLen are truncated and terminated by "...".
class exception : public std::exception {
 public:
  static constexpr std::size_t kMsgMaxLen = 95;

  template <unsigned N>
  explicit exception(const char (&str)[N]) noexcept
    requires(N <= kMsgMaxLen + 1)
  {
    std::memcpy(_data, str, N);
  }

  template <typename... Args>
  explicit exception(std::format_string<Args...> fmt, Args&&... args) {
    const auto res = std::format_to_n(_data, kMsgMaxLen, fmt, std::forward<Args>(args)...);
    if (std::cmp_less_equal(res.size, kMsgMaxLen)) {
      *res.out = '\0';
    } else {
      static constexpr std::size_t kEllipsisLen = 3;
      std::memcpy(_data + kMsgMaxLen - kEllipsisLen, "...", kEllipsisLen);
      _data[kMsgMaxLen] = '\0';
    }
  }

  [[nodiscard]] const char* what() const noexcept override { return _data; }

 private:
  char _data[kMsgMaxLen + 1];
};

}  // namespace uplimit
