#pragma once

#include <string>

namespace uplimit::http {

struct Header {
  std::string name;
  std::string value;

  bool operator==(const Header&) const noexcept = default;
};

}  // namespace uplimit::http
