#include "uplimit/body-source.hpp"

#include <algorithm>
#include <cstddef>
#include <string_view>

namespace uplimit {

std::string_view BufferedBodySource::readChunk(std::size_t maxBytes) {
  const std::size_t len = std::min(std::max<std::size_t>(maxBytes, 1), remaining());
  std::string_view chunk(_body.data() + _pos, len);
  _pos += len;
  return chunk;
}

}  // namespace uplimit
