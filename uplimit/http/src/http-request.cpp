#include "uplimit/http-request.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "uplimit/declared-length.hpp"
#include "uplimit/http-constants.hpp"
#include "uplimit/http-header.hpp"
#include "uplimit/string-equal-ignore-case.hpp"

namespace uplimit {

HttpRequest& HttpRequest::addHeader(std::string_view name, std::string_view value) {
  for (auto& header : _headers) {
    if (CaseInsensitiveEqual(header.name, name)) {
      header.value.push_back(',');
      header.value.append(value);
      return *this;
    }
  }
  _headers.push_back(http::Header{std::string(name), std::string(value)});
  return *this;
}

std::optional<std::string_view> HttpRequest::headerValue(std::string_view name) const noexcept {
  for (const auto& header : _headers) {
    if (CaseInsensitiveEqual(header.name, name)) {
      return std::string_view(header.value);
    }
  }
  return std::nullopt;
}

DeclaredLength HttpRequest::declaredLength() const noexcept {
  if (headerValue(http::TransferEncoding)) {
    return {};
  }
  const auto contentLength = headerValue(http::ContentLength);
  if (!contentLength) {
    return {};
  }
  return ParseContentLength(*contentLength);
}

std::string_view HttpRequest::readBody(std::size_t maxBytes) {
  if (!_body) {
    return {};
  }
  return _body->readChunk(maxBytes);
}

std::string HttpRequest::readAllBody() {
  std::string body;
  for (std::string_view chunk = readBody(); !chunk.empty(); chunk = readBody()) {
    body.append(chunk);
  }
  return body;
}

}  // namespace uplimit
