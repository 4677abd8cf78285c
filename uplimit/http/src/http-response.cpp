#include "uplimit/http-response.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "uplimit/http-constants.hpp"
#include "uplimit/http-header.hpp"
#include "uplimit/http-status-code.hpp"
#include "uplimit/string-equal-ignore-case.hpp"

namespace uplimit {

HttpResponse::HttpResponse(http::StatusCode code, std::string_view reason) : _status(code) { setStatus(code, reason); }

std::optional<std::string_view> HttpResponse::headerValue(std::string_view key) const noexcept {
  for (const auto& header : _headers) {
    if (CaseInsensitiveEqual(header.name, key)) {
      return std::string_view(header.value);
    }
  }
  return std::nullopt;
}

void HttpResponse::setStatus(http::StatusCode statusCode, std::string_view reason) {
  _status = statusCode;
  _reason = reason.empty() ? http::ReasonPhraseFor(statusCode) : reason;
}

void HttpResponse::setHeader(std::string_view key, std::string_view value) {
  for (auto& header : _headers) {
    if (CaseInsensitiveEqual(header.name, key)) {
      header.value = value;
      return;
    }
  }
  _headers.push_back(http::Header{std::string(key), std::string(value)});
}

void HttpResponse::setBody(std::string body, std::string_view contentType) {
  _body = std::move(body);
  if (!_body.empty()) {
    setHeader(http::ContentType, contentType);
  }
}

}  // namespace uplimit
