#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "uplimit/http-constants.hpp"
#include "uplimit/http-header.hpp"
#include "uplimit/http-status-code.hpp"

namespace uplimit {

// Response produced by a handler or by a short-circuiting middleware.
// Serialization is left to the host server.
class HttpResponse {
 public:
  // Constructs an HttpResponse with the given status code and optional reason phrase.
  // If reason is empty, the canonical reason phrase of the status code is used (if known).
  explicit HttpResponse(http::StatusCode code = http::StatusCodeOK, std::string_view reason = {});

  // Get the current status code stored in this HttpResponse.
  [[nodiscard]] http::StatusCode status() const noexcept { return _status; }

  // Get the current reason stored in this HttpResponse.
  [[nodiscard]] std::string_view reason() const noexcept { return _reason; }

  // Retrieves the value of the first occurrence of the given header key (case-insensitive search per RFC 7230).
  // If the header is not found, returns std::nullopt.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view key) const noexcept;

  // Same as headerValue() but returns an empty string_view if the header is not found.
  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view key) const noexcept {
    const auto optValue = headerValue(key);
    return optValue ? *optValue : std::string_view{};
  }

  [[nodiscard]] const std::vector<http::Header>& headers() const noexcept { return _headers; }

  // Get a view of the current body stored in this HttpResponse.
  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  // Sets the status code, and resets the reason phrase to the canonical one.
  HttpResponse& status(http::StatusCode statusCode) & {
    setStatus(statusCode, {});
    return *this;
  }

  HttpResponse&& status(http::StatusCode statusCode) && {
    setStatus(statusCode, {});
    return std::move(*this);
  }

  HttpResponse& reason(std::string_view reason) & {
    _reason = reason;
    return *this;
  }

  HttpResponse&& reason(std::string_view reason) && {
    _reason = reason;
    return std::move(*this);
  }

  // Appends a header line, even if a header with the same key already exists.
  HttpResponse& addHeader(std::string_view key, std::string_view value) & {
    _headers.push_back(http::Header{std::string(key), std::string(value)});
    return *this;
  }

  HttpResponse&& addHeader(std::string_view key, std::string_view value) && {
    _headers.push_back(http::Header{std::string(key), std::string(value)});
    return std::move(*this);
  }

  // Sets a header, replacing the value of the first existing header with the same key (case-insensitive).
  HttpResponse& header(std::string_view key, std::string_view value) & {
    setHeader(key, value);
    return *this;
  }

  HttpResponse&& header(std::string_view key, std::string_view value) && {
    setHeader(key, value);
    return std::move(*this);
  }

  // Sets the body, and the Content-Type header when the body is not empty.
  HttpResponse& body(std::string body, std::string_view contentType = http::ContentTypeTextPlain) & {
    setBody(std::move(body), contentType);
    return *this;
  }

  HttpResponse&& body(std::string body, std::string_view contentType = http::ContentTypeTextPlain) && {
    setBody(std::move(body), contentType);
    return std::move(*this);
  }

 private:
  void setStatus(http::StatusCode statusCode, std::string_view reason);

  void setHeader(std::string_view key, std::string_view value);

  void setBody(std::string body, std::string_view contentType);

  std::string _reason;
  std::vector<http::Header> _headers;
  std::string _body;
  http::StatusCode _status;
};

}  // namespace uplimit
