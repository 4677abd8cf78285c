#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "uplimit/body-source.hpp"
#include "uplimit/declared-length.hpp"
#include "uplimit/http-header.hpp"
#include "uplimit/http-method.hpp"

namespace uplimit {

class PayloadTooLarge;

// Incoming request as seen by middleware and handlers: head (method, path, headers) and a replaceable body source.
// The body is read lazily, in arrival order, through readBody() / readBodyAsync().
class HttpRequest {
 public:
  static constexpr std::size_t kDefaultReadBodyChunk = 4096;

  HttpRequest() = default;

  HttpRequest(http::Method method, std::string_view path) : _path(path), _method(method) {}

  HttpRequest(const HttpRequest&) = delete;
  HttpRequest(HttpRequest&&) noexcept = default;
  HttpRequest& operator=(const HttpRequest&) = delete;
  HttpRequest& operator=(HttpRequest&&) noexcept = default;

  ~HttpRequest() = default;

  // The method of the request (GET, PUT, ...)
  [[nodiscard]] http::Method method() const noexcept { return _method; }

  [[nodiscard]] std::string_view path() const noexcept { return _path; }

  // Appends a header. Duplicated header names are merged into a single comma separated value,
  // so that conflicting duplicates of Content-Length (an empty one included) are detected as malformed.
  HttpRequest& addHeader(std::string_view name, std::string_view value);

  // Returns the header value for the given name (case-insensitive lookup), or std::nullopt if absent.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const noexcept;

  // Like headerValue() but returns an empty string_view if the header is absent.
  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view name) const noexcept {
    const auto optValue = headerValue(name);
    return optValue ? *optValue : std::string_view{};
  }

  [[nodiscard]] const std::vector<http::Header>& headers() const noexcept { return _headers; }

  // Body length declared by the client through Content-Length.
  // Per RFC 7230 section 3.3.3, Content-Length is ignored when Transfer-Encoding is present.
  [[nodiscard]] DeclaredLength declaredLength() const noexcept;

  // Installs (or replaces) the body source of this request.
  void setBody(std::unique_ptr<BodySource> body) noexcept { _body = std::move(body); }

  // Takes the body source out of this request, which is left without body.
  [[nodiscard]] std::unique_ptr<BodySource> takeBody() noexcept { return std::move(_body); }

  [[nodiscard]] bool hasBody() const noexcept { return _body != nullptr; }

  // Streaming accessor for the request body. Returns a view that remains valid until the next readBody()
  // invocation. An empty view means that the body has been fully consumed (a request without body source has an
  // empty body). maxBytes should be > 0.
  // Throws PayloadTooLarge if the installed body source enforces a limit that has been exceeded, and propagates
  // transport errors from the body source.
  [[nodiscard]] std::string_view readBody(std::size_t maxBytes = kDefaultReadBodyChunk);

  // Awaitable version of readBody(), suspending the awaiting coroutine while body bytes are not available yet.
  [[nodiscard]] ReadChunkAwaitable readBodyAsync(std::size_t maxBytes = kDefaultReadBodyChunk) noexcept {
    return {_body.get(), maxBytes};
  }

  // Reads the remaining body and returns it in a single string.
  // Same error reporting as readBody().
  [[nodiscard]] std::string readAllBody();

  // Returns the body limit violation detected while reading this request's body, or nullptr if none.
  [[nodiscard]] const PayloadTooLarge* bodyLimitViolation() const noexcept {
    return _body ? _body->limitViolation() : nullptr;
  }

 private:
  std::string _path{"/"};
  std::vector<http::Header> _headers;
  std::unique_ptr<BodySource> _body;
  http::Method _method{http::Method::GET};
};

}  // namespace uplimit
