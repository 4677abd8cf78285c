#pragma once

#include <string_view>

#include "uplimit/http-status-code.hpp"

namespace uplimit::http {

// HTTP header field names are case-insensitive per RFC 7230. They are stored here in their canonical form,
// lookups must stay case-insensitive.
inline constexpr std::string_view Connection = "Connection";
inline constexpr std::string_view TransferEncoding = "Transfer-Encoding";
inline constexpr std::string_view ContentLength = "Content-Length";
inline constexpr std::string_view ContentType = "Content-Type";

// Common Header Values (lowercase tokens where case-insensitive comparison used)
inline constexpr std::string_view close = "close";
inline constexpr std::string_view chunked = "chunked";

// Reason Phrases (only those we currently emit explicitly)
inline constexpr std::string_view ReasonOK = "OK";                                      // 200
inline constexpr std::string_view ReasonCreated = "Created";                            // 201
inline constexpr std::string_view ReasonNoContent = "No Content";                       // 204
inline constexpr std::string_view ReasonBadRequest = "Bad Request";                     // 400
inline constexpr std::string_view ReasonForbidden = "Forbidden";                        // 403
inline constexpr std::string_view ReasonNotFound = "Not Found";                         // 404
inline constexpr std::string_view ReasonLengthRequired = "Length Required";             // 411
inline constexpr std::string_view ReasonPayloadTooLarge = "Payload Too Large";          // 413
inline constexpr std::string_view ReasonInternalServerError = "Internal Server Error";  // 500
inline constexpr std::string_view ReasonServiceUnavailable = "Service Unavailable";     // 503

// Content type
inline constexpr std::string_view ContentTypeTextPlain = "text/plain";

// Return the canonical reason phrase for a subset of status codes we care about.
constexpr std::string_view ReasonPhraseFor(http::StatusCode status) noexcept {
  switch (status) {
    case StatusCodeOK:
      return ReasonOK;
    case StatusCodeCreated:
      return ReasonCreated;
    case StatusCodeNoContent:
      return ReasonNoContent;
    case StatusCodeBadRequest:
      return ReasonBadRequest;
    case StatusCodeForbidden:
      return ReasonForbidden;
    case StatusCodeNotFound:
      return ReasonNotFound;
    case StatusCodeLengthRequired:
      return ReasonLengthRequired;
    case StatusCodePayloadTooLarge:
      return ReasonPayloadTooLarge;
    case StatusCodeInternalServerError:
      return ReasonInternalServerError;
    case StatusCodeServiceUnavailable:
      return ReasonServiceUnavailable;
    default:
      return {};
  }
}

}  // namespace uplimit::http
