#pragma once

#include "uplimit/bounded-body-reader.hpp"
#include "uplimit/http-request.hpp"
#include "uplimit/http-response.hpp"
#include "uplimit/limit-policy.hpp"
#include "uplimit/middleware.hpp"
#include "uplimit/payload-too-large.hpp"
#include "uplimit/request-pipeline.hpp"
#include "uplimit/upload-limit-config.hpp"

namespace uplimit {

// Builds the 413 (Payload Too Large) response of a body limit violation.
// The fast path and the streaming check both answer with this exact response shape.
[[nodiscard]] HttpResponse MakePayloadTooLargeResponse(const PayloadTooLarge& error, bool closeConnection = true);

// Request body size limit, to be installed in a request pipeline with installInto(), which registers both of its
// middleware. Both are needed: without the response one, a violation detected while streaming is not turned into
// a 413.
//
// As a request middleware, it either:
//  - short-circuits with a 413 when the declared Content-Length is already above the limit (no body byte is read),
//  - or replaces the body of the request by a BoundedBodyReader over the original one, and lets the request
//    continue. Handlers reading past the limit get a PayloadTooLarge exception.
//
// As a response middleware, it turns the response of a request whose body exceeded the limit into the same 413,
// whatever the handler did with the PayloadTooLarge exception.
//
// An UploadLimit is immutable once installed, and can be shared between concurrent requests.
// The completion callback must be registered before installInto() or requestMiddleware() is called, as the
// middleware holds a copy.
class UploadLimit {
 public:
  using CompletionCallback = BoundedBodyReader::CompletionCallback;

  // Throws invalid_argument if config is not valid.
  explicit UploadLimit(UploadLimitConfig config);

  explicit UploadLimit(LimitPolicy policy);

  // Request middleware entry point.
  MiddlewareResult operator()(HttpRequest& request) const;

  // Response middleware entry point.
  void operator()(const HttpRequest& request, HttpResponse& response) const;

  // Registers the request and the response middleware of this limit in pipeline, and returns it.
  RequestPipeline& installInto(RequestPipeline& pipeline) const;

  [[nodiscard]] RequestMiddleware requestMiddleware() const;

  [[nodiscard]] ResponseMiddleware responseMiddleware() const;

  // Sets a callback invoked once per request, when its body reader reaches a terminal state.
  // It may be invoked concurrently by different requests.
  UploadLimit& onBodyCompletion(CompletionCallback callback);

  [[nodiscard]] LimitPolicy policy() const noexcept { return _config.policy(); }

  [[nodiscard]] const UploadLimitConfig& config() const noexcept { return _config; }

 private:
  UploadLimitConfig _config;
  CompletionCallback _completionCallback;
};

}  // namespace uplimit
