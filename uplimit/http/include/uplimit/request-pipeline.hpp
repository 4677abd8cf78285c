#pragma once

#include <functional>
#include <vector>

#include "uplimit/http-request.hpp"
#include "uplimit/http-response.hpp"
#include "uplimit/middleware.hpp"
#include "uplimit/request-task.hpp"

namespace uplimit {

// Minimal in-process host of a request: request middleware chain, one handler, response middleware chain.
// It does not own any transport: requests are built by the caller, responses are returned to it.
//
// Error handling follows the server rules:
//  - an exception thrown by a request middleware is logged and the chain continues,
//  - an exception escaping the handler is logged and answered with a 500,
//  - response middleware runs on every response, short-circuited ones included.
//
// A RequestPipeline is immutable once requests are dispatched and can then be shared between threads.
class RequestPipeline {
 public:
  using RequestHandler = std::function<HttpResponse(HttpRequest&)>;
  using AsyncRequestHandler = std::function<RequestTask<HttpResponse>(HttpRequest&)>;

  // Response of a dispatched request.
  // It is pending while an asynchronous handler is suspended, waiting for body bytes from the transport.
  // The pipeline and the request must outlive it.
  class PendingResponse {
   public:
    PendingResponse(const PendingResponse&) = delete;
    PendingResponse(PendingResponse&&) noexcept = default;
    PendingResponse& operator=(const PendingResponse&) = delete;
    PendingResponse& operator=(PendingResponse&&) noexcept = default;

    ~PendingResponse() = default;

    [[nodiscard]] bool done() const noexcept { return _task.done(); }

    // Returns the final response, with the response middleware applied.
    // Throws std::logic_error if the handler is still suspended, or if the response has already been taken.
    [[nodiscard]] HttpResponse takeResponse();

   private:
    friend class RequestPipeline;

    PendingResponse(const RequestPipeline& pipeline, HttpRequest& request, HttpResponse response) noexcept;

    PendingResponse(const RequestPipeline& pipeline, HttpRequest& request, RequestTask<HttpResponse> task) noexcept;

    const RequestPipeline* _pipeline;
    HttpRequest* _request;
    RequestTask<HttpResponse> _task;
    HttpResponse _response;
    bool _taken{false};
  };

  RequestPipeline& addRequestMiddleware(RequestMiddleware middleware);

  RequestPipeline& addResponseMiddleware(ResponseMiddleware middleware);

  // Sets the handler, replacing any previous (synchronous or asynchronous) one.
  RequestPipeline& setHandler(RequestHandler handler);

  RequestPipeline& setAsyncHandler(AsyncRequestHandler handler);

  // Runs the request middleware chain, then the handler until its completion or its first suspension.
  // Without handler, requests not short-circuited by middleware are answered with 404.
  [[nodiscard]] PendingResponse dispatch(HttpRequest& request) const;

  // Convenience for hosts that have the whole request available: dispatch(request).takeResponse().
  // Throws std::logic_error if the handler suspends waiting for body bytes.
  [[nodiscard]] HttpResponse handle(HttpRequest& request) const;

 private:
  bool runPreChain(HttpRequest& request, HttpResponse& out) const;

  void applyResponseMiddleware(const HttpRequest& request, HttpResponse& response) const;

  std::vector<RequestMiddleware> _requestMiddleware;
  std::vector<ResponseMiddleware> _responseMiddleware;
  RequestHandler _handler;
  AsyncRequestHandler _asyncHandler;
};

}  // namespace uplimit
