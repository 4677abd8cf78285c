#include "uplimit/request-pipeline.hpp"

#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

#include "uplimit/http-constants.hpp"
#include "uplimit/http-request.hpp"
#include "uplimit/http-response.hpp"
#include "uplimit/http-status-code.hpp"
#include "uplimit/log.hpp"
#include "uplimit/middleware.hpp"
#include "uplimit/request-task.hpp"

namespace uplimit {

namespace {

HttpResponse MakeInternalError(std::string body) {
  HttpResponse resp(http::StatusCodeInternalServerError, http::ReasonInternalServerError);
  resp.body(std::move(body));
  return resp;
}

}  // namespace

RequestPipeline::PendingResponse::PendingResponse(const RequestPipeline& pipeline, HttpRequest& request,
                                                  HttpResponse response) noexcept
    : _pipeline(&pipeline), _request(&request), _response(std::move(response)) {}

RequestPipeline::PendingResponse::PendingResponse(const RequestPipeline& pipeline, HttpRequest& request,
                                                  RequestTask<HttpResponse> task) noexcept
    : _pipeline(&pipeline), _request(&request), _task(std::move(task)) {}

HttpResponse RequestPipeline::PendingResponse::takeResponse() {
  if (_taken) {
    throw std::logic_error("Response has already been taken");
  }
  if (!_task.done()) {
    throw std::logic_error("Async handler is still waiting for request body");
  }
  if (_task.valid()) {
    try {
      _response = _task.result();
    } catch (const std::exception& ex) {
      log::error("Exception in async handler: {}", ex.what());
      _response = MakeInternalError(ex.what());
    } catch (...) {
      log::error("Unknown exception in async handler");
      _response = MakeInternalError("Unknown error");
    }
    _task.reset();
  }
  _taken = true;
  _pipeline->applyResponseMiddleware(*_request, _response);
  return std::move(_response);
}

RequestPipeline& RequestPipeline::addRequestMiddleware(RequestMiddleware middleware) {
  _requestMiddleware.push_back(std::move(middleware));
  return *this;
}

RequestPipeline& RequestPipeline::addResponseMiddleware(ResponseMiddleware middleware) {
  _responseMiddleware.push_back(std::move(middleware));
  return *this;
}

RequestPipeline& RequestPipeline::setHandler(RequestHandler handler) {
  _handler = std::move(handler);
  _asyncHandler = {};
  return *this;
}

RequestPipeline& RequestPipeline::setAsyncHandler(AsyncRequestHandler handler) {
  _asyncHandler = std::move(handler);
  _handler = {};
  return *this;
}

RequestPipeline::PendingResponse RequestPipeline::dispatch(HttpRequest& request) const {
  HttpResponse resp;
  if (runPreChain(request, resp)) {
    return {*this, request, std::move(resp)};
  }

  if (_asyncHandler) {
    RequestTask<HttpResponse> task;
    try {
      task = _asyncHandler(request);
    } catch (const std::exception& ex) {
      log::error("Exception while creating async handler task: {}", ex.what());
      return {*this, request, MakeInternalError(ex.what())};
    } catch (...) {
      log::error("Unknown exception while creating async handler task");
      return {*this, request, MakeInternalError("Unknown error")};
    }
    if (!task.valid()) {
      log::error("Async handler returned an invalid RequestTask for path {}", request.path());
      return {*this, request, MakeInternalError("Async handler inactive")};
    }
    // exceptions escaping the coroutine body are captured by its promise
    task.resume();
    return {*this, request, std::move(task)};
  }

  if (!_handler) {
    resp.status(http::StatusCodeNotFound);
    resp.body("Not Found");
    return {*this, request, std::move(resp)};
  }

  try {
    resp = _handler(request);
  } catch (const std::exception& ex) {
    log::error("Exception in handler: {}", ex.what());
    resp = MakeInternalError(ex.what());
  } catch (...) {
    log::error("Unknown exception in handler");
    resp = MakeInternalError("Unknown error");
  }
  return {*this, request, std::move(resp)};
}

HttpResponse RequestPipeline::handle(HttpRequest& request) const { return dispatch(request).takeResponse(); }

bool RequestPipeline::runPreChain(HttpRequest& request, HttpResponse& out) const {
  for (const auto& middleware : _requestMiddleware) {
    MiddlewareResult decision;
    try {
      decision = middleware(request);
    } catch (const std::exception& ex) {
      log::error("Exception while applying request middleware: {}", ex.what());
      continue;
    } catch (...) {
      log::error("Unknown exception while applying request middleware");
      continue;
    }
    if (decision.shouldShortCircuit()) {
      out = std::move(decision).takeResponse();
      return true;
    }
  }
  return false;
}

void RequestPipeline::applyResponseMiddleware(const HttpRequest& request, HttpResponse& response) const {
  for (const auto& middleware : _responseMiddleware) {
    try {
      middleware(request, response);
    } catch (const std::exception& ex) {
      log::error("Exception in response middleware: {}", ex.what());
    } catch (...) {
      log::error("Unknown exception in response middleware");
    }
  }
}

}  // namespace uplimit
