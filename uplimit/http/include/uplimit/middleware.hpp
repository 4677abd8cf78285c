#pragma once

#include <cstdint>
#include <functional>
#include <utility>

#include "uplimit/http-request.hpp"
#include "uplimit/http-response.hpp"

namespace uplimit {

// Result of running a request middleware stage.
class MiddlewareResult {
 public:
  enum class Decision : std::uint8_t { Continue, ShortCircuit };

  // Default to Continue.
  MiddlewareResult() noexcept = default;

  // Short-circuits the request with given response.
  explicit MiddlewareResult(HttpResponse response) noexcept
      : _response(std::move(response)), _decision(Decision::ShortCircuit) {}

  static MiddlewareResult Continue() noexcept { return {}; }

  static MiddlewareResult ShortCircuit(HttpResponse response) noexcept { return MiddlewareResult(std::move(response)); }

  [[nodiscard]] Decision decision() const noexcept { return _decision; }

  [[nodiscard]] bool shouldContinue() const noexcept { return _decision == Decision::Continue; }

  [[nodiscard]] bool shouldShortCircuit() const noexcept { return _decision == Decision::ShortCircuit; }

  // Response of a short-circuiting result.
  [[nodiscard]] const HttpResponse& response() const noexcept { return _response; }

  [[nodiscard]] HttpResponse&& takeResponse() && noexcept { return std::move(_response); }

 private:
  HttpResponse _response;
  Decision _decision{Decision::Continue};
};

// Middleware invoked before the handler executes. It may mutate the request (replace its body source for instance)
// and return a short-circuit response to skip subsequent middleware and the handler.
using RequestMiddleware = std::function<MiddlewareResult(HttpRequest&)>;

// Middleware invoked on every response, including short-circuited ones. It can amend or replace the response.
using ResponseMiddleware = std::function<void(const HttpRequest&, HttpResponse&)>;

}  // namespace uplimit
