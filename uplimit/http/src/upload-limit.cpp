#include "uplimit/upload-limit.hpp"

#include <cstdint>
#include <memory>
#include <utility>

#include "uplimit/body-source.hpp"
#include "uplimit/bounded-body-reader.hpp"
#include "uplimit/declared-length.hpp"
#include "uplimit/http-constants.hpp"
#include "uplimit/http-method.hpp"
#include "uplimit/http-request.hpp"
#include "uplimit/http-response.hpp"
#include "uplimit/http-status-code.hpp"
#include "uplimit/limit-policy.hpp"
#include "uplimit/log.hpp"
#include "uplimit/middleware.hpp"
#include "uplimit/payload-too-large.hpp"
#include "uplimit/request-pipeline.hpp"
#include "uplimit/unitsparser.hpp"
#include "uplimit/upload-limit-config.hpp"

namespace uplimit {

HttpResponse MakePayloadTooLargeResponse(const PayloadTooLarge& error, bool closeConnection) {
  HttpResponse resp(http::StatusCodePayloadTooLarge, http::ReasonPayloadTooLarge);
  resp.body(error.what());
  if (closeConnection) {
    resp.header(http::Connection, http::close);
  }
  return resp;
}

UploadLimit::UploadLimit(UploadLimitConfig config) : _config(std::move(config)) {
  _config.validate();
  log::info("Request body limit set to {} bytes ({}), declared length check {}", _config.maxBodyBytes,
            BytesToStr(static_cast<int64_t>(_config.maxBodyBytes)), _config.declaredLengthCheck ? "on" : "off");
}

UploadLimit::UploadLimit(LimitPolicy policy) : UploadLimit(UploadLimitConfig{}.withMaxBodyBytes(policy.maxBytes())) {}

MiddlewareResult UploadLimit::operator()(HttpRequest& request) const {
  const LimitPolicy limitPolicy = _config.policy();
  if (_config.declaredLengthCheck) {
    const DeclaredLength declared = request.declaredLength();
    if (declared.isValid() && !limitPolicy.allows(declared.value)) {
      log::debug("Rejecting {} {} with declared length {} above limit of {} bytes", http::MethodToStr(request.method()),
                 request.path(), declared.value, limitPolicy.maxBytes());
      return MiddlewareResult::ShortCircuit(MakePayloadTooLargeResponse(
          PayloadTooLarge(declared.value, limitPolicy.maxBytes()), _config.closeConnectionOnReject));
    }
  }

  std::unique_ptr<BodySource> inner = request.takeBody();
  if (!inner) {
    inner = std::make_unique<BufferedBodySource>();
  }
  auto reader = std::make_unique<BoundedBodyReader>(limitPolicy, std::move(inner), _config.maxChunkBytes);
  if (_completionCallback) {
    reader->onCompletion(_completionCallback);
  }
  request.setBody(std::move(reader));
  return MiddlewareResult::Continue();
}

void UploadLimit::operator()(const HttpRequest& request, HttpResponse& response) const {
  const PayloadTooLarge* violation = request.bodyLimitViolation();
  if (violation != nullptr) {
    response = MakePayloadTooLargeResponse(*violation, _config.closeConnectionOnReject);
  }
}

RequestPipeline& UploadLimit::installInto(RequestPipeline& pipeline) const {
  return pipeline.addRequestMiddleware(requestMiddleware()).addResponseMiddleware(responseMiddleware());
}

RequestMiddleware UploadLimit::requestMiddleware() const {
  return [limit = *this](HttpRequest& request) { return limit(request); };
}

ResponseMiddleware UploadLimit::responseMiddleware() const {
  return [limit = *this](const HttpRequest& request, HttpResponse& response) { limit(request, response); };
}

UploadLimit& UploadLimit::onBodyCompletion(CompletionCallback callback) {
  _completionCallback = std::move(callback);
  return *this;
}

}  // namespace uplimit
