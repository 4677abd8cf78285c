#include "uplimit/upload-limit.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "uplimit/bounded-body-reader.hpp"
#include "uplimit/http-constants.hpp"
#include "uplimit/http-method.hpp"
#include "uplimit/http-request.hpp"
#include "uplimit/http-response.hpp"
#include "uplimit/http-status-code.hpp"
#include "uplimit/invalid_argument_exception.hpp"
#include "uplimit/limit-policy.hpp"
#include "uplimit/middleware.hpp"
#include "uplimit/payload-too-large.hpp"
#include "uplimit/request-pipeline.hpp"
#include "uplimit/request-task.hpp"
#include "uplimit/scripted-body-source.hpp"
#include "uplimit/upload-limit-config.hpp"

namespace uplimit {

namespace {

HttpResponse EchoBody(HttpRequest& req) {
  HttpResponse resp(http::StatusCodeOK);
  resp.body(req.readAllBody());
  return resp;
}

void ExpectPayloadTooLarge(const HttpResponse& resp, std::string_view expectedBody, bool closeConnection = true) {
  EXPECT_EQ(resp.status(), http::StatusCodePayloadTooLarge);
  EXPECT_EQ(resp.reason(), http::ReasonPayloadTooLarge);
  EXPECT_EQ(resp.headerValueOrEmpty(http::ContentType), http::ContentTypeTextPlain);
  EXPECT_EQ(resp.body(), expectedBody);
  if (closeConnection) {
    EXPECT_EQ(resp.headerValueOrEmpty(http::Connection), http::close);
  } else {
    EXPECT_FALSE(resp.headerValue(http::Connection).has_value());
  }
}

}  // namespace

class UploadLimitTest : public ::testing::Test {
 protected:
  void install(const UploadLimit& limit, RequestPipeline::RequestHandler handler = EchoBody) {
    limit.installInto(pipeline).setHandler(std::move(handler));
  }

  HttpRequest& makeRequest(std::string_view body, std::size_t chunkSize, std::string_view contentLength = {}) {
    scriptedBody = test::ScriptedBody::Split(body, chunkSize);
    request.setBody(scriptedBody.source());
    if (!contentLength.empty()) {
      request.addHeader(http::ContentLength, contentLength);
    }
    return request;
  }

  RequestPipeline pipeline;
  HttpRequest request{http::Method::POST, "/upload"};
  test::ScriptedBody scriptedBody;
};

TEST(MakePayloadTooLargeResponseTest, ResponseShape) {
  HttpResponse resp = MakePayloadTooLargeResponse(PayloadTooLarge(11, 8));
  ExpectPayloadTooLarge(resp, "payload size exceeds configured maximum (11 > 8)");

  resp = MakePayloadTooLargeResponse(PayloadTooLarge(11, 8), false);
  ExpectPayloadTooLarge(resp, "payload size exceeds configured maximum (11 > 8)", false);
}

TEST_F(UploadLimitTest, InvalidConfigThrows) {
  EXPECT_THROW(UploadLimit(UploadLimitConfig{}.withMaxChunkBytes(0)), invalid_argument);
}

TEST_F(UploadLimitTest, FromPolicy) {
  UploadLimit limit(LimitPolicy(123));
  EXPECT_EQ(limit.policy(), LimitPolicy(123));
  EXPECT_EQ(limit.config().maxBodyBytes, 123U);
  EXPECT_TRUE(limit.config().declaredLengthCheck);
}

TEST_F(UploadLimitTest, ContinuesAndWrapsBody) {
  UploadLimit limit(LimitPolicy(10));
  makeRequest("0123456789", 4, "10");

  MiddlewareResult result = limit(request);
  EXPECT_TRUE(result.shouldContinue());
  ASSERT_TRUE(request.hasBody());
  EXPECT_EQ(request.readAllBody(), "0123456789");
  EXPECT_EQ(request.bodyLimitViolation(), nullptr);
}

TEST_F(UploadLimitTest, DeclaredLengthAboveLimitIsRejectedWithoutReading) {
  UploadLimit limit(LimitPolicy(10));
  makeRequest("0123456789A", 4, "11");

  MiddlewareResult result = limit(request);
  ASSERT_TRUE(result.shouldShortCircuit());
  ExpectPayloadTooLarge(result.response(), "payload size exceeds configured maximum (11 > 10)");
  EXPECT_EQ(scriptedBody.nbReads(), 0U);
}

TEST_F(UploadLimitTest, HandlerNotCalledOnEarlyRejection) {
  bool handlerCalled = false;
  install(UploadLimit(LimitPolicy(10)), [&handlerCalled](HttpRequest& req) {
    handlerCalled = true;
    return EchoBody(req);
  });
  makeRequest(std::string(1000, 'a'), 100, "1000");

  ExpectPayloadTooLarge(pipeline.handle(request), "payload size exceeds configured maximum (1000 > 10)");
  EXPECT_FALSE(handlerCalled);
  EXPECT_EQ(scriptedBody.nbReads(), 0U);
}

TEST_F(UploadLimitTest, MalformedDeclaredLengthFallsBackToStreamingCheck) {
  install(UploadLimit(LimitPolicy(10)));
  makeRequest(std::string(20, 'a'), 8, "20, 20");

  ExpectPayloadTooLarge(pipeline.handle(request), "payload size exceeds configured maximum (16 > 10)");
  EXPECT_GT(scriptedBody.nbReads(), 0U);
}

TEST_F(UploadLimitTest, TransferEncodingBypassesDeclaredLength) {
  install(UploadLimit(LimitPolicy(10)));
  makeRequest("short", 8, "1000");
  request.addHeader(http::TransferEncoding, http::chunked);

  HttpResponse resp = pipeline.handle(request);
  EXPECT_EQ(resp.status(), http::StatusCodeOK);
  EXPECT_EQ(resp.body(), "short");
}

TEST_F(UploadLimitTest, DeclaredLengthCheckCanBeDisabled) {
  install(UploadLimit(UploadLimitConfig{}.withMaxBodyBytes(10U).withDeclaredLengthCheck(false)));
  makeRequest(std::string(30, 'a'), 8, "30");

  ExpectPayloadTooLarge(pipeline.handle(request), "payload size exceeds configured maximum (16 > 10)");
  EXPECT_EQ(scriptedBody.nbReads(), 2U);
}

TEST_F(UploadLimitTest, FastPathAndStreamingRejectionsLookTheSame) {
  UploadLimit limit(LimitPolicy(10));
  install(limit);

  makeRequest(std::string(12, 'a'), 12, "12");
  HttpResponse early = pipeline.handle(request);

  HttpRequest streamed(http::Method::POST, "/upload");
  auto body = test::ScriptedBody::Split(std::string(12, 'a'), 12);
  streamed.setBody(body.source());
  HttpResponse late = pipeline.handle(streamed);

  EXPECT_EQ(early.status(), late.status());
  EXPECT_EQ(early.reason(), late.reason());
  EXPECT_EQ(early.headers(), late.headers());
  EXPECT_EQ(early.body(), late.body());
}

TEST_F(UploadLimitTest, CloseConnectionCanBeDisabled) {
  install(UploadLimit(UploadLimitConfig{}.withMaxBodyBytes(4U).withCloseConnectionOnReject(false)));

  makeRequest("12345", 5);
  ExpectPayloadTooLarge(pipeline.handle(request), "payload size exceeds configured maximum (5 > 4)", false);
}

TEST_F(UploadLimitTest, StreamingScenario) {
  std::vector<std::size_t> delivered;
  bool handlerSucceeded = false;
  install(UploadLimit(LimitPolicy(4096)), [&](HttpRequest& req) {
    for (std::string_view chunk = req.readBody(); !chunk.empty(); chunk = req.readBody()) {
      delivered.push_back(chunk.size());
    }
    handlerSucceeded = true;
    return HttpResponse(http::StatusCodeOK);
  });
  makeRequest(std::string(5000, 'u'), 1000);

  ExpectPayloadTooLarge(pipeline.handle(request), "payload size exceeds configured maximum (5000 > 4096)");
  EXPECT_EQ(delivered, std::vector<std::size_t>(4, 1000));
  EXPECT_FALSE(handlerSucceeded);
}

TEST_F(UploadLimitTest, HandlerSwallowingViolationStillGets413) {
  install(UploadLimit(LimitPolicy(8)), [](HttpRequest& req) {
    try {
      return EchoBody(req);
    } catch (const PayloadTooLarge&) {
      return HttpResponse(http::StatusCodeOK);
    }
  });
  makeRequest(std::string(11, 'a'), 11);

  ExpectPayloadTooLarge(pipeline.handle(request), "payload size exceeds configured maximum (11 > 8)");
}

TEST_F(UploadLimitTest, InstallIntoRegistersBothMiddleware) {
  const UploadLimit limit(LimitPolicy(8));
  RequestPipeline& installed = limit.installInto(pipeline);
  EXPECT_EQ(&installed, &pipeline);

  bool handlerSawViolation = false;
  pipeline.setHandler([&handlerSawViolation](HttpRequest& req) {
    try {
      return EchoBody(req);
    } catch (const PayloadTooLarge&) {
      handlerSawViolation = true;
      return HttpResponse(http::StatusCodeNoContent);
    }
  });
  makeRequest(std::string(9, 'i'), 4);

  ExpectPayloadTooLarge(pipeline.handle(request), "payload size exceeds configured maximum (9 > 8)");
  EXPECT_TRUE(handlerSawViolation);
}

TEST_F(UploadLimitTest, BodyWithinLimitReachesHandler) {
  install(UploadLimit(LimitPolicy(8)));
  makeRequest("12345678", 3, "8");

  HttpResponse resp = pipeline.handle(request);
  EXPECT_EQ(resp.status(), http::StatusCodeOK);
  EXPECT_EQ(resp.body(), "12345678");
  EXPECT_FALSE(resp.headerValue(http::Connection).has_value());
}

TEST_F(UploadLimitTest, RequestWithoutBodyGetsEmptyBoundedBody) {
  UploadLimit limit(LimitPolicy(0));
  HttpRequest get(http::Method::GET, "/");

  EXPECT_TRUE(limit(get).shouldContinue());
  ASSERT_TRUE(get.hasBody());
  EXPECT_EQ(get.readAllBody(), "");
  EXPECT_EQ(get.bodyLimitViolation(), nullptr);
}

TEST_F(UploadLimitTest, ZeroLimitRejectsAnyByte) {
  install(UploadLimit(LimitPolicy(0)));
  makeRequest("x", 1);

  ExpectPayloadTooLarge(pipeline.handle(request), "payload size exceeds configured maximum (1 > 0)");
}

TEST_F(UploadLimitTest, ResponseMiddlewareLeavesOtherResponsesUntouched) {
  UploadLimit limit(LimitPolicy(8));
  HttpRequest req(http::Method::POST, "/");
  HttpResponse resp(http::StatusCodeCreated);
  resp.body("created");

  limit(req, resp);
  EXPECT_EQ(resp.status(), http::StatusCodeCreated);
  EXPECT_EQ(resp.body(), "created");
}

TEST_F(UploadLimitTest, MaxChunkBytesIsForwardedToReader) {
  install(UploadLimit(UploadLimitConfig{}.withMaxBodyBytes(1000U).withMaxChunkBytes(16U)));
  makeRequest(std::string(100, 'c'), 100);

  HttpResponse resp = pipeline.handle(request);
  EXPECT_EQ(resp.body(), std::string(100, 'c'));
  EXPECT_EQ(scriptedBody.largestRequest(), 16U);
}

TEST_F(UploadLimitTest, BodyCompletionCallback) {
  std::vector<BodyOutcome> outcomes;
  UploadLimit limit(LimitPolicy(10));
  limit.onBodyCompletion([&outcomes](const BodyOutcome& outcome) { outcomes.push_back(outcome); });
  install(limit);

  makeRequest("12345", 5);
  EXPECT_EQ(pipeline.handle(request).status(), http::StatusCodeOK);

  HttpRequest tooLarge(http::Method::POST, "/upload");
  auto body = test::ScriptedBody::Split(std::string(11, 'a'), 6);
  tooLarge.setBody(body.source());
  EXPECT_EQ(pipeline.handle(tooLarge).status(), http::StatusCodePayloadTooLarge);

  ASSERT_EQ(outcomes.size(), 2U);
  EXPECT_EQ(outcomes[0].state, BodyReadState::Exhausted);
  EXPECT_EQ(outcomes[0].consumed, 5U);
  EXPECT_EQ(outcomes[1].state, BodyReadState::Exceeded);
  EXPECT_EQ(outcomes[1].consumed, 6U);
  EXPECT_EQ(outcomes[1].observed, 11U);
  EXPECT_EQ(outcomes[1].limit, 10U);
}

TEST_F(UploadLimitTest, AsyncHandlerStreamingViolation) {
  UploadLimit(LimitPolicy(6)).installInto(pipeline).setAsyncHandler([](HttpRequest& req) -> RequestTask<HttpResponse> {
        std::string content;
        for (std::string_view chunk = co_await req.readBodyAsync(); !chunk.empty();
             chunk = co_await req.readBodyAsync()) {
          content.append(chunk);
        }
        HttpResponse resp;
        resp.body(std::move(content));
        co_return resp;
      });

  auto body = test::ScriptedBody::Async();
  request.setBody(body.source());
  auto pending = pipeline.dispatch(request);
  EXPECT_FALSE(pending.done());

  body.feed("abcd");
  EXPECT_FALSE(pending.done());
  body.feed("efgh");
  ASSERT_TRUE(pending.done());

  ExpectPayloadTooLarge(pending.takeResponse(), "payload size exceeds configured maximum (8 > 6)");
  EXPECT_EQ(body.bytesUnread(), 0U);
}

}  // namespace uplimit
