#include "uplimit/request-pipeline.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "uplimit/http-constants.hpp"
#include "uplimit/http-method.hpp"
#include "uplimit/http-request.hpp"
#include "uplimit/http-response.hpp"
#include "uplimit/http-status-code.hpp"
#include "uplimit/middleware.hpp"
#include "uplimit/request-task.hpp"
#include "uplimit/scripted-body-source.hpp"

namespace uplimit {

class RequestPipelineTest : public ::testing::Test {
 protected:
  RequestPipeline pipeline;
  HttpRequest request{http::Method::POST, "/upload"};
};

TEST_F(RequestPipelineTest, NoHandlerGives404) {
  HttpResponse resp = pipeline.handle(request);
  EXPECT_EQ(resp.status(), http::StatusCodeNotFound);
}

TEST_F(RequestPipelineTest, HandlerResponse) {
  pipeline.setHandler([](HttpRequest& req) {
    HttpResponse resp(http::StatusCodeOK);
    resp.body(std::string(req.path()));
    return resp;
  });

  HttpResponse resp = pipeline.handle(request);
  EXPECT_EQ(resp.status(), http::StatusCodeOK);
  EXPECT_EQ(resp.reason(), http::ReasonOK);
  EXPECT_EQ(resp.body(), "/upload");
  EXPECT_EQ(resp.headerValueOrEmpty(http::ContentType), http::ContentTypeTextPlain);
}

TEST_F(RequestPipelineTest, MiddlewareRunsInOrderAndCanShortCircuit) {
  std::string trace;
  bool handlerCalled = false;
  pipeline
      .addRequestMiddleware([&trace](HttpRequest&) {
        trace += "1";
        return MiddlewareResult::Continue();
      })
      .addRequestMiddleware([&trace](HttpRequest&) {
        trace += "2";
        return MiddlewareResult::ShortCircuit(HttpResponse(http::StatusCodeForbidden));
      })
      .addRequestMiddleware([&trace](HttpRequest&) {
        trace += "3";
        return MiddlewareResult::Continue();
      })
      .setHandler([&handlerCalled](HttpRequest&) {
        handlerCalled = true;
        return HttpResponse();
      });

  HttpResponse resp = pipeline.handle(request);
  EXPECT_EQ(resp.status(), http::StatusCodeForbidden);
  EXPECT_EQ(resp.reason(), http::ReasonForbidden);
  EXPECT_EQ(trace, "12");
  EXPECT_FALSE(handlerCalled);
}

TEST_F(RequestPipelineTest, ThrowingRequestMiddlewareIsSkipped) {
  pipeline.addRequestMiddleware([](HttpRequest&) -> MiddlewareResult { throw std::runtime_error("middleware"); })
      .setHandler([](HttpRequest&) { return HttpResponse(http::StatusCodeNoContent); });

  EXPECT_EQ(pipeline.handle(request).status(), http::StatusCodeNoContent);
}

TEST_F(RequestPipelineTest, HandlerExceptionGives500) {
  pipeline.setHandler([](HttpRequest&) -> HttpResponse { throw std::runtime_error("handler failure"); });

  HttpResponse resp = pipeline.handle(request);
  EXPECT_EQ(resp.status(), http::StatusCodeInternalServerError);
  EXPECT_EQ(resp.body(), "handler failure");
}

TEST_F(RequestPipelineTest, TransportErrorsAreNotTurnedInto413) {
  auto body = test::ScriptedBody({"abc"});
  body.failAfter(0);
  request.setBody(body.source());
  pipeline.setHandler([](HttpRequest& req) {
    HttpResponse resp;
    resp.body(req.readAllBody());
    return resp;
  });

  EXPECT_EQ(pipeline.handle(request).status(), http::StatusCodeInternalServerError);
}

TEST_F(RequestPipelineTest, ResponseMiddlewareAppliesToAllResponses) {
  pipeline.addResponseMiddleware([](const HttpRequest&, HttpResponse& resp) { resp.header("X-Seen", "1"); })
      .addResponseMiddleware([](const HttpRequest&, HttpResponse&) { throw std::runtime_error("ignored"); })
      .addRequestMiddleware([](HttpRequest& req) {
        if (req.headerValue("X-Deny")) {
          return MiddlewareResult::ShortCircuit(HttpResponse(http::StatusCodeForbidden));
        }
        return MiddlewareResult::Continue();
      })
      .setHandler([](HttpRequest&) { return HttpResponse(); });

  EXPECT_EQ(pipeline.handle(request).headerValueOrEmpty("X-Seen"), "1");

  HttpRequest denied(http::Method::GET, "/");
  denied.addHeader("X-Deny", "yes");
  HttpResponse resp = pipeline.handle(denied);
  EXPECT_EQ(resp.status(), http::StatusCodeForbidden);
  EXPECT_EQ(resp.headerValueOrEmpty("X-Seen"), "1");
}

TEST_F(RequestPipelineTest, AsyncHandlerCompletingImmediately) {
  pipeline.setAsyncHandler([](HttpRequest& req) -> RequestTask<HttpResponse> {
    HttpResponse resp(http::StatusCodeCreated);
    resp.body(std::string(req.path()));
    co_return resp;
  });

  auto pending = pipeline.dispatch(request);
  ASSERT_TRUE(pending.done());
  HttpResponse resp = pending.takeResponse();
  EXPECT_EQ(resp.status(), http::StatusCodeCreated);
  EXPECT_EQ(resp.body(), "/upload");
  EXPECT_THROW((void)pending.takeResponse(), std::logic_error);
}

TEST_F(RequestPipelineTest, AsyncHandlerWaitingForBody) {
  auto body = test::ScriptedBody::Async();
  request.setBody(body.source());
  pipeline.setAsyncHandler([](HttpRequest& req) -> RequestTask<HttpResponse> {
    std::string content;
    for (std::string_view chunk = co_await req.readBodyAsync(); !chunk.empty();
         chunk = co_await req.readBodyAsync()) {
      content.append(chunk);
    }
    HttpResponse resp;
    resp.body(std::move(content));
    co_return resp;
  });

  auto pending = pipeline.dispatch(request);
  EXPECT_FALSE(pending.done());
  EXPECT_THROW((void)pending.takeResponse(), std::logic_error);

  body.feed("some ");
  body.feed("data");
  EXPECT_FALSE(pending.done());
  body.finish();

  ASSERT_TRUE(pending.done());
  HttpResponse resp = pending.takeResponse();
  EXPECT_EQ(resp.status(), http::StatusCodeOK);
  EXPECT_EQ(resp.body(), "some data");
}

TEST_F(RequestPipelineTest, DroppedPendingResponseIsNotResumedByTransport) {
  auto body = test::ScriptedBody::Async();
  request.setBody(body.source());
  int nbResumes = 0;
  pipeline.setAsyncHandler([&nbResumes](HttpRequest& req) -> RequestTask<HttpResponse> {
    std::string_view chunk = co_await req.readBodyAsync();
    ++nbResumes;
    HttpResponse resp;
    resp.body(std::string(chunk));
    co_return resp;
  });

  {
    auto pending = pipeline.dispatch(request);
    EXPECT_FALSE(pending.done());
    EXPECT_TRUE(body.hasWaiter());
  }
  EXPECT_FALSE(body.hasWaiter());

  body.feed("late bytes");
  body.finish();
  EXPECT_EQ(nbResumes, 0);
  EXPECT_EQ(body.nbReads(), 0U);
}

TEST_F(RequestPipelineTest, HandleThrowsWhenAsyncHandlerSuspends) {
  auto body = test::ScriptedBody::Async();
  request.setBody(body.source());
  pipeline.setAsyncHandler([](HttpRequest& req) -> RequestTask<HttpResponse> {
    std::string_view chunk = co_await req.readBodyAsync();
    HttpResponse resp;
    resp.body(std::string(chunk));
    co_return resp;
  });

  EXPECT_THROW((void)pipeline.handle(request), std::logic_error);
}

TEST_F(RequestPipelineTest, AsyncHandlerExceptionGives500) {
  pipeline.setAsyncHandler([](HttpRequest&) -> RequestTask<HttpResponse> {
    throw std::runtime_error("async failure");
    co_return HttpResponse();
  });

  HttpResponse resp = pipeline.handle(request);
  EXPECT_EQ(resp.status(), http::StatusCodeInternalServerError);
  EXPECT_EQ(resp.body(), "async failure");
}

TEST_F(RequestPipelineTest, InvalidAsyncTaskGives500) {
  pipeline.setAsyncHandler([](HttpRequest&) { return RequestTask<HttpResponse>(); });

  EXPECT_EQ(pipeline.handle(request).status(), http::StatusCodeInternalServerError);
}

TEST_F(RequestPipelineTest, SetHandlerReplacesAsyncHandler) {
  pipeline.setAsyncHandler([](HttpRequest&) -> RequestTask<HttpResponse> { co_return HttpResponse(); })
      .setHandler([](HttpRequest&) { return HttpResponse(http::StatusCodeNoContent); });

  EXPECT_EQ(pipeline.handle(request).status(), http::StatusCodeNoContent);
}

}  // namespace uplimit
