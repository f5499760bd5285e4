#include <gtest/gtest.h>
#include "../weft.h"

#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using weft::Context;
using weft::Method;
using weft::Status;

class MockWriter : public weft::IResponseWriter {
public:
    std::vector<weft::Response> responses;

    void write(const weft::Response &response) override { responses.push_back(response); }
};

class TimeoutMiddlewareTest : public ::testing::Test {
protected:
    weft::Engine engine;
    MockWriter writer;

    weft::Response serve(const std::string &target) {
        weft::Request request(Method::GET, target);
        engine.serve_one(request, writer);
        return writer.responses.back();
    }
};

TEST_F(TimeoutMiddlewareTest, FastHandlerIsUntouched) {
    engine.use(weft::timeout_middleware(1s));
    engine.get("/fast", [](Context &ctx) { ctx.text("done"); });

    auto response = serve("/fast");
    EXPECT_EQ(response.status().code(), 200);
    EXPECT_EQ(response.body(), "done");
}

TEST_F(TimeoutMiddlewareTest, SlowHandlerIsReplacedByTimeout) {
    std::vector<weft::ContextError> errors;
    engine.on_request_finalized([&errors](const Context &ctx) { errors = ctx.errors(); });
    engine.use(weft::timeout_middleware(10ms));
    engine.get("/slow", [](Context &ctx) {
        std::this_thread::sleep_for(30ms);
        ctx.set_header("X-Partial", "1");
        ctx.text("too late");
    });

    auto response = serve("/slow");
    EXPECT_EQ(response.status().code(), 504);
    EXPECT_EQ(response.body(), "Request timed out");
    EXPECT_FALSE(response.has_header("X-Partial"));
    ASSERT_EQ(errors.size(), 1u);
}

TEST_F(TimeoutMiddlewareTest, OuterMiddlewareHeadersSurviveTimeout) {
    auto limiter = std::make_shared<weft::FixedWindowRateLimiter>(
        weft::RateLimitOptions().max_requests(10).window(1min));
    engine.use(weft::rate_limit_middleware(limiter));
    engine.use(weft::timeout_middleware(10ms));
    engine.get("/slow", [](Context &ctx) {
        std::this_thread::sleep_for(30ms);
        ctx.set_header("X-Partial", "1");
        ctx.text("too late");
    });

    auto response = serve("/slow");
    EXPECT_EQ(response.status().code(), 504);
    EXPECT_EQ(response.body(), "Request timed out");
    EXPECT_EQ(response.header("X-RateLimit-Limit"), "10");
    EXPECT_EQ(response.header("X-RateLimit-Remaining"), "9");
    EXPECT_EQ(response.header("Content-Type"), "text/plain; charset=utf-8");
    EXPECT_FALSE(response.has_header("X-Partial"));
}

TEST_F(TimeoutMiddlewareTest, HandlersCanObserveTheDeadline) {
    bool observed = false;
    engine.use(weft::timeout_middleware(5ms, Status::SERVICE_UNAVAILABLE));
    engine.get("/poll", [&observed](Context &ctx) {
        const auto give_up = Context::Clock::now() + 2s;
        while (!ctx.is_cancelled() && Context::Clock::now() < give_up)
            std::this_thread::sleep_for(1ms);
        observed = ctx.is_cancelled();
    });

    auto response = serve("/poll");
    EXPECT_TRUE(observed);
    EXPECT_EQ(response.status().code(), 503);
}

TEST_F(TimeoutMiddlewareTest, NonPositiveTimeoutIsRejected) {
    EXPECT_THROW(weft::TimeoutMiddleware(0ms), std::invalid_argument);
    EXPECT_THROW(weft::TimeoutMiddleware(-1s), std::invalid_argument);
}
