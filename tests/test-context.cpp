#include <gtest/gtest.h>
#include "../weft.h"

#include <chrono>
#include <string>
#include <vector>

using weft::Context;
using weft::HandlerChain;
using weft::Method;
using weft::Status;

class ContextTest : public ::testing::Test {
protected:
    weft::Request request{Method::GET, "/users/42?page=2"};
    Context ctx;
    std::vector<std::string> trace;

    void SetUp() override { request.set_header("X-Trace", "abc"); }

    void run(HandlerChain chain, weft::PathParameters params = {}) {
        ctx.init(request, nullptr, std::move(params), std::make_shared<const HandlerChain>(std::move(chain)),
                 "/users/:id");
        ctx.next();
    }

    weft::Handler recorder(const std::string &name) {
        return [this, name](Context &c) {
            trace.push_back(name + ":before");
            c.next();
            trace.push_back(name + ":after");
        };
    }
};

TEST_F(ContextTest, OnionOrder) {
    run({recorder("A"), recorder("B"), [this](Context &) { trace.push_back("C"); }});

    const std::vector<std::string> expected{"A:before", "B:before", "C", "B:after", "A:after"};
    EXPECT_EQ(trace, expected);
    EXPECT_FALSE(ctx.is_aborted());
    EXPECT_EQ(ctx.handler_index(), 3u);
}

TEST_F(ContextTest, AbortStopsLaterHandlersButUnwindsEarlierOnes) {
    run({recorder("A"),
         [this](Context &c) {
             trace.push_back("B");
             c.abort_with_status(Status::UNAUTHORIZED);
             c.next();
             trace.push_back("B:after");
         },
         [this](Context &) { trace.push_back("C"); }});

    const std::vector<std::string> expected{"A:before", "B", "B:after", "A:after"};
    EXPECT_EQ(trace, expected);
    EXPECT_TRUE(ctx.is_aborted());
    EXPECT_EQ(ctx.response().status().code(), 401);
}

TEST_F(ContextTest, HandlerWithoutNextEndsChain) {
    run({[this](Context &) { trace.push_back("A"); }, [this](Context &) { trace.push_back("B"); }});

    EXPECT_EQ(trace, std::vector<std::string>{"A"});
    EXPECT_FALSE(ctx.is_aborted());
}

TEST_F(ContextTest, NextPastEndIsNoOp) {
    run({[](Context &c) {
        c.next();
        c.next();
    }});
    EXPECT_EQ(ctx.handler_index(), 1u);
    EXPECT_EQ(ctx.chain_size(), 1u);
}

TEST_F(ContextTest, NextWithoutChainDoesNothing) {
    ctx.init(request, nullptr, {}, nullptr);
    EXPECT_NO_THROW(ctx.next());
    EXPECT_EQ(ctx.chain_size(), 0u);
}

TEST_F(ContextTest, RequestAccessors) {
    weft::PathParameters params;
    params.set("id", "42");
    run({[](Context &) {}}, params);

    EXPECT_EQ(ctx.method(), Method::GET);
    EXPECT_EQ(ctx.path(), "/users/42");
    EXPECT_EQ(ctx.full_path(), "/users/:id");
    EXPECT_EQ(ctx.path_param("id"), "42");
    EXPECT_EQ(ctx.path_param("missing", "none"), "none");
    EXPECT_EQ(ctx.query("page"), "2");
    EXPECT_EQ(ctx.header("x-trace"), "abc");
}

TEST_F(ContextTest, UnboundContextThrowsOnRequestAccess) {
    EXPECT_FALSE(ctx.has_request());
    EXPECT_THROW((void)ctx.request(), std::logic_error);
}

TEST_F(ContextTest, RenderHelpers) {
    run({[](Context &c) { c.text("hello", Status::CREATED); }});
    EXPECT_TRUE(ctx.is_written());
    EXPECT_EQ(ctx.response().status().code(), 201);
    EXPECT_EQ(ctx.response().body(), "hello");
    EXPECT_EQ(ctx.response().header("Content-Type"), "text/plain; charset=utf-8");

    run({[](Context &c) {
        qb::json body;
        body["id"] = 42;
        c.json(body);
    }});
    EXPECT_EQ(ctx.response().header("Content-Type"), "application/json; charset=utf-8");
    EXPECT_EQ(qb::json::parse(ctx.response().body())["id"], 42);

    run({[](Context &c) { c.redirect("/login"); }});
    EXPECT_EQ(ctx.response().status().code(), 302);
    EXPECT_EQ(ctx.response().header("Location"), "/login");

    run({[](Context &c) { c.no_content(); }});
    EXPECT_EQ(ctx.response().status().code(), 204);
    EXPECT_TRUE(ctx.response().body().empty());

    auto snap = ctx.snapshot();
    EXPECT_EQ(snap.status.code(), 204);
    EXPECT_EQ(snap.size, 0u);
    EXPECT_TRUE(snap.written);
}

TEST_F(ContextTest, CustomDataRoundTrip) {
    run({[](Context &c) {
        c.set("user", std::string("alice"));
        c.set("attempts", 3);
        c.next();
    }});

    EXPECT_EQ(ctx.get<std::string>("user"), std::optional<std::string>("alice"));
    EXPECT_EQ(ctx.get<int>("attempts"), std::optional<int>(3));
    EXPECT_FALSE(ctx.get<int>("user").has_value());
    EXPECT_FALSE(ctx.get<int>("missing").has_value());
    EXPECT_TRUE(ctx.has("user"));
    EXPECT_EQ(ctx.data_size(), 2u);

    if (auto *attempts = ctx.get_ptr<int>("attempts"))
        ++*attempts;
    EXPECT_EQ(ctx.get<int>("attempts"), std::optional<int>(4));
    EXPECT_EQ(ctx.get_ptr<double>("attempts"), nullptr);

    EXPECT_TRUE(ctx.remove("user"));
    EXPECT_FALSE(ctx.remove("user"));
    EXPECT_FALSE(ctx.has("user"));
}

TEST_F(ContextTest, TypedKeys) {
    static const weft::ContextKey<std::string> user_id{"user_id"};
    run({[](Context &c) { c.set(user_id, std::string("u-1")); }});

    auto value = ctx.get(user_id);
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "u-1");
    EXPECT_TRUE(ctx.has("user_id"));
}

TEST_F(ContextTest, TypedKeysConvertTheValue) {
    static const weft::ContextKey<std::string> user_name{"user_name"};
    static const weft::ContextKey<long> quota{"quota"};
    run({[](Context &c) {
        c.set(user_name, "alice");
        c.set(quota, 5);
    }});

    EXPECT_EQ(ctx.get(user_name).value_or(""), "alice");
    EXPECT_EQ(ctx.get(quota).value_or(0), 5L);
    EXPECT_FALSE(ctx.get<const char *>("user_name").has_value());
}

TEST_F(ContextTest, InitClearsPreviousRequestState) {
    run({[](Context &c) {
        c.set("user", std::string("alice"));
        c.add_error("boom");
        c.set_deadline(Context::Clock::now());
        c.text("first", Status::ACCEPTED);
        c.abort();
    }});
    ASSERT_TRUE(ctx.has("user"));

    run({[](Context &) {}});
    EXPECT_FALSE(ctx.has("user"));
    EXPECT_FALSE(ctx.has_errors());
    EXPECT_FALSE(ctx.is_aborted());
    EXPECT_FALSE(ctx.is_written());
    EXPECT_FALSE(ctx.deadline().has_value());
    EXPECT_EQ(ctx.response().status().code(), 200);
    EXPECT_TRUE(ctx.response().body().empty());
}

TEST_F(ContextTest, ErrorsAccumulate) {
    run({[](Context &c) {
             c.add_error("validation failed", weft::ContextError::Kind::Public);
             c.next();
         },
         [](Context &c) { c.add_error("db slow"); }});

    ASSERT_EQ(ctx.errors().size(), 2u);
    EXPECT_EQ(ctx.errors()[0].message, "validation failed");
    EXPECT_TRUE(ctx.errors()[0].kind == weft::ContextError::Kind::Public);
    EXPECT_TRUE(ctx.errors()[1].kind == weft::ContextError::Kind::Private);
}

TEST_F(ContextTest, AbortWithError) {
    bool reached = false;
    run({[](Context &c) {
             c.abort_with_error(Status::FORBIDDEN, "forbidden");
             c.next();
         },
         [&reached](Context &) { reached = true; }});

    EXPECT_FALSE(reached);
    EXPECT_TRUE(ctx.is_aborted());
    EXPECT_EQ(ctx.response().status().code(), 403);
    EXPECT_EQ(ctx.response().body(), "forbidden");
    ASSERT_EQ(ctx.errors().size(), 1u);
    EXPECT_TRUE(ctx.errors()[0].kind == weft::ContextError::Kind::Public);
}

TEST_F(ContextTest, CancellationFollowsRequest) {
    run({[](Context &) {}});
    EXPECT_FALSE(ctx.is_cancelled());
    request.cancel();
    EXPECT_TRUE(ctx.is_cancelled());
}

TEST_F(ContextTest, PassedDeadlineCancels) {
    run({[](Context &) {}});
    ctx.set_deadline(Context::Clock::now() + std::chrono::hours(1));
    EXPECT_FALSE(ctx.is_cancelled());
    EXPECT_FALSE(ctx.deadline_exceeded());

    ctx.set_deadline(Context::Clock::now() - std::chrono::milliseconds(1));
    EXPECT_TRUE(ctx.deadline_exceeded());
    EXPECT_TRUE(ctx.is_cancelled());

    ctx.clear_deadline();
    EXPECT_FALSE(ctx.is_cancelled());
}

TEST_F(ContextTest, DetachedCopySurvivesReset) {
    weft::PathParameters params;
    params.set("id", "42");
    run({[](Context &c) {
            c.set("user", std::string("alice"));
            c.add_error("note");
        }},
        params);

    weft::DetachedContext detached = ctx.copy();
    ctx.reset();

    EXPECT_FALSE(ctx.has_request());
    EXPECT_EQ(detached.request().path(), "/users/42");
    EXPECT_EQ(detached.path_param("id"), "42");
    EXPECT_EQ(detached.full_path(), "/users/:id");
    EXPECT_EQ(detached.get<std::string>("user"), std::optional<std::string>("alice"));
    EXPECT_EQ(detached.errors().size(), 1u);

    EXPECT_FALSE(detached.is_cancelled());
    request.cancel();
    EXPECT_TRUE(detached.is_cancelled());
}
