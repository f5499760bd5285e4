#include <gtest/gtest.h>
#include "../weft.h"

#include <memory>
#include <string>
#include <type_traits>
#include <vector>

using weft::Context;
using weft::Engine;
using weft::Method;
using weft::RouteGroup;

class NullWriter : public weft::IResponseWriter {
public:
    weft::Response last;
    void write(const weft::Response &response) override { last = response; }
};

// Appends its tag to a shared trace around the rest of the chain.
class TraceMiddleware : public weft::IMiddleware {
public:
    TraceMiddleware(std::vector<std::string> &trace, std::string tag)
        : _trace(trace), _tag(std::move(tag)) {}

    void process(Context &ctx) override {
        _trace.push_back(_tag);
        ctx.next();
    }

    [[nodiscard]] std::string name() const override { return "Trace(" + _tag + ")"; }

private:
    std::vector<std::string> &_trace;
    std::string _tag;
};

class RouteGroupTest : public ::testing::Test {
protected:
    Engine engine;
    NullWriter writer;
    std::vector<std::string> trace;

    weft::Handler tag(const std::string &name) {
        return [this, name](Context &ctx) {
            trace.push_back(name);
            ctx.next();
        };
    }

    weft::Handler terminal(const std::string &name) {
        return [this, name](Context &ctx) {
            trace.push_back(name);
            ctx.text(name);
        };
    }

    weft::Response serve(Method method, const std::string &target) {
        weft::Request request(method, target);
        engine.serve_one(request, writer);
        return writer.last;
    }
};

TEST_F(RouteGroupTest, JoinPaths) {
    EXPECT_EQ(RouteGroup::join_paths("/api", "/users"), "/api/users");
    EXPECT_EQ(RouteGroup::join_paths("/api/", "/users"), "/api/users");
    EXPECT_EQ(RouteGroup::join_paths("/api", "users"), "/api/users");
    EXPECT_EQ(RouteGroup::join_paths("/api", "/"), "/api/");
    EXPECT_EQ(RouteGroup::join_paths("/api", ""), "/api");
    EXPECT_EQ(RouteGroup::join_paths("", "/users"), "/users");
    EXPECT_EQ(RouteGroup::join_paths("", ""), "/");
}

TEST_F(RouteGroupTest, MiddlewareRunsOuterToInner) {
    engine.use(tag("global"));
    auto &api = engine.group("/api", tag("api"));
    auto &v1 = api.group("/v1", tag("v1"));
    v1.get("/items/:id", tag("route"), terminal("handler"));

    auto response = serve(Method::GET, "/api/v1/items/9");
    EXPECT_EQ(response.body(), "handler");
    const std::vector<std::string> expected{"global", "api", "v1", "route", "handler"};
    EXPECT_EQ(trace, expected);
}

TEST_F(RouteGroupTest, SubgroupsAreOwnedByTheirParent) {
    static_assert(!std::is_constructible<RouteGroup, weft::RouteTree &, std::string, weft::HandlerChain>::value,
                  "groups are created through group()");

    auto &first = engine.group("/a", tag("a"));
    auto &nested = first.group("/b", tag("b"));
    auto &second = engine.group("/c");
    EXPECT_NE(&first, &second);
    EXPECT_EQ(nested.prefix(), "/a/b");
    EXPECT_EQ(nested.middleware_count(), 2u);
    nested.get("/leaf", terminal("leaf"));

    EXPECT_EQ(serve(Method::GET, "/a/b/leaf").body(), "leaf");
    const std::vector<std::string> expected{"a", "b", "leaf"};
    EXPECT_EQ(trace, expected);
}

TEST_F(RouteGroupTest, SiblingGroupsAreIndependent) {
    auto &admin = engine.group("/admin", tag("admin"));
    auto &pub = engine.group("/public");
    admin.get("/stats", terminal("stats"));
    pub.get("/stats", terminal("public-stats"));

    serve(Method::GET, "/public/stats");
    EXPECT_EQ(trace, std::vector<std::string>{"public-stats"});
    EXPECT_EQ(admin.middleware_count(), 1u);
    EXPECT_EQ(pub.middleware_count(), 0u);
    EXPECT_EQ(pub.prefix(), "/public");
}

TEST_F(RouteGroupTest, MiddlewareAddedLaterOnlyAffectsLaterRoutes) {
    engine.get("/before", terminal("before"));
    engine.use(tag("late"));
    engine.get("/after", terminal("after"));

    serve(Method::GET, "/before");
    EXPECT_EQ(trace, std::vector<std::string>{"before"});

    trace.clear();
    serve(Method::GET, "/after");
    const std::vector<std::string> expected{"late", "after"};
    EXPECT_EQ(trace, expected);
}

TEST_F(RouteGroupTest, MiddlewareObjectsAreAccepted) {
    engine.use(std::make_shared<TraceMiddleware>(trace, "object"));
    engine.get("/x", terminal("x"));

    serve(Method::GET, "/x");
    const std::vector<std::string> expected{"object", "x"};
    EXPECT_EQ(trace, expected);
}

TEST_F(RouteGroupTest, AnyRegistersCommonMethods) {
    engine.any("/echo", [](Context &ctx) { ctx.text(std::string(ctx.method().name())); });

    EXPECT_EQ(serve(Method::GET, "/echo").body(), "GET");
    EXPECT_EQ(serve(Method::PATCH, "/echo").body(), "PATCH");
    EXPECT_EQ(serve(Method::DEL, "/echo").body(), "DELETE");
    EXPECT_EQ(engine.route_list().size(), weft::Method::common().size());
}

TEST_F(RouteGroupTest, VerbHelpersUseTheirMethod) {
    engine.put("/r", terminal("put"));
    engine.del("/r", terminal("del"));
    engine.patch("/r", terminal("patch"));
    engine.options("/r", terminal("options"));
    engine.head("/r", terminal("head"));
    engine.post("/r", terminal("post"));

    EXPECT_EQ(serve(Method::PUT, "/r").body(), "put");
    EXPECT_EQ(serve(Method::DEL, "/r").body(), "del");
    EXPECT_EQ(serve(Method::OPTIONS, "/r").body(), "options");
    EXPECT_EQ(serve(Method::HEAD, "/r").body(), "head");
    EXPECT_EQ(serve(Method::GET, "/r").status().code(), 404);
}

TEST_F(RouteGroupTest, EmptyHandlersAreRejected) {
    EXPECT_THROW(engine.get("/x", weft::Handler()), std::invalid_argument);
    EXPECT_THROW(engine.use(std::shared_ptr<weft::IMiddleware>()), std::invalid_argument);
    EXPECT_TRUE(engine.route_list().empty());
}

TEST_F(RouteGroupTest, ConflictsSurfaceAtRegistration) {
    engine.group("/users").get("/:id", terminal("a"));
    EXPECT_THROW(engine.get("/users/:name/posts", terminal("b")), weft::RouteConflictError);
    EXPECT_THROW(engine.get("/a//b", terminal("c")), weft::RoutePatternError);
}
