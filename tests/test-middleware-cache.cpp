#include <gtest/gtest.h>
#include "../weft.h"

#include <chrono>
#include <memory>
#include <string>
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

class ResponseCacheTest : public ::testing::Test {
protected:
    std::shared_ptr<weft::FragmentCache::Clock::time_point> now =
        std::make_shared<weft::FragmentCache::Clock::time_point>(weft::FragmentCache::Clock::now());
    std::shared_ptr<weft::FragmentCache> cache;
    weft::Engine engine;
    MockWriter writer;
    int renders = 0;

    void SetUp() override {
        auto current = now;
        cache = std::make_shared<weft::FragmentCache>(weft::FragmentCacheOptions(),
                                                      [current] { return *current; });
    }

    void install(weft::ResponseCacheOptions options = weft::ResponseCacheOptions().ttl(5s)) {
        engine.use(weft::response_cache_middleware(cache, std::move(options)));
        engine.get("/articles/:id", [this](Context &ctx) {
            ++renders;
            if (ctx.path_param("id") == "missing") {
                ctx.text("no such article", Status::NOT_FOUND);
                return;
            }
            ctx.html("<p>article " + ctx.path_param("id") + " v" + std::to_string(renders) + "</p>");
        });
        engine.post("/articles/:id", [this](Context &ctx) {
            ++renders;
            ctx.text("saved");
        });
        engine.get("/flaky", [this](Context &ctx) {
            ++renders;
            ctx.add_error("partial render");
            ctx.text("degraded");
        });
    }

    weft::Response serve(Method method, const std::string &target) {
        weft::Request request(method, target);
        engine.serve_one(request, writer);
        return writer.responses.back();
    }
};

TEST_F(ResponseCacheTest, SecondRequestIsServedFromCache) {
    install();

    auto miss = serve(Method::GET, "/articles/1");
    EXPECT_EQ(miss.header("X-Cache"), "MISS");
    EXPECT_EQ(miss.body(), "<p>article 1 v1</p>");

    auto hit = serve(Method::GET, "/articles/1");
    EXPECT_EQ(hit.status().code(), 200);
    EXPECT_EQ(hit.header("X-Cache"), "HIT");
    EXPECT_EQ(hit.body(), "<p>article 1 v1</p>");
    EXPECT_EQ(hit.header("Content-Type"), "text/html; charset=utf-8");
    EXPECT_EQ(renders, 1);
}

TEST_F(ResponseCacheTest, EntriesExpire) {
    install();

    serve(Method::GET, "/articles/1");
    *now += 5s;
    auto again = serve(Method::GET, "/articles/1");
    EXPECT_EQ(again.header("X-Cache"), "MISS");
    EXPECT_EQ(again.body(), "<p>article 1 v2</p>");
    EXPECT_EQ(renders, 2);
}

TEST_F(ResponseCacheTest, QueryIsPartOfTheKey) {
    install();

    serve(Method::GET, "/articles/1?lang=en");
    serve(Method::GET, "/articles/1?lang=fr");
    EXPECT_EQ(renders, 2);
    EXPECT_EQ(serve(Method::GET, "/articles/1?lang=en").header("X-Cache"), "HIT");
}

TEST_F(ResponseCacheTest, UnsafeMethodsBypassCache) {
    install();

    serve(Method::POST, "/articles/1");
    auto second = serve(Method::POST, "/articles/1");
    EXPECT_EQ(renders, 2);
    EXPECT_FALSE(second.has_header("X-Cache"));
}

TEST_F(ResponseCacheTest, NonCacheableStatusIsNotStored) {
    install();

    serve(Method::GET, "/articles/missing");
    auto second = serve(Method::GET, "/articles/missing");
    EXPECT_EQ(second.status().code(), 404);
    EXPECT_EQ(second.header("X-Cache"), "MISS");
    EXPECT_EQ(renders, 2);
}

TEST_F(ResponseCacheTest, ResponsesWithErrorsAreNotStored) {
    install();

    serve(Method::GET, "/flaky");
    serve(Method::GET, "/flaky");
    EXPECT_EQ(renders, 2);
    EXPECT_EQ(cache->size(), 0u);
}

TEST_F(ResponseCacheTest, CustomKeyAndStatuses) {
    install(weft::ResponseCacheOptions()
                .ttl(1min)
                .cacheable_statuses({Status::OK, Status::NOT_FOUND})
                .key_function([](const Context &ctx) { return "article:" + ctx.path_param("id"); }));

    serve(Method::GET, "/articles/missing");
    auto cached = serve(Method::GET, "/articles/missing?ignored=1");
    EXPECT_EQ(cached.header("X-Cache"), "HIT");
    EXPECT_EQ(cached.status().code(), 404);
    EXPECT_EQ(cached.body(), "no such article");
    EXPECT_EQ(renders, 1);
    EXPECT_TRUE(cache->get("article:missing").has_value());
}

TEST_F(ResponseCacheTest, NullCacheIsRejected) {
    EXPECT_THROW((void)weft::response_cache_middleware(nullptr), std::invalid_argument);
}

TEST_F(ResponseCacheTest, HitReplaysEveryHeaderOfTheMiss) {
    engine.use(weft::response_cache_middleware(cache, weft::ResponseCacheOptions().ttl(5s)));
    engine.get("/raw", [this](Context &ctx) {
        ++renders;
        ctx.response().set_header("ETag", "v1");
        ctx.response().add_header("Link", "</a>; rel=next");
        ctx.response().add_header("Link", "</b>; rel=prev");
        ctx.response().set_body("x");
    });

    auto miss = serve(Method::GET, "/raw");
    auto hit = serve(Method::GET, "/raw");
    EXPECT_EQ(renders, 1);
    EXPECT_EQ(hit.header("X-Cache"), "HIT");
    EXPECT_EQ(hit.status().code(), miss.status().code());
    EXPECT_EQ(hit.body(), "x");
    EXPECT_EQ(hit.header("ETag"), "v1");
    EXPECT_EQ(hit.header("Link", 0), "</a>; rel=next");
    EXPECT_EQ(hit.header("Link", 1), "</b>; rel=prev");
    EXPECT_FALSE(miss.has_header("Content-Type"));
    EXPECT_FALSE(hit.has_header("Content-Type"));
}

TEST_F(ResponseCacheTest, ForeignEntryUnderTheKeyIsReplaced) {
    install();
    cache->set_for("GET /articles/1", "not a cached response", 1min);

    auto response = serve(Method::GET, "/articles/1");
    EXPECT_EQ(response.status().code(), 200);
    EXPECT_EQ(response.header("X-Cache"), "MISS");
    EXPECT_EQ(response.body(), "<p>article 1 v1</p>");
    EXPECT_EQ(serve(Method::GET, "/articles/1").header("X-Cache"), "HIT");
    EXPECT_EQ(renders, 1);
}
