#include <gtest/gtest.h>
#include "../weft.h"

#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using weft::Context;
using weft::Method;

class MockWriter : public weft::IResponseWriter {
public:
    std::vector<weft::Response> responses;

    void write(const weft::Response &response) override { responses.push_back(response); }
};

class ConcurrencyTest : public ::testing::Test {
protected:
    static constexpr int kThreads = 8;
    static constexpr int kRequestsPerThread = 200;
};

TEST_F(ConcurrencyTest, ParallelRequestsKeepTheirOwnState) {
    weft::Engine engine;
    engine.use([](Context &ctx) {
        ctx.set("worker", ctx.query("worker"));
        ctx.next();
    });
    engine.get("/echo/:id", [](Context &ctx) {
        std::this_thread::yield();
        ctx.text(ctx.get<std::string>("worker").value_or("?") + ":" + ctx.path_param("id"));
    });
    engine.freeze();

    std::atomic<int> mismatches{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&engine, &mismatches, t] {
            MockWriter writer;
            for (int i = 0; i < kRequestsPerThread; ++i) {
                const std::string expected = std::to_string(t) + ":" + std::to_string(i);
                weft::Request request(Method::GET,
                                      "/echo/" + std::to_string(i) + "?worker=" + std::to_string(t));
                engine.serve_one(request, writer);
                if (writer.responses.size() != static_cast<std::size_t>(i + 1) ||
                    writer.responses.back().body() != expected)
                    mismatches.fetch_add(1);
            }
        });
    }
    for (auto &thread : threads)
        thread.join();

    EXPECT_EQ(mismatches.load(), 0);
    EXPECT_EQ(engine.stats().served, static_cast<std::size_t>(kThreads * kRequestsPerThread));
    EXPECT_EQ(engine.pool().in_use(), 0u);
    EXPECT_LE(engine.pool().allocated(), static_cast<std::size_t>(kThreads));
}

TEST_F(ConcurrencyTest, PanicsInOneThreadDoNotAffectOthers) {
    weft::Engine engine;
    engine.get("/boom", [](Context &) { throw std::runtime_error("boom"); });
    engine.get("/ok", [](Context &ctx) { ctx.text("ok"); });

    std::atomic<int> ok{0};
    std::atomic<int> failed{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&engine, &ok, &failed, t] {
            MockWriter writer;
            for (int i = 0; i < kRequestsPerThread; ++i) {
                const bool explode = (i + t) % 3 == 0;
                weft::Request request(Method::GET, explode ? "/boom" : "/ok");
                engine.serve_one(request, writer);
                const auto code = writer.responses.back().status().code();
                if ((explode && code == 500) || (!explode && code == 200))
                    ok.fetch_add(1);
                else
                    failed.fetch_add(1);
            }
        });
    }
    for (auto &thread : threads)
        thread.join();

    EXPECT_EQ(failed.load(), 0);
    EXPECT_EQ(ok.load(), kThreads * kRequestsPerThread);
    EXPECT_EQ(engine.pool().in_use(), 0u);
}

TEST_F(ConcurrencyTest, SharedCacheAndLimiterUnderContention) {
    auto cache = std::make_shared<weft::FragmentCache>();
    auto limiter = std::make_shared<weft::TokenBucketRateLimiter>(
        weft::TokenBucketOptions().capacity(100).refill_rate(0.001));

    std::atomic<int> admitted{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&cache, &limiter, &admitted, t] {
            for (int i = 0; i < kRequestsPerThread; ++i) {
                const auto key = "fragment:" + std::to_string(i % 16);
                if (!cache->get(key))
                    cache->set(key, "t" + std::to_string(t), std::chrono::minutes(1));
                if (limiter->allow("shared"))
                    admitted.fetch_add(1);
            }
        });
    }
    for (auto &thread : threads)
        thread.join();

    EXPECT_EQ(admitted.load(), 100);
    EXPECT_EQ(cache->size(), 16u);
}
