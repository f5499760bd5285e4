#include <gtest/gtest.h>
#include "../weft.h"

#include <utility>
#include <vector>

using weft::ContextPool;

class ContextPoolTest : public ::testing::Test {
protected:
    ContextPool pool{4};
    weft::Request request{weft::Method::GET, "/"};
};

TEST_F(ContextPoolTest, ReleasedContextIsReused) {
    weft::Context *first = nullptr;
    {
        auto lease = pool.acquire();
        ASSERT_TRUE(lease);
        first = lease.get();
        EXPECT_EQ(pool.in_use(), 1u);
        EXPECT_EQ(pool.idle(), 0u);
    }
    EXPECT_EQ(pool.in_use(), 0u);
    EXPECT_EQ(pool.idle(), 1u);

    auto again = pool.acquire();
    EXPECT_EQ(again.get(), first);
    EXPECT_EQ(pool.allocated(), 1u);
}

TEST_F(ContextPoolTest, ReleasedContextIsReset) {
    {
        auto lease = pool.acquire();
        lease->init(request, nullptr, {}, nullptr);
        lease->set("user", std::string("alice"));
        lease->add_error("boom");
        lease->text("body", weft::Status::CREATED);
    }

    auto lease = pool.acquire();
    EXPECT_FALSE(lease->has_request());
    EXPECT_FALSE(lease->has("user"));
    EXPECT_FALSE(lease->has_errors());
    EXPECT_EQ(lease->response().status().code(), 200);
    EXPECT_TRUE(lease->response().body().empty());
}

TEST_F(ContextPoolTest, ReleaseIsIdempotent) {
    auto lease = pool.acquire();
    lease.release();
    lease.release();
    EXPECT_FALSE(lease);
    EXPECT_EQ(pool.in_use(), 0u);
    EXPECT_EQ(pool.idle(), 1u);
}

TEST_F(ContextPoolTest, MovedLeaseReturnsOnce) {
    {
        auto lease = pool.acquire();
        ContextPool::Lease moved = std::move(lease);
        EXPECT_FALSE(lease);
        EXPECT_TRUE(moved);
        EXPECT_EQ(pool.in_use(), 1u);
    }
    EXPECT_EQ(pool.in_use(), 0u);
    EXPECT_EQ(pool.idle(), 1u);
}

TEST_F(ContextPoolTest, MoveAssignmentReleasesPreviousContext) {
    auto a = pool.acquire();
    auto b = pool.acquire();
    EXPECT_EQ(pool.in_use(), 2u);

    a = std::move(b);
    EXPECT_EQ(pool.in_use(), 1u);
    EXPECT_EQ(pool.idle(), 1u);
}

TEST_F(ContextPoolTest, IdleContextsAreCapped) {
    {
        std::vector<ContextPool::Lease> leases;
        for (int i = 0; i < 6; ++i)
            leases.push_back(pool.acquire());
        EXPECT_EQ(pool.allocated(), 6u);
        EXPECT_EQ(pool.in_use(), 6u);
    }
    EXPECT_EQ(pool.in_use(), 0u);
    EXPECT_EQ(pool.idle(), pool.max_idle());
}

TEST_F(ContextPoolTest, ShrinkFreesIdleContexts) {
    {
        auto a = pool.acquire();
        auto b = pool.acquire();
        auto c = pool.acquire();
    }
    ASSERT_EQ(pool.idle(), 3u);
    pool.shrink(1);
    EXPECT_EQ(pool.idle(), 1u);
    pool.shrink();
    EXPECT_EQ(pool.idle(), 0u);
}
