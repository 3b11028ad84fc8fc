#include "Context.hpp"

#include <gtest/gtest.h>

#include <thread>

using namespace std::chrono_literals;

TEST(ContextTest, BackgroundNeverExpires) {
    Context ctx = Context::background();

    EXPECT_FALSE(ctx.done());
    EXPECT_FALSE(ctx.deadline().has_value());
    EXPECT_FALSE(ctx.remaining().has_value());
}

TEST(ContextTest, TimeoutExpires) {
    Context ctx = Context::withTimeout(20ms);
    EXPECT_FALSE(ctx.isExpired());
    ASSERT_TRUE(ctx.remaining().has_value());
    EXPECT_LE(ctx.remaining()->count(), 20);

    std::this_thread::sleep_for(40ms);

    EXPECT_TRUE(ctx.isExpired());
    EXPECT_TRUE(ctx.done());
    EXPECT_EQ(ctx.remaining()->count(), 0);
}

TEST(ContextTest, PastDeadlineIsExpired) {
    Context ctx = Context::withDeadline(Context::Clock::now() - 1s);

    EXPECT_TRUE(ctx.isExpired());
    EXPECT_FALSE(ctx.isCanceled());
}

TEST(ContextTest, CancelIsSharedByCopies) {
    Context ctx = Context::background();
    Context copy = ctx;

    copy.cancel();

    EXPECT_TRUE(ctx.isCanceled());
    EXPECT_TRUE(ctx.done());
}
