#include "common/Context.hpp"

#include "common/Errors.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

using namespace zonesync::common;
using namespace std::chrono_literals;

TEST(ContextTest, DefaultContextNeverExpires) {
  Context ctx;
  EXPECT_FALSE(ctx.isDone());
  EXPECT_FALSE(ctx.remaining().has_value());
  EXPECT_NO_THROW(ctx.throwIfDone());
}

TEST(ContextTest, CancelIsSharedByCopies) {
  Context ctx;
  Context ctxCopy = ctx;
  ctxCopy.cancel();
  EXPECT_TRUE(ctx.cancelled());
  try {
    ctx.throwIfDone();
    FAIL() << "expected CancelledError";
  } catch (const CancelledError& ex) {
    EXPECT_EQ(ex._sErrorCode, "cancelled");
  }
}

TEST(ContextTest, DeadlineExpires) {
  auto ctx = Context::withTimeout(1ms);
  std::this_thread::sleep_for(5ms);
  EXPECT_TRUE(ctx.expired());
  EXPECT_EQ(ctx.remaining(), 0ms);
  try {
    ctx.throwIfDone();
    FAIL() << "expected CancelledError";
  } catch (const CancelledError& ex) {
    EXPECT_EQ(ex._sErrorCode, "deadline_exceeded");
  }
}

TEST(ContextTest, ChildKeepsEarlierDeadlineAndParentCancellation) {
  auto ctxParent = Context::withTimeout(50ms);
  auto ctxChild = ctxParent.childWithTimeout(10s);
  ASSERT_TRUE(ctxChild.remaining().has_value());
  EXPECT_LE(*ctxChild.remaining(), 50ms);

  ctxParent.cancel();
  EXPECT_TRUE(ctxChild.isDone());
}
