#include "portico/flow-controller.hpp"

#include <gtest/gtest.h>

#include <coroutine>

namespace portico::http {

namespace {

constexpr FlowWatermarks kWatermarks{100, 40, 50};

// Applies pause / resume decisions the way a connection does after every counter update.
void Apply(FlowController& flow) {
  if (flow.shouldPauseReading()) {
    flow.pauseReading();
  } else if (flow.shouldResumeReading()) {
    flow.resumeReading();
  }
}

}  // namespace

TEST(FlowController, DefaultWatermarks) {
  FlowController flow;
  EXPECT_EQ(flow.watermarks().readHigh, 65536U);
  EXPECT_EQ(flow.watermarks().readLow, 16384U);
  EXPECT_EQ(flow.watermarks().writeHigh, 65536U);
}

TEST(FlowController, PauseAboveHighResumeAtLow) {
  FlowController flow(kWatermarks);
  flow.onBytesRead(100);
  EXPECT_FALSE(flow.shouldPauseReading());
  flow.onBytesRead(1);
  EXPECT_TRUE(flow.shouldPauseReading());
  Apply(flow);
  EXPECT_TRUE(flow.readPaused());

  flow.onBytesConsumed(50);
  EXPECT_FALSE(flow.shouldResumeReading());
  Apply(flow);
  EXPECT_TRUE(flow.readPaused());

  flow.onBytesConsumed(11);
  EXPECT_EQ(flow.unconsumed(), 40U);
  EXPECT_TRUE(flow.shouldResumeReading());
  Apply(flow);
  EXPECT_FALSE(flow.readPaused());
}

TEST(FlowController, ExactlyOnePauseAndOneResumeSignal) {
  FlowController flow(kWatermarks);
  for (int idx = 0; idx < 10; ++idx) {
    flow.onBytesRead(30);
    Apply(flow);
  }
  EXPECT_EQ(flow.nbPauseSignals(), 1U);
  EXPECT_EQ(flow.nbResumeSignals(), 0U);
  while (flow.unconsumed() != 0) {
    flow.onBytesConsumed(10);
    Apply(flow);
  }
  EXPECT_EQ(flow.nbPauseSignals(), 1U);
  EXPECT_EQ(flow.nbResumeSignals(), 1U);
}

TEST(FlowController, RedundantSignalsAreNotCounted) {
  FlowController flow(kWatermarks);
  flow.pauseReading();
  flow.pauseReading();
  flow.resumeReading();
  flow.resumeReading();
  EXPECT_EQ(flow.nbPauseSignals(), 1U);
  EXPECT_EQ(flow.nbResumeSignals(), 1U);
}

TEST(FlowController, ConsumedNeverUnderflows) {
  FlowController flow(kWatermarks);
  flow.onBytesRead(5);
  flow.onBytesConsumed(10);
  EXPECT_EQ(flow.unconsumed(), 0U);
  flow.onBytesFlushed(3);
  EXPECT_EQ(flow.unflushed(), 0U);
}

TEST(FlowController, WritableAtOrBelowHigh) {
  FlowController flow(kWatermarks);
  EXPECT_TRUE(flow.isWritable());
  flow.onBytesQueuedForWrite(50);
  EXPECT_TRUE(flow.isWritable());
  flow.onBytesQueuedForWrite(1);
  EXPECT_FALSE(flow.isWritable());
  flow.onBytesFlushed(1);
  EXPECT_TRUE(flow.isWritable());
}

TEST(FlowController, WritableWaiterIsHandedBackOnceWritable) {
  FlowController flow(kWatermarks);
  EXPECT_FALSE(flow.takeWritableWaiter());

  flow.onBytesQueuedForWrite(80);
  EXPECT_FALSE(flow.isWritable());
  flow.setWritableWaiter(std::noop_coroutine());
  EXPECT_TRUE(flow.hasWritableWaiter());

  // still above the mark: the waiter stays registered
  flow.onBytesFlushed(20);
  EXPECT_FALSE(flow.takeWritableWaiter());
  EXPECT_TRUE(flow.hasWritableWaiter());

  flow.onBytesFlushed(10);
  EXPECT_TRUE(flow.takeWritableWaiter());
  EXPECT_FALSE(flow.hasWritableWaiter());
}

TEST(FlowController, ForcedTakeReturnsWaiterWhileNotWritable) {
  FlowController flow(kWatermarks);
  flow.onBytesQueuedForWrite(80);
  flow.setWritableWaiter(std::noop_coroutine());
  EXPECT_FALSE(flow.takeWritableWaiter());
  EXPECT_TRUE(flow.takeWritableWaiter(true));
  EXPECT_FALSE(flow.hasWritableWaiter());
}

TEST(FlowController, ReleaseAllDropsAccountingAndWaiter) {
  FlowController flow(kWatermarks);
  flow.onBytesRead(500);
  flow.onBytesQueuedForWrite(500);
  flow.setWritableWaiter(std::noop_coroutine());
  EXPECT_TRUE(flow.releaseAll());
  EXPECT_EQ(flow.unconsumed(), 0U);
  EXPECT_EQ(flow.unflushed(), 0U);
  EXPECT_FALSE(flow.hasWritableWaiter());
  EXPECT_TRUE(flow.isWritable());
}

}  // namespace portico::http
