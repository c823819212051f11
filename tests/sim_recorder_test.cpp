// File: tests/sim_recorder_test.cpp
#include <gtest/gtest.h>

#include "sr/adapters/sim_recorder/sim_recorder_client.hpp"

namespace sr {
namespace {

TEST(SimRecorderClientTest, CallsNeedAConnection) {
  SimRecorderClient rec;
  EXPECT_EQ(rec.start_recording().code(), Status::Code::kConnectionError);
  EXPECT_EQ(rec.is_recording().status().code(), Status::Code::kConnectionError);

  ASSERT_TRUE(rec.connect().ok());
  EXPECT_TRUE(rec.connected());
  EXPECT_TRUE(rec.start_recording().ok());
  EXPECT_TRUE(*rec.is_recording());

  rec.close();
  rec.close();
  EXPECT_FALSE(rec.connected());
  EXPECT_EQ(rec.stop_recording().code(), Status::Code::kConnectionError);
}

TEST(SimRecorderClientTest, UnreachableRefusesConnect) {
  SimRecorderConfig c;
  c.reachable = false;
  SimRecorderClient rec(c);
  EXPECT_EQ(rec.connect().code(), Status::Code::kConnectionError);
  EXPECT_EQ(rec.counters().connects, 1u);

  rec.set_reachable(true);
  EXPECT_TRUE(rec.connect().ok());
}

TEST(SimRecorderClientTest, BusyWhenAlreadyRecording) {
  SimRecorderClient rec;
  ASSERT_TRUE(rec.connect().ok());
  ASSERT_TRUE(rec.start_recording().ok());
  EXPECT_EQ(rec.start_recording().code(), Status::Code::kBusy);

  SimRecorderConfig c;
  c.externally_recording = true;
  SimRecorderClient foreign(c);
  ASSERT_TRUE(foreign.connect().ok());
  EXPECT_TRUE(*foreign.is_recording());
  EXPECT_EQ(foreign.start_recording().code(), Status::Code::kBusy);
  EXPECT_EQ(foreign.counters().start_attempts, 1u);
  EXPECT_EQ(foreign.counters().starts, 0u);
}

TEST(SimRecorderClientTest, DelayedStopAcknowledgement) {
  SimRecorderConfig c;
  c.stop_ack_polls = 2;
  SimRecorderClient rec(c);
  ASSERT_TRUE(rec.connect().ok());
  ASSERT_TRUE(rec.start_recording().ok());
  ASSERT_TRUE(rec.stop_recording().ok());

  EXPECT_TRUE(*rec.is_recording());
  EXPECT_TRUE(*rec.is_recording());
  EXPECT_FALSE(*rec.is_recording());
  EXPECT_EQ(rec.counters().status_queries, 3u);

  // Stopping again is harmless.
  EXPECT_TRUE(rec.stop_recording().ok());
  EXPECT_EQ(rec.counters().stops, 1u);
}

}  // namespace
}  // namespace sr
