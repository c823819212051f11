// File: tests/status_test.cpp
#include <gtest/gtest.h>

#include "sr/core/status.hpp"

namespace sr {
namespace {

Status fails_with(Status st) { return st; }

Status chain(bool fail_first, int& reached) {
  SR_RETURN_IF_ERROR(fail_first ? Status::busy("first") : Status::ok_status());
  ++reached;
  SR_RETURN_IF_ERROR(fails_with(Status::connection_error("second")));
  ++reached;
  return Status::ok_status();
}

TEST(StatusTest, DefaultIsOk) {
  const Status st;
  EXPECT_TRUE(st.ok());
  EXPECT_EQ(st.code(), Status::Code::kOk);
  EXPECT_TRUE(st.message().empty());
}

TEST(StatusTest, ReturnIfErrorStopsAtFirstFailure) {
  int reached = 0;
  Status st = chain(true, reached);
  EXPECT_EQ(st.code(), Status::Code::kBusy);
  EXPECT_EQ(reached, 0);

  reached = 0;
  st = chain(false, reached);
  EXPECT_EQ(st.code(), Status::Code::kConnectionError);
  EXPECT_EQ(st.message(), "second");
  EXPECT_EQ(reached, 1);
}

TEST(StatusTest, CodeNames) {
  EXPECT_STREQ(to_string(Status::Code::kUnavailable), "unavailable");
  EXPECT_STREQ(to_string(Status::Code::kConnectionError), "connection_error");
  EXPECT_STREQ(to_string(Status::Code::kBusy), "busy");
}

TEST(ResultTest, HoldsValueOrStatus) {
  auto good = Result<float>::ok(0.75f);
  ASSERT_TRUE(good.ok());
  EXPECT_FLOAT_EQ(*good, 0.75f);
  ASSERT_NE(good.value_if_ok(), nullptr);

  auto bad = Result<float>::err(Status::unavailable("no frame"));
  EXPECT_FALSE(bad.ok());
  EXPECT_EQ(bad.value_if_ok(), nullptr);
  EXPECT_EQ(bad.status().code(), Status::Code::kUnavailable);
}

}  // namespace
}  // namespace sr
