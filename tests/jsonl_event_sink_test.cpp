// File: tests/jsonl_event_sink_test.cpp
#include <gtest/gtest.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <string>
#include <vector>

#include "support/temp_dir.hpp"
#include "sr/core/events/jsonl_event_sink.hpp"

namespace sr {
namespace {

std::vector<std::string> read_lines(const std::string& path) {
  std::ifstream f(path);
  std::vector<std::string> out;
  std::string line;
  while (std::getline(f, line)) out.push_back(line);
  return out;
}

RunInfo make_run(const std::string& out_dir, std::int64_t wall_ns) {
  RunInfo run;
  run.station_id = "station_\"x\"";
  run.config_path = "configs/default.yaml";
  run.out_dir = out_dir;
  run.config_hash = "0123456789abcdef";
  run.wall_start_time_ns = TimestampNs{wall_ns};
  return run;
}

TEST(JsonlEventSinkTest, WritesHeaderAndEventsToBothFiles) {
  testing::TempDir dir("jsonl");
  JsonlEventSink sink;
  ASSERT_TRUE(sink.open(make_run(dir.str(), 1000)).ok());

  Event e;
  e.type = "session_state";
  e.t_ns = TimestampNs{2'000'000'000};
  e.t_wall_ns = TimestampNs{2'000'001'000};
  e.from_state = SessionState::kIdle;
  e.state = SessionState::kRecording;
  e.reason = "trigger:audio";
  ASSERT_TRUE(sink.emit(e).ok());

  Event d;
  d.type = "detection_accepted";
  d.t_ns = TimestampNs{2'000'000'000};
  d.source = SourceKind::kAudio;
  d.metric = 0.75f;
  d.message = "line1\nline2";
  ASSERT_TRUE(sink.emit(d).ok());
  ASSERT_TRUE(sink.flush().ok());
  sink.close();

  EXPECT_EQ(sink.path(), (dir.path() / "events_1000.jsonl").string());
  const auto run_lines = read_lines(sink.path());
  const auto latest_lines = read_lines(sink.latest_path());
  ASSERT_EQ(run_lines.size(), 3u);
  EXPECT_EQ(run_lines, latest_lines);

  EXPECT_NE(run_lines[0].find("\"type\":\"run_started\""), std::string::npos);
  EXPECT_NE(run_lines[0].find("\"station_id\":\"station_\\\"x\\\"\""), std::string::npos);
  EXPECT_NE(run_lines[0].find("\"config_hash\":\"0123456789abcdef\""), std::string::npos);

  EXPECT_NE(run_lines[1].find("\"from\":\"idle\""), std::string::npos);
  EXPECT_NE(run_lines[1].find("\"state\":\"recording\""), std::string::npos);
  EXPECT_NE(run_lines[1].find("\"reason\":\"trigger:audio\""), std::string::npos);
  EXPECT_EQ(run_lines[1].find("\"source\""), std::string::npos);

  EXPECT_NE(run_lines[2].find("\"source\":\"audio\""), std::string::npos);
  EXPECT_NE(run_lines[2].find("\"metric\":0.750000"), std::string::npos);
  EXPECT_NE(run_lines[2].find("line1\\nline2"), std::string::npos);
}

TEST(JsonlEventSinkTest, NonFiniteMetricIsWrittenAsNull) {
  testing::TempDir dir("jsonl_inf");
  JsonlEventSink sink;
  ASSERT_TRUE(sink.open(make_run(dir.str(), 7)).ok());

  Event e;
  e.type = "detection_accepted";
  e.source = SourceKind::kVision;
  e.metric = std::numeric_limits<float>::infinity();
  ASSERT_TRUE(sink.emit(e).ok());
  e.metric = std::numeric_limits<float>::quiet_NaN();
  ASSERT_TRUE(sink.emit(e).ok());
  sink.close();

  const auto lines = read_lines(sink.path());
  ASSERT_EQ(lines.size(), 3u);
  for (std::size_t i = 1; i < lines.size(); ++i) {
    EXPECT_NE(lines[i].find("\"metric\":null}"), std::string::npos) << lines[i];
    EXPECT_EQ(lines[i].find("inf"), std::string::npos) << lines[i];
    EXPECT_EQ(lines[i].find("nan"), std::string::npos) << lines[i];
  }
}

TEST(JsonlEventSinkTest, EmitBeforeOpenFails) {
  JsonlEventSink sink;
  Event e;
  e.type = "heartbeat";
  EXPECT_FALSE(sink.emit(e).ok());
  EXPECT_TRUE(sink.flush().ok());
}

TEST(JsonlEventSinkTest, LatestIsTruncatedPerRunAndOldRunsPruned) {
  testing::TempDir dir("jsonl_prune");

  for (std::int64_t wall = 1; wall <= 4; ++wall) {
    JsonlEventSink sink(/*keep_last=*/2);
    ASSERT_TRUE(sink.open(make_run(dir.str(), wall)).ok());
    sink.close();
  }

  EXPECT_FALSE(std::filesystem::exists(dir.path() / "events_1.jsonl"));
  EXPECT_FALSE(std::filesystem::exists(dir.path() / "events_2.jsonl"));
  EXPECT_TRUE(std::filesystem::exists(dir.path() / "events_3.jsonl"));
  EXPECT_TRUE(std::filesystem::exists(dir.path() / "events_4.jsonl"));
  EXPECT_EQ(read_lines((dir.path() / "events_latest.jsonl").string()).size(), 1u);
}

}  // namespace
}  // namespace sr
