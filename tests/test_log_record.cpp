// tests/test_log_record.cpp
//
// Record normalization, the session log line format and JSON keys.

#include <gtest/gtest.h>

#include <chrono>
#include <nlohmann/json.hpp>
#include <regex>

#include "helpers/test_helpers.h"
#include "log_record.h"

using namespace test_utils;
using json = nlohmann::json;

TEST(LogRecordTest, LevelNamesAreCaseInsensitive) {
  EXPECT_EQ(parse_level("error"), LogLevel::Error);
  EXPECT_EQ(parse_level("Warn"), LogLevel::Warn);
  EXPECT_EQ(parse_level("WARNING"), LogLevel::Warn);
  EXPECT_EQ(parse_level("trace"), LogLevel::Trace);
  EXPECT_FALSE(parse_level("verbose").has_value());
}

TEST(LogRecordTest, UnknownLevelNormalizesToInfo) {
  EXPECT_EQ(normalize_level("verbose"), LogLevel::Info);
  EXPECT_EQ(normalize_level(""), LogLevel::Info);
  EXPECT_EQ(normalize_level("DEBUG"), LogLevel::Debug);
}

TEST(LogRecordTest, RendersUppercaseLevelsAndLowercaseSources) {
  EXPECT_STREQ(to_string(LogLevel::Error), "ERROR");
  EXPECT_STREQ(to_string(LogLevel::Warn), "WARN");
  EXPECT_STREQ(to_string(LogSource::Local), "local");
  EXPECT_STREQ(to_string(LogSource::Remote), "remote");
}

TEST(LogRecordTest, TimestampFormatSortsAsText) {
  auto now = std::chrono::system_clock::now();
  std::string earlier = make_timestamp(now);
  std::string later = make_timestamp(now + std::chrono::milliseconds(1500));

  std::regex format(R"(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}\.\d{3})");
  EXPECT_TRUE(std::regex_match(earlier, format)) << earlier;
  EXPECT_LT(earlier, later);
}

TEST(LogRecordTest, MakeRecordStampsCaptureTime) {
  LogRecord record =
      make_record(LogLevel::Warn, "frontend", "low disk", LogSource::Local);
  EXPECT_EQ(record.level, LogLevel::Warn);
  EXPECT_EQ(record.target, "frontend");
  EXPECT_EQ(record.message, "low disk");
  EXPECT_EQ(record.timestamp.size(), 23u);
}

TEST(LogRecordTest, LogLineRoundTripsThroughParser) {
  LogRecord record = make_test_record(LogLevel::Warn, "disk [sda] almost full",
                                      LogSource::Remote, "storage");
  std::string line = format_log_line(record);
  EXPECT_EQ(line, "[2024-05-01 12:00:00.000 WARN storage] disk [sda] almost full");

  auto parsed = parse_log_line(line);
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, record);
}

TEST(LogRecordTest, LineWithoutHeaderBecomesInfoMessage) {
  auto parsed = parse_log_line("plain text from somewhere");
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->level, LogLevel::Info);
  EXPECT_EQ(parsed->message, "plain text from somewhere");
  EXPECT_EQ(parsed->source, LogSource::Remote);
}

TEST(LogRecordTest, UnclosedHeaderIsRejected) {
  EXPECT_FALSE(parse_log_line("[2024-05-01 12:00:00.000 INFO no end").has_value());
}

TEST(LogRecordTest, ShortHeaderIsKeptAsTimestamp) {
  auto parsed = parse_log_line("[12:00:00] started", LogSource::Local);
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->timestamp, "12:00:00");
  EXPECT_EQ(parsed->level, LogLevel::Info);
  EXPECT_EQ(parsed->message, "started");
  EXPECT_EQ(parsed->source, LogSource::Local);
}

TEST(LogRecordTest, JsonUsesStableKeys) {
  LogRecord record =
      make_test_record(LogLevel::Error, "boom", LogSource::Remote, "core");
  json j = record;
  EXPECT_EQ(j["timestamp"], "2024-05-01 12:00:00.000");
  EXPECT_EQ(j["level"], "ERROR");
  EXPECT_EQ(j["target"], "core");
  EXPECT_EQ(j["message"], "boom");
  EXPECT_EQ(j["source"], "remote");

  EXPECT_EQ(j.get<LogRecord>(), record);
}

TEST(LogRecordTest, JsonWithMissingKeysGetsDefaults) {
  LogRecord record = json{{"message", "hi"}, {"level", "loud"}}.get<LogRecord>();
  EXPECT_EQ(record.message, "hi");
  EXPECT_EQ(record.level, LogLevel::Info);
  EXPECT_EQ(record.source, LogSource::Local);
}
