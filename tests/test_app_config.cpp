// tests/test_app_config.cpp

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "app_config.h"
#include "helpers/test_helpers.h"

using namespace test_utils;
using json = nlohmann::json;

class AppConfigTest : public ::testing::Test {
 protected:
  AppConfigTest()
      : dir_("config"), manager_((dir_ / "config.json").string()) {}

  void write_config(const json& data) {
    write_file_contents(manager_.file_path(), data.dump());
  }

  TempDir dir_;
  ConfigManager manager_;
};

TEST_F(AppConfigTest, MissingFileGivesDefaults) {
  AppConfig config = manager_.load();
  EXPECT_EQ(config.buffer_capacity, 1000u);
  EXPECT_EQ(config.remote_endpoint, RemoteSubscriber::DEFAULT_ENDPOINT);
  EXPECT_EQ(config.remote_channel, "remote-log");
  EXPECT_EQ(config.overscan, 20);
  EXPECT_EQ(config.log_retention_days, 7);
  EXPECT_EQ(config.cell_metrics.cell_width_px, 8);
  EXPECT_TRUE(config.issue_tracker_url.empty());
}

TEST_F(AppConfigTest, ReadsValues) {
  write_config({{"buffer_capacity", 250},
                {"remote_endpoint", "tcp://127.0.0.1:7000"},
                {"remote_channel", "app"},
                {"overscan", 5},
                {"console_window_command", "xterm -e {exe} {endpoint}"},
                {"issue_tracker_url", "https://issues.example.com/new"},
                {"cell_height_px", 20},
                {"log_retention_days", 0},
                {"export_dir", "/tmp/exports"}});

  AppConfig config = manager_.load();
  EXPECT_EQ(config.buffer_capacity, 250u);
  EXPECT_EQ(config.remote_endpoint, "tcp://127.0.0.1:7000");
  EXPECT_EQ(config.remote_channel, "app");
  EXPECT_EQ(config.overscan, 5);
  EXPECT_EQ(config.console_window_command, "xterm -e {exe} {endpoint}");
  EXPECT_EQ(config.issue_tracker_url, "https://issues.example.com/new");
  EXPECT_EQ(config.cell_metrics.cell_height_px, 20);
  EXPECT_EQ(config.log_retention_days, 0);
  EXPECT_EQ(config.export_dir, "/tmp/exports");
}

TEST_F(AppConfigTest, NonHttpIssueTrackerIsRejected) {
  write_config({{"issue_tracker_url", "issues.example.com/new"}});
  EXPECT_TRUE(manager_.load().issue_tracker_url.empty());
}

TEST_F(AppConfigTest, NumbersAreClamped) {
  write_config({{"buffer_capacity", 0},
                {"overscan", 100000},
                {"cell_width_px", -3},
                {"log_retention_days", 1e12}});

  AppConfig config = manager_.load();
  EXPECT_EQ(config.buffer_capacity, 1u);
  EXPECT_EQ(config.overscan, AppConfig::MAX_OVERSCAN);
  EXPECT_EQ(config.cell_metrics.cell_width_px, 1);
  EXPECT_EQ(config.log_retention_days, AppConfig::MAX_RETENTION_DAYS);
}

TEST_F(AppConfigTest, WrongTypesFallBackPerKey) {
  write_config({{"buffer_capacity", "lots"},
                {"remote_endpoint", ""},
                {"remote_channel", 42},
                {"overscan", 3}});

  AppConfig config = manager_.load();
  EXPECT_EQ(config.buffer_capacity, LogBuffer::DEFAULT_CAPACITY);
  EXPECT_EQ(config.remote_endpoint, RemoteSubscriber::DEFAULT_ENDPOINT);
  EXPECT_EQ(config.remote_channel, RemoteSubscriber::DEFAULT_CHANNEL);
  EXPECT_EQ(config.overscan, 3);
}

TEST_F(AppConfigTest, CommandWithoutEndpointIsRejected) {
  write_config({{"console_window_command", "xterm -e {exe}"}});
  EXPECT_EQ(manager_.load().console_window_command,
            ProcessWindowLauncher::DEFAULT_COMMAND);
}

TEST_F(AppConfigTest, ParseErrorGivesDefaults) {
  write_file_contents(manager_.file_path(), "{\"overscan\": 3,");
  EXPECT_EQ(manager_.load().overscan, 20);

  write_file_contents(manager_.file_path(), "\"just a string\"");
  EXPECT_EQ(manager_.load().overscan, 20);
}

TEST_F(AppConfigTest, WriteDefaultsOnlyWhenMissing) {
  ASSERT_TRUE(manager_.write_defaults_if_missing());
  json data = json::parse(read_file_contents(manager_.file_path()));
  EXPECT_EQ(data["buffer_capacity"], 1000);
  EXPECT_EQ(data["remote_channel"], "remote-log");
  EXPECT_TRUE(data.contains("console_window_command"));

  write_config({{"overscan", 9}});
  ASSERT_TRUE(manager_.write_defaults_if_missing());
  EXPECT_EQ(manager_.load().overscan, 9);
}
