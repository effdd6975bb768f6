// tests/test_console_model.cpp
//
// Incremental view model: must always equal filter(snapshot, criteria).

#include <gtest/gtest.h>

#include "console_model.h"
#include "helpers/test_helpers.h"

using namespace test_utils;

namespace {

std::vector<LogRecord> rows_of(const ConsoleModel& model) {
  return std::vector<LogRecord>(model.rows().begin(), model.rows().end());
}

}  // namespace

TEST(ConsoleModelTest, AttachBuildsFromSnapshot) {
  LogHub hub(100);
  for (const auto& record : make_numbered_records(10)) hub.publish(record);

  ConsoleModel model(hub, 1, 5);
  EXPECT_FALSE(model.is_live());
  model.attach();
  EXPECT_TRUE(model.is_live());
  EXPECT_EQ(model.rows().size(), 10u);
  EXPECT_EQ(model.virtualizer().row_count(), 10u);
}

TEST(ConsoleModelTest, IncrementalRowsMatchFullFilterUnderEviction) {
  LogHub hub(20);
  ConsoleModel model(hub, 1, 5);
  FilterCriteria criteria;
  criteria.level = LogLevel::Error;
  model.set_criteria(criteria);
  model.attach();

  for (int i = 0; i < 100; ++i) {
    LogLevel level = i % 3 == 0 ? LogLevel::Error : LogLevel::Info;
    hub.publish(make_test_record(level, fmt::format("r{}", i)));
    ASSERT_EQ(rows_of(model), QueryEngine::filter(hub.snapshot(), criteria))
        << "after append " << i;
  }
}

TEST(ConsoleModelTest, ClearThenAppendShowsOnlyNewRecord) {
  LogHub hub(100);
  ConsoleModel model(hub, 1, 5);
  model.attach();
  for (const auto& record : make_numbered_records(30)) hub.publish(record);

  hub.clear();
  EXPECT_TRUE(model.rows().empty());
  EXPECT_EQ(model.total_count(), 0u);

  hub.publish(make_test_record(LogLevel::Info, "fresh"));
  ASSERT_EQ(model.rows().size(), 1u);
  EXPECT_EQ(model.rows().front().message, "fresh");
  EXPECT_EQ(hub.buffer().size(), 1u);
}

TEST(ConsoleModelTest, CriteriaChangeRebuilds) {
  LogHub hub(100);
  hub.publish(make_test_record(LogLevel::Info, "alpha"));
  hub.publish(make_test_record(LogLevel::Info, "beta"));
  ConsoleModel model(hub, 1, 5);
  model.attach();

  FilterCriteria criteria;
  criteria.text = "BET";
  model.set_criteria(criteria);
  ASSERT_EQ(model.rows().size(), 1u);
  EXPECT_EQ(model.rows().front().message, "beta");

  model.set_criteria(FilterCriteria{});
  EXPECT_EQ(model.rows().size(), 2u);
}

TEST(ConsoleModelTest, DetachedModelIgnoresHub) {
  LogHub hub(100);
  ConsoleModel model(hub, 1, 5);
  model.attach();
  hub.publish(make_test_record(LogLevel::Info, "seen"));

  model.detach();
  EXPECT_FALSE(model.is_live());
  EXPECT_EQ(hub.listener_count(), 0u);
  hub.publish(make_test_record(LogLevel::Info, "unseen"));
  EXPECT_TRUE(model.rows().empty());

  model.attach();
  EXPECT_EQ(model.rows().size(), 2u);
}

TEST(ConsoleModelTest, CountsComeFromTheWholeBuffer) {
  LogHub hub(100);
  ConsoleModel model(hub, 1, 5);
  FilterCriteria criteria;
  criteria.source = SourceFilter::Remote;
  model.set_criteria(criteria);
  model.attach();

  hub.publish(make_test_record(LogLevel::Error, "local error"));
  hub.publish(make_test_record(LogLevel::Warn, "remote warning",
                               LogSource::Remote));

  EXPECT_EQ(model.rows().size(), 1u);
  EXPECT_EQ(model.error_count(), 1u);
  EXPECT_EQ(model.warn_count(), 1u);
  EXPECT_EQ(model.total_count(), 2u);
}

TEST(ConsoleModelTest, CopyTextUsesFilteredRows) {
  LogHub hub(100);
  ConsoleModel model(hub, 1, 5);
  model.attach();
  hub.publish(make_test_record(LogLevel::Info, "one", LogSource::Local, "a"));
  hub.publish(make_test_record(LogLevel::Error, "two", LogSource::Local, "b"));

  EXPECT_EQ(model.copy_text(),
            "[2024-05-01 12:00:00.000 INFO a] one\n"
            "[2024-05-01 12:00:00.000 ERROR b] two");
}

TEST(ConsoleModelTest, AppendsKeepViewAtTheEnd) {
  LogHub hub(1000);
  ConsoleModel model(hub, 1, 2);
  model.virtualizer().set_viewport_height(10);
  model.attach();
  for (const auto& record : make_numbered_records(100)) hub.publish(record);

  EXPECT_EQ(model.virtualizer().scroll_top(), 90);
  EXPECT_EQ(model.virtualizer().visible_range().end, 100u);
}
