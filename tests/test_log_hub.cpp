// tests/test_log_hub.cpp
//
// Listener registry: disposal, ordering and re-entrant publishing.

#include <gtest/gtest.h>

#include <memory>

#include "helpers/test_helpers.h"
#include "log_hub.h"

using namespace test_utils;

TEST(LogHubTest, PublishAppendsAndNotifies) {
  LogHub hub(10);
  std::vector<std::string> seen;
  auto subscription = hub.subscribe([&](const LogEvent& event) {
    ASSERT_EQ(event.kind, LogEvent::Kind::Appended);
    seen.push_back(event.record->message);
  });

  hub.publish(make_test_record(LogLevel::Info, "one"));
  hub.publish(make_test_record(LogLevel::Info, "two"));

  EXPECT_EQ(seen, (std::vector<std::string>{"one", "two"}));
  EXPECT_EQ(hub.buffer().size(), 2u);
}

TEST(LogHubTest, EvictionIsReported) {
  LogHub hub(1);
  std::vector<std::string> evicted;
  auto subscription = hub.subscribe([&](const LogEvent& event) {
    if (event.evicted) evicted.push_back(event.evicted->message);
  });

  hub.publish(make_test_record(LogLevel::Info, "a"));
  hub.publish(make_test_record(LogLevel::Info, "b"));
  EXPECT_EQ(evicted, std::vector<std::string>{"a"});
}

TEST(LogHubTest, DisposeIsIdempotent) {
  LogHub hub;
  int calls = 0;
  Subscription subscription =
      hub.subscribe([&](const LogEvent&) { ++calls; });
  EXPECT_TRUE(subscription.active());
  EXPECT_EQ(hub.listener_count(), 1u);

  subscription.dispose();
  subscription.dispose();
  EXPECT_FALSE(subscription.active());
  EXPECT_EQ(hub.listener_count(), 0u);

  hub.publish(make_test_record(LogLevel::Info, "ignored"));
  EXPECT_EQ(calls, 0);
}

TEST(LogHubTest, SubscriptionUnsubscribesWhenDestroyed) {
  LogHub hub;
  {
    auto subscription = hub.subscribe([](const LogEvent&) {});
    EXPECT_EQ(hub.listener_count(), 1u);
  }
  EXPECT_EQ(hub.listener_count(), 0u);
}

TEST(LogHubTest, SubscriptionMayOutliveHub) {
  Subscription subscription;
  {
    LogHub hub;
    subscription = hub.subscribe([](const LogEvent&) {});
  }
  EXPECT_FALSE(subscription.active());
  subscription.dispose();
}

TEST(LogHubTest, ListenerDisposedDuringNotificationIsSkipped) {
  LogHub hub;
  int second_calls = 0;
  Subscription second;
  auto first = hub.subscribe([&](const LogEvent&) { second.dispose(); });
  second = hub.subscribe([&](const LogEvent&) { ++second_calls; });

  hub.publish(make_test_record(LogLevel::Info, "x"));
  EXPECT_EQ(second_calls, 0);
}

TEST(LogHubTest, ReentrantPublishKeepsBufferOrderForEveryListener) {
  LogHub hub;
  std::vector<std::string> first_seen;
  std::vector<std::string> second_seen;
  bool echoed = false;

  auto first = hub.subscribe([&](const LogEvent& event) {
    first_seen.push_back(event.record->message);
    if (!echoed) {
      echoed = true;
      hub.publish(make_test_record(LogLevel::Warn, "nested"));
    }
  });
  auto second = hub.subscribe([&](const LogEvent& event) {
    second_seen.push_back(event.record->message);
  });

  hub.publish(make_test_record(LogLevel::Info, "outer"));

  std::vector<std::string> expected{"outer", "nested"};
  EXPECT_EQ(first_seen, expected);
  EXPECT_EQ(second_seen, expected);
  auto snapshot = hub.snapshot();
  ASSERT_EQ(snapshot.size(), 2u);
  EXPECT_EQ(snapshot[0].message, "outer");
  EXPECT_EQ(snapshot[1].message, "nested");
}

TEST(LogHubTest, ClearAndReplaceNotify) {
  LogHub hub(3);
  std::vector<LogEvent::Kind> kinds;
  auto subscription =
      hub.subscribe([&](const LogEvent& event) { kinds.push_back(event.kind); });

  hub.publish(make_test_record(LogLevel::Info, "a"));
  hub.clear();
  hub.replace(make_numbered_records(5));

  EXPECT_EQ(kinds, (std::vector<LogEvent::Kind>{LogEvent::Kind::Appended,
                                                LogEvent::Kind::Cleared,
                                                LogEvent::Kind::Reset}));
  EXPECT_EQ(hub.buffer().size(), 3u);
}
