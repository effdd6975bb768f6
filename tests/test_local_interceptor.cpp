// tests/test_local_interceptor.cpp
//
// The interceptor is process-wide: once installed, std::clog and std::cerr
// stay redirected for the rest of the test binary. Each test attaches its own
// sink and releases it when done.

#include <gtest/gtest.h>

#include <iostream>
#include <map>
#include <thread>
#include <vector>

#include "helpers/test_helpers.h"
#include "local_interceptor.h"

using namespace test_utils;
using json = nlohmann::json;

namespace {

struct Opaque {
  int value = 0;
};

struct Streamable {
  int id = 7;
};

std::ostream& operator<<(std::ostream& out, const Streamable& s) {
  return out << "Streamable#" << s.id;
}

}  // namespace

class LocalInterceptorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    interceptor_ = &LocalInterceptor::install();
    attachment_ = interceptor_->attach(sink_);
  }

  void TearDown() override { attachment_.release(); }

  LocalInterceptor* interceptor_ = nullptr;
  CollectingSink sink_;
  LocalInterceptor::SinkAttachment attachment_;
};

// ============================================================================
// Installation and sinks
// ============================================================================

TEST_F(LocalInterceptorTest, InstallIsIdempotent) {
  EXPECT_EQ(&LocalInterceptor::install(), interceptor_);
  EXPECT_EQ(LocalInterceptor::instance(), interceptor_);

  std::clog << "only once" << std::endl;
  ASSERT_EQ(sink_.records.size(), 1u);
}

TEST_F(LocalInterceptorTest, NewerAttachmentWins) {
  CollectingSink second;
  LocalInterceptor::SinkAttachment second_attachment =
      interceptor_->attach(second);

  // releasing the older attachment must not detach the newer sink
  attachment_.release();
  std::clog << "routed" << std::endl;
  EXPECT_TRUE(sink_.records.empty());
  ASSERT_EQ(second.records.size(), 1u);

  second_attachment.release();
  std::clog << "dropped" << std::endl;
  EXPECT_EQ(second.records.size(), 1u);
}

TEST_F(LocalInterceptorTest, NoSinkIsSafe) {
  attachment_.release();
  std::clog << "nobody listening" << std::endl;
  Log::error("nobody listening either");
  EXPECT_TRUE(sink_.records.empty());
}

// ============================================================================
// Stream capture
// ============================================================================

TEST_F(LocalInterceptorTest, ClogLinesAreInfo) {
  std::clog << "Config loaded." << std::endl;
  ASSERT_EQ(sink_.records.size(), 1u);
  const LogRecord& record = sink_.records[0];
  EXPECT_EQ(record.level, LogLevel::Info);
  EXPECT_EQ(record.message, "Config loaded.");
  EXPECT_EQ(record.target, "frontend");
  EXPECT_EQ(record.source, LogSource::Local);
  EXPECT_FALSE(record.timestamp.empty());
}

TEST_F(LocalInterceptorTest, CerrLinesAreErrorsUnlessTagged) {
  std::cerr << "Failed to open file." << std::endl;
  std::cerr << "Warning: Error parsing layout file." << std::endl;
  std::clog << "  debug: cache warmed" << std::endl;

  ASSERT_EQ(sink_.records.size(), 3u);
  EXPECT_EQ(sink_.records[0].level, LogLevel::Error);
  EXPECT_EQ(sink_.records[1].level, LogLevel::Warn);
  EXPECT_EQ(sink_.records[2].level, LogLevel::Debug);
}

TEST_F(LocalInterceptorTest, PartialLinesAreJoined) {
  std::clog << "value=";
  std::clog.flush();
  EXPECT_TRUE(sink_.records.empty());
  std::clog << 42 << "\n" << "second line\n";
  std::clog.flush();

  ASSERT_EQ(sink_.records.size(), 2u);
  EXPECT_EQ(sink_.records[0].message, "value=42");
  EXPECT_EQ(sink_.records[1].message, "second line");
}

TEST_F(LocalInterceptorTest, BlankLinesAreSkipped) {
  std::clog << "\n   \n" << std::flush;
  EXPECT_TRUE(sink_.records.empty());
}

TEST_F(LocalInterceptorTest, ListenerMayLogWhileHandlingARecord) {
  attachment_.release();
  LogHub hub(100);
  LocalInterceptor::SinkAttachment hub_attachment = interceptor_->attach(hub);
  bool echoed = false;
  auto subscription = hub.subscribe([&](const LogEvent& event) {
    if (event.kind == LogEvent::Kind::Appended && !echoed) {
      echoed = true;
      std::clog << "echo of " << event.record->message << std::endl;
    }
  });

  std::clog << "trigger" << std::endl;

  auto records = hub.snapshot();
  ASSERT_EQ(records.size(), 2u);
  EXPECT_EQ(records[0].message, "trigger");
  EXPECT_EQ(records[1].message, "echo of trigger");
}

TEST_F(LocalInterceptorTest, LocalAndRemoteRecordsKeepArrivalOrder) {
  attachment_.release();
  LogHub hub(100);
  LocalInterceptor::SinkAttachment hub_attachment = interceptor_->attach(hub);

  std::clog << "local one" << std::endl;
  hub.publish(make_test_record(LogLevel::Info, "remote one", LogSource::Remote));
  Log::warn("local two");
  hub.publish(make_test_record(LogLevel::Error, "remote two", LogSource::Remote));

  auto records = hub.snapshot();
  ASSERT_EQ(records.size(), 4u);
  EXPECT_EQ(records[0].message, "local one");
  EXPECT_EQ(records[1].message, "remote one");
  EXPECT_EQ(records[2].message, "local two");
  EXPECT_EQ(records[3].message, "remote two");
  EXPECT_EQ(records[2].source, LogSource::Local);
  EXPECT_EQ(records[3].source, LogSource::Remote);
}

TEST_F(LocalInterceptorTest, OtherThreadsAreQueuedUntilDrained) {
  std::thread worker([] {
    Log::info("from worker");
    std::clog << "worker line" << std::endl;
  });
  worker.join();

  EXPECT_TRUE(sink_.records.empty());
  EXPECT_EQ(interceptor_->pending_count(), 2u);

  Log::info("from main");
  ASSERT_EQ(sink_.records.size(), 1u);

  interceptor_->drain_pending();
  ASSERT_EQ(sink_.records.size(), 3u);
  EXPECT_EQ(sink_.records[1].message, "from worker");
  EXPECT_EQ(sink_.records[2].message, "worker line");
  EXPECT_EQ(interceptor_->pending_count(), 0u);
}

TEST_F(LocalInterceptorTest, DrainingFromAnotherThreadPublishesNothing) {
  std::thread([] { Log::warn("queued"); }).join();
  std::thread([this] { interceptor_->drain_pending(); }).join();
  EXPECT_TRUE(sink_.records.empty());
  EXPECT_EQ(interceptor_->pending_count(), 1u);
}

TEST_F(LocalInterceptorTest, ReleasingTheSinkDropsQueuedRecords) {
  std::thread([] { Log::error("late"); }).join();
  EXPECT_EQ(interceptor_->pending_count(), 1u);
  attachment_.release();
  EXPECT_EQ(interceptor_->pending_count(), 0u);

  std::thread([] { Log::error("nobody listening"); }).join();
  EXPECT_EQ(interceptor_->pending_count(), 0u);
}

TEST_F(LocalInterceptorTest, PendingQueueIsBounded) {
  std::thread([] {
    for (size_t i = 0; i < LocalInterceptor::MAX_PENDING + 5; ++i) {
      Log::debug("burst", i);
    }
  }).join();
  EXPECT_EQ(interceptor_->pending_count(), LocalInterceptor::MAX_PENDING);

  interceptor_->drain_pending();
  ASSERT_EQ(sink_.records.size(), LocalInterceptor::MAX_PENDING);
  EXPECT_EQ(sink_.records.front().message, "burst 5");
}

TEST(LevelTagTest, DetectsLeadingTags) {
  EXPECT_EQ(detect_level_tag("Error: x", LogLevel::Info), LogLevel::Error);
  EXPECT_EQ(detect_level_tag("FATAL: x", LogLevel::Info), LogLevel::Error);
  EXPECT_EQ(detect_level_tag("warn: x", LogLevel::Error), LogLevel::Warn);
  EXPECT_EQ(detect_level_tag("trace:", LogLevel::Error), LogLevel::Trace);
  EXPECT_EQ(detect_level_tag("an error: x", LogLevel::Info), LogLevel::Info);
  EXPECT_EQ(detect_level_tag("", LogLevel::Warn), LogLevel::Warn);
}

// ============================================================================
// Log:: functions
// ============================================================================

TEST_F(LocalInterceptorTest, LogFunctionsJoinArguments) {
  Log::info("hello", 42);
  Log::warn("disk at", 93.5, "%");
  Log::Scope("status").error("check failed", json{{"code", 7}});
  Log::debug();

  ASSERT_EQ(sink_.records.size(), 4u);
  EXPECT_EQ(sink_.records[0].message, "hello 42");
  EXPECT_EQ(sink_.records[0].level, LogLevel::Info);
  EXPECT_EQ(sink_.records[0].target, "frontend");
  EXPECT_EQ(sink_.records[1].message, "disk at 93.5 %");
  EXPECT_EQ(sink_.records[1].level, LogLevel::Warn);
  EXPECT_EQ(sink_.records[2].message, R"(check failed {"code":7})");
  EXPECT_EQ(sink_.records[2].target, "status");
  EXPECT_EQ(sink_.records[2].level, LogLevel::Error);
  EXPECT_EQ(sink_.records[3].message, "");
  EXPECT_EQ(sink_.records[3].level, LogLevel::Debug);
}

TEST_F(LocalInterceptorTest, CapturedCallsAreNotCapturedTwice) {
  Log::error("once");
  EXPECT_EQ(sink_.records.size(), 1u);
}

TEST(LogTextTest, ContainersBecomeJson) {
  EXPECT_EQ(Log::detail::to_text(std::vector<int>{1, 2, 3}), "[1,2,3]");
  std::map<std::string, int> counts{{"a", 1}};
  EXPECT_EQ(Log::detail::to_text(counts), R"({"a":1})");
  EXPECT_EQ(Log::detail::to_text(true), "true");
}

TEST(LogTextTest, StringsArePassedThrough) {
  const char* null_text = nullptr;
  EXPECT_EQ(Log::detail::to_text(null_text), "null");
  EXPECT_EQ(Log::detail::to_text(std::string("plain")), "plain");
  EXPECT_EQ(Log::detail::to_text(std::string_view("view")), "view");
}

TEST(LogTextTest, InvalidUtf8DoesNotThrow) {
  std::vector<std::string> values{"ok", "bad\xFF"};
  std::string text;
  EXPECT_NO_THROW(text = Log::detail::to_text(values));
  EXPECT_EQ(text.rfind("[\"ok\",\"bad", 0), 0u);

  EXPECT_NO_THROW(Log::detail::to_text(json("bad\xFF")));
}

TEST(LogTextTest, OtherTypesAreCoerced) {
  EXPECT_EQ(Log::detail::to_text(Streamable{}), "Streamable#7");
  std::string opaque = Log::detail::to_text(Opaque{});
  EXPECT_EQ(opaque.front(), '[');
  EXPECT_EQ(opaque.back(), ']');
}
