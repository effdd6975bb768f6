#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <vector>

#include "log_buffer.h"

// Anything log records can be published to.
class RecordSink {
 public:
  virtual ~RecordSink() = default;
  virtual void publish(const LogRecord& record) = 0;
};

struct LogEvent {
  enum class Kind { Appended, Cleared, Reset };

  Kind kind = Kind::Appended;
  const LogRecord* record = nullptr;   // set for Appended
  const LogRecord* evicted = nullptr;  // set for Appended when the buffer was full
};

using LogListener = std::function<void(const LogEvent&)>;

namespace hub_detail {
struct Registry {
  uint64_t next_id = 1;
  std::map<uint64_t, std::shared_ptr<LogListener>> listeners;
};
}  // namespace hub_detail

// Disposer returned by LogHub::subscribe(). Unsubscribes when destroyed.
class Subscription {
 public:
  Subscription() = default;
  ~Subscription() { dispose(); }

  Subscription(Subscription&& other) noexcept;
  Subscription& operator=(Subscription&& other) noexcept;
  Subscription(const Subscription&) = delete;
  Subscription& operator=(const Subscription&) = delete;

  /**
   * @brief Removes the listener. Safe to call repeatedly, and safe after the
   * hub is gone.
   */
  void dispose();
  bool active() const;

 private:
  friend class LogHub;
  Subscription(std::weak_ptr<hub_detail::Registry> registry, uint64_t id)
      : registry_(std::move(registry)), id_(id) {}

  std::weak_ptr<hub_detail::Registry> registry_;
  uint64_t id_ = 0;
};

/**
 * @brief The bounded buffer plus the listeners that follow it.
 *
 * Every producer publishes here; the buffer order is the arrival order.
 * Operations issued from inside a listener are queued and applied after the
 * current notification completes, so every listener observes the same order
 * as the buffer.
 */
class LogHub : public RecordSink {
 public:
  explicit LogHub(size_t capacity = LogBuffer::DEFAULT_CAPACITY);

  void publish(const LogRecord& record) override;
  void clear();
  void replace(std::vector<LogRecord> records);

  std::vector<LogRecord> snapshot() const { return buffer_.snapshot(); }
  const LogBuffer& buffer() const { return buffer_; }

  [[nodiscard]] Subscription subscribe(LogListener listener);
  size_t listener_count() const { return registry_->listeners.size(); }

 private:
  void dispatch(std::function<void()> operation);
  void notify(const LogEvent& event);

  LogBuffer buffer_;
  std::shared_ptr<hub_detail::Registry> registry_;
  std::deque<std::function<void()>> pending_;
  bool dispatching_ = false;
};
