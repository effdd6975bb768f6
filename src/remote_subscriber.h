#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <zmq.hpp>

#include "log_hub.h"

enum class SubscriberStatus { Inactive, Active, Retrying };

const char* to_string(SubscriberStatus status);

// Exponential retry delay for a failed subscription.
class ReconnectBackoff {
 public:
  static inline const std::chrono::milliseconds INITIAL_DELAY{250};
  static inline const std::chrono::milliseconds MAX_DELAY{10000};

  // Delay to wait now; doubles the following one.
  std::chrono::milliseconds next();
  void reset() { delay_ = INITIAL_DELAY; }

 private:
  std::chrono::milliseconds delay_ = INITIAL_DELAY;
};

/**
 * @brief Receives log events pushed by the host process over a ZeroMQ SUB
 * socket and publishes them as remote records.
 *
 * Messages are two frames, [channel][payload]. The payload is a JSON object
 * {timestamp, level, target, message}, or a plain text log line.
 *
 * Nothing here blocks: pump() drains whatever is queued and is meant to be
 * called once per UI frame.
 */
class RemoteSubscriber {
 public:
  using Clock = std::chrono::steady_clock;

  static inline const std::string DEFAULT_ENDPOINT =
      "ipc:///tmp/logdock-remote.sock";
  static inline const std::string DEFAULT_CHANNEL = "remote-log";
  static inline const std::string ERROR_TARGET = "remote-subscriber";
  static inline const size_t DEFAULT_PUMP_LIMIT = 512;
  static inline const int RECEIVE_HWM = 10000;

  RemoteSubscriber(zmq::context_t& context, RecordSink& sink,
                   std::string endpoint = DEFAULT_ENDPOINT,
                   std::string channel = DEFAULT_CHANNEL);
  ~RemoteSubscriber() { unsubscribe(); }

  RemoteSubscriber(const RemoteSubscriber&) = delete;
  RemoteSubscriber& operator=(const RemoteSubscriber&) = delete;

  /**
   * @brief Opens a fresh socket and starts listening. On failure an ERROR
   * record is published and a retry is scheduled.
   * @return true if the subscription is active.
   */
  bool subscribe();

  /**
   * @brief Closes the socket and cancels any retry. Idempotent. No record is
   * published afterwards until subscribe() is called again.
   */
  void unsubscribe();

  /**
   * @brief Publishes up to `max_events` queued events without blocking, and
   * performs a due retry.
   * @return number of records published.
   */
  size_t pump(size_t max_events = DEFAULT_PUMP_LIMIT);

  SubscriberStatus status() const { return status_; }
  const std::string& endpoint() const { return endpoint_; }
  const std::string& channel() const { return channel_; }

  /**
   * @brief Turns one payload into a remote record. JSON objects are read by
   * key, anything else is parsed as a log line. A missing timestamp becomes
   * the capture time and a missing target becomes "remote".
   */
  static std::optional<LogRecord> decode_payload(std::string_view payload);

 private:
  void fail(const std::string& reason);

  zmq::context_t& context_;
  RecordSink& sink_;
  std::string endpoint_;
  std::string channel_;

  std::optional<zmq::socket_t> socket_;
  SubscriberStatus status_ = SubscriberStatus::Inactive;
  ReconnectBackoff backoff_;
  Clock::time_point retry_at_;
};
