#pragma once

#include <memory>
#include <string>

#include "console_port.h"
#include "detach_coordinator.h"
#include "log_hub.h"

/**
 * @brief The detached window's end of the console port.
 *
 * Keeps a mirror hub that is fed only by the host: a snapshot replaces it,
 * records append, "cleared" empties it. Records published to the session
 * itself (the window's own logs) are sent to the host, which echoes them
 * back through the mirror.
 */
class ConsoleWindowSession : public RecordSink {
 public:
  ConsoleWindowSession(std::unique_ptr<ConsolePort> port, size_t capacity);
  ~ConsoleWindowSession() override { close(); }

  ConsoleWindowSession(const ConsoleWindowSession&) = delete;
  ConsoleWindowSession& operator=(const ConsoleWindowSession&) = delete;

  // Tells the host the window is ready.
  bool announce();

  /**
   * @brief Applies queued host messages to the mirror.
   * @return number of messages handled.
   */
  size_t poll();

  void publish(const LogRecord& record) override;

  // Asks the host to clear the shared buffer.
  bool request_clear();

  /**
   * @brief Hands the console back to the host. Sends console-attached once;
   * later calls do nothing.
   */
  void close();

  bool reattach_requested() const { return reattach_requested_; }
  bool closed() const { return closed_; }
  DetachState state() const { return state_; }

  LogHub& hub() { return mirror_; }
  const std::string& log_path() const { return log_path_; }
  const std::string& endpoint() const { return port_->endpoint(); }

 private:
  void on_message(const PortMessage& message);

  std::unique_ptr<ConsolePort> port_;
  LogHub mirror_;
  std::string log_path_;
  DetachState state_ = DetachState::Embedded;
  bool reattach_requested_ = false;
  bool closed_ = false;
  bool sending_ = false;
};
