#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <zmq.hpp>

#include "log_record.h"

// One message between the host process and its detached console window.
struct PortMessage {
  enum class Type {
    ConsoleDetached,  // window -> host: window is up and ready for a snapshot
    ConsoleAttached,  // window -> host: window is closing, show the embedded view
    Snapshot,         // host -> window: whole buffer plus log_path
    Record,           // both ways: one appended record
    Clear,            // window -> host: clear the shared buffer
    Cleared,          // host -> window: the buffer was cleared
    Reattach,         // host -> window: please close
  };

  Type type = Type::Record;
  std::vector<LogRecord> records;
  std::string log_path;

  static PortMessage of(Type type) {
    PortMessage message;
    message.type = type;
    return message;
  }
};

const char* to_string(PortMessage::Type type);
std::optional<PortMessage::Type> parse_message_type(std::string_view name);

// {"type": "...", "records": [...], "log_path": "..."}
std::string encode_message(const PortMessage& message);
std::optional<PortMessage> decode_message(std::string_view payload);

/**
 * @brief Typed, non-blocking, ordered message channel between exactly two
 * peers.
 */
class ConsolePort {
 public:
  virtual ~ConsolePort() = default;

  /**
   * @return false if the message could not be queued. The reason is logged.
   */
  virtual bool send(const PortMessage& message) = 0;

  /**
   * @return the next received message, or std::nullopt if none is waiting.
   */
  virtual std::optional<PortMessage> try_receive() = 0;

  virtual const std::string& endpoint() const = 0;
};

// ConsolePort over a ZeroMQ PAIR socket.
class ZmqConsolePort : public ConsolePort {
 public:
  /**
   * @throws zmq::error_t if the endpoint cannot be bound.
   */
  static std::unique_ptr<ZmqConsolePort> bind(zmq::context_t& context,
                                              const std::string& endpoint);
  /**
   * @throws zmq::error_t if the endpoint is malformed.
   */
  static std::unique_ptr<ZmqConsolePort> connect(zmq::context_t& context,
                                                 const std::string& endpoint);

  bool send(const PortMessage& message) override;
  std::optional<PortMessage> try_receive() override;
  const std::string& endpoint() const override { return endpoint_; }

 private:
  ZmqConsolePort(zmq::socket_t socket, std::string endpoint)
      : socket_(std::move(socket)), endpoint_(std::move(endpoint)) {}

  zmq::socket_t socket_;
  std::string endpoint_;
};

/**
 * @brief A fresh endpoint for a console port:
 * ipc://<runtime dir>/logdock-<pid>-<n>.console
 */
std::string make_console_endpoint();
