#include "console_port.h"

#include <fmt/core.h>
#include <unistd.h>

#include <atomic>
#include <iostream>
#include <nlohmann/json.hpp>

#include "sys_utils.h"

using json = nlohmann::json;

namespace {

struct TypeName {
  PortMessage::Type type;
  std::string_view name;
};

constexpr TypeName TYPE_NAMES[] = {
    {PortMessage::Type::ConsoleDetached, "console-detached"},
    {PortMessage::Type::ConsoleAttached, "console-attached"},
    {PortMessage::Type::Snapshot, "snapshot"},
    {PortMessage::Type::Record, "record"},
    {PortMessage::Type::Clear, "clear"},
    {PortMessage::Type::Cleared, "cleared"},
    {PortMessage::Type::Reattach, "reattach"},
};

}  // namespace

const char* to_string(PortMessage::Type type) {
  for (const auto& entry : TYPE_NAMES) {
    if (entry.type == type) {
      return entry.name.data();
    }
  }
  return "record";
}

std::optional<PortMessage::Type> parse_message_type(std::string_view name) {
  for (const auto& entry : TYPE_NAMES) {
    if (entry.name == name) {
      return entry.type;
    }
  }
  return std::nullopt;
}

std::string encode_message(const PortMessage& message) {
  json data;
  data["type"] = to_string(message.type);
  if (!message.records.empty()) {
    data["records"] = message.records;
  }
  if (!message.log_path.empty()) {
    data["log_path"] = message.log_path;
  }
  return data.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::optional<PortMessage> decode_message(std::string_view payload) {
  json data = json::parse(payload, nullptr, false);
  if (!data.is_object()) {
    return std::nullopt;
  }
  auto type_it = data.find("type");
  if (type_it == data.end() || !type_it->is_string()) {
    return std::nullopt;
  }
  std::optional<PortMessage::Type> type =
      parse_message_type(type_it->get<std::string>());
  if (!type) {
    return std::nullopt;
  }

  PortMessage message;
  message.type = *type;
  message.log_path = data.value("log_path", std::string());
  auto records_it = data.find("records");
  if (records_it != data.end() && records_it->is_array()) {
    try {
      message.records = records_it->get<std::vector<LogRecord>>();
    } catch (const json::exception& e) {
      std::cerr << fmt::format("Dropping malformed {} message: {}",
                               to_string(message.type), e.what())
                << std::endl;
      return std::nullopt;
    }
  }
  return message;
}

std::unique_ptr<ZmqConsolePort> ZmqConsolePort::bind(
    zmq::context_t& context, const std::string& endpoint) {
  zmq::socket_t socket(context, zmq::socket_type::pair);
  socket.set(zmq::sockopt::linger, 0);
  socket.bind(endpoint);
  return std::unique_ptr<ZmqConsolePort>(
      new ZmqConsolePort(std::move(socket), endpoint));
}

std::unique_ptr<ZmqConsolePort> ZmqConsolePort::connect(
    zmq::context_t& context, const std::string& endpoint) {
  zmq::socket_t socket(context, zmq::socket_type::pair);
  socket.set(zmq::sockopt::linger, 0);
  socket.connect(endpoint);
  return std::unique_ptr<ZmqConsolePort>(
      new ZmqConsolePort(std::move(socket), endpoint));
}

bool ZmqConsolePort::send(const PortMessage& message) {
  std::string payload = encode_message(message);
  try {
    auto sent = socket_.send(zmq::buffer(payload), zmq::send_flags::dontwait);
    if (!sent) {
      std::cerr << fmt::format("Console port {} is not ready; {} dropped.",
                               endpoint_, to_string(message.type))
                << std::endl;
      return false;
    }
  } catch (const zmq::error_t& e) {
    std::cerr << fmt::format("Cannot send {} on {}: {}",
                             to_string(message.type), endpoint_, e.what())
              << std::endl;
    return false;
  }
  return true;
}

std::optional<PortMessage> ZmqConsolePort::try_receive() {
  while (true) {
    zmq::message_t frame;
    try {
      auto received = socket_.recv(frame, zmq::recv_flags::dontwait);
      if (!received) {
        return std::nullopt;
      }
    } catch (const zmq::error_t& e) {
      std::cerr << fmt::format("Cannot receive on {}: {}", endpoint_, e.what())
                << std::endl;
      return std::nullopt;
    }

    std::string_view payload(static_cast<const char*>(frame.data()),
                             frame.size());
    std::optional<PortMessage> message = decode_message(payload);
    if (message) {
      return message;
    }
    std::cerr << fmt::format("Warning: Ignoring unknown message on {}.",
                             endpoint_)
              << std::endl;
  }
}

std::string make_console_endpoint() {
  static std::atomic<unsigned> counter{0};
  std::filesystem::path socket_path =
      SysUtils::get_runtime_dir() /
      fmt::format("logdock-{}-{}.console", getpid(), ++counter);
  return "ipc://" + socket_path.string();
}
