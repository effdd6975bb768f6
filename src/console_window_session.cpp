#include "console_window_session.h"

#include <fmt/core.h>

#include <iostream>

ConsoleWindowSession::ConsoleWindowSession(std::unique_ptr<ConsolePort> port,
                                           size_t capacity)
    : port_(std::move(port)), mirror_(capacity) {}

bool ConsoleWindowSession::announce() {
  if (state_ != DetachState::Embedded || closed_) {
    return false;
  }
  if (!port_->send(PortMessage::of(PortMessage::Type::ConsoleDetached))) {
    return false;
  }
  state_ = DetachState::DetachPending;
  return true;
}

size_t ConsoleWindowSession::poll() {
  size_t handled = 0;
  while (std::optional<PortMessage> message = port_->try_receive()) {
    on_message(*message);
    ++handled;
  }
  return handled;
}

void ConsoleWindowSession::on_message(const PortMessage& message) {
  switch (message.type) {
    case PortMessage::Type::Snapshot:
      mirror_.replace(message.records);
      log_path_ = message.log_path;
      if (state_ == DetachState::DetachPending) {
        state_ = DetachState::Detached;
      }
      break;
    case PortMessage::Type::Record:
      for (const auto& record : message.records) {
        mirror_.publish(record);
      }
      break;
    case PortMessage::Type::Cleared:
      mirror_.clear();
      break;
    case PortMessage::Type::Reattach:
      reattach_requested_ = true;
      break;
    case PortMessage::Type::ConsoleDetached:
    case PortMessage::Type::ConsoleAttached:
    case PortMessage::Type::Clear:
      std::cerr << fmt::format("Warning: Unexpected {} message from host.",
                               to_string(message.type))
                << std::endl;
      break;
  }
}

void ConsoleWindowSession::publish(const LogRecord& record) {
  // a failed send logs, and that log line would come straight back here
  if (closed_ || sending_) {
    return;
  }
  sending_ = true;
  PortMessage message = PortMessage::of(PortMessage::Type::Record);
  message.records.push_back(record);
  port_->send(message);
  sending_ = false;
}

bool ConsoleWindowSession::request_clear() {
  if (closed_) {
    return false;
  }
  return port_->send(PortMessage::of(PortMessage::Type::Clear));
}

void ConsoleWindowSession::close() {
  if (closed_) {
    return;
  }
  closed_ = true;
  state_ = DetachState::ReattachPending;
  port_->send(PortMessage::of(PortMessage::Type::ConsoleAttached));
}
