#include "detach_coordinator.h"

#include <fmt/core.h>

#include <iostream>

const char* to_string(DetachState state) {
  switch (state) {
    case DetachState::Embedded:
      return "embedded";
    case DetachState::DetachPending:
      return "detach-pending";
    case DetachState::Detached:
      return "detached";
    case DetachState::ReattachPending:
      return "reattach-pending";
  }
  return "embedded";
}

DetachCoordinator::DetachCoordinator(LogHub& hub, ConsoleModel& embedded,
                                     PortFactory open_port,
                                     WindowLauncher& launcher)
    : hub_(hub),
      embedded_(embedded),
      open_port_(std::move(open_port)),
      launcher_(launcher) {}

DetachCoordinator::~DetachCoordinator() {
  forwarder_.dispose();
  if (port_ && (state_ == DetachState::Detached ||
                state_ == DetachState::DetachPending)) {
    port_->send(PortMessage::of(PortMessage::Type::Reattach));
  }
}

bool DetachCoordinator::request_detach() {
  if (state_ != DetachState::Embedded) {
    return false;
  }

  try {
    port_ = open_port_();
  } catch (const std::exception& e) {
    std::cerr << fmt::format("Cannot open console port: {}", e.what())
              << std::endl;
    port_.reset();
    return false;
  }
  if (!port_) {
    std::cerr << "Cannot open console port." << std::endl;
    return false;
  }

  std::string error;
  if (!launcher_.launch(port_->endpoint(), error)) {
    std::cerr << fmt::format("Cannot detach console: {}", error) << std::endl;
    port_.reset();
    return false;
  }

  state_ = DetachState::DetachPending;
  std::clog << fmt::format("Waiting for console window on {}.",
                           port_->endpoint())
            << std::endl;
  return true;
}

void DetachCoordinator::request_reattach() {
  switch (state_) {
    case DetachState::DetachPending:
      std::clog << "Console detach cancelled." << std::endl;
      if (port_) {
        port_->send(PortMessage::of(PortMessage::Type::Reattach));
      }
      return_to_embedded();
      break;
    case DetachState::Detached:
      if (port_->send(PortMessage::of(PortMessage::Type::Reattach))) {
        state_ = DetachState::ReattachPending;
      } else {
        // the window cannot hear us; take the console back now
        return_to_embedded();
      }
      break;
    case DetachState::Embedded:
    case DetachState::ReattachPending:
      break;
  }
}

void DetachCoordinator::poll() {
  if (window_lost_) {
    window_lost_ = false;
    std::cerr << "Warning: Console window stopped receiving logs; showing the "
                 "embedded console."
              << std::endl;
    if (port_) {
      port_->send(PortMessage::of(PortMessage::Type::Reattach));
    }
    return_to_embedded();
  }

  while (port_) {
    std::optional<PortMessage> message = port_->try_receive();
    if (!message) {
      break;
    }
    on_message(*message);
  }

  // also reaps a window that exits after it reattached
  if (std::optional<int> status = launcher_.poll_exit()) {
    on_window_exit(*status);
  }
}

void DetachCoordinator::on_message(const PortMessage& message) {
  switch (message.type) {
    case PortMessage::Type::ConsoleDetached:
      if (state_ != DetachState::DetachPending) {
        break;
      }
      // the embedded view stops before the window gets its first record
      embedded_.detach();
      {
        PortMessage snapshot = PortMessage::of(PortMessage::Type::Snapshot);
        snapshot.records = hub_.snapshot();
        snapshot.log_path = log_path_;
        if (!port_->send(snapshot)) {
          std::cerr << "Console window did not receive the log snapshot."
                    << std::endl;
          return_to_embedded();
          break;
        }
      }
      start_forwarding();
      state_ = DetachState::Detached;
      std::clog << "Console detached." << std::endl;
      break;
    case PortMessage::Type::ConsoleAttached:
      return_to_embedded();
      std::clog << "Console reattached." << std::endl;
      break;
    case PortMessage::Type::Record:
      for (const auto& record : message.records) {
        hub_.publish(record);
      }
      break;
    case PortMessage::Type::Clear:
      hub_.clear();
      break;
    case PortMessage::Type::Snapshot:
    case PortMessage::Type::Cleared:
    case PortMessage::Type::Reattach:
      std::cerr << fmt::format("Warning: Unexpected {} message from console "
                               "window.",
                               to_string(message.type))
                << std::endl;
      break;
  }
}

void DetachCoordinator::on_window_exit(int status) {
  switch (state_) {
    case DetachState::DetachPending:
      // a terminal wrapper may fork and exit 0 before the window connects
      if (status != 0) {
        std::cerr << fmt::format("Console window exited with status {}.",
                                 status)
                  << std::endl;
        return_to_embedded();
      }
      break;
    case DetachState::Detached:
      std::cerr << "Warning: Console window closed without reattaching."
                << std::endl;
      return_to_embedded();
      break;
    case DetachState::ReattachPending:
      return_to_embedded();
      break;
    case DetachState::Embedded:
      break;
  }
}

void DetachCoordinator::start_forwarding() {
  window_lost_ = false;
  forwarder_ = hub_.subscribe([this](const LogEvent& event) {
    if (!port_) return;
    PortMessage message;
    switch (event.kind) {
      case LogEvent::Kind::Appended:
        message.type = PortMessage::Type::Record;
        message.records.push_back(*event.record);
        break;
      case LogEvent::Kind::Cleared:
        message.type = PortMessage::Type::Cleared;
        break;
      case LogEvent::Kind::Reset:
        message.type = PortMessage::Type::Snapshot;
        message.records = hub_.snapshot();
        message.log_path = log_path_;
        break;
    }
    // the send error record is queued behind this event; stop first
    if (!port_->send(message)) {
      forwarder_.dispose();
      window_lost_ = true;
    }
  });
}

void DetachCoordinator::return_to_embedded() {
  // the forwarder goes first so the window never shares the live role
  forwarder_.dispose();
  port_.reset();
  state_ = DetachState::Embedded;
  embedded_.attach();
}
