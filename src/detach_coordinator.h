#pragma once

#include <functional>
#include <memory>
#include <string>

#include "console_model.h"
#include "console_port.h"
#include "log_hub.h"
#include "window_launcher.h"

enum class DetachState { Embedded, DetachPending, Detached, ReattachPending };

const char* to_string(DetachState state);

/**
 * @brief Moves the live console between the embedded panel and a standalone
 * window, keeping exactly one of them live.
 *
 *   Embedded --request_detach()--> DetachPending
 *   DetachPending --console-detached--> Detached (embedded hidden, snapshot sent)
 *   DetachPending --window failed / request_reattach()--> Embedded
 *   Detached --request_reattach()--> ReattachPending
 *   Detached, ReattachPending --console-attached / window exit--> Embedded
 *
 * Every transition is driven by a port message, a launcher event or an
 * explicit request; poll() must be called from the UI loop.
 */
class DetachCoordinator {
 public:
  // Opens a fresh port bound to a new endpoint. May throw.
  using PortFactory = std::function<std::unique_ptr<ConsolePort>()>;

  DetachCoordinator(LogHub& hub, ConsoleModel& embedded,
                    PortFactory open_port, WindowLauncher& launcher);
  ~DetachCoordinator();

  DetachCoordinator(const DetachCoordinator&) = delete;
  DetachCoordinator& operator=(const DetachCoordinator&) = delete;

  /**
   * @brief Opens a port and launches the window. Failures are logged and
   * leave the console embedded.
   * @return true if the state is now DetachPending.
   */
  bool request_detach();

  /**
   * @brief Asks the detached window to close, or cancels a pending detach.
   */
  void request_reattach();

  /**
   * @brief Handles queued port messages and launcher events.
   */
  void poll();

  DetachState state() const { return state_; }

  // Sent with the snapshot so the window can show it.
  void set_log_path(std::string log_path) { log_path_ = std::move(log_path); }

 private:
  void on_message(const PortMessage& message);
  void on_window_exit(int status);
  void start_forwarding();
  void return_to_embedded();

  LogHub& hub_;
  ConsoleModel& embedded_;
  PortFactory open_port_;
  WindowLauncher& launcher_;

  DetachState state_ = DetachState::Embedded;
  std::unique_ptr<ConsolePort> port_;
  Subscription forwarder_;
  bool window_lost_ = false;
  std::string log_path_;
};
