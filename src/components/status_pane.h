#pragma once
#include <ftxui/component/component.hpp>
#include <functional>
#include <string>

#include "detach_coordinator.h"
#include "layout_store.h"
#include "remote_subscriber.h"

// Host-side overview: where logs come from and where the console lives.
class StatusPane {
 private:
  RemoteSubscriber& remote_;
  DetachCoordinator& coordinator_;
  std::function<ConsoleLayoutState()> layout_;
  std::function<bool()> console_visible_;

  ftxui::Component action_buttons_;
  ftxui::Component main_component_;

  static inline const int LABEL_WIDTH = 16;

 public:
  StatusPane(RemoteSubscriber& remote, DetachCoordinator& coordinator,
             std::function<ConsoleLayoutState()> layout,
             std::function<bool()> console_visible);

  ftxui::Component get_component();

 private:
  void setup_action_buttons();
  ftxui::Element create_row(const std::string& label, ftxui::Element value);
};
