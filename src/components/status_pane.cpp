#include "status_pane.h"

#include <fmt/core.h>

#include "local_interceptor.h"

using namespace ftxui;

#ifndef APP_VERSION  // defined in CMake
#define APP_VERSION "unknown"
#endif

static Color subscriber_color(SubscriberStatus status) {
  switch (status) {
    case SubscriberStatus::Active:
      return Color::Green;
    case SubscriberStatus::Retrying:
      return Color::Yellow;
    case SubscriberStatus::Inactive:
      return Color::GrayDark;
  }
  return Color::Default;
}

StatusPane::StatusPane(RemoteSubscriber& remote,
                       DetachCoordinator& coordinator,
                       std::function<ConsoleLayoutState()> layout,
                       std::function<bool()> console_visible)
    : remote_(remote),
      coordinator_(coordinator),
      layout_(std::move(layout)),
      console_visible_(std::move(console_visible)) {
  setup_action_buttons();

  main_component_ = Renderer(action_buttons_, [this] {
    ConsoleLayoutState layout = layout_();
    std::string console_text =
        coordinator_.state() != DetachState::Embedded
            ? to_string(coordinator_.state())
        : console_visible_()
            ? fmt::format("docked {}, {}px", to_string(layout.position),
                          layout.size)
            : "hidden";

    return vbox({
        text(fmt::format("LogDock {}", APP_VERSION)) | bold | hcenter,
        separator(),
        create_row("Remote endpoint", text(remote_.endpoint())),
        create_row("Remote channel", text(remote_.channel())),
        create_row("Remote status",
                   text(to_string(remote_.status())) |
                       color(subscriber_color(remote_.status()))),
        create_row("Console", text(console_text)),
        separator(),
        window(text("Emit test logs"), action_buttons_->Render()),
        window(text("Keys"),
               vbox({
                   paragraph("F12: show/hide console   F2: detach/reattach   "
                             "Ctrl+C: quit"),
                   paragraph("In the log list: arrows, PgUp/PgDn, Home/End, "
                             "wheel to scroll; a: auto-scroll; [ ]: resize"),
               })),
        filler(),
    });
  });
}

Component StatusPane::get_component() { return main_component_; }

void StatusPane::setup_action_buttons() {
  action_buttons_ = Container::Horizontal({
      Button("info", [] { Log::info("Test info message", 42); }),
      Button("warn", [] { Log::warn("Test warning", "disk almost full"); }),
      Button("error",
             [] {
               Log::Scope("status").error(
                   "Test error",
                   nlohmann::json{{"code", 500}, {"retry", false}});
             }),
      Button("debug", [] { Log::debug("Test debug", 3.25, true); }),
  });
}

Element StatusPane::create_row(const std::string& label, Element value) {
  return hbox({
      text(label) | size(WIDTH, EQUAL, LABEL_WIDTH) | dim,
      value | flex,
  });
}
