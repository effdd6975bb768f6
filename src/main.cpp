#include <fcntl.h>
#include <unistd.h>

#include <fmt/core.h>

#include <chrono>
#include <filesystem>
#include <ftxui/component/component.hpp>
#include <ftxui/component/loop.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <iostream>
#include <thread>
#include <zmq.hpp>

#include "app_config.h"
#include "components/log_console.h"
#include "components/status_pane.h"
#include "console_model.h"
#include "console_port.h"
#include "console_window_session.h"
#include "detach_coordinator.h"
#include "layout_store.h"
#include "local_interceptor.h"
#include "log_file_sink.h"
#include "log_hub.h"
#include "remote_subscriber.h"
#include "sys_utils.h"
#include "window_launcher.h"

using namespace ftxui;

#ifndef APP_VERSION  // defined in CMake
#define APP_VERSION "unknown"
#endif

struct CommandLine {
  std::string console_endpoint;  // set: run as a detached console window
  std::string remote_endpoint;
  std::string config_path;
  bool show_version = false;
};

static void print_usage() {
  std::cout << "Usage: logdock [--remote <endpoint>] [--config <file>]\n"
               "       logdock --console-window <endpoint>\n"
               "       logdock --version"
            << std::endl;
}

static bool parse_command_line(int argc, char* argv[], CommandLine& cmd) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    bool has_value = i + 1 < argc;
    if (arg == "--version") {
      cmd.show_version = true;
    } else if (arg == "--console-window" && has_value) {
      cmd.console_endpoint = argv[++i];
    } else if (arg == "--remote" && has_value) {
      cmd.remote_endpoint = argv[++i];
    } else if (arg == "--config" && has_value) {
      cmd.config_path = argv[++i];
    } else {
      std::cerr << fmt::format("Unknown or incomplete argument: {}", arg)
                << std::endl;
      return false;
    }
  }
  return true;
}

// Keeps stderr output from tearing the full-screen UI.
static void redirect_stderr_to_file(const std::filesystem::path& path) {
  int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
  if (fd < 0) {
    std::cerr << fmt::format("Warning: Cannot open {}. Logs will be printed "
                             "to the terminal.",
                             path.string())
              << std::endl;
    return;
  }
  dup2(fd, STDERR_FILENO);
  close(fd);
}

static void run_loop(ScreenInteractive& screen, Component root,
                     const std::function<void()>& on_frame) {
  Loop loop(&screen, root);
  while (!loop.HasQuitted()) {
    if (LocalInterceptor* interceptor = LocalInterceptor::instance()) {
      interceptor->drain_pending();
    }
    on_frame();
    screen.RequestAnimationFrame();
    loop.RunOnce();
    std::this_thread::sleep_for(std::chrono::milliseconds(1000 / 60));
  }
}

// -----------------------------------------------------------------------------
// Detached console window
// -----------------------------------------------------------------------------

static int run_console_window(const std::string& endpoint,
                              const AppConfig& config,
                              zmq::context_t& context) {
  std::unique_ptr<ConsolePort> port;
  try {
    port = ZmqConsolePort::connect(context, endpoint);
  } catch (const zmq::error_t& e) {
    std::cerr << fmt::format("Fatal: Cannot connect to {}: {}", endpoint,
                             e.what())
              << std::endl;
    return 1;
  }

  ConsoleWindowSession session(std::move(port), config.buffer_capacity);
  auto attachment = LocalInterceptor::install().attach(session);

  ConsoleModel model(session.hub(), 1, config.overscan);
  model.attach();

  auto screen = ScreenInteractive::Fullscreen();

  ConsoleActions actions;
  actions.clear = [&session] { session.request_clear(); };
  actions.close = [&screen] { screen.Exit(); };
  actions.log_path = [&session] { return session.log_path(); };

  ConsolePanelOptions options;
  options.title = "Console (detached)";
  options.close_label = "reattach";
  options.issue_tracker_url = config.issue_tracker_url;
  options.export_dir = config.export_dir;
  options.platform = SysUtils::get_platform_name();

  ConsolePanel console(model, actions, options);

  if (!session.announce()) {
    std::cerr << fmt::format("Fatal: Cannot reach the host on {}.", endpoint)
              << std::endl;
    return 1;
  }

  run_loop(screen, console.get_component(), [&] {
    session.poll();
    if (session.reattach_requested()) {
      screen.Exit();
    }
  });

  session.close();
  return 0;
}

// -----------------------------------------------------------------------------
// Host
// -----------------------------------------------------------------------------

static int run_host(const AppConfig& config,
                    const std::filesystem::path& config_dir,
                    zmq::context_t& context) {
  LogHub hub(config.buffer_capacity);
  auto attachment = LocalInterceptor::install().attach(hub);

  std::filesystem::path log_dir = config_dir / "logs";
  LogFileSink::remove_old_logs(log_dir, config.log_retention_days);
  LogFileSink file_sink(hub, log_dir);
  std::string log_path = file_sink.is_open() ? file_sink.path() : "";

  RemoteSubscriber remote(context, hub, config.remote_endpoint,
                          config.remote_channel);
  remote.subscribe();

  LayoutStore layout_store((config_dir / "layout.json").string());
  ConsoleLayoutState layout = layout_store.load();
  bool console_visible = true;

  ConsoleModel embedded(hub, 1, config.overscan);
  embedded.attach();

  ProcessWindowLauncher launcher(config.console_window_command,
                                 SysUtils::get_executable_path());
  DetachCoordinator coordinator(
      hub, embedded,
      [&context] {
        return ZmqConsolePort::bind(context, make_console_endpoint());
      },
      launcher);
  coordinator.set_log_path(log_path);

  auto set_layout = [&layout, &layout_store](const ConsoleLayoutState& next) {
    layout = LayoutStore::clamp(next);
    layout_store.save(layout);
  };

  ConsoleActions actions;
  actions.clear = [&hub] { hub.clear(); };
  actions.close = [&console_visible] { console_visible = false; };
  actions.detach = [&coordinator] { coordinator.request_detach(); };
  actions.dock = [&layout, &set_layout](DockPosition position) {
    if (position != layout.position) {
      set_layout({position, LayoutStore::default_size(position)});
    }
  };
  actions.resize = [&layout, &set_layout, &config](int cells) {
    set_layout({layout.position,
                layout.size +
                    config.cell_metrics.to_pixels(layout.position, cells)});
  };
  actions.log_path = [log_path] { return log_path; };

  ConsolePanelOptions options;
  options.issue_tracker_url = config.issue_tracker_url;
  options.export_dir = config.export_dir;
  options.platform = SysUtils::get_platform_name();

  ConsolePanel console(embedded, actions, options);
  StatusPane status(
      remote, coordinator, [&layout] { return layout; },
      [&console_visible] { return console_visible; });

  auto console_shown = [&] {
    return console_visible && coordinator.state() == DetachState::Embedded;
  };

  auto main_container = Container::Vertical({
      status.get_component(),
      Maybe(console.get_component(), console_shown),
  });

  auto main_renderer = Renderer(main_container, [&] {
    Element content = status.get_component()->Render() | border | flex;
    if (!console_shown()) {
      return content;
    }
    int cells = config.cell_metrics.to_cells(layout);
    Element panel = console.get_component()->Render();
    if (layout.position == DockPosition::Right) {
      return hbox({content, panel | size(WIDTH, EQUAL, cells)});
    }
    return vbox({content, panel | size(HEIGHT, EQUAL, cells)});
  });

  auto root = CatchEvent(main_renderer, [&](Event event) {
    if (event == Event::F12) {
      console_visible = !console_visible;
      return true;
    }
    if (event == Event::F2) {
      if (coordinator.state() == DetachState::Embedded) {
        coordinator.request_detach();
      } else {
        coordinator.request_reattach();
      }
      return true;
    }
    return false;
  });

  std::clog << fmt::format("LogDock {} started. Session log: {}", APP_VERSION,
                           log_path.empty() ? "none" : log_path)
            << std::endl;

  auto screen = ScreenInteractive::Fullscreen();
  run_loop(screen, root, [&] {
    remote.pump();
    coordinator.poll();
  });

  return 0;
}

int main(int argc, char* argv[]) {
  CommandLine cmd;
  if (!parse_command_line(argc, argv, cmd)) {
    print_usage();
    return 2;
  }
  if (cmd.show_version) {
    std::cout << fmt::format("LogDock {}", APP_VERSION) << std::endl;
    return 0;
  }

  std::filesystem::path config_dir = SysUtils::get_user_config_path();
  if (config_dir.empty()) {
    std::cerr << "Fatal: Cannot determine user config directory." << std::endl;
    return 1;
  }

  std::error_code ec;
  std::filesystem::create_directories(config_dir / "logs", ec);
  if (ec) {
    std::cerr << fmt::format("Fatal: Cannot create {}: {}",
                             config_dir.string(), ec.message())
              << std::endl;
    return 1;
  }

  if (isatty(STDERR_FILENO)) {
    redirect_stderr_to_file(config_dir / "logs" / "stderr.log");
  }

  std::string config_path = cmd.config_path.empty()
                                ? (config_dir / "config.json").string()
                                : cmd.config_path;
  ConfigManager config_manager(config_path);
  if (cmd.config_path.empty()) {
    config_manager.write_defaults_if_missing();
  }
  AppConfig config = config_manager.load();
  if (!cmd.remote_endpoint.empty()) {
    config.remote_endpoint = cmd.remote_endpoint;
  }

  std::unique_ptr<zmq::context_t> context;
  try {
    context = std::make_unique<zmq::context_t>(1);
  } catch (const zmq::error_t& e) {
    std::cerr << fmt::format("Fatal: Cannot initialize ZeroMQ: {}", e.what())
              << std::endl;
    return 1;
  }

  if (!cmd.console_endpoint.empty()) {
    return run_console_window(cmd.console_endpoint, config, *context);
  }
  return run_host(config, config_dir, *context);
}
