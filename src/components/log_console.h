#pragma once
#include <ftxui/component/component.hpp>
#include <ftxui/screen/box.hpp>
#include <functional>
#include <string>
#include <vector>

#include "console_model.h"
#include "layout_store.h"

// What the console buttons do in the host that shows the panel.
struct ConsoleActions {
  std::function<void()> clear;
  std::function<void()> close;
  std::function<void()> detach;            // empty: no detach button
  std::function<void(DockPosition)> dock;  // empty: no dock buttons
  std::function<void(int)> resize;         // by +/- cells; empty: fixed size
  std::function<std::string()> log_path;
};

struct ConsolePanelOptions {
  std::string title = "Console";
  std::string close_label = "close";
  std::string issue_tracker_url;
  std::string export_dir;
  std::string platform;
};

/**
 * @brief The console view: header with counts and actions, filter bar,
 * virtualized rows and a footer.
 *
 * Rows come from a ConsoleModel; only its visible range is turned into
 * elements each frame.
 */
class ConsolePanel {
 private:
  ConsoleModel& model_;
  ConsoleActions actions_;
  ConsolePanelOptions options_;

  std::vector<std::string> source_entries_{"all", "local", "remote"};
  std::vector<std::string> level_entries_{"any", "err", "warn",
                                          "info", "dbg", "trc"};
  int source_selected_ = 0;
  int level_selected_ = 0;
  std::string filter_text_;

  ftxui::Component filter_bar_;
  ftxui::Component action_buttons_;
  ftxui::Component rows_;
  ftxui::Component main_component_;
  ftxui::Box rows_box_;

  static inline const int SCROLL_STEP = 3;
  static inline const int TARGET_WIDTH = 16;

 public:
  ConsolePanel(ConsoleModel& model, ConsoleActions actions,
               ConsolePanelOptions options);

  ftxui::Component get_component();

  // Actions also reachable from the host's own key bindings.
  void export_logs();
  void copy_logs();
  void report_bug();
  void open_log_folder();

 private:
  void setup_filter_bar();
  void setup_action_buttons();
  void setup_rows();

  void apply_filter();
  bool handle_scroll_event(ftxui::Event event);

  ftxui::Element render_header();
  ftxui::Element render_rows();
  ftxui::Element render_row(const LogRecord& record);
  ftxui::Element render_footer();
};
