#include "log_console.h"

#include <fmt/core.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iostream>

#include "log_export.h"
#include "sys_utils.h"

using namespace ftxui;

static Color level_color(LogLevel level) {
  switch (level) {
    case LogLevel::Error:
      return Color::Red;
    case LogLevel::Warn:
      return Color::Yellow;
    case LogLevel::Info:
      return Color::Green;
    case LogLevel::Debug:
      return Color::Blue;
    case LogLevel::Trace:
      return Color::GrayDark;
  }
  return Color::Default;
}

static std::string short_time(const std::string& timestamp) {
  // "YYYY-MM-DD HH:MM:SS.mmm" -> "HH:MM:SS.mmm"
  return timestamp.size() > 11 ? timestamp.substr(11) : timestamp;
}

ConsolePanel::ConsolePanel(ConsoleModel& model, ConsoleActions actions,
                           ConsolePanelOptions options)
    : model_(model),
      actions_(std::move(actions)),
      options_(std::move(options)) {
  setup_filter_bar();
  setup_action_buttons();
  setup_rows();

  auto panel_component =
      Container::Vertical({action_buttons_, filter_bar_, rows_});

  main_component_ = Renderer(panel_component, [this] {
    apply_filter();
    return vbox({
               render_header(),
               filter_bar_->Render(),
               separator(),
               rows_->Render() | flex,
               separator(),
               render_footer(),
           }) |
           border;
  });
}

Component ConsolePanel::get_component() { return main_component_; }

// -----------------------------------------------------------------------------
// Setup
// -----------------------------------------------------------------------------

void ConsolePanel::setup_filter_bar() {
  filter_bar_ = Container::Horizontal({
      Toggle(&source_entries_, &source_selected_),
      Toggle(&level_entries_, &level_selected_),
      Input(&filter_text_, "Filter... (/regex/)"),
  });
}

void ConsolePanel::setup_action_buttons() {
  Components buttons;
  if (actions_.dock) {
    buttons.push_back(Button(
        "right", [this] { actions_.dock(DockPosition::Right); },
        ButtonOption::Ascii()));
    buttons.push_back(Button(
        "bottom", [this] { actions_.dock(DockPosition::Bottom); },
        ButtonOption::Ascii()));
  }
  if (actions_.detach) {
    buttons.push_back(
        Button("detach", [this] { actions_.detach(); }, ButtonOption::Ascii()));
  }
  buttons.push_back(
      Button("export", [this] { export_logs(); }, ButtonOption::Ascii()));
  buttons.push_back(
      Button("copy", [this] { copy_logs(); }, ButtonOption::Ascii()));
  buttons.push_back(Button(
      "clear",
      [this] {
        if (actions_.clear) actions_.clear();
      },
      ButtonOption::Ascii()));
  buttons.push_back(Button(
      "auto",
      [this] {
        Virtualizer& v = model_.virtualizer();
        v.set_auto_scroll(!v.auto_scroll());
      },
      ButtonOption::Ascii()));
  if (bug_report_available(options_.issue_tracker_url)) {
    buttons.push_back(
        Button("bug", [this] { report_bug(); }, ButtonOption::Ascii()));
  }
  buttons.push_back(
      Button("logs", [this] { open_log_folder(); }, ButtonOption::Ascii()));
  buttons.push_back(Button(
      options_.close_label,
      [this] {
        if (actions_.close) actions_.close();
      },
      ButtonOption::Ascii()));
  action_buttons_ = Container::Horizontal(buttons);
}

void ConsolePanel::setup_rows() {
  auto rows_renderer = Renderer([this](bool focused) {
    Element rows = render_rows();
    if (focused) {
      rows = rows | bgcolor(Color::Grey11);
    }
    return rows;
  });
  rows_ = CatchEvent(rows_renderer,
                     [this](Event event) { return handle_scroll_event(event); });
}

// -----------------------------------------------------------------------------
// Behavior
// -----------------------------------------------------------------------------

void ConsolePanel::apply_filter() {
  FilterCriteria criteria;
  criteria.source = static_cast<SourceFilter>(source_selected_);
  if (level_selected_ > 0) {
    criteria.level = ALL_LEVELS[level_selected_ - 1];
  }
  criteria.text = filter_text_;
  model_.set_criteria(criteria);
}

bool ConsolePanel::handle_scroll_event(Event event) {
  Virtualizer& v = model_.virtualizer();
  bool scrolled = true;

  if (event.is_mouse()) {
    if (event.mouse().button == Mouse::WheelUp) {
      v.scroll_rows(-SCROLL_STEP);
    } else if (event.mouse().button == Mouse::WheelDown) {
      v.scroll_rows(SCROLL_STEP);
    } else {
      return false;
    }
  } else if (event == Event::ArrowUp) {
    v.scroll_rows(-1);
  } else if (event == Event::ArrowDown) {
    v.scroll_rows(1);
  } else if (event == Event::PageUp) {
    v.scroll_pages(-1);
  } else if (event == Event::PageDown) {
    v.scroll_pages(1);
  } else if (event == Event::Home) {
    v.scroll_to(0);
  } else if (event == Event::End) {
    v.scroll_to_end();
  } else if (event == Event::Character('a')) {
    v.set_auto_scroll(!v.auto_scroll());
    return true;
  } else if (event == Event::Character('[') && actions_.resize) {
    actions_.resize(-1);
    return true;
  } else if (event == Event::Character(']') && actions_.resize) {
    actions_.resize(1);
    return true;
  } else {
    scrolled = false;
  }

  if (scrolled) {
    // reading older rows pauses following; reaching the end resumes it
    v.set_auto_scroll(v.scroll_top() >= v.max_scroll_top());
  }
  return scrolled;
}

void ConsolePanel::export_logs() {
  std::filesystem::path dir =
      options_.export_dir.empty()
          ? SysUtils::get_user_config_path() / "exports"
          : std::filesystem::path(options_.export_dir);
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    std::cerr << fmt::format("Cannot create export directory {}: {}",
                             dir.string(), ec.message())
              << std::endl;
    return;
  }

  auto now = std::chrono::system_clock::now();
  ExportInfo info{now, options_.platform,
                  actions_.log_path ? actions_.log_path() : std::string()};
  std::string path = (dir / default_export_file_name(now)).string();
  ::export_logs(path, model_.hub().snapshot(), info);
}

void ConsolePanel::copy_logs() {
  if (SysUtils::copy_to_clipboard(model_.copy_text())) {
    std::clog << fmt::format("Copied {} log lines to the clipboard.",
                             model_.rows().size())
              << std::endl;
  } else {
    std::cerr << "Failed to copy logs. Is wl-copy or xclip installed?"
              << std::endl;
  }
}

void ConsolePanel::report_bug() {
  if (!bug_report_available(options_.issue_tracker_url)) {
    std::cerr << "No issue_tracker_url configured; cannot open a bug report."
              << std::endl;
    return;
  }
  std::string url = build_bug_report_url(
      options_.issue_tracker_url, model_.hub().snapshot(), options_.platform,
      actions_.log_path ? actions_.log_path() : std::string());
  if (!SysUtils::open_external(url)) {
    std::cerr << "Failed to open the issue tracker." << std::endl;
  }
}

void ConsolePanel::open_log_folder() {
  std::string log_path = actions_.log_path ? actions_.log_path() : "";
  if (log_path.empty()) {
    std::cerr << "No session log file to show." << std::endl;
    return;
  }
  std::string folder = std::filesystem::path(log_path).parent_path().string();
  if (!SysUtils::open_external(folder)) {
    std::cerr << fmt::format("Failed to open {}.", folder) << std::endl;
  }
}

// -----------------------------------------------------------------------------
// Rendering
// -----------------------------------------------------------------------------

Element ConsolePanel::render_header() {
  size_t errors = model_.error_count();
  size_t warnings = model_.warn_count();

  Elements badges;
  badges.push_back(text(options_.title) | bold);
  badges.push_back(text(" "));
  badges.push_back(text(fmt::format("{} err", errors)) |
                   (errors > 0 ? color(Color::Red) : Decorator(dim)));
  badges.push_back(text(" "));
  badges.push_back(text(fmt::format("{} warn", warnings)) |
                   (warnings > 0 ? color(Color::Yellow) : Decorator(dim)));
  if (model_.virtualizer().auto_scroll()) {
    badges.push_back(text(" [auto]") | dim);
  }

  return hbox({
      hbox(badges),
      filler(),
      action_buttons_->Render(),
  });
}

Element ConsolePanel::render_rows() {
  Virtualizer& v = model_.virtualizer();
  v.set_viewport_height(rows_box_.y_max - rows_box_.y_min + 1);

  const auto& rows = model_.rows();
  if (rows.empty()) {
    return vbox({text("No logs") | dim | hcenter, filler()}) | flex |
           reflect(rows_box_);
  }

  // overscan rows above the first visible one have nowhere to go in a
  // terminal, so drawing starts at the scroll position
  VisibleRange range = v.visible_range();
  size_t first = std::max(range.start,
                          static_cast<size_t>(v.scroll_top() / v.row_height()));
  Elements lines;
  for (size_t i = first; i < range.end; ++i) {
    lines.push_back(render_row(rows[i]));
  }
  lines.push_back(filler());
  return vbox(lines) | yframe | flex | reflect(rows_box_);
}

Element ConsolePanel::render_row(const LogRecord& record) {
  return hbox({
      text(short_time(record.timestamp)) | dim,
      text(" "),
      text(level_label(record.level)) | color(level_color(record.level)) |
          size(WIDTH, EQUAL, 5),
      text(record.source == LogSource::Remote ? "R " : "L ") | dim,
      text(record.target) | color(Color::Cyan) |
          size(WIDTH, LESS_THAN, TARGET_WIDTH),
      text(" "),
      text(record.message) | flex,
  });
}

Element ConsolePanel::render_footer() {
  std::string log_path = actions_.log_path ? actions_.log_path() : "";
  std::string count_text =
      model_.rows().size() == model_.total_count()
          ? fmt::format("{} logs", model_.total_count())
          : fmt::format("{} of {} logs", model_.rows().size(),
                        model_.total_count());
  return hbox({
      text(log_path.empty() ? "no session log" : log_path) | dim,
      filler(),
      text(count_text),
  });
}
