#include "layout_store.h"

#include <fmt/core.h>

#include <algorithm>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

#include "log_export.h"
#include "sys_utils.h"

using json = nlohmann::json;

const char* to_string(DockPosition position) {
  return position == DockPosition::Right ? "right" : "bottom";
}

std::optional<DockPosition> parse_dock_position(std::string_view name) {
  if (name == "right") return DockPosition::Right;
  if (name == "bottom") return DockPosition::Bottom;
  return std::nullopt;
}

int LayoutStore::default_size(DockPosition position) {
  return position == DockPosition::Right ? 400 : 300;
}

int LayoutStore::clamp_size(DockPosition position, int size) {
  if (position == DockPosition::Right) {
    return std::clamp(size, RIGHT_MIN, RIGHT_MAX);
  }
  return std::clamp(size, BOTTOM_MIN, BOTTOM_MAX);
}

ConsoleLayoutState LayoutStore::clamp(const ConsoleLayoutState& state) {
  return ConsoleLayoutState{state.position,
                            clamp_size(state.position, state.size)};
}

ConsoleLayoutState LayoutStore::load() const {
  ConsoleLayoutState state = default_state();

  std::ifstream file(SysUtils::make_path_string(file_path_));
  if (!file.is_open()) {
    return state;
  }

  json data;
  try {
    data = json::parse(file);
  } catch (const json::parse_error& e) {
    std::cerr << fmt::format(
                     "Warning: Error parsing layout file {}. Using defaults. "
                     "Details: {}",
                     file_path_, e.what())
              << std::endl;
    return state;
  }

  if (!data.is_object() || !data.contains(STORAGE_KEY)) {
    return state;
  }
  const json& saved = data[STORAGE_KEY];
  if (!saved.is_object()) {
    return state;
  }

  auto position_it = saved.find("position");
  if (position_it == saved.end() || !position_it->is_string()) {
    return state;
  }
  std::optional<DockPosition> position =
      parse_dock_position(position_it->get<std::string>());
  if (!position) {
    return state;
  }

  state.position = *position;
  state.size = default_size(*position);
  auto size_it = saved.find("size");
  if (size_it != saved.end() && size_it->is_number()) {
    double size = size_it->get<double>();
    // huge values must not overflow the int conversion
    size = std::clamp(size, 0.0, 100000.0);
    state.size = clamp_size(*position, static_cast<int>(size));
  }
  return state;
}

bool LayoutStore::save(const ConsoleLayoutState& state) const {
  ConsoleLayoutState clamped = clamp(state);

  // keep unrelated keys that may share the file
  json data = json::object();
  std::ifstream existing(SysUtils::make_path_string(file_path_));
  if (existing.is_open()) {
    json parsed = json::parse(existing, nullptr, false);
    if (parsed.is_object()) {
      data = std::move(parsed);
    }
  }
  data[STORAGE_KEY] = {{"position", to_string(clamped.position)},
                       {"size", clamped.size}};

  return write_file_atomically(file_path_, data.dump(4));
}

int CellMetrics::to_cells(const ConsoleLayoutState& state) const {
  int unit = state.position == DockPosition::Right ? cell_width_px
                                                   : cell_height_px;
  return std::max(1, state.size / std::max(1, unit));
}

int CellMetrics::to_pixels(DockPosition position, int cells) const {
  int unit = position == DockPosition::Right ? cell_width_px : cell_height_px;
  return cells * std::max(1, unit);
}
