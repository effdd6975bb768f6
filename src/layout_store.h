#pragma once

#include <optional>
#include <string>
#include <string_view>

enum class DockPosition { Right, Bottom };

const char* to_string(DockPosition position);
std::optional<DockPosition> parse_dock_position(std::string_view name);

struct ConsoleLayoutState {
  DockPosition position = DockPosition::Bottom;
  int size = 400;  // pixels

  bool operator==(const ConsoleLayoutState& other) const {
    return position == other.position && size == other.size;
  }
};

/**
 * @brief Persists where the embedded console is docked and how large it is.
 *
 * The state lives under one key of a small JSON file; last write wins.
 */
class LayoutStore {
 public:
  static inline const std::string STORAGE_KEY = "logdock-console-state";
  static inline const int RIGHT_MIN = 280;
  static inline const int RIGHT_MAX = 900;
  static inline const int BOTTOM_MIN = 180;
  static inline const int BOTTOM_MAX = 700;

  explicit LayoutStore(std::string file_path)
      : file_path_(std::move(file_path)) {}

  /**
   * @brief Reads the stored state. Anything missing or malformed falls back
   * to defaults; a stored size is clamped.
   */
  ConsoleLayoutState load() const;

  /**
   * @brief Clamps and writes `state` atomically.
   * @return false if the file could not be written.
   */
  bool save(const ConsoleLayoutState& state) const;

  static ConsoleLayoutState default_state() { return ConsoleLayoutState{}; }
  static int default_size(DockPosition position);
  static int clamp_size(DockPosition position, int size);
  static ConsoleLayoutState clamp(const ConsoleLayoutState& state);

  const std::string& file_path() const { return file_path_; }

 private:
  std::string file_path_;
};

// Terminal cells <-> stored pixels.
struct CellMetrics {
  int cell_width_px = 8;
  int cell_height_px = 16;

  // size of the docked panel in cells along its resizable axis
  int to_cells(const ConsoleLayoutState& state) const;
  int to_pixels(DockPosition position, int cells) const;
};
