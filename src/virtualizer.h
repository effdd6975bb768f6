#pragma once

#include <cstddef>

struct VisibleRange {
  size_t start = 0;
  size_t end = 0;  // exclusive

  size_t size() const { return end - start; }
};

/**
 * @brief Scroll geometry for a list of fixed-height rows.
 *
 * Only the rows in visible_range() are ever drawn:
 *   start = max(0, floor(scroll_top / H) - K)
 *   end   = min(N, start + ceil(V / H) + 2K)
 * where H is the row height, V the viewport height, K the overscan and N the
 * row count. All quantities share one unit (pixels, or cells in a terminal).
 */
class Virtualizer {
 public:
  Virtualizer(int row_height, int overscan);

  void set_viewport_height(int height);

  /**
   * @brief Rows were appended. Follows the tail only when auto-scroll is on.
   */
  void on_rows_appended(size_t row_count);

  /**
   * @brief The row list was rebuilt (filter change, clear, reset).
   */
  void on_rows_reset(size_t row_count);

  VisibleRange visible_range() const;
  size_t max_rendered_rows() const;

  int row_top(size_t index) const { return static_cast<int>(index) * row_height_; }
  int total_height() const { return row_top(row_count_); }
  int max_scroll_top() const;

  int scroll_top() const { return scroll_top_; }
  void scroll_to(int top);
  void scroll_by(int delta) { scroll_to(scroll_top_ + delta); }
  void scroll_rows(int rows) { scroll_by(rows * row_height_); }
  void scroll_pages(int pages) { scroll_by(pages * viewport_height_); }
  void scroll_to_end();

  bool auto_scroll() const { return auto_scroll_; }
  void set_auto_scroll(bool enabled);

  int row_height() const { return row_height_; }
  int overscan() const { return overscan_; }
  int viewport_height() const { return viewport_height_; }
  size_t row_count() const { return row_count_; }

 private:
  int row_height_;
  int overscan_;
  int viewport_height_ = 0;
  size_t row_count_ = 0;
  int scroll_top_ = 0;
  bool auto_scroll_ = true;
};
