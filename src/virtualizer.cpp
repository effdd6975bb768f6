#include "virtualizer.h"

#include <algorithm>

Virtualizer::Virtualizer(int row_height, int overscan)
    : row_height_(std::max(1, row_height)), overscan_(std::max(0, overscan)) {}

void Virtualizer::set_viewport_height(int height) {
  height = std::max(0, height);
  if (height == viewport_height_) return;
  viewport_height_ = height;
  if (auto_scroll_) {
    scroll_to_end();
  }
}

void Virtualizer::on_rows_appended(size_t row_count) {
  row_count_ = row_count;
  if (auto_scroll_) {
    scroll_to_end();
  }
}

void Virtualizer::on_rows_reset(size_t row_count) {
  row_count_ = row_count;
  if (auto_scroll_) {
    scroll_to_end();
  } else {
    scroll_to(scroll_top_);
  }
}

VisibleRange Virtualizer::visible_range() const {
  int first_row = scroll_top_ / row_height_;
  size_t start = static_cast<size_t>(std::max(0, first_row - overscan_));
  start = std::min(start, row_count_);
  size_t end = std::min(row_count_, start + max_rendered_rows());
  return VisibleRange{start, end};
}

size_t Virtualizer::max_rendered_rows() const {
  int rows_in_view = (viewport_height_ + row_height_ - 1) / row_height_;
  return static_cast<size_t>(rows_in_view + 2 * overscan_);
}

int Virtualizer::max_scroll_top() const {
  return std::max(0, total_height() - viewport_height_);
}

void Virtualizer::scroll_to(int top) {
  scroll_top_ = std::clamp(top, 0, max_scroll_top());
}

void Virtualizer::scroll_to_end() { scroll_top_ = max_scroll_top(); }

void Virtualizer::set_auto_scroll(bool enabled) {
  auto_scroll_ = enabled;
  if (auto_scroll_) {
    scroll_to_end();
  }
}
