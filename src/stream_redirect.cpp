#include "stream_redirect.h"

#include <vector>

int LogStreamBuffer::sync() {
  std::vector<std::string> lines;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string content = str();
    if (content.empty()) {
      return 0;
    }
    str("");

    if (original_ != nullptr) {
      original_->sputn(content.data(), content.size());
      original_->pubsync();
    }

    size_t start = 0;
    while (true) {
      size_t end = content.find('\n', start);
      if (end == std::string::npos) {
        partial_line_.append(content, start, std::string::npos);
        break;
      }
      partial_line_.append(content, start, end - start);
      lines.push_back(std::move(partial_line_));
      partial_line_.clear();
      start = end + 1;
    }
  }

  // outside the lock: a handler may write to this stream again
  for (const auto& line : lines) {
    on_line_(line);
  }
  return 0;
}
