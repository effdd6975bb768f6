#pragma once
#include <functional>
#include <mutex>
#include <sstream>
#include <string>

// Passes everything written to a stream through to the stream's original
// buffer, and reports each complete line to a handler.
class LogStreamBuffer : public std::stringbuf {
 public:
  using LineHandler = std::function<void(const std::string& line)>;

  // Must be constructed before the stream is redirected to it.
  LogStreamBuffer(std::ostream& stream, LineHandler on_line)
      : original_(stream.rdbuf()), on_line_(std::move(on_line)) {}
  ~LogStreamBuffer() override { pubsync(); }

  std::streambuf* original() const { return original_; }

 protected:
  int sync() override;

 private:
  std::streambuf* original_;
  LineHandler on_line_;
  std::string partial_line_;
  std::mutex mutex_;
};

// to redirect stream to a LogStreamBuffer
class StreamRedirector {
 public:
  StreamRedirector(std::ostream& stream, std::streambuf* new_buf)
      : stream_(stream), old_buf_(stream.rdbuf(new_buf)) {}

  ~StreamRedirector() { stream_.rdbuf(old_buf_); }

  StreamRedirector(const StreamRedirector&) = delete;
  StreamRedirector& operator=(const StreamRedirector&) = delete;

 private:
  std::ostream& stream_;
  std::streambuf* old_buf_;
};
