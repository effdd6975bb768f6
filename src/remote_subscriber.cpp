#include "remote_subscriber.h"

#include <fmt/core.h>

#include <algorithm>
#include <iostream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <vector>
#include <zmq_addon.hpp>

using json = nlohmann::json;

namespace {

const std::string REMOTE_TARGET = "remote";

std::string_view frame_view(const zmq::message_t& frame) {
  return std::string_view(static_cast<const char*>(frame.data()), frame.size());
}

}  // namespace

const char* to_string(SubscriberStatus status) {
  switch (status) {
    case SubscriberStatus::Inactive:
      return "inactive";
    case SubscriberStatus::Active:
      return "active";
    case SubscriberStatus::Retrying:
      return "retrying";
  }
  return "inactive";
}

std::chrono::milliseconds ReconnectBackoff::next() {
  std::chrono::milliseconds current = delay_;
  delay_ = std::min(delay_ * 2, MAX_DELAY);
  return current;
}

RemoteSubscriber::RemoteSubscriber(zmq::context_t& context, RecordSink& sink,
                                   std::string endpoint, std::string channel)
    : context_(context),
      sink_(sink),
      endpoint_(std::move(endpoint)),
      channel_(std::move(channel)) {}

bool RemoteSubscriber::subscribe() {
  socket_.reset();
  try {
    zmq::socket_t socket(context_, zmq::socket_type::sub);
    socket.set(zmq::sockopt::linger, 0);
    socket.set(zmq::sockopt::rcvhwm, RECEIVE_HWM);
    socket.set(zmq::sockopt::reconnect_ivl, 100);
    socket.set(zmq::sockopt::reconnect_ivl_max, 5000);
    socket.set(zmq::sockopt::subscribe, channel_);
    socket.connect(endpoint_);
    socket_ = std::move(socket);
  } catch (const zmq::error_t& e) {
    fail(fmt::format("Cannot subscribe to {} on {}: {}", channel_, endpoint_,
                     e.what()));
    return false;
  }

  status_ = SubscriberStatus::Active;
  backoff_.reset();
  std::clog << fmt::format("Listening for remote logs on {} ({}).", endpoint_,
                           channel_)
            << std::endl;
  return true;
}

void RemoteSubscriber::unsubscribe() {
  socket_.reset();
  status_ = SubscriberStatus::Inactive;
  backoff_.reset();
}

size_t RemoteSubscriber::pump(size_t max_events) {
  if (status_ == SubscriberStatus::Retrying && Clock::now() >= retry_at_) {
    subscribe();
  }
  if (status_ != SubscriberStatus::Active || !socket_) {
    return 0;
  }

  size_t published = 0;
  for (size_t i = 0; i < max_events; ++i) {
    std::vector<zmq::message_t> frames;
    try {
      auto result = zmq::recv_multipart(*socket_, std::back_inserter(frames),
                                        zmq::recv_flags::dontwait);
      if (!result) {
        break;
      }
    } catch (const zmq::error_t& e) {
      fail(fmt::format("Remote log channel {} failed: {}", endpoint_,
                       e.what()));
      break;
    }

    // SUB filtering is by prefix; require the exact channel
    if (frames.size() < 2 || frame_view(frames[0]) != channel_) {
      continue;
    }
    std::optional<LogRecord> record = decode_payload(frame_view(frames[1]));
    if (!record) {
      continue;
    }
    sink_.publish(*record);
    ++published;

    // a listener may have torn us down
    if (status_ != SubscriberStatus::Active) {
      break;
    }
  }
  return published;
}

std::optional<LogRecord> RemoteSubscriber::decode_payload(
    std::string_view payload) {
  if (payload.empty()) {
    return std::nullopt;
  }

  std::optional<LogRecord> record;
  json data = json::parse(payload, nullptr, false);
  if (data.is_object()) {
    LogRecord parsed;
    auto timestamp = data.find("timestamp");
    if (timestamp != data.end() && timestamp->is_string()) {
      parsed.timestamp = timestamp->get<std::string>();
    }
    auto level = data.find("level");
    if (level != data.end() && level->is_string()) {
      parsed.level = normalize_level(level->get<std::string>());
    }
    auto target = data.find("target");
    if (target != data.end() && target->is_string()) {
      parsed.target = target->get<std::string>();
    }
    auto message = data.find("message");
    if (message != data.end()) {
      parsed.message = message->is_string()
                           ? message->get<std::string>()
                           : message->dump(-1, ' ', false,
                                           json::error_handler_t::replace);
    }
    record = std::move(parsed);
  } else {
    std::string_view line = payload;
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
      line.remove_suffix(1);
    }
    record = parse_log_line(line, LogSource::Remote);
    if (!record) {
      // unterminated header: keep the text
      record = LogRecord();
      record->message = std::string(line);
    }
  }

  record->source = LogSource::Remote;
  if (record->timestamp.empty()) {
    record->timestamp = current_timestamp();
  }
  if (record->target.empty()) {
    record->target = REMOTE_TARGET;
  }
  return record;
}

void RemoteSubscriber::fail(const std::string& reason) {
  socket_.reset();
  status_ = SubscriberStatus::Retrying;
  std::chrono::milliseconds delay = backoff_.next();
  retry_at_ = Clock::now() + delay;
  sink_.publish(make_record(
      LogLevel::Error, ERROR_TARGET,
      fmt::format("{} Retrying in {} ms.", reason, delay.count()),
      LogSource::Local));
}
