#include "log_hub.h"

// -----------------------------------------------------------------------------
// Subscription
// -----------------------------------------------------------------------------

Subscription::Subscription(Subscription&& other) noexcept
    : registry_(std::move(other.registry_)), id_(other.id_) {
  other.id_ = 0;
}

Subscription& Subscription::operator=(Subscription&& other) noexcept {
  if (this != &other) {
    dispose();
    registry_ = std::move(other.registry_);
    id_ = other.id_;
    other.id_ = 0;
  }
  return *this;
}

void Subscription::dispose() {
  if (id_ == 0) return;
  if (auto registry = registry_.lock()) {
    registry->listeners.erase(id_);
  }
  registry_.reset();
  id_ = 0;
}

bool Subscription::active() const {
  if (id_ == 0) return false;
  auto registry = registry_.lock();
  return registry && registry->listeners.count(id_) > 0;
}

// -----------------------------------------------------------------------------
// LogHub
// -----------------------------------------------------------------------------

LogHub::LogHub(size_t capacity)
    : buffer_(capacity),
      registry_(std::make_shared<hub_detail::Registry>()) {}

void LogHub::publish(const LogRecord& record) {
  dispatch([this, record] {
    std::optional<LogRecord> evicted = buffer_.append(record);
    LogEvent event;
    event.kind = LogEvent::Kind::Appended;
    event.record = &record;
    event.evicted = evicted ? &*evicted : nullptr;
    notify(event);
  });
}

void LogHub::clear() {
  dispatch([this] {
    buffer_.clear();
    LogEvent event;
    event.kind = LogEvent::Kind::Cleared;
    notify(event);
  });
}

void LogHub::replace(std::vector<LogRecord> records) {
  dispatch([this, records = std::move(records)] {
    buffer_.replace(records);
    LogEvent event;
    event.kind = LogEvent::Kind::Reset;
    notify(event);
  });
}

Subscription LogHub::subscribe(LogListener listener) {
  uint64_t id = registry_->next_id++;
  registry_->listeners[id] =
      std::make_shared<LogListener>(std::move(listener));
  return Subscription(registry_, id);
}

void LogHub::dispatch(std::function<void()> operation) {
  pending_.push_back(std::move(operation));
  if (dispatching_) return;

  struct DispatchGuard {
    bool& flag;
    explicit DispatchGuard(bool& f) : flag(f) { flag = true; }
    ~DispatchGuard() { flag = false; }
  } guard(dispatching_);

  while (!pending_.empty()) {
    std::function<void()> next = std::move(pending_.front());
    pending_.pop_front();
    next();
  }
}

void LogHub::notify(const LogEvent& event) {
  std::vector<uint64_t> ids;
  ids.reserve(registry_->listeners.size());
  for (const auto& [id, listener] : registry_->listeners) {
    ids.push_back(id);
  }
  for (uint64_t id : ids) {
    // a listener may have been disposed by an earlier one
    auto it = registry_->listeners.find(id);
    if (it == registry_->listeners.end()) continue;
    std::shared_ptr<LogListener> listener = it->second;
    (*listener)(event);
  }
}
