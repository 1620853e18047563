#include "event_hub.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"

namespace gearledger::sync {

Subscription::Subscription(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {
}

bool Subscription::TryPush(std::string event) {
  {
    std::lock_guard lock(mutex_);
    if (closed_ || queue_.size() >= capacity_) {
      return false;
    }
    queue_.push_back(std::move(event));
  }
  cv_.notify_one();
  return true;
}

Subscription::PopStatus Subscription::Pop(std::chrono::milliseconds timeout, std::string* out) {
  std::unique_lock lock(mutex_);
  if (!cv_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); })) {
    return PopStatus::kTimeout;
  }
  // Drain what is queued before reporting the close.
  if (!queue_.empty()) {
    *out = std::move(queue_.front());
    queue_.pop_front();
    return PopStatus::kEvent;
  }
  return PopStatus::kClosed;
}

void Subscription::Close() {
  {
    std::lock_guard lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool Subscription::IsClosed() const {
  std::lock_guard lock(mutex_);
  return closed_;
}

EventHub::EventHub(std::size_t queue_capacity) : queue_capacity_(queue_capacity) {
}

std::shared_ptr<Subscription> EventHub::Subscribe() {
  auto subscription = std::make_shared<Subscription>(queue_capacity_);
  std::lock_guard lock(mutex_);
  if (closed_) {
    subscription->Close();
  } else {
    subscribers_.push_back(subscription);
  }
  return subscription;
}

void EventHub::Unsubscribe(const std::shared_ptr<Subscription>& subscription) {
  subscription->Close();
  std::lock_guard lock(mutex_);
  subscribers_.erase(std::remove(subscribers_.begin(), subscribers_.end(), subscription), subscribers_.end());
}

std::size_t EventHub::Publish(const std::string& event) {
  std::vector<std::shared_ptr<Subscription>> snapshot;
  {
    std::lock_guard lock(mutex_);
    snapshot = subscribers_;
  }

  std::size_t                                delivered = 0;
  std::vector<std::shared_ptr<Subscription>> evicted;
  for (const auto& subscriber : snapshot) {
    if (subscriber->TryPush(event)) {
      ++delivered;
    } else {
      evicted.push_back(subscriber);
    }
  }

  for (const auto& subscriber : evicted) {
    Unsubscribe(subscriber);
  }
  if (!evicted.empty()) {
    GEARLEDGER_LOG_WARN("evicted slow or closed SSE subscribers", {observability::IntField("count", static_cast<int64_t>(evicted.size()))});
  }
  return delivered;
}

std::size_t EventHub::SubscriberCount() const {
  std::lock_guard lock(mutex_);
  return subscribers_.size();
}

void EventHub::CloseAll() {
  std::vector<std::shared_ptr<Subscription>> snapshot;
  {
    std::lock_guard lock(mutex_);
    closed_ = true;
    snapshot.swap(subscribers_);
  }
  for (const auto& subscriber : snapshot) {
    subscriber->Close();
  }
}

} // namespace gearledger::sync
