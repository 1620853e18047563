#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace gearledger::sync {

/*
  Bounded FIFO of serialized events for one SSE connection.
*/
class Subscription {
 public:
  enum class PopStatus {
    kEvent,
    kTimeout,
    kClosed,
  };

  explicit Subscription(std::size_t capacity);

  // Non-blocking. False when the queue is full or closed.
  bool TryPush(std::string event);

  // Blocks up to `timeout` for the next event.
  PopStatus Pop(std::chrono::milliseconds timeout, std::string* out);

  void Close();
  bool IsClosed() const;

 private:
  const std::size_t       capacity_;
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::deque<std::string> queue_;
  bool                    closed_ = false;
};

/*
  EventHub

  Best-effort fan-out to live subscribers. No backlog: an event published
  while nobody listens is dropped. A subscriber whose queue is full or closed
  is evicted during Publish().
*/
class EventHub {
 public:
  explicit EventHub(std::size_t queue_capacity);

  std::shared_ptr<Subscription> Subscribe();
  void                          Unsubscribe(const std::shared_ptr<Subscription>& subscription);

  // Returns the number of subscribers that accepted the event.
  std::size_t Publish(const std::string& event);

  std::size_t SubscriberCount() const;

  // Closes every queue so blocked SSE workers return; later subscriptions
  // start closed. Used on shutdown.
  void CloseAll();

 private:
  const std::size_t                          queue_capacity_;
  mutable std::mutex                         mutex_;
  std::vector<std::shared_ptr<Subscription>> subscribers_;
  bool                                       closed_ = false;
};

} // namespace gearledger::sync
