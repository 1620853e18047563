#include "client_tracker.hpp"

#include "internal/observability/logging.hpp"

namespace gearledger::sync {

ClientTracker::ClientTracker(std::chrono::milliseconds stale_after, std::chrono::milliseconds sweep_interval,
                             std::shared_ptr<SyncObserver> observer)
    : stale_after_(stale_after), sweep_interval_(sweep_interval), observer_(std::move(observer)) {
}

ClientTracker::~ClientTracker() {
  Stop();
}

bool ClientTracker::Touch(const std::string& address) {
  const auto now = Clock::now();

  bool        is_new = false;
  std::size_t count  = 0;
  {
    std::lock_guard lock(mutex_);
    auto            it = last_seen_.find(address);
    is_new             = it == last_seen_.end() || now - it->second > stale_after_;
    last_seen_[address] = now;
    for (const auto& [peer, seen] : last_seen_) {
      if (now - seen <= stale_after_) {
        ++count;
      }
    }
  }

  if (is_new) {
    GEARLEDGER_LOG_INFO("client connected", {observability::StringField("address", address)});
    // A stale entry not yet swept can leave the live count unchanged.
    Report(count, /*force=*/true);
  }
  return is_new;
}

std::size_t ClientTracker::Count() const {
  const auto      now = Clock::now();
  std::lock_guard lock(mutex_);

  std::size_t live = 0;
  for (const auto& [address, seen] : last_seen_) {
    if (now - seen <= stale_after_) {
      ++live;
    }
  }
  return live;
}

std::vector<std::string> ClientTracker::Addresses() const {
  std::lock_guard          lock(mutex_);
  std::vector<std::string> out;
  out.reserve(last_seen_.size());
  for (const auto& [address, seen] : last_seen_) {
    out.push_back(address);
  }
  return out;
}

std::size_t ClientTracker::Sweep() {
  const auto  now   = Clock::now();
  std::size_t count = 0;
  {
    std::lock_guard lock(mutex_);
    for (auto it = last_seen_.begin(); it != last_seen_.end();) {
      if (now - it->second > stale_after_) {
        GEARLEDGER_LOG_INFO("client went stale", {observability::StringField("address", it->first)});
        it = last_seen_.erase(it);
      } else {
        ++it;
      }
    }
    count = last_seen_.size();
  }

  Report(count);
  return count;
}

void ClientTracker::Report(std::size_t count, bool force) {
  {
    std::lock_guard lock(mutex_);
    if (count == last_reported_ && !force) {
      return;
    }
    last_reported_ = count;
  }
  if (observer_) {
    observer_->OnClientCountChanged(count);
  }
}

void ClientTracker::Start() {
  std::lock_guard lock(run_mutex_);
  if (running_) {
    return;
  }
  running_ = true;
  thread_  = std::thread(&ClientTracker::Run, this);
}

void ClientTracker::Stop() {
  {
    std::lock_guard lock(run_mutex_);
    running_ = false;
  }
  run_cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void ClientTracker::Run() {
  std::unique_lock lock(run_mutex_);
  while (running_) {
    if (run_cv_.wait_for(lock, sweep_interval_, [this] { return !running_; })) {
      break;
    }
    lock.unlock();
    Sweep();
    lock.lock();
  }
}

} // namespace gearledger::sync
