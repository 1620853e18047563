#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "internal/util/time.hpp"
#include "sync_observer.hpp"

namespace gearledger::sync {

/*
  ClientTracker

  Liveness heuristic keyed by peer address. Any recognized client request
  refreshes the entry; a background sweep drops entries idle for longer than
  `stale_after` and reports count changes to the observer.

  Several logical clients behind one address collapse into one entry.
*/
class ClientTracker {
 public:
  ClientTracker(std::chrono::milliseconds stale_after, std::chrono::milliseconds sweep_interval,
                std::shared_ptr<SyncObserver> observer = nullptr);
  ~ClientTracker();

  ClientTracker(const ClientTracker&)            = delete;
  ClientTracker& operator=(const ClientTracker&) = delete;

  // Returns true when the address was not tracked (or had expired).
  bool Touch(const std::string& address);

  // Live entries, without mutating the map.
  std::size_t Count() const;

  std::vector<std::string> Addresses() const;

  // Drops stale entries; notifies when the count differs from the last report.
  std::size_t Sweep();

  void Start();
  void Stop();

 private:
  using Clock = util::SteadyClock;

  void Run();
  void Report(std::size_t count, bool force = false);

  const std::chrono::milliseconds stale_after_;
  const std::chrono::milliseconds sweep_interval_;
  std::shared_ptr<SyncObserver>   observer_;

  mutable std::mutex                                  mutex_;
  std::unordered_map<std::string, Clock::time_point>  last_seen_;
  std::size_t                                         last_reported_ = 0;

  std::mutex              run_mutex_;
  std::condition_variable run_cv_;
  bool                    running_ = false;
  std::thread             thread_;
};

} // namespace gearledger::sync
