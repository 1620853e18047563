#pragma once

#include <cstddef>

namespace gearledger::sync {

/*
  Host-side hooks (UI refresh etc.). Callbacks run on the worker that
  accepted the mutation or on the sweeper thread; implementations must not
  block.
*/
class SyncObserver {
 public:
  virtual ~SyncObserver() = default;

  // A result/catalog mutation was accepted.
  virtual void OnDataChanged() {}

  // Number of live connected peers changed.
  virtual void OnClientCountChanged(std::size_t /*count*/) {}
};

} // namespace gearledger::sync
