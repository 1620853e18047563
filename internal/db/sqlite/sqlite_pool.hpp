#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "sqlite_db.hpp"

namespace gearledger::db::sqlite {

/*
  SqlitePool

  Connection-per-worker pool used by SqliteRepository.

  Design notes:
  -------------
  - Each transaction checks out its own connection and holds it exclusively
    until the transaction object is destroyed.
  - A checked-out connection is never visible to another thread; it goes
    back to the idle list only when the owning worker releases it.
  - At most max_connections are open; further Acquire() calls block until
    one is released.

  Lifetime:
    Repository owns shared_ptr<SqlitePool>
    Transaction holds shared_ptr<SqliteDB> whose deleter returns it here
*/

class SqlitePool : public std::enable_shared_from_this<SqlitePool> {
 public:
  SqlitePool(std::string path, std::chrono::milliseconds busy_timeout, std::size_t max_connections = 16);

  // Acquire a ready-to-use connection for exclusive use by the caller
  std::shared_ptr<SqliteDB> Acquire();

  const std::string& Path() const {
    return path_;
  }

 private:
  std::shared_ptr<SqliteDB> Wrap(SqliteDB* conn);
  void                      Release(SqliteDB* conn);

  std::string               path_;
  std::chrono::milliseconds busy_timeout_;
  std::size_t               max_connections_;

  std::mutex                             mutex_;
  std::condition_variable                cv_;
  std::vector<std::unique_ptr<SqliteDB>> idle_;
  std::size_t                            live_connections_ = 0;
};

} // namespace gearledger::db::sqlite
