#pragma once

#include <memory>

#include "event_log.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"

namespace callscribe::events {

/*
  Event log stored in the `call_events` table; the autoincrement sequence
  gives the global append order.
*/
class SqliteEventLog final : public EventLog {
 public:
  explicit SqliteEventLog(std::shared_ptr<db::sqlite::SqliteDB> db);

  void                     Append(const std::string& partition_key, const std::string& record) override;
  std::vector<std::string> ReadPartition(const std::string& partition_key) override;

  static void Migrate(db::sqlite::SqliteDB& db);

 private:
  std::shared_ptr<db::sqlite::SqliteDB> db_;
};

} // namespace callscribe::events
