#include "sqlite_event_log.hpp"

#include <stdexcept>

#include "internal/util/time.hpp"

namespace callscribe::events {

using db::sqlite::Statement;

SqliteEventLog::SqliteEventLog(std::shared_ptr<db::sqlite::SqliteDB> db) : db_(std::move(db)) {
  Migrate(*db_);
}

void SqliteEventLog::Migrate(db::sqlite::SqliteDB& db) {
  db.Exec(
      "CREATE TABLE IF NOT EXISTS call_events("
      "  seq INTEGER PRIMARY KEY AUTOINCREMENT,"
      "  partition_key TEXT NOT NULL,"
      "  appended_at_ms INTEGER NOT NULL,"
      "  record TEXT NOT NULL);");
  db.Exec("CREATE INDEX IF NOT EXISTS call_events_partition ON call_events(partition_key, seq);");
}

void SqliteEventLog::Append(const std::string& partition_key, const std::string& record) {
  Statement st(*db_, "INSERT INTO call_events(partition_key, appended_at_ms, record) VALUES(?,?,?);");
  st.BindText(1, partition_key);
  st.BindInt64(2, static_cast<int64_t>(util::ToUnixMillis(util::Now())));
  st.BindText(3, record);

  auto result = db_->Translate(st.Step());
  if (!result) {
    throw std::runtime_error("append call event: " + result.message);
  }
}

std::vector<std::string> SqliteEventLog::ReadPartition(const std::string& partition_key) {
  Statement st(*db_, "SELECT record FROM call_events WHERE partition_key=? ORDER BY seq;");
  st.BindText(1, partition_key);

  std::vector<std::string> out;
  int                      rc;
  while ((rc = st.Step()) == SQLITE_ROW) {
    out.push_back(st.ColumnText(0));
  }
  auto result = db_->Translate(rc);
  if (!result) {
    throw std::runtime_error("read call events: " + result.message);
  }
  return out;
}

} // namespace callscribe::events
