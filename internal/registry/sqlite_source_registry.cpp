#include "sqlite_source_registry.hpp"

#include <stdexcept>

#include "internal/util/time.hpp"

namespace callscribe::registry {

using db::sqlite::Statement;

SqliteSourceRegistry::SqliteSourceRegistry(std::shared_ptr<db::sqlite::SqliteDB> db) : db_(std::move(db)) {
  Migrate(*db_);
}

void SqliteSourceRegistry::Migrate(db::sqlite::SqliteDB& db) {
  db.Exec(
      "CREATE TABLE IF NOT EXISTS call_sources("
      "  call_id TEXT NOT NULL,"
      "  channel TEXT NOT NULL,"
      "  source_id TEXT NOT NULL,"
      "  registered_at_ms INTEGER NOT NULL,"
      "  PRIMARY KEY(call_id, channel));");
}

ChannelSources SqliteSourceRegistry::Query(const std::string& call_id) {
  Statement st(*db_, "SELECT channel, source_id FROM call_sources WHERE call_id=?;");
  st.BindText(1, call_id);

  ChannelSources sources;
  int            rc;
  while ((rc = st.Step()) == SQLITE_ROW) {
    const auto channel = st.ColumnText(0);
    if (channel == audio::ToString(audio::Channel::kCaller)) {
      sources.caller = st.ColumnText(1);
    } else if (channel == audio::ToString(audio::Channel::kAgent)) {
      sources.agent = st.ColumnText(1);
    }
  }
  auto result = db_->Translate(rc);
  if (!result) {
    throw std::runtime_error("query call sources: " + result.message);
  }
  return sources;
}

void SqliteSourceRegistry::Register(const std::string& call_id, audio::Channel channel, const std::string& source_id) {
  Statement st(*db_, "INSERT OR REPLACE INTO call_sources(call_id, channel, source_id, registered_at_ms) VALUES(?,?,?,?);");
  st.BindText(1, call_id);
  st.BindText(2, std::string(audio::ToString(channel)));
  st.BindText(3, source_id);
  st.BindInt64(4, static_cast<int64_t>(util::ToUnixMillis(util::Now())));

  auto result = db_->Translate(st.Step());
  if (!result) {
    throw std::runtime_error("register call source: " + result.message);
  }
}

} // namespace callscribe::registry
