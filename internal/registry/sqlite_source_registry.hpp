#pragma once

#include <memory>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "source_registry.hpp"

namespace callscribe::registry {

class SqliteSourceRegistry final : public SourceRegistry {
 public:
  explicit SqliteSourceRegistry(std::shared_ptr<db::sqlite::SqliteDB> db);

  ChannelSources Query(const std::string& call_id) override;
  void           Register(const std::string& call_id, audio::Channel channel, const std::string& source_id) override;

  static void Migrate(db::sqlite::SqliteDB& db);

 private:
  std::shared_ptr<db::sqlite::SqliteDB> db_;
};

} // namespace callscribe::registry
