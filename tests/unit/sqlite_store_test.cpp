#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/events/sqlite_event_log.hpp"
#include "internal/registry/sqlite_source_registry.hpp"

namespace {

using callscribe::audio::Channel;
using callscribe::db::sqlite::SqliteDB;

std::filesystem::path DbPath(const std::string& test_name) {
  return std::filesystem::temp_directory_path() / "callscribe_sqlite_store_tests" / test_name / "callscribe.db";
}

// Fresh database; WAL side files go with the directory.
std::shared_ptr<SqliteDB> OpenDb(const std::string& test_name) {
  const auto path = DbPath(test_name);
  std::filesystem::remove_all(path.parent_path());
  std::filesystem::create_directories(path.parent_path());
  return std::make_shared<SqliteDB>(path.string());
}

void TestEventLogKeepsAppendOrderPerPartition() {
  auto                                 db = OpenDb("event_log");
  callscribe::events::SqliteEventLog log(db);

  log.Append("call-a", R"({"event_type":"START"})");
  log.Append("call-b", R"({"event_type":"START"})");
  log.Append("call-a", R"({"event_type":"END"})");

  const auto a = log.ReadPartition("call-a");
  assert(a.size() == 2);
  assert(a[0] == R"({"event_type":"START"})");
  assert(a[1] == R"({"event_type":"END"})");
  assert(log.ReadPartition("call-b").size() == 1);
  assert(log.ReadPartition("call-c").empty());
}

void TestEventLogSurvivesReopen() {
  {
    auto                               db = OpenDb("reopen");
    callscribe::events::SqliteEventLog log(db);
    log.Append("call-a", "one");
  }
  auto db = std::make_shared<SqliteDB>(DbPath("reopen").string());
  callscribe::events::SqliteEventLog log(db);
  log.Append("call-a", "two");

  const auto records = log.ReadPartition("call-a");
  assert(records.size() == 2);
  assert(records[0] == "one" && records[1] == "two");
}

void TestRegistryReplacesChannelSource() {
  auto                                         db = OpenDb("registry");
  callscribe::registry::SqliteSourceRegistry registry(db);

  assert(!registry.Query("call-1").caller.has_value());
  registry.Register("call-1", Channel::kCaller, "stream-a");
  registry.Register("call-1", Channel::kAgent, "stream-b");
  registry.Register("call-1", Channel::kCaller, "stream-c");

  const auto sources = registry.Query("call-1");
  assert(sources.Complete());
  assert(*sources.caller == "stream-c");
  assert(*sources.agent == "stream-b");
}

void TestEventLogAndRegistryShareOneDatabase() {
  auto                                         db = OpenDb("shared");
  callscribe::events::SqliteEventLog         log(db);
  callscribe::registry::SqliteSourceRegistry registry(db);

  registry.Register("call-1", Channel::kAgent, "stream-b");
  log.Append("call-1", "record");
  assert(registry.Query("call-1").agent == std::string("stream-b"));
  assert(log.ReadPartition("call-1").size() == 1);
}

} // namespace

int main() {
  TestEventLogKeepsAppendOrderPerPartition();
  TestEventLogSurvivesReopen();
  TestRegistryReplacesChannelSource();
  TestEventLogAndRegistryShareOneDatabase();

  std::cout << "callscribe_unit_sqlite_store: pass\n";
  return 0;
}
