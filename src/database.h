#ifndef DATABASE_H_
#define DATABASE_H_

#include <mutex>
#include <memory>
#include <string>

#include <sqlite_orm/sqlite_orm.h>
#include <codie/store.h>

struct KvEntry {
  std::string key;
  std::string value;
};

namespace {

inline auto InitStorage(const std::string& path) {
  using namespace sqlite_orm;
  auto storage = make_storage(path,
      make_table("kv",
                 make_column("key", &KvEntry::key, primary_key()),
                 make_column("value", &KvEntry::value)));
  storage.sync_schema(true);
  return storage;
}

} // namespace

// Shared by every instance pointed at the same file; compare-and-swap takes the write lock
//  up front (BEGIN IMMEDIATE) so concurrent processes serialize on it.
class SqliteStore : public KeyValueStore {
 public:
  using Storage = decltype(InitStorage(""));

 private:
  static constexpr int kBusyTimeout = 2000; // ms

  std::string path_;
  std::unique_ptr<Storage> db_;
  std::mutex mtx_;

  bool Init_();

 public:
  explicit SqliteStore(const std::string& path) : path_(path) {}

  // false if the database cannot be opened
  bool Init();

  bool Get(const std::string& key, std::optional<std::string>& value) override;
  bool Put(const std::string& key, const std::string& value) override;
  CasResult CompareAndSwap(const std::string& key, const std::optional<std::string>& expected,
                           const std::string& desired) override;
};

#endif  // DATABASE_H_
