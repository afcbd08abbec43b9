#include "database.h"

#include <system_error>

#include <spdlog/spdlog.h>

bool SqliteStore::Init_() {
  if (db_) return true;
  try {
    db_ = std::make_unique<Storage>(InitStorage(path_));
    db_->open_forever();
    db_->busy_timeout(kBusyTimeout);
    return true;
  } catch (std::system_error& err) {
    spdlog::warn("Failed to open store {}: {}", path_, err.what());
    db_.reset();
    return false;
  }
}

bool SqliteStore::Init() {
  std::lock_guard lck(mtx_);
  return Init_();
}

bool SqliteStore::Get(const std::string& key, std::optional<std::string>& value) {
  std::lock_guard lck(mtx_);
  if (!Init_()) return false;
  try {
    auto entry = db_->get_pointer<KvEntry>(key);
    if (entry) {
      value = std::move(entry->value);
    } else {
      value = std::nullopt;
    }
    return true;
  } catch (std::system_error& err) {
    spdlog::warn("Store get failed: key={} error={}", key, err.what());
    return false;
  }
}

bool SqliteStore::Put(const std::string& key, const std::string& value) {
  std::lock_guard lck(mtx_);
  if (!Init_()) return false;
  try {
    db_->replace(KvEntry{key, value});
    return true;
  } catch (std::system_error& err) {
    spdlog::warn("Store put failed: key={} error={}", key, err.what());
    return false;
  }
}

CasResult SqliteStore::CompareAndSwap(
    const std::string& key, const std::optional<std::string>& expected, const std::string& desired) {
  std::lock_guard lck(mtx_);
  if (!Init_()) return CasResult::UNAVAILABLE;
  try {
    db_->begin_immediate_transaction();
  } catch (std::system_error& err) {
    spdlog::warn("Store transaction failed: key={} error={}", key, err.what());
    return CasResult::UNAVAILABLE;
  }
  try {
    auto entry = db_->get_pointer<KvEntry>(key);
    bool matches = entry ? (expected && *expected == entry->value) : !expected;
    if (!matches) {
      db_->rollback();
      return CasResult::CONFLICT;
    }
    db_->replace(KvEntry{key, desired});
    db_->commit();
    return CasResult::SWAPPED;
  } catch (std::system_error& err) {
    spdlog::warn("Store compare-and-swap failed: key={} error={}", key, err.what());
    try {
      db_->rollback();
    } catch (std::system_error& rollback_err) {
      spdlog::warn("Store rollback failed: key={} error={}", key, rollback_err.what());
    }
    return CasResult::UNAVAILABLE;
  }
}
