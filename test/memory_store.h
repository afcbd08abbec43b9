#ifndef TEST_MEMORY_STORE_H_
#define TEST_MEMORY_STORE_H_

#include <mutex>
#include <atomic>
#include <string>
#include <unordered_map>

#include <codie/store.h>

// In-process store with injectable outages and compare-and-swap conflicts
class MemoryStore : public KeyValueStore {
  std::mutex mtx_;
  std::unordered_map<std::string, std::string> data_;
 public:
  std::atomic_bool unavailable{false};
  // the next N compare-and-swaps report a conflict without looking at the value
  std::atomic_int forced_conflicts{0};
  std::atomic_int cas_calls{0};

  bool Get(const std::string& key, std::optional<std::string>& value) override {
    if (unavailable) return false;
    std::lock_guard lck(mtx_);
    if (auto it = data_.find(key); it != data_.end()) {
      value = it->second;
    } else {
      value = std::nullopt;
    }
    return true;
  }

  bool Put(const std::string& key, const std::string& value) override {
    if (unavailable) return false;
    std::lock_guard lck(mtx_);
    data_[key] = value;
    return true;
  }

  CasResult CompareAndSwap(const std::string& key, const std::optional<std::string>& expected,
                           const std::string& desired) override {
    cas_calls++;
    if (unavailable) return CasResult::UNAVAILABLE;
    if (forced_conflicts > 0) {
      forced_conflicts--;
      return CasResult::CONFLICT;
    }
    std::lock_guard lck(mtx_);
    auto it = data_.find(key);
    bool matches = it == data_.end() ? !expected : (expected && *expected == it->second);
    if (!matches) return CasResult::CONFLICT;
    data_[key] = desired;
    return CasResult::SWAPPED;
  }
};

#endif  // TEST_MEMORY_STORE_H_
