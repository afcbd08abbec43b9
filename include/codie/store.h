#ifndef INCLUDE_CODIE_STORE_H_
#define INCLUDE_CODIE_STORE_H_

#include <string>
#include <optional>

#define ENUM_CAS_RESULT_ \
  X(SWAPPED) \
  X(CONFLICT) /* current value differs from expected */ \
  X(UNAVAILABLE)
enum class CasResult {
#define X(name) name,
  ENUM_CAS_RESULT_
#undef X
};

// Persistent key-value store used for rate limit bookkeeping.
// Implementations must be safe to call from multiple threads; CompareAndSwap must also be
//  atomic against other processes sharing the same store.
class KeyValueStore {
 public:
  virtual ~KeyValueStore() = default;

  // return false if the store is unreachable; value is std::nullopt if the key does not exist
  virtual bool Get(const std::string& key, std::optional<std::string>& value) = 0;
  virtual bool Put(const std::string& key, const std::string& value) = 0;
  // expected == std::nullopt means the key must not exist
  virtual CasResult CompareAndSwap(const std::string& key, const std::optional<std::string>& expected,
                                   const std::string& desired) = 0;
};

#endif  // INCLUDE_CODIE_STORE_H_
