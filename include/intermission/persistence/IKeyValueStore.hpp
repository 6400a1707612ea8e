// Repository: Intermission
// Component: Key-Value Store Interface
// Purpose: Minimal persisted integer storage consumed by the manual trigger
//          policy. Hosts plug in their own preference store.
// Copyright (c) 2026 Intermission

#ifndef INTERMISSION_PERSISTENCE_IKEY_VALUE_STORE_HPP_
#define INTERMISSION_PERSISTENCE_IKEY_VALUE_STORE_HPP_

#include <cstdint>
#include <optional>
#include <string>

namespace intermission::persistence {

class IKeyValueStore {
 public:
  virtual ~IKeyValueStore() = default;

  // nullopt when the key is absent or unreadable.
  virtual std::optional<int64_t> GetInt(const std::string& key) const = 0;

  // Returns false if the value could not be made durable. The caller keeps
  // its in-memory value either way.
  virtual bool SetInt(const std::string& key, int64_t value) = 0;
};

}  // namespace intermission::persistence

#endif  // INTERMISSION_PERSISTENCE_IKEY_VALUE_STORE_HPP_
