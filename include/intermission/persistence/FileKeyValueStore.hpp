// Repository: Intermission
// Component: File Key-Value Store
// Purpose: Durable key=value file with atomic (tmp + rename) rewrites.
// Copyright (c) 2026 Intermission

#ifndef INTERMISSION_PERSISTENCE_FILE_KEY_VALUE_STORE_HPP_
#define INTERMISSION_PERSISTENCE_FILE_KEY_VALUE_STORE_HPP_

#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "intermission/persistence/IKeyValueStore.hpp"

namespace intermission::persistence {

// File format, one entry per line:
//   manualTriggerCounter=7
// The file is read once at construction (a missing file is an empty store).
// Every SetInt rewrites the whole file through "<path>.tmp.<pid>" followed
// by rename(), so a crash mid-write leaves the previous contents intact.
class FileKeyValueStore : public IKeyValueStore {
 public:
  explicit FileKeyValueStore(std::string path);

  FileKeyValueStore(const FileKeyValueStore&) = delete;
  FileKeyValueStore& operator=(const FileKeyValueStore&) = delete;

  std::optional<int64_t> GetInt(const std::string& key) const override;
  bool SetInt(const std::string& key, int64_t value) override;

  const std::string& path() const { return path_; }
  size_t size() const { return values_.size(); }

  // Lines skipped during load because they could not be parsed.
  size_t skipped_line_count() const { return skipped_lines_; }

 private:
  void Load();
  bool Flush() const;

  std::string path_;
  std::map<std::string, int64_t> values_;
  size_t skipped_lines_ = 0;
};

}  // namespace intermission::persistence

#endif  // INTERMISSION_PERSISTENCE_FILE_KEY_VALUE_STORE_HPP_
