// Repository: Intermission
// Component: File Key-Value Store
// Copyright (c) 2026 Intermission

#include "intermission/persistence/FileKeyValueStore.hpp"

#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unistd.h>

#include "intermission/util/Logger.hpp"

namespace intermission::persistence {

using util::Logger;

namespace {

std::string Trim(const std::string& s) {
  const auto begin = s.find_first_not_of(" \t\r");
  if (begin == std::string::npos) return "";
  const auto end = s.find_last_not_of(" \t\r");
  return s.substr(begin, end - begin + 1);
}

}  // namespace

FileKeyValueStore::FileKeyValueStore(std::string path) : path_(std::move(path)) {
  Load();
}

void FileKeyValueStore::Load() {
  std::ifstream in(path_);
  if (!in) {
    Logger::Debug("[FileKeyValueStore] NO_FILE path=" + path_);
    return;
  }

  std::string line;
  size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    const std::string trimmed = Trim(line);
    if (trimmed.empty() || trimmed.front() == '#') continue;

    const auto eq = trimmed.find('=');
    if (eq == std::string::npos || eq == 0) {
      ++skipped_lines_;
      std::ostringstream oss;
      oss << "[FileKeyValueStore] SKIP_LINE path=" << path_ << " line=" << line_no
          << " reason=no_key";
      Logger::Warn(oss.str());
      continue;
    }

    const std::string key = Trim(trimmed.substr(0, eq));
    const std::string value = Trim(trimmed.substr(eq + 1));
    try {
      size_t consumed = 0;
      const long long parsed = std::stoll(value, &consumed);
      if (consumed != value.size()) {
        throw std::invalid_argument("trailing characters");
      }
      values_[key] = static_cast<int64_t>(parsed);
    } catch (const std::exception& e) {
      ++skipped_lines_;
      std::ostringstream oss;
      oss << "[FileKeyValueStore] SKIP_LINE path=" << path_ << " line=" << line_no
          << " key=" << key << " reason=" << e.what();
      Logger::Warn(oss.str());
    }
  }
}

std::optional<int64_t> FileKeyValueStore::GetInt(const std::string& key) const {
  auto it = values_.find(key);
  if (it == values_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool FileKeyValueStore::SetInt(const std::string& key, int64_t value) {
  values_[key] = value;
  return Flush();
}

bool FileKeyValueStore::Flush() const {
  std::ostringstream content;
  for (const auto& [key, value] : values_) {
    content << key << '=' << value << '\n';
  }

  const std::string tmp_path =
      path_ + ".tmp." + std::to_string(static_cast<unsigned long>(getpid()));
  {
    std::ofstream of(tmp_path, std::ios::out | std::ios::trunc);
    if (!of) {
      Logger::Warn("[FileKeyValueStore] WRITE_FAILED path=" + tmp_path);
      return false;
    }
    of << content.str();
    of.flush();
    if (!of) {
      Logger::Warn("[FileKeyValueStore] WRITE_FAILED path=" + tmp_path);
      (void)unlink(tmp_path.c_str());
      return false;
    }
  }

  if (std::rename(tmp_path.c_str(), path_.c_str()) != 0) {
    (void)unlink(tmp_path.c_str());
    Logger::Warn("[FileKeyValueStore] RENAME_FAILED path=" + path_);
    return false;
  }
  return true;
}

}  // namespace intermission::persistence
