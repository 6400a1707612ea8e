// Repository: Intermission
// Component: Scheduler Configuration
// Copyright (c) 2026 Intermission

#include "intermission/runtime/SchedulerConfig.hpp"

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <map>
#include <sstream>
#include <stdexcept>

#include "intermission/util/Logger.hpp"

namespace intermission::runtime {

using util::Logger;

namespace {

std::string Trim(const std::string& s) {
  const auto begin = s.find_first_not_of(" \t\r");
  if (begin == std::string::npos) return "";
  const auto end = s.find_last_not_of(" \t\r");
  return s.substr(begin, end - begin + 1);
}

// The parsers throw std::invalid_argument / std::out_of_range; callers
// catch std::exception and attach the line number.
int64_t ParseInt64(const std::string& value) {
  size_t consumed = 0;
  const long long parsed = std::stoll(value, &consumed);
  if (consumed != value.size()) {
    throw std::invalid_argument("not an integer: " + value);
  }
  return static_cast<int64_t>(parsed);
}

int ParseInt(const std::string& value) {
  size_t consumed = 0;
  const int parsed = std::stoi(value, &consumed);
  if (consumed != value.size()) {
    throw std::invalid_argument("not an integer: " + value);
  }
  return parsed;
}

double ParseDouble(const std::string& value) {
  size_t consumed = 0;
  const double parsed = std::stod(value, &consumed);
  if (consumed != value.size()) {
    throw std::invalid_argument("not a number: " + value);
  }
  return parsed;
}

bool ParseBool(const std::string& value) {
  if (value == "true" || value == "1") return true;
  if (value == "false" || value == "0") return false;
  throw std::invalid_argument("not a boolean: " + value);
}

ManualTriggerMode ParseMode(const std::string& value) {
  if (value == "immediate") return ManualTriggerMode::kImmediate;
  if (value == "with_countdown") return ManualTriggerMode::kWithCountdown;
  throw std::invalid_argument("unknown manual_trigger_mode: " + value);
}

std::set<std::string> ParseZoneList(const std::string& value) {
  std::set<std::string> zones;
  std::istringstream in(value);
  std::string item;
  while (std::getline(in, item, ',')) {
    const std::string zone = Trim(item);
    if (!zone.empty()) {
      zones.insert(zone);
    }
  }
  return zones;
}

using FieldSetter = std::function<void(SchedulerConfig*, const std::string&)>;

const std::map<std::string, FieldSetter>& FieldSetters() {
  static const std::map<std::string, FieldSetter> kSetters = {
      {"countdown_duration_s",
       [](SchedulerConfig* c, const std::string& v) { c->countdown_duration_s = ParseDouble(v); }},
      {"countdown_warning_enabled",
       [](SchedulerConfig* c, const std::string& v) { c->countdown_warning_enabled = ParseBool(v); }},
      {"cooldown_window_ms",
       [](SchedulerConfig* c, const std::string& v) { c->cooldown_window_ms = ParseInt64(v); }},
      {"stale_timer_grace_ms",
       [](SchedulerConfig* c, const std::string& v) { c->stale_timer_grace_ms = ParseInt64(v); }},
      {"stale_timer_threshold_s",
       [](SchedulerConfig* c, const std::string& v) { c->stale_timer_threshold_s = ParseDouble(v); }},
      {"manual_trigger_frequency",
       [](SchedulerConfig* c, const std::string& v) { c->manual_trigger_frequency = ParseInt(v); }},
      {"manual_trigger_counter_key",
       [](SchedulerConfig* c, const std::string& v) { c->manual_trigger_counter_key = v; }},
      {"manual_trigger_mode",
       [](SchedulerConfig* c, const std::string& v) { c->manual_trigger_mode = ParseMode(v); }},
      {"restrict_to_allowed_zones",
       [](SchedulerConfig* c, const std::string& v) { c->restrict_to_allowed_zones = ParseBool(v); }},
      {"allowed_zones",
       [](SchedulerConfig* c, const std::string& v) { c->allowed_zones = ParseZoneList(v); }},
      {"reset_blocks_on_zone_return",
       [](SchedulerConfig* c, const std::string& v) { c->reset_blocks_on_zone_return = ParseBool(v); }},
      {"block_until_initialized",
       [](SchedulerConfig* c, const std::string& v) { c->block_until_initialized = ParseBool(v); }},
      {"awaiting_open_timeout_ms",
       [](SchedulerConfig* c, const std::string& v) { c->awaiting_open_timeout_ms = ParseInt64(v); }},
      {"debug_logging",
       [](SchedulerConfig* c, const std::string& v) { c->debug_logging = ParseBool(v); }},
  };
  return kSetters;
}

}  // namespace

std::vector<std::string> SchedulerConfig::Validate() const {
  std::vector<std::string> problems;
  if (std::isnan(countdown_duration_s)) {
    problems.push_back("countdown_duration_s is NaN");
  } else if (countdown_duration_s < 0.0) {
    problems.push_back("countdown_duration_s is negative");
  }
  if (cooldown_window_ms < 0) {
    problems.push_back("cooldown_window_ms is negative");
  }
  if (stale_timer_grace_ms < 0) {
    problems.push_back("stale_timer_grace_ms is negative");
  }
  if (std::isnan(stale_timer_threshold_s) || stale_timer_threshold_s < 0.0) {
    problems.push_back("stale_timer_threshold_s must be >= 0");
  }
  if (manual_trigger_counter_key.empty()) {
    problems.push_back("manual_trigger_counter_key is empty");
  }
  if (restrict_to_allowed_zones && allowed_zones.empty()) {
    problems.push_back("allowed_zones is empty while restrict_to_allowed_zones is set");
  }
  if (awaiting_open_timeout_ms <= 0) {
    problems.push_back("awaiting_open_timeout_ms must be > 0");
  }
  return problems;
}

bool LoadSchedulerConfigFile(const std::string& path,
                             SchedulerConfig* config,
                             std::string* error) {
  std::ifstream in(path);
  if (!in) {
    if (error) *error = "cannot open config file: " + path;
    return false;
  }

  const auto& setters = FieldSetters();
  std::string line;
  size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    const std::string trimmed = Trim(line);
    if (trimmed.empty() || trimmed.front() == '#') continue;

    std::ostringstream where;
    where << path << ":" << line_no << ": ";

    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      if (error) *error = where.str() + "expected key = value";
      return false;
    }
    const std::string key = Trim(trimmed.substr(0, eq));
    const std::string value = Trim(trimmed.substr(eq + 1));

    auto it = setters.find(key);
    if (it == setters.end()) {
      if (error) *error = where.str() + "unknown key '" + key + "'";
      return false;
    }
    try {
      it->second(config, value);
    } catch (const std::exception& e) {
      if (error) *error = where.str() + key + ": " + e.what();
      return false;
    }
  }

  std::ostringstream oss;
  oss << "[SchedulerConfig] LOADED path=" << path << " lines=" << line_no;
  Logger::Debug(oss.str());
  return true;
}

int ApplyEnvOverrides(SchedulerConfig* config) {
  int applied = 0;

  auto apply = [&](const char* name, auto&& assign) {
    const char* raw = std::getenv(name);
    if (raw == nullptr) return;
    const std::string value = Trim(raw);
    try {
      assign(value);
      ++applied;
      Logger::Info(std::string("[SchedulerConfig] ENV_OVERRIDE ") + name + "=" + value);
    } catch (const std::exception& e) {
      Logger::Warn(std::string("[SchedulerConfig] ENV_IGNORED ") + name + "=" + value +
                   " reason=" + e.what());
    }
  };

  // Presence alone enables debug, matching Logger::IsDebugEnabled().
  apply("INTERMISSION_DEBUG", [&](const std::string&) {
    config->debug_logging = true;
  });
  apply("INTERMISSION_MANUAL_FREQUENCY", [&](const std::string& v) {
    config->manual_trigger_frequency = ParseInt(v);
  });
  apply("INTERMISSION_COOLDOWN_MS", [&](const std::string& v) {
    config->cooldown_window_ms = ParseInt64(v);
  });
  apply("INTERMISSION_COUNTDOWN_S", [&](const std::string& v) {
    config->countdown_duration_s = ParseDouble(v);
  });
  return applied;
}

}  // namespace intermission::runtime
