// Repository: Intermission
// Component: Admission Simulator Harness
// Purpose: Runs an AdmissionScheduler against SimulatedPlatform for
//          diagnostics, with scripted blocks, zone changes and manual
//          triggers.
// Copyright (c) 2026 Intermission
//
// This binary is for testing and diagnostics only. The scheduler is unaware
// it is being driven by a simulated platform.
//
// Pacing: by default ticks run back to back on a virtual clock (one tick =
// one virtual second). --realtime sleeps between ticks on the wall clock.

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "intermission/countdown/IControllable.hpp"
#include "intermission/countdown/ICountdownObserver.hpp"
#include "intermission/persistence/FileKeyValueStore.hpp"
#include "intermission/platform/SimulatedPlatform.hpp"
#include "intermission/runtime/AdmissionScheduler.hpp"
#include "intermission/runtime/SchedulerConfig.hpp"
#include "intermission/runtime/TickLoop.hpp"
#include "intermission/timing/DeterministicWaitStrategy.hpp"
#include "intermission/timing/IWaitStrategy.hpp"
#include "intermission/timing/SystemTimeSource.hpp"
#include "intermission/util/Logger.hpp"

namespace {

using intermission::util::Logger;
namespace runtime = intermission::runtime;
namespace platform = intermission::platform;
namespace timing = intermission::timing;

// =============================================================================
// Global state for signal handling
// =============================================================================
std::atomic<runtime::TickLoop*> g_loop{nullptr};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    if (auto* loop = g_loop.load(std::memory_order_acquire)) {
      loop->RequestStop();
    }
  }
}

// =============================================================================
// CLI Arguments
// =============================================================================
enum class ScriptAction { kManual, kBlock, kUnblock, kZone, kRewarded };

struct ScriptEntry {
  ScriptAction action = ScriptAction::kManual;
  std::string argument;  // zone id / reward id
};

struct CliArgs {
  int64_t ticks = 60;
  std::string config_path;
  std::string store_path;
  std::string initial_zone = "workshop";

  // Simulated platform
  int64_t timer_interval_ms = 60000;
  int64_t event_length_ms = 5000;
  int64_t open_delay_ms = 0;
  bool platform_available = true;

  std::multimap<int64_t, ScriptEntry> script;  // tick -> action

  bool realtime = false;
  bool metrics = false;
  bool debug = false;
  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
            << "\n"
            << "Admission scheduler simulator for testing and diagnostics.\n"
            << "One tick is one second of scheduler time.\n"
            << "\n"
            << "RUN OPTIONS:\n"
            << "  --ticks N              Number of ticks to run (default: 60, -1 = until SIGINT)\n"
            << "  --config PATH          Scheduler config file (key = value)\n"
            << "  --store PATH           Persist the manual trigger counter in PATH\n"
            << "  --initial-zone ZONE    Zone reported at startup (default: workshop)\n"
            << "  --realtime             Sleep between ticks instead of using a virtual clock\n"
            << "\n"
            << "SIMULATED PLATFORM:\n"
            << "  --timer-interval MS    Natural timer interval (default: 60000)\n"
            << "  --event-length MS      Time between open and close (default: 5000)\n"
            << "  --open-delay MS        Time between request and open (default: 0)\n"
            << "  --platform-disabled    Platform reports itself unavailable\n"
            << "\n"
            << "SCRIPT (repeatable, T = tick index):\n"
            << "  --manual-at T          Manual trigger request\n"
            << "  --rewarded-at T:ID     Rewarded request with reward id ID\n"
            << "  --block-at T           Block()\n"
            << "  --unblock-at T         Unblock()\n"
            << "  --zone-at T:ZONE       Zone change notification\n"
            << "\n"
            << "OUTPUT:\n"
            << "  --metrics              Print Prometheus metrics text at the end\n"
            << "  --debug                Enable debug logging\n"
            << "  --help                 Show this help message\n"
            << "\n"
            << "EXAMPLES:\n"
            << "  Natural cycle with a short timer:\n"
            << "    " << program_name << " --ticks 40 --timer-interval 10000 --debug\n"
            << "\n"
            << "  Leave the allowed zone while a countdown is running:\n"
            << "    " << program_name << " --timer-interval 5000 --zone-at 6:garage\n"
            << "\n";
}

// "T:VALUE" -> (T, VALUE). Throws on malformed input.
std::pair<int64_t, std::string> ParseTickPair(const std::string& text) {
  const auto colon = text.find(':');
  if (colon == std::string::npos || colon == 0 || colon + 1 == text.size()) {
    throw std::invalid_argument("expected T:VALUE, got '" + text + "'");
  }
  return {std::stoll(text.substr(0, colon)), text.substr(colon + 1)};
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;

  try {
    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      const bool has_value = i + 1 < argc;

      if (arg == "--help" || arg == "-h") {
        args.help = true;
        args.valid = true;
        return args;
      } else if (arg == "--ticks" && has_value) {
        args.ticks = std::stoll(argv[++i]);
      } else if (arg == "--config" && has_value) {
        args.config_path = argv[++i];
      } else if (arg == "--store" && has_value) {
        args.store_path = argv[++i];
      } else if (arg == "--initial-zone" && has_value) {
        args.initial_zone = argv[++i];
      } else if (arg == "--timer-interval" && has_value) {
        args.timer_interval_ms = std::stoll(argv[++i]);
      } else if (arg == "--event-length" && has_value) {
        args.event_length_ms = std::stoll(argv[++i]);
      } else if (arg == "--open-delay" && has_value) {
        args.open_delay_ms = std::stoll(argv[++i]);
      } else if (arg == "--platform-disabled") {
        args.platform_available = false;
      } else if (arg == "--manual-at" && has_value) {
        args.script.emplace(std::stoll(argv[++i]), ScriptEntry{ScriptAction::kManual, ""});
      } else if (arg == "--block-at" && has_value) {
        args.script.emplace(std::stoll(argv[++i]), ScriptEntry{ScriptAction::kBlock, ""});
      } else if (arg == "--unblock-at" && has_value) {
        args.script.emplace(std::stoll(argv[++i]), ScriptEntry{ScriptAction::kUnblock, ""});
      } else if (arg == "--zone-at" && has_value) {
        auto [tick, zone] = ParseTickPair(argv[++i]);
        args.script.emplace(tick, ScriptEntry{ScriptAction::kZone, zone});
      } else if (arg == "--rewarded-at" && has_value) {
        auto [tick, id] = ParseTickPair(argv[++i]);
        args.script.emplace(tick, ScriptEntry{ScriptAction::kRewarded, id});
      } else if (arg == "--realtime") {
        args.realtime = true;
      } else if (arg == "--metrics") {
        args.metrics = true;
      } else if (arg == "--debug") {
        args.debug = true;
      } else {
        args.error = "Unknown argument: " + arg;
        return args;
      }
    }
  } catch (const std::exception& e) {
    args.error = std::string("Malformed argument value: ") + e.what();
    return args;
  }

  if (args.ticks == 0) {
    args.error = "--ticks must be non-zero";
    return args;
  }

  args.valid = true;
  return args;
}

// =============================================================================
// Console collaborators
// =============================================================================

class ConsoleController : public intermission::countdown::IControllable {
 public:
  explicit ConsoleController(std::string name) : name_(std::move(name)) {}

  bool IsEnabled() const override { return enabled_; }
  void SetEnabled(bool enabled) override {
    enabled_ = enabled;
    Logger::Info("[Sim] CONTROLLER " + name_ + (enabled ? " ENABLED" : " DISABLED"));
  }
  std::string Name() const override { return name_; }

 private:
  std::string name_;
  bool enabled_ = true;
};

class ConsoleCountdownObserver : public intermission::countdown::ICountdownObserver {
 public:
  void OnCountdownStarted() override { Logger::Info("[Sim] WARNING_SHOWN"); }
  void OnCountdownTick(int remaining_s) override {
    Logger::Info("[Sim] WARNING " + std::to_string(remaining_s));
  }
  void OnCountdownEnded() override { Logger::Info("[Sim] WARNING_HIDDEN"); }
};

void RunScriptEntry(runtime::AdmissionScheduler& scheduler, const ScriptEntry& entry) {
  switch (entry.action) {
    case ScriptAction::kManual:
      scheduler.RequestManualTrigger();
      break;
    case ScriptAction::kBlock:
      scheduler.Block();
      break;
    case ScriptAction::kUnblock:
      scheduler.Unblock();
      break;
    case ScriptAction::kZone:
      scheduler.OnZoneChanged(entry.argument);
      break;
    case ScriptAction::kRewarded: {
      const std::string id = entry.argument;
      scheduler.RequestRewarded(id, [id] { Logger::Info("[Sim] REWARD_APPLIED id=" + id); });
      break;
    }
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  CliArgs args = ParseArgs(argc, argv);
  if (args.help) {
    PrintUsage(argv[0]);
    return 0;
  }
  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return 1;
  }

  runtime::SchedulerConfig config;
  if (!args.config_path.empty()) {
    std::string error;
    if (!runtime::LoadSchedulerConfigFile(args.config_path, &config, &error)) {
      Logger::Error("[Sim] CONFIG_ERROR " + error);
      return 2;
    }
  }
  runtime::ApplyEnvOverrides(&config);
  if (args.debug) {
    config.debug_logging = true;
  }

  // Clock and pacing
  auto virtual_clock = std::make_shared<timing::DeterministicTimeSource>(0);
  timing::SystemTimeSource system_clock;
  const timing::ITimeSource* clock =
      args.realtime ? static_cast<const timing::ITimeSource*>(&system_clock)
                    : virtual_clock.get();
  std::unique_ptr<timing::IWaitStrategy> wait;
  if (args.realtime) {
    wait = std::make_unique<timing::RealtimeWaitStrategy>();
  } else {
    wait = std::make_unique<timing::DeterministicWaitStrategy>(virtual_clock);
  }

  platform::SimulatedPlatform::Options platform_options;
  platform_options.timer_interval_ms = args.timer_interval_ms;
  platform_options.event_length_ms = args.event_length_ms;
  platform_options.open_delay_ms = args.open_delay_ms;
  platform_options.available = args.platform_available;
  platform::SimulatedPlatform sim_platform(clock, platform_options);

  std::unique_ptr<intermission::persistence::FileKeyValueStore> store;
  if (!args.store_path.empty()) {
    store = std::make_unique<intermission::persistence::FileKeyValueStore>(args.store_path);
  }

  ConsoleCountdownObserver observer;
  runtime::AdmissionScheduler::Collaborators collaborators;
  collaborators.platform = &sim_platform;
  collaborators.store = store.get();
  collaborators.clock = clock;
  collaborators.countdown_observer = &observer;

  runtime::AdmissionScheduler::Callbacks callbacks;
  callbacks.on_event_closed = [](platform::EventKind kind) {
    Logger::Info(std::string("[Sim] EVENT_CLOSED kind=") + platform::ToString(kind));
  };

  std::unique_ptr<runtime::AdmissionScheduler> scheduler;
  try {
    scheduler = std::make_unique<runtime::AdmissionScheduler>(config, collaborators, callbacks);
  } catch (const std::invalid_argument& e) {
    Logger::Error(std::string("[Sim] CONFIG_INVALID ") + e.what());
    return 2;
  }

  auto player_input = std::make_shared<ConsoleController>("player-input");
  auto interaction = std::make_shared<ConsoleController>("interaction");
  scheduler->RegisterController(player_input);
  scheduler->RegisterController(interaction);

  scheduler->AttachZoneSource(args.initial_zone);
  scheduler->OnHostInitialized();

  runtime::TickLoop loop(scheduler.get(), wait.get());
  g_loop.store(&loop, std::memory_order_release);
  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  {
    std::ostringstream oss;
    oss << "[Sim] START ticks=" << args.ticks << " pacing="
        << (args.realtime ? "realtime" : "virtual")
        << " timer_interval_ms=" << args.timer_interval_ms
        << " scripted=" << args.script.size();
    Logger::Info(oss.str());
  }

  const int64_t ran = loop.RunTicks(args.ticks, [&](int64_t tick) {
    sim_platform.Pump();
    auto range = args.script.equal_range(tick);
    for (auto it = range.first; it != range.second; ++it) {
      RunScriptEntry(*scheduler, it->second);
    }
  });
  sim_platform.Pump();

  g_loop.store(nullptr, std::memory_order_release);
  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);

  const runtime::SchedulerMetrics metrics = scheduler->Snapshot();
  {
    std::ostringstream oss;
    oss << "[Sim] DONE ticks=" << ran << " phase=" << runtime::ToString(metrics.phase)
        << " opened=" << metrics.events_opened_total
        << " closed=" << metrics.events_closed_total
        << " countdowns=" << metrics.countdowns_started_total
        << " cancelled=" << metrics.countdowns_cancelled_total
        << " manual_counter=" << scheduler->manual_trigger_counter();
    Logger::Info(oss.str());
  }
  if (args.metrics) {
    std::cout << metrics.GeneratePrometheusText();
  }

  scheduler.reset();
  return 0;
}
