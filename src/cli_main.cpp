#include <iostream>
#include <string>

#include "starclaim/core/config_io.h"
#include "starclaim/core/enum_strings.h"
#include "starclaim/core/simulation.h"
#include "starclaim/util/file_io.h"
#include "starclaim/util/log.h"
#include "starclaim/util/snapshot_export.h"
#include "starclaim/util/strings.h"

namespace {

#ifndef STARCLAIM_VERSION
#define STARCLAIM_VERSION "unknown"
#endif

int get_int_arg(int argc, char** argv, const std::string& key, int def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return std::stoi(argv[i + 1]);
  }
  return def;
}

double get_double_arg(int argc, char** argv, const std::string& key, double def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return std::stod(argv[i + 1]);
  }
  return def;
}

std::string get_str_arg(int argc, char** argv, const std::string& key, const std::string& def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return argv[i + 1];
  }
  return def;
}

bool has_kv_arg(int argc, char** argv, const std::string& key) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return true;
  }
  return false;
}

bool has_flag(int argc, char** argv, const std::string& flag) {
  for (int i = 1; i < argc; ++i) {
    if (argv[i] == flag) return true;
  }
  return false;
}

void print_usage(const char* exe) {
  std::cout << "Starclaim CLI v" << STARCLAIM_VERSION << "\n\n";
  std::cout << "Usage: " << (exe ? exe : "starclaim_cli") << " [options]\n\n";
  std::cout << "Runs a headless match until one faction is eliminated or --max-ms elapses.\n\n";
  std::cout << "Options:\n";
  std::cout << "  --seed N           World generation seed (default: 1)\n";
  std::cout << "  --nodes N          Number of nodes (default: 7)\n";
  std::cout << "  --config PATH      JSON config with optional sim/world/difficulty sections\n";
  std::cout << "  --difficulty NAME  easy|normal|hard (default: normal)\n";
  std::cout << "  --tick-ms MS       Simulated time per tick (default: 16)\n";
  std::cout << "  --max-ms MS        Stop after this much simulated time (default: 600000)\n";
  std::cout << "  --autoplay         Let the decision engine drive both factions\n";
  std::cout << "  --events           Print the persistent event log after the run\n";
  std::cout << "  --dump PATH        Write the final snapshot as JSON\n";
  std::cout << "  --log-level LEVEL  debug|info|warn|error|off (default: info)\n";
  std::cout << "  --diagnostics      Log ignored arrivals and AI decisions (implies debug)\n";
  std::cout << "  --quiet            Suppress the summary output\n";
  std::cout << "  --version          Print version and exit\n";
  std::cout << "  -h, --help         Show this help\n";
}

} // namespace

int main(int argc, char** argv) {
  try {
    if (has_flag(argc, argv, "--version")) {
      std::cout << STARCLAIM_VERSION << "\n";
      return 0;
    }
    if (has_flag(argc, argv, "--help") || has_flag(argc, argv, "-h")) {
      print_usage(argv[0]);
      return 0;
    }

    const std::string level_text = get_str_arg(argc, argv, "--log-level", "info");
    starclaim::log::Level level = starclaim::log::Level::Info;
    if (!starclaim::log::parse_level(level_text, &level)) {
      std::cerr << "Unknown --log-level: " << level_text << "\n\n";
      print_usage(argv[0]);
      return 2;
    }
    const bool diagnostics = has_flag(argc, argv, "--diagnostics");
    if (diagnostics) level = starclaim::log::Level::Debug;
    starclaim::log::set_level(level);

    const bool quiet = has_flag(argc, argv, "--quiet");
    const bool autoplay = has_flag(argc, argv, "--autoplay");

    starclaim::ConfigFile base;
    if (autoplay) base.sim.ai_controls_faction_a = true;

    const std::string config_path = get_str_arg(argc, argv, "--config", "");
    starclaim::ConfigFile cfg = config_path.empty() ? base : starclaim::load_config_file(config_path, base);

    // Command-line flags override the config file.
    if (autoplay) cfg.sim.ai_controls_faction_a = true;
    if (diagnostics) cfg.sim.diagnostics = true;
    if (has_kv_arg(argc, argv, "--seed")) cfg.world.seed = std::stoull(get_str_arg(argc, argv, "--seed", "1"));
    if (has_kv_arg(argc, argv, "--nodes")) cfg.world.node_count = get_int_arg(argc, argv, "--nodes", 7);
    if (has_kv_arg(argc, argv, "--difficulty")) {
      const std::string name = get_str_arg(argc, argv, "--difficulty", "normal");
      starclaim::Difficulty d = starclaim::Difficulty::Normal;
      if (!starclaim::parse_difficulty(name, &d)) {
        std::cerr << "Unknown --difficulty: " << name << "\n\n";
        print_usage(argv[0]);
        return 2;
      }
      cfg.difficulty = d;
    }
    if (cfg.difficulty) starclaim::apply_difficulty(cfg.sim, *cfg.difficulty);

    const double tick_ms = get_double_arg(argc, argv, "--tick-ms", 16.0);
    const double max_ms = get_double_arg(argc, argv, "--max-ms", 600000.0);
    if (!(tick_ms > 0.0) || !(max_ms > 0.0)) {
      std::cerr << "--tick-ms and --max-ms must be positive\n";
      return 2;
    }

    starclaim::Simulation sim(cfg.sim);
    std::string err;
    if (!sim.reset(cfg.world, &err)) {
      std::cerr << "Invalid world config: " << err << "\n";
      return 2;
    }

    const int ticks = sim.advance(max_ms, tick_ms);

    if (!quiet) {
      std::cout << "Ticks: " << ticks << "\n";
      if (const auto summary = sim.result()) {
        std::cout << starclaim::summary_to_text(*summary);
      } else {
        const auto& st = sim.state().stats;
        std::cout << "No result after " << starclaim::format_duration_ms(st.elapsed_ms) << "\n";
        for (starclaim::Faction f : starclaim::kPlayableFactions) {
          const auto& fs = st.of(f);
          std::cout << "  " << starclaim::faction_to_string(f) << ": nodes=" << fs.nodes << " units=" << fs.units
                    << " in_transit=" << fs.units_in_transit << "\n";
        }
      }
    }

    if (has_flag(argc, argv, "--events")) {
      for (const auto& ev : sim.events()) {
        std::cout << "[" << starclaim::format_duration_ms(ev.time_ms) << "] "
                  << starclaim::event_level_to_string(ev.level) << " "
                  << starclaim::event_category_to_string(ev.category) << ": " << ev.message << "\n";
      }
    }

    const std::string dump_path = get_str_arg(argc, argv, "--dump", "");
    if (!dump_path.empty()) {
      starclaim::write_text_file(dump_path, starclaim::snapshot_to_json(sim.snapshot()));
      if (!quiet) std::cout << "Wrote snapshot to " << dump_path << "\n";
    }

    return 0;
  } catch (const std::exception& e) {
    starclaim::log::error(std::string("Fatal: ") + e.what());
    return 1;
  }
}
