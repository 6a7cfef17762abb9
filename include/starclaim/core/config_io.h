#pragma once

#include <optional>
#include <string>

#include "starclaim/core/scenario.h"
#include "starclaim/core/simulation.h"
#include "starclaim/util/json.h"

namespace starclaim {

// Settings loaded from a JSON config file.
//
// Layout:
//   {
//     "sim":   { "fleet_speed": 120, "ai": { "decision_interval_ms": 3500 }, ... },
//     "world": { "seed": 7, "node_count": 9, "capacity_pool": [6, 8, 10], ... },
//     "difficulty": "hard"
//   }
//
// Every section and key is optional. Unknown keys are ignored; a known key with
// the wrong JSON type throws std::runtime_error naming the key.
struct ConfigFile {
  SimConfig sim;
  WorldConfig world;
  std::optional<Difficulty> difficulty;
};

// Overlays the keys present in `v` (the "sim" object) onto cfg.
void apply_sim_config_json(const json::Value& v, SimConfig& cfg);

// Overlays the keys present in `v` (the "world" object) onto cfg.
void apply_world_config_json(const json::Value& v, WorldConfig& cfg);

// Parses a whole config document on top of `base`. When "difficulty" is
// present it is applied after the "sim" section.
ConfigFile config_from_json(const json::Value& root, const ConfigFile& base = {});

// Reads and parses `path`. Throws std::runtime_error on I/O, JSON or type
// errors, and when the resulting world config is invalid.
ConfigFile load_config_file(const std::string& path, const ConfigFile& base = {});

} // namespace starclaim
