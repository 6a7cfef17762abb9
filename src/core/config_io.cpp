#include "starclaim/core/config_io.h"

#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <utility>
#include <vector>

#include "starclaim/core/enum_strings.h"
#include "starclaim/util/file_io.h"

namespace starclaim {
namespace {

const json::Value* find_key(const json::Object& o, const std::string& k) {
  auto it = o.find(k);
  return it == o.end() ? nullptr : &it->second;
}

const json::Object& section(const json::Value& v, const std::string& name) {
  const auto* o = v.as_object();
  if (!o) throw std::runtime_error("Config section '" + name + "' must be an object");
  return *o;
}

void read_number(const json::Object& o, const std::string& key, double& out) {
  const auto* v = find_key(o, key);
  if (!v) return;
  const double* d = v->as_number();
  if (!d) throw std::runtime_error("Config key '" + key + "' must be a number");
  out = *d;
}

int to_int(double d, const std::string& key) {
  if (d < static_cast<double>(std::numeric_limits<int>::min()) ||
      d > static_cast<double>(std::numeric_limits<int>::max())) {
    throw std::runtime_error("Config key '" + key + "' is out of range");
  }
  return static_cast<int>(d);
}

void read_int(const json::Object& o, const std::string& key, int& out) {
  const auto* v = find_key(o, key);
  if (!v) return;
  const double* d = v->as_number();
  if (!d || std::floor(*d) != *d) throw std::runtime_error("Config key '" + key + "' must be an integer");
  out = to_int(*d, key);
}

void read_bool(const json::Object& o, const std::string& key, bool& out) {
  const auto* v = find_key(o, key);
  if (!v) return;
  const bool* b = v->as_bool();
  if (!b) throw std::runtime_error("Config key '" + key + "' must be true or false");
  out = *b;
}

} // namespace

void apply_sim_config_json(const json::Value& v, SimConfig& cfg) {
  const auto& o = section(v, "sim");

  read_number(o, "conquest_duration_ms", cfg.node.conquest_duration_ms);
  read_number(o, "battle_duration_ms", cfg.node.battle_duration_ms);
  read_number(o, "production_base_per_sec", cfg.node.production_base_per_sec);
  read_number(o, "production_per_capacity", cfg.node.production_per_capacity);

  read_number(o, "fleet_speed", cfg.fleet_speed);
  read_number(o, "max_tick_ms", cfg.max_tick_ms);
  read_int(o, "max_events", cfg.max_events);
  read_bool(o, "diagnostics", cfg.diagnostics);

  read_bool(o, "ai_controls_faction_a", cfg.ai_controls_faction_a);
  read_bool(o, "ai_controls_faction_b", cfg.ai_controls_faction_b);
  read_number(o, "faction_a_production_scale", cfg.faction_a_production_scale);
  read_number(o, "faction_b_production_scale", cfg.faction_b_production_scale);

  const auto* ai_v = find_key(o, "ai");
  if (!ai_v) return;
  const auto& ai = section(*ai_v, "sim.ai");
  AiConfig& a = cfg.ai;
  read_number(ai, "decision_interval_ms", a.decision_interval_ms);
  read_number(ai, "exploration_chance", a.exploration_chance);
  read_number(ai, "exploration_top_fraction", a.exploration_top_fraction);
  read_number(ai, "threat_min_level", a.threat_min_level);
  read_number(ai, "threat_distance", a.threat_distance);
  read_number(ai, "defensive_ship_ratio", a.defensive_ship_ratio);
  read_number(ai, "defensive_production_ratio", a.defensive_production_ratio);
  read_int(ai, "defensive_threat_count", a.defensive_threat_count);
  read_number(ai, "aggressive_ship_ratio", a.aggressive_ship_ratio);
  read_number(ai, "attack_buffer_fraction", a.attack_buffer_fraction);
  read_int(ai, "garrison", a.garrison);
  read_number(ai, "distance_penalty_divisor", a.distance_penalty_divisor);
  read_number(ai, "capacity_value_multiplier", a.capacity_value_multiplier);
  read_number(ai, "ship_efficiency_weight", a.ship_efficiency_weight);
  read_number(ai, "repeat_cooldown_ms", a.repeat_cooldown_ms);
  read_number(ai, "repeat_penalty", a.repeat_penalty);
  read_int(ai, "max_history", a.max_history);
}

void apply_world_config_json(const json::Value& v, WorldConfig& cfg) {
  const auto& o = section(v, "world");

  if (const auto* s = find_key(o, "seed")) {
    const double* d = s->as_number();
    if (!d || *d < 0.0 || std::floor(*d) != *d) {
      throw std::runtime_error("Config key 'seed' must be a non-negative integer");
    }
    // 2^64 is the first double past the uint64_t range.
    if (*d >= 18446744073709551616.0) throw std::runtime_error("Config key 'seed' is out of range");
    cfg.seed = static_cast<std::uint64_t>(*d);
  }

  read_int(o, "node_count", cfg.node_count);

  if (const auto* pool = find_key(o, "capacity_pool")) {
    const auto* arr = pool->as_array();
    if (!arr) throw std::runtime_error("Config key 'capacity_pool' must be an array of integers");
    std::vector<int> values;
    values.reserve(arr->size());
    for (const auto& e : *arr) {
      const double* d = e.as_number();
      if (!d || std::floor(*d) != *d) throw std::runtime_error("Config key 'capacity_pool' must be an array of integers");
      values.push_back(to_int(*d, "capacity_pool"));
    }
    cfg.capacity_pool = std::move(values);
  }

  read_number(o, "width", cfg.width);
  read_number(o, "height", cfg.height);
  read_number(o, "min_distance", cfg.min_distance);
  read_number(o, "margin", cfg.margin);
  read_number(o, "top_band", cfg.top_band);
  read_int(o, "max_attempts", cfg.max_attempts);
  read_int(o, "starting_units", cfg.starting_units);
}

ConfigFile config_from_json(const json::Value& root, const ConfigFile& base) {
  const auto& o = section(root, "root");
  ConfigFile out = base;

  if (const auto* s = find_key(o, "sim")) apply_sim_config_json(*s, out.sim);
  if (const auto* w = find_key(o, "world")) apply_world_config_json(*w, out.world);

  if (const auto* d = find_key(o, "difficulty")) {
    const auto* name = d->as_string();
    Difficulty diff = Difficulty::Normal;
    if (!name || !parse_difficulty(*name, &diff)) {
      throw std::runtime_error("Config key 'difficulty' must be one of easy, normal, hard");
    }
    out.difficulty = diff;
    apply_difficulty(out.sim, diff);
  }
  return out;
}

ConfigFile load_config_file(const std::string& path, const ConfigFile& base) {
  const auto txt = read_text_file(path);

  ConfigFile cfg;
  try {
    cfg = config_from_json(json::parse(txt), base);
  } catch (const std::runtime_error& e) {
    throw std::runtime_error(path + ": " + e.what());
  }

  std::string err;
  if (!validate_world_config(cfg.world, &err)) throw std::runtime_error(path + ": invalid world config: " + err);
  return cfg;
}

} // namespace starclaim
