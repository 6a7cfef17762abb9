#include "starclaim/core/scenario.h"

#include <algorithm>
#include <cmath>

#include "starclaim/util/log.h"

namespace starclaim {
namespace {

constexpr int kGridColumns = 3;

bool far_enough(const std::vector<Vec2>& placed, const Vec2& p, double min_distance) {
  const double min_sq = min_distance * min_distance;
  for (const Vec2& q : placed) {
    if ((p - q).length_squared() < min_sq) return false;
  }
  return true;
}

// Deterministic slot i of a 3-column grid spanning the usable area.
Vec2 grid_slot(const WorldConfig& cfg, int i, int count) {
  const int rows = std::max(1, (count + kGridColumns - 1) / kGridColumns);
  const double top = cfg.margin + cfg.top_band;
  const double col_w = (cfg.width - 2.0 * cfg.margin) / kGridColumns;
  const double row_h = (cfg.height - cfg.margin - top) / rows;
  return {cfg.margin + (i % kGridColumns) * col_w, top + (i / kGridColumns) * row_h};
}

} // namespace

bool validate_world_config(const WorldConfig& cfg, std::string* error) {
  auto fail = [&](const std::string& msg) {
    if (error) *error = msg;
    return false;
  };
  if (cfg.node_count < 2) return fail("node_count must be at least 2 (one starting node per faction)");
  if (cfg.capacity_pool.empty()) return fail("capacity_pool must not be empty");
  for (int c : cfg.capacity_pool) {
    if (c <= 0) return fail("capacity_pool values must be positive");
  }
  if (!(cfg.width > 2.0 * cfg.margin)) return fail("width must exceed twice the margin");
  if (!(cfg.height > 2.0 * cfg.margin + cfg.top_band)) return fail("height must exceed the margins plus top band");
  if (cfg.min_distance < 0.0) return fail("min_distance must be non-negative");
  if (cfg.max_attempts < 0) return fail("max_attempts must be non-negative");
  if (cfg.starting_units < 0) return fail("starting_units must be non-negative");
  return true;
}

std::vector<Vec2> generate_node_positions(const WorldConfig& cfg, util::HashRng& rng, int* fallback_count) {
  std::vector<Vec2> positions;
  const int count = std::max(0, cfg.node_count);
  positions.reserve(static_cast<std::size_t>(count));

  const double x_lo = cfg.margin;
  const double x_hi = cfg.width - cfg.margin;
  const double y_lo = cfg.margin + cfg.top_band;
  const double y_hi = cfg.height - cfg.margin;

  int fallbacks = 0;
  for (int i = 0; i < count; ++i) {
    bool placed = false;
    for (int attempt = 0; attempt < cfg.max_attempts; ++attempt) {
      const Vec2 p{rng.range(x_lo, x_hi), rng.range(y_lo, y_hi)};
      if (!far_enough(positions, p, cfg.min_distance)) continue;
      positions.push_back(p);
      placed = true;
      break;
    }
    if (!placed) {
      positions.push_back(grid_slot(cfg, i, count));
      ++fallbacks;
    }
  }

  if (fallbacks > 0) {
    log::warn("World generation: " + std::to_string(fallbacks) + " of " + std::to_string(count) +
              " nodes placed on the fallback grid (min_distance=" + std::to_string(cfg.min_distance) + ")");
  }
  if (fallback_count) *fallback_count = fallbacks;
  return positions;
}

WorldLayout generate_world(const WorldConfig& cfg, const NodeRules& rules, util::HashRng& rng, Id first_id) {
  WorldLayout out;
  const int count = std::max(0, cfg.node_count);

  std::vector<int> capacities = cfg.capacity_pool;
  rng.shuffle(capacities);
  if (!cfg.capacity_pool.empty()) {
    while (static_cast<int>(capacities.size()) < count) {
      capacities.insert(capacities.end(), cfg.capacity_pool.begin(), cfg.capacity_pool.end());
    }
  }

  const std::vector<Vec2> positions = generate_node_positions(cfg, rng, &out.fallback_placements);

  out.nodes.reserve(static_cast<std::size_t>(count));
  for (int i = 0; i < count; ++i) {
    const int capacity = capacities.empty() ? 1 : capacities[static_cast<std::size_t>(i)];
    Faction owner = Faction::Unclaimed;
    int units = 0;
    if (i == 0) {
      owner = Faction::FactionA;
      units = cfg.starting_units;
    } else if (i == 1) {
      owner = Faction::FactionB;
      units = cfg.starting_units;
    }
    out.nodes.push_back(make_node(first_id + static_cast<Id>(i), positions[static_cast<std::size_t>(i)], capacity,
                                  owner, units, rules));
  }
  return out;
}

} // namespace starclaim
