#include <algorithm>
#include <cmath>
#include <iostream>
#include <string>

#include "starclaim/core/scenario.h"
#include "starclaim/util/log.h"

#define SC_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_world_gen() {
  using namespace starclaim;

  const NodeRules rules;

  // --- Default map ---
  {
    const WorldConfig cfg;
    util::HashRng rng(cfg.seed);
    const WorldLayout w = generate_world(cfg, rules, rng);

    SC_ASSERT(w.nodes.size() == 7);
    SC_ASSERT(w.fallback_placements == 0);

    for (std::size_t i = 0; i < w.nodes.size(); ++i) {
      const Node& n = w.nodes[i];
      SC_ASSERT(n.id == static_cast<Id>(i + 1));
      SC_ASSERT(n.pos.x >= cfg.margin && n.pos.x <= cfg.width - cfg.margin);
      SC_ASSERT(n.pos.y >= cfg.margin + cfg.top_band && n.pos.y <= cfg.height - cfg.margin);
      SC_ASSERT(std::find(cfg.capacity_pool.begin(), cfg.capacity_pool.end(), n.capacity) != cfg.capacity_pool.end());
      for (std::size_t j = i + 1; j < w.nodes.size(); ++j) {
        SC_ASSERT(distance(n.pos, w.nodes[j].pos) >= cfg.min_distance);
      }
    }

    // Every pool value is used before any is recycled.
    for (int c : cfg.capacity_pool) {
      const auto used = std::count_if(w.nodes.begin(), w.nodes.end(), [c](const Node& n) { return n.capacity == c; });
      SC_ASSERT(used >= 1);
    }

    SC_ASSERT(w.nodes[0].owner == Faction::FactionA);
    SC_ASSERT(w.nodes[1].owner == Faction::FactionB);
    SC_ASSERT(w.nodes[0].units == std::min(cfg.starting_units, w.nodes[0].capacity));
    SC_ASSERT(w.nodes[1].units == std::min(cfg.starting_units, w.nodes[1].capacity));
    for (std::size_t i = 2; i < w.nodes.size(); ++i) {
      SC_ASSERT(w.nodes[i].owner == Faction::Unclaimed);
      SC_ASSERT(w.nodes[i].units == 0);
    }
  }

  // --- Determinism ---
  {
    WorldConfig cfg;
    cfg.seed = 12345;
    util::HashRng r1(cfg.seed);
    util::HashRng r2(cfg.seed);
    const WorldLayout a = generate_world(cfg, rules, r1);
    const WorldLayout b = generate_world(cfg, rules, r2);
    SC_ASSERT(a.nodes.size() == b.nodes.size());
    for (std::size_t i = 0; i < a.nodes.size(); ++i) {
      SC_ASSERT(a.nodes[i].pos == b.nodes[i].pos);
      SC_ASSERT(a.nodes[i].capacity == b.nodes[i].capacity);
    }

    cfg.seed = 54321;
    util::HashRng r3(cfg.seed);
    const WorldLayout c = generate_world(cfg, rules, r3);
    bool any_diff = false;
    for (std::size_t i = 0; i < a.nodes.size(); ++i) any_diff = any_diff || (a.nodes[i].pos != c.nodes[i].pos);
    SC_ASSERT(any_diff);
  }

  // --- Grid fallback when spacing cannot be satisfied ---
  {
    const log::Level saved = log::level();
    log::set_level(log::Level::Off);

    WorldConfig cfg;
    cfg.min_distance = 5000.0;
    cfg.max_attempts = 20;
    util::HashRng rng(3);
    int fallbacks = -1;
    const auto pos = generate_node_positions(cfg, rng, &fallbacks);
    log::set_level(saved);

    SC_ASSERT(pos.size() == 7);
    // Only the first node fits; every other one lands on its grid slot.
    SC_ASSERT(fallbacks == 6);
    const double col_w = (cfg.width - 2.0 * cfg.margin) / 3.0;
    const double row_h = (cfg.height - cfg.margin - (cfg.margin + cfg.top_band)) / 3.0;
    SC_ASSERT(std::fabs(pos[1].x - (cfg.margin + col_w)) < 1e-9);
    SC_ASSERT(std::fabs(pos[1].y - (cfg.margin + cfg.top_band)) < 1e-9);
    SC_ASSERT(std::fabs(pos[4].x - (cfg.margin + col_w)) < 1e-9);
    SC_ASSERT(std::fabs(pos[4].y - (cfg.margin + cfg.top_band + row_h)) < 1e-9);
    SC_ASSERT(std::fabs(pos[6].x - cfg.margin) < 1e-9);
    SC_ASSERT(std::fabs(pos[6].y - (cfg.margin + cfg.top_band + 2.0 * row_h)) < 1e-9);
  }

  // --- Capacity pool recycling ---
  {
    WorldConfig cfg;
    cfg.capacity_pool = {5};
    cfg.node_count = 4;
    cfg.min_distance = 50.0;
    util::HashRng rng(9);
    const WorldLayout w = generate_world(cfg, rules, rng);
    SC_ASSERT(w.nodes.size() == 4);
    for (const auto& n : w.nodes) SC_ASSERT(n.capacity == 5);
    SC_ASSERT(w.nodes[0].units == 5);
  }

  // --- Validation ---
  {
    std::string err;
    SC_ASSERT(validate_world_config(WorldConfig{}, &err));

    WorldConfig bad;
    bad.node_count = 1;
    SC_ASSERT(!validate_world_config(bad, &err));
    SC_ASSERT(!err.empty());

    bad = WorldConfig{};
    bad.capacity_pool.clear();
    SC_ASSERT(!validate_world_config(bad, &err));

    bad = WorldConfig{};
    bad.width = 150.0;
    SC_ASSERT(!validate_world_config(bad));
  }

  return 0;
}
