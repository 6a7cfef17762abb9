#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "starclaim/core/node.h"
#include "starclaim/util/hash_rng.h"

namespace starclaim {

// Parameters for procedural map generation (consumed by Simulation::reset).
struct WorldConfig {
  std::uint64_t seed{1};

  // Total nodes, including the two starting nodes.
  int node_count{7};

  // Capacities are drawn from a shuffled copy of this pool. When the pool is
  // smaller than node_count, further shuffled copies are appended.
  std::vector<int> capacity_pool{6, 8, 10, 12, 15, 20};

  // Playing field size in field units.
  double width{1200.0};
  double height{800.0};

  // Minimum pairwise distance between node centres.
  double min_distance{120.0};

  // Clearance from every field edge, plus an extra band at the top that the
  // presentation layer reserves for its HUD.
  double margin{100.0};
  double top_band{70.0};

  // Rejection-sampling budget per node before falling back to a grid slot.
  int max_attempts{1000};

  // Units on each faction's starting node.
  int starting_units{10};
};

// Returns false (with a message) when the config cannot produce a playable map.
bool validate_world_config(const WorldConfig& cfg, std::string* error = nullptr);

struct WorldLayout {
  std::vector<Node> nodes;

  // Nodes that could not be placed by rejection sampling and were put on the
  // deterministic fallback grid instead.
  int fallback_placements{0};
};

// Generates node positions only. Exposed for tests and tooling.
std::vector<Vec2> generate_node_positions(const WorldConfig& cfg, util::HashRng& rng, int* fallback_count = nullptr);

// Generates a full map: positions, capacities and starting ownership.
//
// Node ids are assigned sequentially starting at first_id. The first node
// belongs to FactionA, the second to FactionB (each with starting_units); every
// other node starts Unclaimed with no units.
WorldLayout generate_world(const WorldConfig& cfg, const NodeRules& rules, util::HashRng& rng, Id first_id = 1);

} // namespace starclaim
