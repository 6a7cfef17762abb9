#pragma once

#include "starclaim/core/faction.h"
#include "starclaim/core/ids.h"
#include "starclaim/core/timer.h"
#include "starclaim/core/vec2.h"

namespace starclaim {

// Timing and production constants shared by every node.
struct NodeRules {
  // Time an Unclaimed node needs to fall to a conqueror.
  double conquest_duration_ms{3000.0};

  // Time a contested node spends in battle before it resolves.
  double battle_duration_ms{1500.0};

  // Production rate in units/second is base + capacity * per_capacity.
  double production_base_per_sec{0.8};
  double production_per_capacity{0.12};
};

// Production rate (units/second) for a node of the given capacity. Monotonic in
// capacity for non-negative per_capacity.
double production_rate_for_capacity(const NodeRules& rules, int capacity);

enum class NodeState { Idle, Conquering, Battling };

enum class NodeEntryResult {
  Accepted,
  // The node is in a state (or has an owner) that the entry point cannot
  // apply to. The node is left untouched.
  StateConflict,
};

// What happened to a node during one update().
struct NodeUpdateReport {
  int units_produced{0};

  bool conquest_completed{false};
  bool battle_resolved{false};

  Faction previous_owner{Faction::Unclaimed};
  Faction new_owner{Faction::Unclaimed};

  // Battle inputs as they stood when the battle timer expired.
  Faction attacker{Faction::Unclaimed};
  int attacking_units{0};
  int defending_units{0};

  bool ownership_changed() const { return previous_owner != new_owner; }
};

// A capacity-bounded territory.
//
// Invariants maintained by the member functions:
// - 0 <= units <= capacity
// - conquest and battle are never active at the same time
// - owner == Unclaimed implies units == 0 (conquest arrivals are consumed)
struct Node {
  Id id{kInvalidId};
  Vec2 pos;

  int capacity{0};
  int units{0};
  Faction owner{Faction::Unclaimed};

  // Units per second, derived from capacity at creation.
  double production_rate{0.0};
  double production_accum_ms{0.0};

  // Conquest (Unclaimed nodes only).
  Timer conquest_timer;
  Faction conqueror{Faction::Unclaimed};

  // Battle (owned nodes only).
  Timer battle_timer;
  Faction attacker{Faction::Unclaimed};
  int attacking_units{0};

  NodeState state() const;
  bool is_conquering() const { return conquest_timer.active; }
  bool is_battling() const { return battle_timer.active; }
  int free_capacity() const { return capacity > units ? capacity - units : 0; }

  // Starts (or restarts) the conquest of an Unclaimed node. A second faction
  // arriving mid-conquest takes over the single conqueror slot.
  NodeEntryResult begin_conquest(Faction by);

  // Starts a battle on an owned node. A second attacker overwrites the first
  // attacker and its unit count; nothing is merged.
  NodeEntryResult begin_battle(Faction by, int attacking);

  // Adds friendly units, clamped to capacity. Returns the number of units that
  // did not fit (lost).
  int reinforce(int arriving);

  // Removes up to `count` units and returns how many were actually removed.
  int withdraw(int count);

  // Advances production, conquest and battle by delta_ms, in that order.
  // production_scale multiplies production_rate (1.0 = unmodified).
  NodeUpdateReport update(double delta_ms, double production_scale = 1.0);

 private:
  void complete_conquest(NodeUpdateReport& report);
  void complete_battle(NodeUpdateReport& report);
};

// Builds a node with timers and production derived from `rules`.
Node make_node(Id id, Vec2 pos, int capacity, Faction owner, int units, const NodeRules& rules);

} // namespace starclaim
