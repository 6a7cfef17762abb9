#include <cmath>
#include <iostream>

#include "starclaim/core/node.h"

#define SC_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

using starclaim::Faction;
using starclaim::Node;
using starclaim::NodeEntryResult;
using starclaim::NodeRules;
using starclaim::NodeState;

Node owned(int capacity, Faction owner, int units) {
  return starclaim::make_node(1, {0.0, 0.0}, capacity, owner, units, NodeRules{});
}

// Battles run with production disabled so the defender count stays fixed.
int resolve_battle(Node& n, Faction attacker, int attacking) {
  if (n.begin_battle(attacker, attacking) != NodeEntryResult::Accepted) return -1;
  const auto report = n.update(1500.0, 0.0);
  return report.battle_resolved ? 0 : -1;
}

} // namespace

int test_node() {
  const NodeRules rules;

  // --- Construction ---
  {
    const Node n = starclaim::make_node(7, {10.0, 20.0}, 10, Faction::FactionA, 25, rules);
    SC_ASSERT(n.id == 7);
    SC_ASSERT(n.units == 10);
    SC_ASSERT(n.state() == NodeState::Idle);
    SC_ASSERT(std::fabs(n.production_rate - 2.0) < 1e-12);

    const Node u = starclaim::make_node(8, {0.0, 0.0}, 8, Faction::Unclaimed, 5, rules);
    SC_ASSERT(u.units == 0);

    SC_ASSERT(std::fabs(starclaim::production_rate_for_capacity(rules, 20) - 3.2) < 1e-12);
    SC_ASSERT(starclaim::production_rate_for_capacity(rules, 6) < starclaim::production_rate_for_capacity(rules, 8));
  }

  // --- Battle resolution ---
  {
    Node n = owned(10, Faction::FactionA, 6);
    SC_ASSERT(n.begin_battle(Faction::FactionB, 10) == NodeEntryResult::Accepted);
    SC_ASSERT(n.state() == NodeState::Battling);

    auto r = n.update(1499.0, 0.0);
    SC_ASSERT(!r.battle_resolved);
    SC_ASSERT(n.is_battling());

    r = n.update(1.0, 0.0);
    SC_ASSERT(r.battle_resolved);
    SC_ASSERT(r.ownership_changed());
    SC_ASSERT(r.attacking_units == 10);
    SC_ASSERT(r.defending_units == 6);
    SC_ASSERT(n.owner == Faction::FactionB);
    SC_ASSERT(n.units == 4);
    SC_ASSERT(n.state() == NodeState::Idle);
  }
  {
    Node n = owned(10, Faction::FactionA, 10);
    SC_ASSERT(resolve_battle(n, Faction::FactionB, 6) == 0);
    SC_ASSERT(n.owner == Faction::FactionA);
    SC_ASSERT(n.units == 4);
  }
  {
    Node n = owned(10, Faction::FactionA, 5);
    SC_ASSERT(resolve_battle(n, Faction::FactionB, 5) == 0);
    SC_ASSERT(n.owner == Faction::FactionA);
    SC_ASSERT(n.units == 0);
  }
  {
    // The winner's remainder never exceeds capacity.
    Node n = owned(10, Faction::FactionA, 1);
    SC_ASSERT(resolve_battle(n, Faction::FactionB, 20) == 0);
    SC_ASSERT(n.owner == Faction::FactionB);
    SC_ASSERT(n.units == 10);
  }
  {
    // A second attacker overwrites the first and restarts the timer.
    Node n = owned(10, Faction::FactionA, 5);
    SC_ASSERT(n.begin_battle(Faction::FactionB, 9) == NodeEntryResult::Accepted);
    SC_ASSERT(!n.update(1000.0, 0.0).battle_resolved);
    SC_ASSERT(n.begin_battle(Faction::FactionB, 3) == NodeEntryResult::Accepted);
    SC_ASSERT(!n.update(1000.0, 0.0).battle_resolved);
    SC_ASSERT(n.update(500.0, 0.0).battle_resolved);
    SC_ASSERT(n.owner == Faction::FactionA);
    SC_ASSERT(n.units == 2);
  }

  // --- Conquest ---
  {
    Node n = starclaim::make_node(3, {0.0, 0.0}, 8, Faction::Unclaimed, 0, rules);
    SC_ASSERT(n.begin_conquest(Faction::FactionA) == NodeEntryResult::Accepted);
    SC_ASSERT(n.state() == NodeState::Conquering);
    SC_ASSERT(!n.update(2999.0).conquest_completed);
    SC_ASSERT(n.owner == Faction::Unclaimed);

    const auto r = n.update(1.0);
    SC_ASSERT(r.conquest_completed);
    SC_ASSERT(r.previous_owner == Faction::Unclaimed);
    SC_ASSERT(r.new_owner == Faction::FactionA);
    SC_ASSERT(n.owner == Faction::FactionA);
    SC_ASSERT(n.units == 0);
    SC_ASSERT(n.state() == NodeState::Idle);
  }
  {
    Node n = starclaim::make_node(3, {0.0, 0.0}, 8, Faction::Unclaimed, 0, rules);
    SC_ASSERT(n.begin_conquest(Faction::FactionA) == NodeEntryResult::Accepted);
    SC_ASSERT(!n.update(2000.0).conquest_completed);
    // Latest arrival takes the conqueror slot and restarts the timer.
    SC_ASSERT(n.begin_conquest(Faction::FactionB) == NodeEntryResult::Accepted);
    SC_ASSERT(!n.update(2000.0).conquest_completed);
    SC_ASSERT(n.update(1000.0).conquest_completed);
    SC_ASSERT(n.owner == Faction::FactionB);
  }

  // --- Entry points that do not apply ---
  {
    Node a = owned(10, Faction::FactionA, 5);
    SC_ASSERT(a.begin_conquest(Faction::FactionB) == NodeEntryResult::StateConflict);
    SC_ASSERT(a.begin_battle(Faction::FactionA, 3) == NodeEntryResult::StateConflict);
    SC_ASSERT(a.begin_battle(Faction::Unclaimed, 3) == NodeEntryResult::StateConflict);
    SC_ASSERT(a.begin_battle(Faction::FactionB, 0) == NodeEntryResult::StateConflict);
    SC_ASSERT(a.state() == NodeState::Idle);

    Node u = starclaim::make_node(2, {0.0, 0.0}, 8, Faction::Unclaimed, 0, rules);
    SC_ASSERT(u.begin_battle(Faction::FactionA, 3) == NodeEntryResult::StateConflict);
    SC_ASSERT(u.begin_conquest(Faction::Unclaimed) == NodeEntryResult::StateConflict);
    SC_ASSERT(u.state() == NodeState::Idle);
  }

  // --- Reinforcement / withdrawal ---
  {
    Node n = owned(10, Faction::FactionA, 8);
    // 8 + 5 on capacity 10: two absorbed, three lost.
    SC_ASSERT(n.reinforce(5) == 3);
    SC_ASSERT(n.units == 10);
    SC_ASSERT(n.free_capacity() == 0);
    SC_ASSERT(n.reinforce(0) == 0);

    SC_ASSERT(n.withdraw(15) == 10);
    SC_ASSERT(n.units == 0);
    SC_ASSERT(n.withdraw(-3) == 0);
  }

  // --- Production ---
  {
    // Capacity 10 produces 2 units/second: one unit every 500 ms.
    Node n = owned(10, Faction::FactionA, 0);
    SC_ASSERT(n.update(499.0).units_produced == 0);
    SC_ASSERT(n.update(2.0).units_produced == 1);
    SC_ASSERT(n.units == 1);

    int produced = 0;
    for (int i = 0; i < 6; ++i) produced += n.update(100.0).units_produced;
    SC_ASSERT(produced == 1);
    SC_ASSERT(n.units == 2);

    // Doubling the scale halves the interval.
    SC_ASSERT(n.update(100.0).units_produced == 0);
    SC_ASSERT(n.update(160.0, 2.0).units_produced == 1);

    // Nothing is produced at capacity or while Unclaimed.
    Node full = owned(6, Faction::FactionA, 6);
    SC_ASSERT(full.update(10000.0).units_produced == 0);
    SC_ASSERT(full.units == 6);

    Node u = starclaim::make_node(2, {0.0, 0.0}, 8, Faction::Unclaimed, 0, rules);
    SC_ASSERT(u.update(10000.0).units_produced == 0);
    SC_ASSERT(u.units == 0);

    // Units stay within capacity under any amount of time.
    Node m = owned(6, Faction::FactionB, 0);
    for (int i = 0; i < 200; ++i) {
      m.update(100.0);
      SC_ASSERT(m.units >= 0 && m.units <= m.capacity);
    }
    SC_ASSERT(m.units == 6);
  }

  return 0;
}
