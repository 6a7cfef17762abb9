#include "starclaim/core/node.h"

#include <algorithm>

namespace starclaim {

double production_rate_for_capacity(const NodeRules& rules, int capacity) {
  return rules.production_base_per_sec + static_cast<double>(std::max(0, capacity)) * rules.production_per_capacity;
}

Node make_node(Id id, Vec2 pos, int capacity, Faction owner, int units, const NodeRules& rules) {
  Node n;
  n.id = id;
  n.pos = pos;
  n.capacity = std::max(0, capacity);
  n.owner = owner;
  n.units = (owner == Faction::Unclaimed) ? 0 : std::clamp(units, 0, n.capacity);
  n.production_rate = production_rate_for_capacity(rules, n.capacity);
  n.conquest_timer = Timer(rules.conquest_duration_ms);
  n.battle_timer = Timer(rules.battle_duration_ms);
  return n;
}

NodeState Node::state() const {
  if (conquest_timer.active) return NodeState::Conquering;
  if (battle_timer.active) return NodeState::Battling;
  return NodeState::Idle;
}

NodeEntryResult Node::begin_conquest(Faction by) {
  if (!is_playable(by)) return NodeEntryResult::StateConflict;
  if (owner != Faction::Unclaimed || battle_timer.active) return NodeEntryResult::StateConflict;

  conqueror = by;
  conquest_timer.start();
  return NodeEntryResult::Accepted;
}

NodeEntryResult Node::begin_battle(Faction by, int attacking) {
  if (!is_playable(by) || by == owner) return NodeEntryResult::StateConflict;
  if (owner == Faction::Unclaimed || conquest_timer.active) return NodeEntryResult::StateConflict;
  if (attacking <= 0) return NodeEntryResult::StateConflict;

  attacker = by;
  attacking_units = attacking;
  battle_timer.start();
  return NodeEntryResult::Accepted;
}

int Node::reinforce(int arriving) {
  if (arriving <= 0) return 0;
  const int absorbed = std::min(arriving, free_capacity());
  units += absorbed;
  return arriving - absorbed;
}

int Node::withdraw(int count) {
  const int taken = std::clamp(count, 0, units);
  units -= taken;
  return taken;
}

NodeUpdateReport Node::update(double delta_ms, double production_scale) {
  NodeUpdateReport report;
  report.previous_owner = owner;

  if (owner != Faction::Unclaimed && units < capacity) {
    const double rate = production_rate * production_scale;
    if (rate > 0.0) {
      production_accum_ms += delta_ms;
      if (production_accum_ms >= 1000.0 / rate) {
        units = std::min(capacity, units + 1);
        production_accum_ms = 0.0;
        report.units_produced = 1;
      }
    }
  }

  if (conquest_timer.update(delta_ms)) complete_conquest(report);
  if (battle_timer.update(delta_ms)) complete_battle(report);

  report.new_owner = owner;
  return report;
}

void Node::complete_conquest(NodeUpdateReport& report) {
  report.conquest_completed = true;
  if (!is_playable(conqueror)) return;
  owner = conqueror;
  units = 0;
  conqueror = Faction::Unclaimed;
}

void Node::complete_battle(NodeUpdateReport& report) {
  report.battle_resolved = true;
  report.attacker = attacker;
  report.attacking_units = attacking_units;
  report.defending_units = units;

  if (attacking_units > units) {
    owner = attacker;
    units = std::min(capacity, attacking_units - units);
  } else {
    units = std::max(0, units - attacking_units);
  }

  attacker = Faction::Unclaimed;
  attacking_units = 0;
}

} // namespace starclaim
