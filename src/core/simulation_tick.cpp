#include "starclaim/core/simulation.h"

#include <algorithm>
#include <cmath>

#include "starclaim/core/enum_strings.h"
#include "starclaim/util/log.h"

namespace starclaim {
namespace {

std::string id_str(Id id) { return std::to_string(static_cast<unsigned long long>(id)); }

} // namespace

void Simulation::tick(double delta_ms) {
  if (state_.paused || state_.phase != GamePhase::Playing) return;

  double dt = std::isfinite(delta_ms) ? std::max(0.0, delta_ms) : 0.0;
  if (cfg_.max_tick_ms > 0.0) dt = std::min(dt, cfg_.max_tick_ms);

  state_.stats.elapsed_ms += dt;
  state_.stats.ticks += 1;

  tick_nodes(dt);
  tick_fleets(dt);
  tick_ai(dt);
  refresh_stats();
  check_termination();
}

int Simulation::advance(double total_ms, double step_ms) {
  if (!(step_ms > 0.0) || !(total_ms > 0.0)) return 0;
  if (cfg_.max_tick_ms > 0.0) step_ms = std::min(step_ms, cfg_.max_tick_ms);

  int ticks = 0;
  double remaining = total_ms;
  while (remaining > 0.0 && is_playing() && !state_.paused) {
    const double dt = std::min(step_ms, remaining);
    tick(dt);
    remaining -= dt;
    ++ticks;
  }
  return ticks;
}

void Simulation::tick_nodes(double dt) {
  for (auto& node : state_.nodes) {
    const NodeUpdateReport report = node.update(dt, cfg_.production_scale(node.owner));

    if (report.units_produced > 0) {
      state_.stats.units_produced += report.units_produced;
      state_.stats.of(report.previous_owner).units_produced += report.units_produced;
    }

    if (report.conquest_completed && report.ownership_changed()) {
      push_event(EventLevel::Info, EventCategory::Conquest,
                 "Node " + id_str(node.id) + " captured by " + faction_to_string(node.owner), node.owner,
                 report.previous_owner, node.id);
      record_ownership_change(node, report.previous_owner);
    }

    if (report.battle_resolved) {
      const std::string tally = " (" + std::to_string(report.attacking_units) + " vs " +
                                std::to_string(report.defending_units) + ")";
      if (report.ownership_changed()) {
        push_event(EventLevel::Warn, EventCategory::Battle,
                   "Node " + id_str(node.id) + " taken by " + faction_to_string(node.owner) + tally, node.owner,
                   report.previous_owner, node.id);
        record_ownership_change(node, report.previous_owner);
      } else {
        push_event(EventLevel::Info, EventCategory::Battle,
                   "Node " + id_str(node.id) + " held by " + faction_to_string(node.owner) + tally, node.owner,
                   report.attacker, node.id);
      }
    }
  }
}

void Simulation::tick_fleets(double dt) {
  // Reverse order so removal does not disturb the fleets still to visit.
  for (std::size_t i = state_.fleets.size(); i-- > 0;) {
    if (!state_.fleets[i].advance(dt)) continue;

    const Fleet fleet = state_.fleets[i];
    state_.fleets.erase(state_.fleets.begin() + static_cast<std::ptrdiff_t>(i));

    Node* dest = find_node(state_, fleet.dest_id);
    if (!dest) {
      log::warn("Fleet " + id_str(fleet.id) + " arrived at unknown node " + id_str(fleet.dest_id));
      continue;
    }

    const ArrivalOutcome out = resolve_arrival(fleet, *dest);
    switch (out.kind) {
      case ArrivalKind::Conquest:
        break;
      case ArrivalKind::Battle:
        push_event(EventLevel::Info, EventCategory::Fleet,
                   faction_to_string(fleet.owner) + " attacks node " + id_str(dest->id) + " with " +
                       std::to_string(fleet.units) + " units",
                   fleet.owner, dest->owner, dest->id);
        break;
      case ArrivalKind::Reinforcement:
        if (out.units_lost > 0) {
          state_.stats.units_lost_to_overflow += out.units_lost;
          push_event(EventLevel::Info, EventCategory::Fleet,
                     std::to_string(out.units_lost) + " unit(s) lost to capacity at node " + id_str(dest->id),
                     fleet.owner, Faction::Unclaimed, dest->id);
        }
        break;
      case ArrivalKind::Rejected:
        if (cfg_.diagnostics && log::enabled(log::Level::Debug)) {
          log::debug("Fleet " + id_str(fleet.id) + " ignored by node " + id_str(dest->id) + " (" +
                     node_state_to_string(dest->state()) + ", owner " + faction_to_string(dest->owner) + ")");
        }
        break;
    }
  }
}

void Simulation::record_ownership_change(const Node& node, Faction previous_owner) {
  state_.stats.nodes_conquered += 1;
  state_.stats.of(node.owner).nodes_conquered += 1;
  if (is_playable(previous_owner)) state_.stats.of(previous_owner).nodes_lost += 1;

  if (AiState* ai = find_ai_state(state_, node.owner)) ai->nodes_conquered += 1;
  if (AiState* ai = find_ai_state(state_, previous_owner)) ai->nodes_lost += 1;
}

} // namespace starclaim
