#include "starclaim/core/simulation.h"

#include <algorithm>
#include <utility>

#include "starclaim/core/enum_strings.h"
#include "starclaim/util/log.h"
#include "starclaim/util/strings.h"

namespace starclaim {
namespace {

TransferResult reject(TransferRejection reason, std::string message) {
  TransferResult r;
  r.accepted = false;
  r.reason = reason;
  r.message = std::move(message);
  return r;
}

std::string node_label(Id id) { return "node " + std::to_string(static_cast<unsigned long long>(id)); }

} // namespace

double SimConfig::production_scale(Faction f) const {
  switch (f) {
    case Faction::FactionA: return faction_a_production_scale;
    case Faction::FactionB: return faction_b_production_scale;
    case Faction::Unclaimed: return 1.0;
  }
  return 1.0;
}

bool SimConfig::ai_controls(Faction f) const {
  switch (f) {
    case Faction::FactionA: return ai_controls_faction_a;
    case Faction::FactionB: return ai_controls_faction_b;
    case Faction::Unclaimed: return false;
  }
  return false;
}

void apply_difficulty(SimConfig& cfg, Difficulty d) {
  double interval = 3500.0;
  double scale = 1.0;
  switch (d) {
    case Difficulty::Easy:
      interval = 5000.0;
      scale = 0.8;
      break;
    case Difficulty::Normal:
      interval = 3500.0;
      scale = 1.0;
      break;
    case Difficulty::Hard:
      interval = 2500.0;
      scale = 1.2;
      break;
  }

  cfg.ai.decision_interval_ms = interval;
  if (cfg.ai_controls_faction_a) cfg.faction_a_production_scale = scale;
  if (cfg.ai_controls_faction_b) cfg.faction_b_production_scale = scale;
}

Simulation::Simulation(SimConfig cfg) : cfg_(std::move(cfg)) {}

bool Simulation::reset(const WorldConfig& world, std::string* error) {
  state_ = GameState{};
  std::string err;
  if (!validate_world_config(world, &err)) {
    log::error("Invalid world config: " + err);
    if (error) *error = err;
    return false;
  }

  rng_ = util::HashRng(world.seed);
  WorldLayout layout = generate_world(world, cfg_.node, rng_, /*first_id=*/1);
  state_.nodes = std::move(layout.nodes);
  state_.next_id = static_cast<Id>(state_.nodes.size()) + 1;

  for (Faction f : kPlayableFactions) {
    if (!cfg_.ai_controls(f)) continue;
    AiState ai;
    ai.faction = f;
    state_.ai.push_back(ai);
  }

  state_.phase = GamePhase::Playing;
  refresh_stats();

  log::info("New match: " + std::to_string(state_.nodes.size()) + " nodes, seed " +
            std::to_string(static_cast<unsigned long long>(world.seed)) +
            (layout.fallback_placements > 0
                 ? ", " + std::to_string(layout.fallback_placements) + " grid fallback placement(s)"
                 : std::string()));
  push_event(EventLevel::Info, EventCategory::General,
             "Match started with " + std::to_string(state_.nodes.size()) + " nodes");
  return true;
}

TransferResult Simulation::issue_transfer(Id source_id, Id dest_id, Faction faction) {
  if (state_.phase != GamePhase::Playing || state_.paused) {
    return reject(TransferRejection::NotPlaying, "Match is not being played");
  }
  if (!is_playable(faction)) return reject(TransferRejection::InvalidFaction, "Unclaimed cannot issue transfers");

  Node* src = find_node(state_, source_id);
  const Node* dst = find_node(state_, dest_id);
  if (!src || !dst) return reject(TransferRejection::UnknownNode, "Unknown node");
  if (src == dst) return reject(TransferRejection::SameNode, "Source and destination are the same node");
  if (src->owner != faction) return reject(TransferRejection::NotOwner, node_label(source_id) + " is not owned");
  if (src->units <= 0) return reject(TransferRejection::NoUnits, node_label(source_id) + " has no units");

  int count = 0;
  if (dst->owner == Faction::Unclaimed) {
    count = 1;
  } else if (dst->owner == faction) {
    count = std::min(dst->free_capacity(), src->units - 1);
  } else {
    count = dst->units + 1;
  }
  count = std::min(count, src->units);
  if (count <= 0) return reject(TransferRejection::NothingToSend, "Nothing to send to " + node_label(dest_id));

  return launch_fleet(*src, *dst, faction, count);
}

TransferResult Simulation::issue_transfer_units(Id source_id, Id dest_id, Faction faction, int requested,
                                                int garrison) {
  if (state_.phase != GamePhase::Playing || state_.paused) {
    return reject(TransferRejection::NotPlaying, "Match is not being played");
  }
  if (!is_playable(faction)) return reject(TransferRejection::InvalidFaction, "Unclaimed cannot issue transfers");

  Node* src = find_node(state_, source_id);
  const Node* dst = find_node(state_, dest_id);
  if (!src || !dst) return reject(TransferRejection::UnknownNode, "Unknown node");
  if (src == dst) return reject(TransferRejection::SameNode, "Source and destination are the same node");
  if (src->owner != faction) return reject(TransferRejection::NotOwner, node_label(source_id) + " is not owned");
  if (src->units <= 0) return reject(TransferRejection::NoUnits, node_label(source_id) + " has no units");

  const int count = std::min(requested, src->units - std::max(0, garrison));
  if (count <= 0) return reject(TransferRejection::NothingToSend, "Nothing to send from " + node_label(source_id));

  return launch_fleet(*src, *dst, faction, count);
}

TransferResult Simulation::launch_fleet(Node& source, const Node& dest, Faction faction, int units) {
  const int taken = source.withdraw(units);

  Fleet f = make_fleet(allocate_id(state_), source, dest, faction, taken, cfg_.fleet_speed);
  TransferResult r;
  r.accepted = true;
  r.units_sent = taken;
  r.fleet_id = f.id;
  state_.fleets.push_back(std::move(f));

  state_.stats.fleets_launched += 1;
  state_.stats.of(faction).fleets_launched += 1;
  return r;
}

void Simulation::pause() {
  if (state_.paused) return;
  state_.paused = true;
  log::info("Simulation paused");
}

void Simulation::resume() {
  if (!state_.paused) return;
  state_.paused = false;
  log::info("Simulation resumed");
}

bool Simulation::is_over() const {
  return state_.phase == GamePhase::FactionAWin || state_.phase == GamePhase::FactionBWin;
}

Snapshot Simulation::snapshot() const {
  Snapshot s;
  s.nodes = state_.nodes;
  s.fleets = state_.fleets;
  s.stats = state_.stats;
  s.phase = state_.phase;
  s.paused = state_.paused;
  return s;
}

std::optional<GameSummary> Simulation::result() const {
  if (!is_over()) return std::nullopt;

  GameSummary g;
  g.phase = state_.phase;
  g.winner = (state_.phase == GamePhase::FactionAWin) ? Faction::FactionA : Faction::FactionB;
  g.duration_ms = state_.stats.elapsed_ms;
  g.fleets_launched = state_.stats.fleets_launched;
  g.units_produced = state_.stats.units_produced;
  g.nodes_conquered = state_.stats.nodes_conquered;
  g.stats = state_.stats;
  return g;
}

void Simulation::push_event(EventLevel level, EventCategory category, std::string message, Faction faction,
                            Faction faction2, Id node_id) {
  SimEvent ev;
  ev.seq = state_.next_event_seq;
  state_.next_event_seq += 1;
  if (state_.next_event_seq == 0) state_.next_event_seq = 1;

  ev.time_ms = state_.stats.elapsed_ms;
  ev.level = level;
  ev.category = category;
  ev.faction = faction;
  ev.faction2 = faction2;
  ev.node_id = node_id;
  ev.message = std::move(message);
  state_.events.push_back(std::move(ev));

  const int max_events = cfg_.max_events;
  if (max_events > 0 && static_cast<int>(state_.events.size()) > max_events) {
    const std::size_t cut = state_.events.size() - static_cast<std::size_t>(max_events);
    state_.events.erase(state_.events.begin(), state_.events.begin() + static_cast<std::ptrdiff_t>(cut));
  }
}

void Simulation::refresh_stats() {
  for (auto& fs : state_.stats.factions) {
    fs.nodes = 0;
    fs.units = 0;
    fs.units_in_transit = 0;
    fs.production_per_sec = 0.0;
  }

  for (const auto& n : state_.nodes) {
    FactionStats& fs = state_.stats.of(n.owner);
    fs.nodes += 1;
    fs.units += n.units;
    if (n.owner != Faction::Unclaimed) fs.production_per_sec += n.production_rate * cfg_.production_scale(n.owner);
  }
  for (const auto& f : state_.fleets) state_.stats.of(f.owner).units_in_transit += f.units;
}

void Simulation::check_termination() {
  if (state_.phase != GamePhase::Playing) return;

  Faction winner = Faction::Unclaimed;
  if (state_.stats.of(Faction::FactionA).nodes == 0) {
    winner = Faction::FactionB;
  } else if (state_.stats.of(Faction::FactionB).nodes == 0) {
    winner = Faction::FactionA;
  }
  if (winner == Faction::Unclaimed) return;

  state_.phase = (winner == Faction::FactionA) ? GamePhase::FactionAWin : GamePhase::FactionBWin;

  const std::string msg = "Game over: " + faction_to_string(winner) + " wins after " +
                          format_duration_ms(state_.stats.elapsed_ms) + " (" +
                          std::to_string(state_.stats.nodes_conquered) + " nodes conquered, " +
                          std::to_string(state_.stats.fleets_launched) + " fleets launched)";
  log::info(msg);
  push_event(EventLevel::Warn, EventCategory::General, msg, winner, opponent_of(winner));
}

} // namespace starclaim
