#pragma once

#include <optional>
#include <string>
#include <vector>

#include "starclaim/core/ai_planner.h"
#include "starclaim/core/game_state.h"
#include "starclaim/core/scenario.h"
#include "starclaim/util/hash_rng.h"

namespace starclaim {

struct SimConfig {
  NodeRules node;
  AiConfig ai;

  // Fleet travel speed in field units per second.
  double fleet_speed{120.0};

  // Upper bound for a single tick's delta. Larger deltas (e.g. after the host
  // stalled) are clamped so timers and travel cannot skip whole phases.
  double max_tick_ms{100.0};

  // Maximum number of persistent events kept in GameState::events.
  // 0 means "unlimited".
  int max_events{500};

  // Emit debug-level log lines for ignored node entries and AI decisions.
  bool diagnostics{false};

  // Which factions the decision engine drives. FactionA is normally the human
  // side; enabling both gives a fully automatic match.
  bool ai_controls_faction_a{false};
  bool ai_controls_faction_b{true};

  // Production multipliers per faction (difficulty presets adjust the
  // AI-controlled side).
  double faction_a_production_scale{1.0};
  double faction_b_production_scale{1.0};

  double production_scale(Faction f) const;
  bool ai_controls(Faction f) const;
};

enum class Difficulty { Easy, Normal, Hard };

// Sets the decision cadence and the production scale of every AI-controlled
// faction.
//
// Easy:   5000 ms, 0.8x
// Normal: 3500 ms, 1.0x
// Hard:   2500 ms, 1.2x
void apply_difficulty(SimConfig& cfg, Difficulty d);

enum class TransferRejection {
  None,
  NotPlaying,
  InvalidFaction,
  UnknownNode,
  SameNode,
  NotOwner,
  NoUnits,
  NothingToSend,
};

struct TransferResult {
  bool accepted{false};
  int units_sent{0};
  Id fleet_id{kInvalidId};

  TransferRejection reason{TransferRejection::None};
  std::string message;
};

// Read-only view of the world for presentation layers.
struct Snapshot {
  std::vector<Node> nodes;
  std::vector<Fleet> fleets;
  SimStats stats;
  GamePhase phase{GamePhase::Idle};
  bool paused{false};
};

// Terminal result, available once a faction has been eliminated.
struct GameSummary {
  GamePhase phase{GamePhase::Idle};
  Faction winner{Faction::Unclaimed};

  double duration_ms{0.0};
  int fleets_launched{0};
  int units_produced{0};
  int nodes_conquered{0};

  SimStats stats;
};

class Simulation {
 public:
  explicit Simulation(SimConfig cfg = {});

  const SimConfig& cfg() const { return cfg_; }

  GameState& state() { return state_; }
  const GameState& state() const { return state_; }

  // Generates a new world from `world` and starts play. Any previous match is
  // discarded. Returns false (with a message) if the world config is invalid;
  // the simulation is then left Idle with an empty world.
  bool reset(const WorldConfig& world, std::string* error = nullptr);

  // Player-style transfer: the unit count is derived from the destination.
  // Unclaimed target: 1. Opponent target: defenders + 1. Friendly target: the
  // free capacity, leaving at least one unit behind. Always clamped to what
  // the source holds.
  TransferResult issue_transfer(Id source_id, Id dest_id, Faction faction);

  // Explicit transfer: sends min(requested, units - garrison).
  TransferResult issue_transfer_units(Id source_id, Id dest_id, Faction faction, int requested, int garrison = 1);

  // Advances the world by delta_ms (clamped to [0, max_tick_ms]).
  // No-op while paused or when the match is not being played.
  void tick(double delta_ms);

  // Calls tick() repeatedly in step_ms increments until total_ms has been
  // consumed or the match ends. Returns the number of ticks performed.
  int advance(double total_ms, double step_ms);

  void pause();
  void resume();
  bool is_paused() const { return state_.paused; }

  bool is_playing() const { return state_.phase == GamePhase::Playing; }
  bool is_over() const;

  Snapshot snapshot() const;

  std::optional<GameSummary> result() const;

  const std::vector<SimEvent>& events() const { return state_.events; }

  // nullptr if the faction is not AI-controlled.
  const AiState* ai_state(Faction f) const { return find_ai_state(state_, f); }

  // Records a persistent event (bounded by SimConfig::max_events).
  void push_event(EventLevel level, EventCategory category, std::string message, Faction faction = Faction::Unclaimed,
                  Faction faction2 = Faction::Unclaimed, Id node_id = kInvalidId);

 private:
  TransferResult launch_fleet(Node& source, const Node& dest, Faction faction, int units);

  void tick_nodes(double dt);
  void tick_fleets(double dt);
  void tick_ai(double dt);
  void refresh_stats();
  void check_termination();

  void run_ai_cycle(AiState& ai);
  void record_ownership_change(const Node& node, Faction previous_owner);

  SimConfig cfg_;
  GameState state_;
  util::HashRng rng_;
};

} // namespace starclaim
