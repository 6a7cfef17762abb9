#pragma once

#include <array>
#include <cstdint>
#include <deque>
#include <string>
#include <vector>

#include "starclaim/core/faction.h"
#include "starclaim/core/fleet.h"
#include "starclaim/core/ids.h"
#include "starclaim/core/node.h"

namespace starclaim {

enum class GamePhase { Idle, Playing, FactionAWin, FactionBWin };

enum class AiStrategy { Balanced, Aggressive, Defensive, Expansion };

// Aggregates refreshed at the end of every tick (node/unit totals) or bumped
// as things happen (launch/production/conquest counters).
struct FactionStats {
  int nodes{0};
  int units{0};
  int units_in_transit{0};
  double production_per_sec{0.0};

  int fleets_launched{0};
  int units_produced{0};
  int nodes_conquered{0};
  int nodes_lost{0};
};

struct SimStats {
  double elapsed_ms{0.0};
  int ticks{0};

  int fleets_launched{0};
  int units_produced{0};
  int nodes_conquered{0};
  int units_lost_to_overflow{0};

  std::array<FactionStats, kFactionSlots> factions{};

  FactionStats& of(Faction f) { return factions[faction_index(f)]; }
  const FactionStats& of(Faction f) const { return factions[faction_index(f)]; }
};

enum class EventLevel { Info, Warn };

enum class EventCategory { General, Conquest, Battle, Fleet, Decision };

struct SimEvent {
  std::uint64_t seq{0};
  double time_ms{0.0};

  EventLevel level{EventLevel::Info};
  EventCategory category{EventCategory::General};

  Faction faction{Faction::Unclaimed};
  Faction faction2{Faction::Unclaimed};
  Id node_id{kInvalidId};

  std::string message;
};

// A transfer the decision engine issued, kept to dampen repetition.
struct DecisionRecord {
  Id source_id{kInvalidId};
  Id dest_id{kInvalidId};
  int units{0};
  double score{0.0};
  double time_ms{0.0};
  AiStrategy strategy{AiStrategy::Balanced};
};

// Decision engine state for one AI-controlled faction.
struct AiState {
  Faction faction{Faction::FactionB};

  // Time since the last evaluation cycle.
  double cadence_ms{0.0};

  AiStrategy strategy{AiStrategy::Balanced};

  // Most recent decisions, oldest first; bounded by AiConfig::max_history.
  std::deque<DecisionRecord> history;

  int cycles{0};
  int actions_performed{0};
  int nodes_conquered{0};
  int nodes_lost{0};
};

struct GameState {
  GamePhase phase{GamePhase::Idle};
  bool paused{false};

  Id next_id{1};

  // Nodes are created once by world generation and kept in id order.
  std::vector<Node> nodes;

  // Active fleets in launch order.
  std::vector<Fleet> fleets;

  SimStats stats;

  std::vector<AiState> ai;

  std::vector<SimEvent> events;
  std::uint64_t next_event_seq{1};
};

Id allocate_id(GameState& s);

Node* find_node(GameState& s, Id id);
const Node* find_node(const GameState& s, Id id);

AiState* find_ai_state(GameState& s, Faction f);
const AiState* find_ai_state(const GameState& s, Faction f);

} // namespace starclaim
