#pragma once

#include <optional>
#include <unordered_map>
#include <vector>

#include "starclaim/core/game_state.h"
#include "starclaim/util/hash_rng.h"

namespace starclaim {

// Tunables for the decision engine.
struct AiConfig {
  // Time between evaluation cycles. Independent of the tick rate.
  double decision_interval_ms{3500.0};

  // Probability of picking uniformly among the top candidates instead of the
  // single best one.
  double exploration_chance{0.2};

  // Fraction of the ranked candidate list that exploration samples from
  // (always at least one candidate).
  double exploration_top_fraction{0.3};

  // --- Threat assessment ---
  double threat_min_level{0.3};
  double threat_distance{500.0};

  // --- Strategy selection ---
  double defensive_ship_ratio{0.5};
  double defensive_production_ratio{0.3};
  int defensive_threat_count{2};
  double aggressive_ship_ratio{1.5};

  // --- Candidate sizing ---
  // Extra fraction of the defenders sent against enemy nodes (rounded up).
  double attack_buffer_fraction{0.2};
  // Units always left behind on the source node.
  int garrison{1};

  // --- Scoring ---
  double distance_penalty_divisor{100.0};
  double capacity_value_multiplier{10.0};
  double ship_efficiency_weight{5.0};

  // A (source, destination) pair chosen within this window scores
  // repeat_penalty times lower.
  double repeat_cooldown_ms{10000.0};
  double repeat_penalty{0.5};

  // Bounded decision history length.
  int max_history{10};
};

// Coarse progress of the match as seen by one faction.
enum class MatchPhase { Expansion, Midgame, Endgame };

// One opponent node threatening one of our nodes.
struct Threat {
  Id source_id{kInvalidId};  // opponent node
  Id target_id{kInvalidId};  // our node
  double distance{0.0};
  double level{0.0};
};

struct BattlefieldAnalysis {
  Faction me{Faction::FactionB};
  Faction opponent{Faction::FactionA};

  std::vector<Id> mine;
  std::vector<Id> theirs;
  std::vector<Id> unclaimed;

  int my_units{0};
  int their_units{0};
  double ship_ratio{0.0};

  double my_production{0.0};
  double their_production{0.0};
  double production_ratio{0.0};

  // Threats above AiConfig::threat_min_level, highest first.
  std::vector<Threat> threats;

  // Highest threat each opponent node poses to any of our nodes (unfiltered).
  std::unordered_map<Id, double> opponent_threat;

  MatchPhase phase{MatchPhase::Expansion};
};

struct TransferCandidate {
  Id source_id{kInvalidId};
  Id dest_id{kInvalidId};

  Faction dest_owner{Faction::Unclaimed};
  int dest_units{0};
  int dest_capacity{0};

  int source_units{0};
  int units{0};

  double distance{0.0};
  double score{0.0};
};

// Weighted threat an attacking node poses to a target node at `dist`:
// 0.5 * unit ratio + 0.3 * proximity + 0.2 * capacity ratio.
double threat_level(const Node& attacker, const Node& target, double dist, const AiConfig& cfg);

BattlefieldAnalysis analyze_battlefield(const std::vector<Node>& nodes, Faction me, const AiConfig& cfg);

AiStrategy choose_strategy(const BattlefieldAnalysis& a, const AiConfig& cfg);

// Units the engine would send from source to target: 1 for Unclaimed targets,
// defenders + ceil(defenders * buffer) + 1 otherwise; capped so the garrison
// stays behind. May be <= 0 when the source cannot spare anything.
int units_to_send(const Node& source, const Node& target, const AiConfig& cfg);

// Every (owned source with more than the garrison, non-owned target) pair with
// a positive send count. Scores are left at zero.
std::vector<TransferCandidate> generate_candidates(const std::vector<Node>& nodes, const BattlefieldAnalysis& a,
                                                   const AiConfig& cfg);

// Step estimate of the chance the transfer takes the target.
double success_probability(const TransferCandidate& c);

// True if the same (source, destination) decision is inside the cooldown window.
bool is_recent_decision(const AiState& ai, Id source_id, Id dest_id, double now_ms, const AiConfig& cfg);

double score_candidate(const TransferCandidate& c, AiStrategy strategy, const BattlefieldAnalysis& a,
                       const AiState& ai, double now_ms, const AiConfig& cfg);

// Picks the best candidate, or with probability exploration_chance a uniform
// pick among the top exploration_top_fraction. `ranked` must be sorted by
// descending score.
std::optional<TransferCandidate> select_candidate(const std::vector<TransferCandidate>& ranked, const AiConfig& cfg,
                                                  util::HashRng& rng);

// Result of one full evaluation cycle.
struct AiPlan {
  BattlefieldAnalysis analysis;
  AiStrategy strategy{AiStrategy::Balanced};

  // Scored candidates, best first.
  std::vector<TransferCandidate> ranked;

  std::optional<TransferCandidate> chosen;
};

// Runs snapshot, threat assessment, strategy selection, candidate generation,
// scoring and selection for ai.faction. Does not mutate anything; the caller
// executes the chosen transfer.
AiPlan plan_ai_cycle(const std::vector<Node>& nodes, const AiState& ai, double now_ms, const AiConfig& cfg,
                     util::HashRng& rng);

} // namespace starclaim
