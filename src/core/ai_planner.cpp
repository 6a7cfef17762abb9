#include "starclaim/core/ai_planner.h"

#include <algorithm>
#include <cmath>

namespace starclaim {
namespace {

const Node* node_by_id(const std::vector<Node>& nodes, Id id) {
  for (const auto& n : nodes) {
    if (n.id == id) return &n;
  }
  return nullptr;
}

MatchPhase classify_phase(std::size_t mine, std::size_t theirs, std::size_t unclaimed) {
  if (unclaimed > mine + theirs) return MatchPhase::Expansion;
  if (unclaimed > 0) return MatchPhase::Midgame;
  return MatchPhase::Endgame;
}

} // namespace

double threat_level(const Node& attacker, const Node& target, double dist, const AiConfig& cfg) {
  const double unit_ratio = static_cast<double>(attacker.units) / std::max(target.units, 1);
  const double proximity = (cfg.threat_distance > 0.0) ? std::max(0.0, 1.0 - dist / cfg.threat_distance) : 0.0;
  const double capacity_ratio = static_cast<double>(attacker.capacity) / std::max(target.capacity, 1);
  return 0.5 * unit_ratio + 0.3 * proximity + 0.2 * capacity_ratio;
}

BattlefieldAnalysis analyze_battlefield(const std::vector<Node>& nodes, Faction me, const AiConfig& cfg) {
  BattlefieldAnalysis a;
  a.me = me;
  a.opponent = opponent_of(me);

  for (const auto& n : nodes) {
    if (n.owner == Faction::Unclaimed) {
      a.unclaimed.push_back(n.id);
    } else if (n.owner == me) {
      a.mine.push_back(n.id);
      a.my_units += n.units;
      a.my_production += n.production_rate;
    } else {
      a.theirs.push_back(n.id);
      a.their_units += n.units;
      a.their_production += n.production_rate;
    }
  }

  a.ship_ratio = static_cast<double>(a.my_units) / std::max(a.their_units, 1);
  a.production_ratio = a.my_production / std::max(a.their_production, 1.0);

  for (Id theirs_id : a.theirs) {
    const Node* src = node_by_id(nodes, theirs_id);
    double worst = 0.0;
    for (Id mine_id : a.mine) {
      const Node* dst = node_by_id(nodes, mine_id);
      const double dist = distance(src->pos, dst->pos);
      const double level = threat_level(*src, *dst, dist, cfg);
      worst = std::max(worst, level);
      if (level > cfg.threat_min_level) a.threats.push_back(Threat{src->id, dst->id, dist, level});
    }
    a.opponent_threat[theirs_id] = worst;
  }
  std::stable_sort(a.threats.begin(), a.threats.end(),
                   [](const Threat& x, const Threat& y) { return x.level > y.level; });

  a.phase = classify_phase(a.mine.size(), a.theirs.size(), a.unclaimed.size());
  return a;
}

AiStrategy choose_strategy(const BattlefieldAnalysis& a, const AiConfig& cfg) {
  const int threat_count = static_cast<int>(a.threats.size());
  if (a.ship_ratio < cfg.defensive_ship_ratio || a.production_ratio < cfg.defensive_production_ratio ||
      threat_count > cfg.defensive_threat_count) {
    return AiStrategy::Defensive;
  }
  if (a.ship_ratio > cfg.aggressive_ship_ratio && a.phase == MatchPhase::Expansion) return AiStrategy::Aggressive;
  if (a.phase == MatchPhase::Expansion && !a.unclaimed.empty()) return AiStrategy::Expansion;
  return AiStrategy::Balanced;
}

int units_to_send(const Node& source, const Node& target, const AiConfig& cfg) {
  int required = 1;
  if (target.owner != Faction::Unclaimed) {
    const int buffer = static_cast<int>(std::ceil(target.units * cfg.attack_buffer_fraction));
    required = target.units + buffer + 1;
  }
  const int available = source.units - std::max(1, cfg.garrison);
  return std::min(required, available);
}

std::vector<TransferCandidate> generate_candidates(const std::vector<Node>& nodes, const BattlefieldAnalysis& a,
                                                   const AiConfig& cfg) {
  std::vector<TransferCandidate> out;

  std::vector<const Node*> targets;
  targets.reserve(a.theirs.size() + a.unclaimed.size());
  for (Id id : a.theirs) targets.push_back(node_by_id(nodes, id));
  for (Id id : a.unclaimed) targets.push_back(node_by_id(nodes, id));

  for (Id src_id : a.mine) {
    const Node* src = node_by_id(nodes, src_id);
    if (!src || src->units <= 1) continue;

    for (const Node* dst : targets) {
      if (!dst) continue;
      const int send = units_to_send(*src, *dst, cfg);
      if (send <= 0) continue;

      TransferCandidate c;
      c.source_id = src->id;
      c.dest_id = dst->id;
      c.dest_owner = dst->owner;
      c.dest_units = dst->units;
      c.dest_capacity = dst->capacity;
      c.source_units = src->units;
      c.units = send;
      c.distance = distance(src->pos, dst->pos);
      out.push_back(c);
    }
  }
  return out;
}

double success_probability(const TransferCandidate& c) {
  if (c.dest_owner == Faction::Unclaimed) return 0.9;
  const double ratio = static_cast<double>(c.units) / std::max(c.dest_units, 1);
  if (ratio >= 2.0) return 0.9;
  if (ratio >= 1.5) return 0.8;
  if (ratio >= 1.2) return 0.6;
  if (ratio >= 1.0) return 0.4;
  return 0.2;
}

bool is_recent_decision(const AiState& ai, Id source_id, Id dest_id, double now_ms, const AiConfig& cfg) {
  for (const auto& d : ai.history) {
    if (d.source_id != source_id || d.dest_id != dest_id) continue;
    if (now_ms - d.time_ms < cfg.repeat_cooldown_ms) return true;
  }
  return false;
}

double score_candidate(const TransferCandidate& c, AiStrategy strategy, const BattlefieldAnalysis& a,
                       const AiState& ai, double now_ms, const AiConfig& cfg) {
  const bool unclaimed = (c.dest_owner == Faction::Unclaimed);
  const double distance_penalty = (cfg.distance_penalty_divisor > 0.0) ? c.distance / cfg.distance_penalty_divisor : 0.0;
  const double capacity_value = c.dest_capacity * cfg.capacity_value_multiplier;
  const double efficiency = (c.units > 0) ? static_cast<double>(c.dest_capacity) / c.units : 0.0;

  double score = 0.0;
  switch (strategy) {
    case AiStrategy::Aggressive:
      score += unclaimed ? 20.0 : 50.0;
      score += capacity_value * 1.5;
      break;
    case AiStrategy::Defensive: {
      double threat = 0.0;
      if (auto it = a.opponent_threat.find(c.dest_id); it != a.opponent_threat.end()) threat = it->second;
      score += threat * 100.0;
      score -= distance_penalty * 2.0;
      break;
    }
    case AiStrategy::Expansion:
      score += unclaimed ? 40.0 : 10.0;
      score += capacity_value;
      break;
    case AiStrategy::Balanced:
      score += unclaimed ? 30.0 : 25.0;
      score += capacity_value;
      break;
  }

  score -= distance_penalty;
  score += efficiency * cfg.ship_efficiency_weight;
  score *= success_probability(c);

  if (is_recent_decision(ai, c.source_id, c.dest_id, now_ms, cfg)) score *= cfg.repeat_penalty;
  return score;
}

std::optional<TransferCandidate> select_candidate(const std::vector<TransferCandidate>& ranked, const AiConfig& cfg,
                                                  util::HashRng& rng) {
  if (ranked.empty()) return std::nullopt;

  const std::size_t top = std::max<std::size_t>(
      1, static_cast<std::size_t>(std::floor(static_cast<double>(ranked.size()) * cfg.exploration_top_fraction)));
  if (top > 1 && rng.chance(cfg.exploration_chance)) return ranked[rng.index(top)];
  return ranked.front();
}

AiPlan plan_ai_cycle(const std::vector<Node>& nodes, const AiState& ai, double now_ms, const AiConfig& cfg,
                     util::HashRng& rng) {
  AiPlan plan;
  plan.analysis = analyze_battlefield(nodes, ai.faction, cfg);
  plan.strategy = choose_strategy(plan.analysis, cfg);

  plan.ranked = generate_candidates(nodes, plan.analysis, cfg);
  for (auto& c : plan.ranked) c.score = score_candidate(c, plan.strategy, plan.analysis, ai, now_ms, cfg);
  std::stable_sort(plan.ranked.begin(), plan.ranked.end(),
                   [](const TransferCandidate& x, const TransferCandidate& y) { return x.score > y.score; });

  plan.chosen = select_candidate(plan.ranked, cfg, rng);
  return plan;
}

} // namespace starclaim
