#include <cmath>
#include <iostream>
#include <vector>

#include "starclaim/core/ai_planner.h"

#define SC_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

using namespace starclaim;

Node mk(Id id, double x, double y, int capacity, Faction owner, int units) {
  return make_node(id, {x, y}, capacity, owner, units, NodeRules{});
}

bool approx(double a, double b) { return std::fabs(a - b) < 1e-6; }

// One FactionB node, one FactionA node far away and three Unclaimed nodes
// close to FactionB.
std::vector<Node> opening_map() {
  return {
      mk(1, 0.0, 0.0, 10, Faction::FactionB, 10),
      mk(2, 1000.0, 0.0, 10, Faction::FactionA, 10),
      mk(3, 200.0, 0.0, 20, Faction::Unclaimed, 0),
      mk(4, 100.0, 0.0, 6, Faction::Unclaimed, 0),
      mk(5, 0.0, 300.0, 8, Faction::Unclaimed, 0),
  };
}

const TransferCandidate* find_candidate(const std::vector<TransferCandidate>& v, Id dest) {
  for (const auto& c : v) {
    if (c.dest_id == dest) return &c;
  }
  return nullptr;
}

} // namespace

int test_ai_planner() {
  using namespace starclaim;

  AiConfig cfg;
  cfg.exploration_chance = 0.0;

  // --- Battlefield analysis ---
  const std::vector<Node> nodes = opening_map();
  const BattlefieldAnalysis a = analyze_battlefield(nodes, Faction::FactionB, cfg);
  SC_ASSERT(a.me == Faction::FactionB);
  SC_ASSERT(a.opponent == Faction::FactionA);
  SC_ASSERT(a.mine.size() == 1);
  SC_ASSERT(a.theirs.size() == 1);
  SC_ASSERT(a.unclaimed.size() == 3);
  SC_ASSERT(approx(a.ship_ratio, 1.0));
  SC_ASSERT(approx(a.production_ratio, 1.0));
  SC_ASSERT(a.phase == MatchPhase::Expansion);

  // 0.5 * (10/10) + 0.3 * 0 (out of range) + 0.2 * (10/10)
  SC_ASSERT(a.threats.size() == 1);
  SC_ASSERT(approx(a.threats[0].level, 0.7));
  SC_ASSERT(a.threats[0].source_id == 2 && a.threats[0].target_id == 1);
  SC_ASSERT(approx(a.opponent_threat.at(2), 0.7));

  // --- Strategy ---
  SC_ASSERT(choose_strategy(a, cfg) == AiStrategy::Expansion);
  {
    BattlefieldAnalysis b = a;
    b.ship_ratio = 0.4;
    SC_ASSERT(choose_strategy(b, cfg) == AiStrategy::Defensive);

    b = a;
    b.production_ratio = 0.2;
    SC_ASSERT(choose_strategy(b, cfg) == AiStrategy::Defensive);

    b = a;
    b.threats.assign(3, Threat{});
    SC_ASSERT(choose_strategy(b, cfg) == AiStrategy::Defensive);

    b = a;
    b.ship_ratio = 2.0;
    SC_ASSERT(choose_strategy(b, cfg) == AiStrategy::Aggressive);

    b.phase = MatchPhase::Midgame;
    SC_ASSERT(choose_strategy(b, cfg) == AiStrategy::Balanced);

    b.phase = MatchPhase::Endgame;
    b.threats.assign(2, Threat{});
    SC_ASSERT(choose_strategy(b, cfg) == AiStrategy::Balanced);
  }

  // --- Phase classification ---
  {
    std::vector<Node> mid = opening_map();
    mid[3].owner = Faction::FactionB;
    const BattlefieldAnalysis m = analyze_battlefield(mid, Faction::FactionB, cfg);
    SC_ASSERT(m.phase == MatchPhase::Midgame);

    std::vector<Node> end = {mk(1, 0.0, 0.0, 10, Faction::FactionB, 5), mk(2, 500.0, 0.0, 10, Faction::FactionA, 5)};
    SC_ASSERT(analyze_battlefield(end, Faction::FactionB, cfg).phase == MatchPhase::Endgame);
  }

  // --- Sizing ---
  {
    const Node src = mk(1, 0.0, 0.0, 40, Faction::FactionB, 30);
    SC_ASSERT(units_to_send(src, mk(2, 0.0, 0.0, 10, Faction::Unclaimed, 0), cfg) == 1);
    SC_ASSERT(units_to_send(src, mk(3, 0.0, 0.0, 20, Faction::FactionA, 10), cfg) == 13);
    SC_ASSERT(units_to_send(src, mk(4, 0.0, 0.0, 20, Faction::FactionA, 7), cfg) == 10);

    const Node small = mk(5, 0.0, 0.0, 10, Faction::FactionB, 5);
    SC_ASSERT(units_to_send(small, mk(6, 0.0, 0.0, 20, Faction::FactionA, 10), cfg) == 4);

    const Node single = mk(7, 0.0, 0.0, 10, Faction::FactionB, 1);
    SC_ASSERT(units_to_send(single, mk(8, 0.0, 0.0, 10, Faction::Unclaimed, 0), cfg) == 0);
  }

  // --- Candidates ---
  const std::vector<TransferCandidate> cands = generate_candidates(nodes, a, cfg);
  SC_ASSERT(cands.size() == 4);
  {
    const TransferCandidate* enemy = find_candidate(cands, 2);
    SC_ASSERT(enemy != nullptr);
    SC_ASSERT(enemy->units == 9);
    SC_ASSERT(enemy->dest_owner == Faction::FactionA);
    for (const auto& c : cands) {
      SC_ASSERT(c.source_id == 1);
      SC_ASSERT(c.units >= 1 && c.units <= c.source_units - 1);
    }

    // Sources holding a single unit never produce candidates.
    std::vector<Node> thin = nodes;
    thin[0].units = 1;
    thin.push_back(mk(6, 50.0, 50.0, 10, Faction::FactionB, 5));
    const BattlefieldAnalysis ta = analyze_battlefield(thin, Faction::FactionB, cfg);
    const auto tc = generate_candidates(thin, ta, cfg);
    SC_ASSERT(!tc.empty());
    for (const auto& c : tc) {
      SC_ASSERT(c.source_id == 6);
      SC_ASSERT(c.units <= 4);
    }
  }

  // --- Success estimate ---
  {
    TransferCandidate c;
    c.dest_owner = Faction::Unclaimed;
    SC_ASSERT(approx(success_probability(c), 0.9));
    c.dest_owner = Faction::FactionA;
    c.dest_units = 10;
    c.units = 20;
    SC_ASSERT(approx(success_probability(c), 0.9));
    c.units = 15;
    SC_ASSERT(approx(success_probability(c), 0.8));
    c.units = 12;
    SC_ASSERT(approx(success_probability(c), 0.6));
    c.units = 10;
    SC_ASSERT(approx(success_probability(c), 0.4));
    c.units = 5;
    SC_ASSERT(approx(success_probability(c), 0.2));
  }

  // --- Scoring ---
  {
    AiState ai;
    ai.faction = Faction::FactionB;

    const TransferCandidate* big = find_candidate(cands, 3);
    SC_ASSERT(big != nullptr);
    // (40 + 20 * 10 - 200 / 100 + (20 / 1) * 5) * 0.9
    SC_ASSERT(approx(score_candidate(*big, AiStrategy::Expansion, a, ai, 0.0, cfg), 304.2));
    // Defensive ignores ownership bonuses and doubles the distance cost:
    // (-2 * 2 - 2 + 100) * 0.9
    SC_ASSERT(approx(score_candidate(*big, AiStrategy::Defensive, a, ai, 0.0, cfg), 84.6));

    const TransferCandidate* enemy = find_candidate(cands, 2);
    // (50 + 150 - 10 + (10 / 9) * 5) * 0.2
    SC_ASSERT(approx(score_candidate(*enemy, AiStrategy::Aggressive, a, ai, 0.0, cfg), (190.0 + 50.0 / 9.0) * 0.2));

    // Repeating a recent decision halves its score until the cooldown passes.
    DecisionRecord rec;
    rec.source_id = 1;
    rec.dest_id = 3;
    rec.time_ms = 0.0;
    ai.history.push_back(rec);
    SC_ASSERT(is_recent_decision(ai, 1, 3, 5000.0, cfg));
    SC_ASSERT(!is_recent_decision(ai, 1, 4, 5000.0, cfg));
    SC_ASSERT(!is_recent_decision(ai, 1, 3, 10000.0, cfg));
    SC_ASSERT(approx(score_candidate(*big, AiStrategy::Expansion, a, ai, 5000.0, cfg), 152.1));
  }

  // --- Full cycle ---
  {
    AiState ai;
    ai.faction = Faction::FactionB;
    util::HashRng rng(1);
    const AiPlan plan = plan_ai_cycle(nodes, ai, 0.0, cfg, rng);
    SC_ASSERT(plan.strategy == AiStrategy::Expansion);
    SC_ASSERT(plan.ranked.size() == 4);
    for (std::size_t i = 1; i < plan.ranked.size(); ++i) SC_ASSERT(plan.ranked[i - 1].score >= plan.ranked[i].score);
    SC_ASSERT(plan.chosen.has_value());
    SC_ASSERT(plan.chosen->dest_id == 3);
    SC_ASSERT(plan.ranked[1].dest_id == 5);
    SC_ASSERT(plan.ranked[3].dest_id == 2);

    // With four candidates the exploration pool is a single entry.
    AiConfig explore = cfg;
    explore.exploration_chance = 1.0;
    for (int i = 0; i < 20; ++i) {
      const AiPlan p = plan_ai_cycle(nodes, ai, 0.0, explore, rng);
      SC_ASSERT(p.chosen && p.chosen->dest_id == 3);
    }
  }
  {
    // Exploration samples only from the top 30%.
    std::vector<TransferCandidate> ranked(10);
    for (std::size_t i = 0; i < ranked.size(); ++i) {
      ranked[i].dest_id = static_cast<Id>(i + 1);
      ranked[i].score = 100.0 - static_cast<double>(i);
    }
    AiConfig explore = cfg;
    explore.exploration_chance = 1.0;
    util::HashRng rng(77);
    bool saw_non_best = false;
    for (int i = 0; i < 200; ++i) {
      const auto c = select_candidate(ranked, explore, rng);
      SC_ASSERT(c.has_value());
      SC_ASSERT(c->dest_id >= 1 && c->dest_id <= 3);
      saw_non_best = saw_non_best || c->dest_id != 1;
    }
    SC_ASSERT(saw_non_best);

    SC_ASSERT(!select_candidate({}, explore, rng).has_value());
  }
  {
    // Nothing to do when every owned node is down to its garrison.
    std::vector<Node> starved = opening_map();
    starved[0].units = 1;
    AiState ai;
    ai.faction = Faction::FactionB;
    util::HashRng rng(5);
    const AiPlan plan = plan_ai_cycle(starved, ai, 0.0, cfg, rng);
    SC_ASSERT(plan.ranked.empty());
    SC_ASSERT(!plan.chosen.has_value());
  }

  return 0;
}
