#include "starclaim/core/simulation.h"

#include "starclaim/core/enum_strings.h"
#include "starclaim/util/log.h"

namespace starclaim {

void Simulation::tick_ai(double dt) {
  for (auto& ai : state_.ai) {
    ai.cadence_ms += dt;
    if (ai.cadence_ms < cfg_.ai.decision_interval_ms) continue;
    ai.cadence_ms = 0.0;
    run_ai_cycle(ai);
  }
}

void Simulation::run_ai_cycle(AiState& ai) {
  const double now = state_.stats.elapsed_ms;
  ai.cycles += 1;
  const bool trace = cfg_.diagnostics && log::enabled(log::Level::Debug);

  const AiPlan plan = plan_ai_cycle(state_.nodes, ai, now, cfg_.ai, rng_);
  if (trace && plan.strategy != ai.strategy) {
    log::debug(faction_to_string(ai.faction) + " strategy " + ai_strategy_to_string(ai.strategy) + " -> " +
               ai_strategy_to_string(plan.strategy) + " (" + match_phase_to_string(plan.analysis.phase) + ")");
  }
  ai.strategy = plan.strategy;

  if (!plan.chosen) {
    if (trace) log::debug(faction_to_string(ai.faction) + ": no valid transfer this cycle");
    return;
  }

  const TransferCandidate& c = *plan.chosen;
  const TransferResult r = issue_transfer_units(c.source_id, c.dest_id, ai.faction, c.units, cfg_.ai.garrison);
  if (!r.accepted) {
    if (trace) {
      log::debug(faction_to_string(ai.faction) + ": transfer rejected (" + transfer_rejection_to_string(r.reason) +
                 "): " + r.message);
    }
    return;
  }

  DecisionRecord rec;
  rec.source_id = c.source_id;
  rec.dest_id = c.dest_id;
  rec.units = r.units_sent;
  rec.score = c.score;
  rec.time_ms = now;
  rec.strategy = plan.strategy;
  ai.history.push_back(rec);
  while (cfg_.ai.max_history >= 0 && static_cast<int>(ai.history.size()) > cfg_.ai.max_history) {
    ai.history.pop_front();
  }
  ai.actions_performed += 1;

  const std::string msg = faction_to_string(ai.faction) + " sends " + std::to_string(r.units_sent) + " from node " +
                          std::to_string(static_cast<unsigned long long>(c.source_id)) + " to node " +
                          std::to_string(static_cast<unsigned long long>(c.dest_id)) + " [" +
                          ai_strategy_to_string(plan.strategy) + "]";
  if (trace) log::debug(msg);
  push_event(EventLevel::Info, EventCategory::Decision, msg, ai.faction, c.dest_owner, c.dest_id);
}

} // namespace starclaim
