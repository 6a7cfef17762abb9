#pragma once

#include <string>
#include <vector>

#include "starclaim/core/simulation.h"
#include "starclaim/util/json.h"

namespace starclaim {

// JSON tree for a snapshot:
//   phase, paused,
//   nodes:  [{id, x, y, owner, units, capacity, production_rate, state,
//             conquest_progress, battle_progress}],
//   fleets: [{id, owner, units, source_id, dest_id, x, y, progress, eta_ms}],
//   stats:  {elapsed_ms, ticks, fleets_launched, units_produced, nodes_conquered,
//            units_lost_to_overflow, factions: {unclaimed, faction_a, faction_b}}
json::Value snapshot_to_json_value(const Snapshot& s);

// Same as snapshot_to_json_value, rendered as indented text with a trailing
// newline.
std::string snapshot_to_json(const Snapshot& s);

// Events as a JSON array of {seq, time_ms, level, category, faction, faction2,
// node_id, message}. Output ends with a trailing newline.
std::string events_to_json(const std::vector<SimEvent>& events);

// One-line-per-faction plain text summary used by the CLI.
std::string summary_to_text(const GameSummary& g);

} // namespace starclaim
