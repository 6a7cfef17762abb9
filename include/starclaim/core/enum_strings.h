#pragma once

#include <string>

#include "starclaim/core/simulation.h"

namespace starclaim {

// Shared string <-> enum conversion helpers.
//
// Used by config loading, snapshot export, event messages and the CLI. The
// strings are lowercase snake_case identifiers.

std::string faction_to_string(Faction f);
Faction faction_from_string(const std::string& s);

std::string game_phase_to_string(GamePhase p);
std::string ai_strategy_to_string(AiStrategy s);
std::string match_phase_to_string(MatchPhase p);
std::string node_state_to_string(NodeState s);
std::string event_level_to_string(EventLevel l);
std::string event_category_to_string(EventCategory c);
std::string transfer_rejection_to_string(TransferRejection r);

std::string difficulty_to_string(Difficulty d);
// Case-insensitive. Returns false for unknown names and leaves *out untouched.
bool parse_difficulty(const std::string& s, Difficulty* out);

} // namespace starclaim
