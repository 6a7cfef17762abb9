#include "starclaim/core/enum_strings.h"

#include "starclaim/util/strings.h"

namespace starclaim {

std::string faction_to_string(Faction f) {
  switch (f) {
    case Faction::Unclaimed: return "unclaimed";
    case Faction::FactionA: return "faction_a";
    case Faction::FactionB: return "faction_b";
  }
  return "unclaimed";
}

Faction faction_from_string(const std::string& s) {
  if (s == "faction_a") return Faction::FactionA;
  if (s == "faction_b") return Faction::FactionB;
  // Safe default for unknown strings.
  return Faction::Unclaimed;
}

std::string game_phase_to_string(GamePhase p) {
  switch (p) {
    case GamePhase::Idle: return "idle";
    case GamePhase::Playing: return "playing";
    case GamePhase::FactionAWin: return "faction_a_win";
    case GamePhase::FactionBWin: return "faction_b_win";
  }
  return "idle";
}

std::string ai_strategy_to_string(AiStrategy s) {
  switch (s) {
    case AiStrategy::Balanced: return "balanced";
    case AiStrategy::Aggressive: return "aggressive";
    case AiStrategy::Defensive: return "defensive";
    case AiStrategy::Expansion: return "expansion";
  }
  return "balanced";
}

std::string match_phase_to_string(MatchPhase p) {
  switch (p) {
    case MatchPhase::Expansion: return "expansion";
    case MatchPhase::Midgame: return "midgame";
    case MatchPhase::Endgame: return "endgame";
  }
  return "expansion";
}

std::string node_state_to_string(NodeState s) {
  switch (s) {
    case NodeState::Idle: return "idle";
    case NodeState::Conquering: return "conquering";
    case NodeState::Battling: return "battling";
  }
  return "idle";
}

std::string event_level_to_string(EventLevel l) {
  switch (l) {
    case EventLevel::Info: return "info";
    case EventLevel::Warn: return "warn";
  }
  return "info";
}

std::string event_category_to_string(EventCategory c) {
  switch (c) {
    case EventCategory::General: return "general";
    case EventCategory::Conquest: return "conquest";
    case EventCategory::Battle: return "battle";
    case EventCategory::Fleet: return "fleet";
    case EventCategory::Decision: return "decision";
  }
  return "general";
}

std::string transfer_rejection_to_string(TransferRejection r) {
  switch (r) {
    case TransferRejection::None: return "none";
    case TransferRejection::NotPlaying: return "not_playing";
    case TransferRejection::InvalidFaction: return "invalid_faction";
    case TransferRejection::UnknownNode: return "unknown_node";
    case TransferRejection::SameNode: return "same_node";
    case TransferRejection::NotOwner: return "not_owner";
    case TransferRejection::NoUnits: return "no_units";
    case TransferRejection::NothingToSend: return "nothing_to_send";
  }
  return "none";
}

std::string difficulty_to_string(Difficulty d) {
  switch (d) {
    case Difficulty::Easy: return "easy";
    case Difficulty::Normal: return "normal";
    case Difficulty::Hard: return "hard";
  }
  return "normal";
}

bool parse_difficulty(const std::string& s, Difficulty* out) {
  const std::string t = to_lower(trim_copy(s));
  Difficulty d;
  if (t == "easy") {
    d = Difficulty::Easy;
  } else if (t == "normal") {
    d = Difficulty::Normal;
  } else if (t == "hard") {
    d = Difficulty::Hard;
  } else {
    return false;
  }
  if (out) *out = d;
  return true;
}

} // namespace starclaim
