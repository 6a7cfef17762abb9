#include "starclaim/core/game_state.h"

#include <algorithm>

namespace starclaim {

Id allocate_id(GameState& s) { return s.next_id++; }

Node* find_node(GameState& s, Id id) {
  auto it = std::lower_bound(s.nodes.begin(), s.nodes.end(), id, [](const Node& n, Id v) { return n.id < v; });
  if (it == s.nodes.end() || it->id != id) return nullptr;
  return &*it;
}

const Node* find_node(const GameState& s, Id id) {
  auto it = std::lower_bound(s.nodes.begin(), s.nodes.end(), id, [](const Node& n, Id v) { return n.id < v; });
  if (it == s.nodes.end() || it->id != id) return nullptr;
  return &*it;
}

AiState* find_ai_state(GameState& s, Faction f) {
  for (auto& a : s.ai) {
    if (a.faction == f) return &a;
  }
  return nullptr;
}

const AiState* find_ai_state(const GameState& s, Faction f) {
  for (const auto& a : s.ai) {
    if (a.faction == f) return &a;
  }
  return nullptr;
}

} // namespace starclaim
