#pragma once

#include <array>
#include <cstddef>

namespace starclaim {

// Node/fleet ownership. FactionA is the human side by default, FactionB the
// decision-engine side; either can be handed to the AI via SimConfig.
enum class Faction { Unclaimed = 0, FactionA = 1, FactionB = 2 };

constexpr std::size_t kFactionSlots = 3;

constexpr std::array<Faction, 2> kPlayableFactions = {Faction::FactionA, Faction::FactionB};

inline std::size_t faction_index(Faction f) { return static_cast<std::size_t>(f); }

inline bool is_playable(Faction f) { return f == Faction::FactionA || f == Faction::FactionB; }

// Unclaimed has no opponent and maps to itself.
inline Faction opponent_of(Faction f) {
  switch (f) {
    case Faction::FactionA: return Faction::FactionB;
    case Faction::FactionB: return Faction::FactionA;
    case Faction::Unclaimed: return Faction::Unclaimed;
  }
  return Faction::Unclaimed;
}

} // namespace starclaim
