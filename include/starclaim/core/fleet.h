#pragma once

#include "starclaim/core/faction.h"
#include "starclaim/core/ids.h"
#include "starclaim/core/node.h"
#include "starclaim/core/vec2.h"

namespace starclaim {

// A fixed-size batch of units travelling a single route between two nodes.
//
// The route and unit count never change after creation. Progress advances
// linearly with time so arrival is deterministic; only position() eases.
struct Fleet {
  Id id{kInvalidId};
  Id source_id{kInvalidId};
  Id dest_id{kInvalidId};
  Faction owner{Faction::Unclaimed};
  int units{0};

  Vec2 origin;
  Vec2 target;

  double travel_ms{0.0};
  double progress{0.0};
  bool arrived{false};

  // Advances progress. Returns true exactly once, on the call that reaches the
  // destination.
  bool advance(double delta_ms);

  // Eased interpolated position for rendering.
  Vec2 position() const;

  double eta_ms() const;
};

// Creates an in-transit fleet from `source` to `dest`.
// speed is in field units per second; a non-positive speed yields an
// instantaneous (zero-duration) route.
Fleet make_fleet(Id id, const Node& source, const Node& dest, Faction owner, int units, double speed);

enum class ArrivalKind {
  Conquest,       // started/overrode a conquest on an Unclaimed node
  Battle,         // started/overrode a battle on an enemy node
  Reinforcement,  // merged into a friendly garrison
  Rejected,       // the node could not accept the arrival; units are lost
};

struct ArrivalOutcome {
  ArrivalKind kind{ArrivalKind::Rejected};
  int units_delivered{0};
  int units_lost{0};
};

// Applies an arrived fleet to its destination node through the node's
// conquest/battle/reinforcement entry points.
ArrivalOutcome resolve_arrival(const Fleet& fleet, Node& dest);

} // namespace starclaim
