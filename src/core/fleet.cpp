#include "starclaim/core/fleet.h"

#include <algorithm>

namespace starclaim {

Fleet make_fleet(Id id, const Node& source, const Node& dest, Faction owner, int units, double speed) {
  Fleet f;
  f.id = id;
  f.source_id = source.id;
  f.dest_id = dest.id;
  f.owner = owner;
  f.units = units;
  f.origin = source.pos;
  f.target = dest.pos;
  const double dist = distance(source.pos, dest.pos);
  f.travel_ms = (speed > 0.0) ? (dist / speed) * 1000.0 : 0.0;
  return f;
}

bool Fleet::advance(double delta_ms) {
  if (arrived) return false;
  if (travel_ms <= 0.0) {
    progress = 1.0;
  } else if (delta_ms > 0.0) {
    progress += delta_ms / travel_ms;
  }
  if (progress < 1.0) return false;
  progress = 1.0;
  arrived = true;
  return true;
}

Vec2 Fleet::position() const { return lerp(origin, target, smoothstep(progress)); }

double Fleet::eta_ms() const {
  if (arrived) return 0.0;
  return std::max(0.0, travel_ms * (1.0 - progress));
}

ArrivalOutcome resolve_arrival(const Fleet& fleet, Node& dest) {
  ArrivalOutcome out;

  switch (dest.owner) {
    case Faction::Unclaimed:
      out.kind = ArrivalKind::Conquest;
      if (dest.begin_conquest(fleet.owner) != NodeEntryResult::Accepted) out.kind = ArrivalKind::Rejected;
      break;
    case Faction::FactionA:
    case Faction::FactionB:
      if (dest.owner == fleet.owner) {
        out.kind = ArrivalKind::Reinforcement;
        out.units_lost = dest.reinforce(fleet.units);
        out.units_delivered = fleet.units - out.units_lost;
        return out;
      }
      out.kind = ArrivalKind::Battle;
      if (dest.begin_battle(fleet.owner, fleet.units) != NodeEntryResult::Accepted) {
        out.kind = ArrivalKind::Rejected;
      }
      break;
  }

  if (out.kind == ArrivalKind::Rejected) {
    out.units_lost = fleet.units;
  } else {
    out.units_delivered = fleet.units;
  }
  return out;
}

} // namespace starclaim
