#include "starclaim/util/snapshot_export.h"

#include <sstream>

#include "starclaim/core/enum_strings.h"
#include "starclaim/util/strings.h"

namespace starclaim {
namespace {

json::Value num(double v) { return json::Value(v); }
json::Value num(int v) { return json::Value(static_cast<double>(v)); }
json::Value id_value(Id id) { return json::Value(static_cast<double>(id)); }
json::Value str(const std::string& s) { return json::Value(s); }

json::Value faction_stats_json(const FactionStats& fs) {
  json::Object o;
  o["nodes"] = num(fs.nodes);
  o["units"] = num(fs.units);
  o["units_in_transit"] = num(fs.units_in_transit);
  o["production_per_sec"] = num(fs.production_per_sec);
  o["fleets_launched"] = num(fs.fleets_launched);
  o["units_produced"] = num(fs.units_produced);
  o["nodes_conquered"] = num(fs.nodes_conquered);
  o["nodes_lost"] = num(fs.nodes_lost);
  return json::object(std::move(o));
}

json::Value stats_json(const SimStats& st) {
  json::Object o;
  o["elapsed_ms"] = num(st.elapsed_ms);
  o["ticks"] = num(st.ticks);
  o["fleets_launched"] = num(st.fleets_launched);
  o["units_produced"] = num(st.units_produced);
  o["nodes_conquered"] = num(st.nodes_conquered);
  o["units_lost_to_overflow"] = num(st.units_lost_to_overflow);

  json::Object factions;
  for (Faction f : {Faction::Unclaimed, Faction::FactionA, Faction::FactionB}) {
    factions[faction_to_string(f)] = faction_stats_json(st.of(f));
  }
  o["factions"] = json::object(std::move(factions));
  return json::object(std::move(o));
}

json::Value node_json(const Node& n) {
  json::Object o;
  o["id"] = id_value(n.id);
  o["x"] = num(n.pos.x);
  o["y"] = num(n.pos.y);
  o["owner"] = str(faction_to_string(n.owner));
  o["units"] = num(n.units);
  o["capacity"] = num(n.capacity);
  o["production_rate"] = num(n.production_rate);
  o["state"] = str(node_state_to_string(n.state()));
  o["conquest_progress"] = num(n.conquest_timer.progress());
  o["battle_progress"] = num(n.battle_timer.progress());
  return json::object(std::move(o));
}

json::Value fleet_json(const Fleet& f) {
  const Vec2 p = f.position();
  json::Object o;
  o["id"] = id_value(f.id);
  o["owner"] = str(faction_to_string(f.owner));
  o["units"] = num(f.units);
  o["source_id"] = id_value(f.source_id);
  o["dest_id"] = id_value(f.dest_id);
  o["x"] = num(p.x);
  o["y"] = num(p.y);
  o["progress"] = num(f.progress);
  o["eta_ms"] = num(f.eta_ms());
  return json::object(std::move(o));
}

} // namespace

json::Value snapshot_to_json_value(const Snapshot& s) {
  json::Array nodes;
  nodes.reserve(s.nodes.size());
  for (const auto& n : s.nodes) nodes.push_back(node_json(n));

  json::Array fleets;
  fleets.reserve(s.fleets.size());
  for (const auto& f : s.fleets) fleets.push_back(fleet_json(f));

  json::Object root;
  root["phase"] = str(game_phase_to_string(s.phase));
  root["paused"] = json::Value(s.paused);
  root["nodes"] = json::array(std::move(nodes));
  root["fleets"] = json::array(std::move(fleets));
  root["stats"] = stats_json(s.stats);
  return json::object(std::move(root));
}

std::string snapshot_to_json(const Snapshot& s) {
  std::string out = json::stringify(snapshot_to_json_value(s), 2);
  out.push_back('\n');
  return out;
}

std::string events_to_json(const std::vector<SimEvent>& events) {
  json::Array arr;
  arr.reserve(events.size());
  for (const auto& ev : events) {
    json::Object o;
    o["seq"] = num(static_cast<double>(ev.seq));
    o["time_ms"] = num(ev.time_ms);
    o["level"] = str(event_level_to_string(ev.level));
    o["category"] = str(event_category_to_string(ev.category));
    o["faction"] = str(faction_to_string(ev.faction));
    o["faction2"] = str(faction_to_string(ev.faction2));
    o["node_id"] = id_value(ev.node_id);
    o["message"] = str(ev.message);
    arr.push_back(json::object(std::move(o)));
  }
  std::string out = json::stringify(json::array(std::move(arr)), 2);
  out.push_back('\n');
  return out;
}

std::string summary_to_text(const GameSummary& g) {
  std::ostringstream ss;
  ss << "Result: " << game_phase_to_string(g.phase) << " (winner " << faction_to_string(g.winner) << ")\n";
  ss << "Duration: " << format_duration_ms(g.duration_ms) << "\n";
  ss << "Fleets launched: " << g.fleets_launched << "\n";
  ss << "Units produced: " << g.units_produced << "\n";
  ss << "Nodes conquered: " << g.nodes_conquered << "\n";
  for (Faction f : kPlayableFactions) {
    const FactionStats& fs = g.stats.of(f);
    ss << "  " << faction_to_string(f) << ": nodes=" << fs.nodes << " units=" << fs.units
       << " fleets=" << fs.fleets_launched << " produced=" << fs.units_produced << " conquered=" << fs.nodes_conquered
       << " lost=" << fs.nodes_lost << "\n";
  }
  return ss.str();
}

} // namespace starclaim
