#include "starclaim/util/log.h"

#include <iostream>
#include <mutex>

#include "starclaim/util/strings.h"

namespace starclaim::log {
namespace {
std::mutex g_mu;
Level g_level = Level::Info;

const char* label(Level l) {
  switch (l) {
    case Level::Debug: return "DEBUG";
    case Level::Info: return "INFO";
    case Level::Warn: return "WARN";
    case Level::Error: return "ERROR";
    case Level::Off: return "";
  }
  return "";
}

void emit(Level l, const std::string& msg) {
  if (!enabled(l)) return;
  std::lock_guard<std::mutex> lock(g_mu);
  std::cerr << "[" << label(l) << "] " << msg << "\n";
}

} // namespace

void set_level(Level lvl) { g_level = lvl; }
Level level() { return g_level; }

bool parse_level(const std::string& text, Level* out) {
  const std::string s = to_lower(trim_copy(text));
  Level parsed = Level::Info;
  if (s == "debug") {
    parsed = Level::Debug;
  } else if (s == "info") {
    parsed = Level::Info;
  } else if (s == "warn" || s == "warning") {
    parsed = Level::Warn;
  } else if (s == "error") {
    parsed = Level::Error;
  } else if (s == "off" || s == "none") {
    parsed = Level::Off;
  } else {
    return false;
  }
  if (out) *out = parsed;
  return true;
}

bool enabled(Level l) { return g_level != Level::Off && l >= g_level && l != Level::Off; }

void debug(const std::string& msg) { emit(Level::Debug, msg); }
void info(const std::string& msg) { emit(Level::Info, msg); }
void warn(const std::string& msg) { emit(Level::Warn, msg); }
void error(const std::string& msg) { emit(Level::Error, msg); }

} // namespace starclaim::log
