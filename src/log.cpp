// ============================================================================
// log.cpp — implementation for log.hpp
// ============================================================================

#include "p100link/log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>
#include <utility>

namespace p100link {
namespace log {

static std::atomic<int> g_level{static_cast<int>(Level::Warn)};
static std::mutex       g_sink_mu;   // guards g_sink and serializes stderr lines
static Sink             g_sink;

void set_level(Level lvl) { g_level.store(static_cast<int>(lvl)); }

Level level() { return static_cast<Level>(g_level.load()); }

bool enabled(Level lvl) {
  return lvl != Level::Off && static_cast<int>(lvl) >= g_level.load();
}

void set_sink(Sink sink) {
  std::lock_guard<std::mutex> lk(g_sink_mu);
  g_sink = std::move(sink);
}

const char* level_name(Level lvl) {
  switch (lvl) {
    case Level::Debug: return "debug";
    case Level::Info:  return "info";
    case Level::Warn:  return "warn";
    case Level::Error: return "error";
    case Level::Off:   return "off";
  }
  return "off";
}

bool parse_level(const std::string& name, Level& out) {
  if (name == "debug") { out = Level::Debug; return true; }
  if (name == "info")  { out = Level::Info;  return true; }
  if (name == "warn")  { out = Level::Warn;  return true; }
  if (name == "error") { out = Level::Error; return true; }
  if (name == "off")   { out = Level::Off;   return true; }
  return false;
}

void write(Level lvl, const char* component, const std::string& fields) {
  if (!enabled(lvl)) return;

  std::string line;
  line.reserve(32 + fields.size());
  line += "level=";
  line += level_name(lvl);
  line += " component=";
  line += component ? component : "-";
  if (!fields.empty()) {
    line += ' ';
    line += fields;
  }

  std::lock_guard<std::mutex> lk(g_sink_mu);
  if (g_sink) {
    g_sink(lvl, line);
    return;
  }
  std::cerr << line << "\n";
}

} // namespace log
} // namespace p100link
