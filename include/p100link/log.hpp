#pragma once
/**
 * @file log.hpp
 * @brief Leveled, line-oriented diagnostics.
 *
 * Every event is a single `key=value` line so that output stays grep-able in
 * the same way as the CLI's `status=... reason=...` lines:
 *
 *   level=warn component=supervisor msg=connect_failed reason=connection_lost
 *
 * The default sink writes to std::cerr. Tests replace it to capture lines.
 * All functions are thread-safe.
 */

#include <functional>
#include <string>

namespace p100link {
namespace log {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

using Sink = std::function<void(Level, const std::string& line)>;

void  set_level(Level lvl);
Level level();
bool  enabled(Level lvl);

/// Install a sink; an empty function restores the std::cerr sink.
void set_sink(Sink sink);

/// "debug" | "info" | "warn" | "error" | "off"
bool        parse_level(const std::string& name, Level& out);
const char* level_name(Level lvl);

/// Emit `level=<lvl> component=<component> <fields>`.
void write(Level lvl, const char* component, const std::string& fields);

inline void debug(const char* c, const std::string& f) { write(Level::Debug, c, f); }
inline void info (const char* c, const std::string& f) { write(Level::Info,  c, f); }
inline void warn (const char* c, const std::string& f) { write(Level::Warn,  c, f); }
inline void error(const char* c, const std::string& f) { write(Level::Error, c, f); }

} // namespace log
} // namespace p100link
