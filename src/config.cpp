// ============================================================================
// config.cpp — implementation for config.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "p100link/config.hpp"
#include "p100link/serial_io.hpp"

#include "nlohmann/json.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace p100link {

using json = nlohmann::json;
namespace fs = std::filesystem;

const char* transport_kind_name(TransportKind k) {
  return k == TransportKind::Serial ? "serial" : "tcp";
}

bool parse_transport_kind(const std::string& s, TransportKind& out) {
  if (s == "tcp")    { out = TransportKind::Tcp;    return true; }
  if (s == "serial") { out = TransportKind::Serial; return true; }
  return false;
}

// ---------------------------------------------------------------------------
// Field readers. Each returns false with a Config error naming the key.
// ---------------------------------------------------------------------------
static bool read_string(const json& j, const char* key, std::string& out, Error& err) {
  auto it = j.find(key);
  if (it == j.end()) return true;
  if (!it->is_string()) {
    err.set(ErrorCode::Config, std::string(key) + " must be a string");
    return false;
  }
  out = it->get<std::string>();
  return true;
}

static bool read_int(const json& j, const char* key, long lo, long hi, int& out, Error& err) {
  auto it = j.find(key);
  if (it == j.end()) return true;
  if (!it->is_number_integer()) {
    err.set(ErrorCode::Config, std::string(key) + " must be an integer");
    return false;
  }
  const long v = it->get<long>();
  if (v < lo || v > hi) {
    err.set(ErrorCode::Config, std::string(key) + "=" + std::to_string(v) + " outside " +
                               std::to_string(lo) + ".." + std::to_string(hi));
    return false;
  }
  out = static_cast<int>(v);
  return true;
}

static constexpr long MAX_MS = 24L * 3600L * 1000L;

bool parse_config_json(const std::string& text, Config& cfg, Error& err) {
  json j;
  try {
    j = json::parse(text);
  } catch (const json::parse_error& e) {
    err.set(ErrorCode::Config, std::string("invalid json: ") + e.what());
    return false;
  }
  if (!j.is_object()) {
    err.set(ErrorCode::Config, "top level must be an object");
    return false;
  }

  Config next = cfg;
  int port = next.port;
  int feedback = static_cast<int>(next.feedback_level);
  std::string transport = transport_kind_name(next.transport);

  if (!read_string(j, "host", next.host, err)) return false;
  if (!read_int(j, "port", 1, 65535, port, err)) return false;
  if (!read_string(j, "transport", transport, err)) return false;
  if (!parse_transport_kind(transport, next.transport)) {
    err.set(ErrorCode::Config, "transport must be tcp or serial, got " + transport);
    return false;
  }
  if (!read_string(j, "serial_device", next.serial_device, err)) return false;
  if (!read_int(j, "baud", 1200, 4000000, next.baud, err)) return false;
  if (!read_int(j, "command_timeout_ms", 1, MAX_MS, next.command_timeout_ms, err)) return false;
  if (!read_int(j, "connect_timeout_ms", 1, MAX_MS, next.connect_timeout_ms, err)) return false;
  if (!read_int(j, "reconnect_base_ms", 1, MAX_MS, next.reconnect_base_ms, err)) return false;
  if (!read_int(j, "reconnect_max_ms", 1, MAX_MS, next.reconnect_max_ms, err)) return false;
  if (!read_int(j, "reconnect_stable_ms", 0, MAX_MS, next.reconnect_stable_ms, err)) return false;
  if (!read_int(j, "feedback_level", 0, 2, feedback, err)) return false;

  next.port = static_cast<uint16_t>(port);
  next.feedback_level = static_cast<FeedbackLevel>(feedback);
  cfg = next;
  return true;
}

bool load_config_file(const std::string& path, Config& cfg, Error& err) {
  std::ifstream in(path);
  if (!in) {
    err.set(ErrorCode::Config, "cannot open " + path);
    return false;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  if (!parse_config_json(ss.str(), cfg, err)) {
    err.detail = path + ": " + err.detail;
    return false;
  }
  return true;
}

bool validate_config(const Config& cfg, Error& err) {
  if (cfg.transport == TransportKind::Tcp && cfg.host.empty()) {
    err.set(ErrorCode::Config, "host is required for tcp");
    return false;
  }
  if (cfg.transport == TransportKind::Serial && cfg.serial_device.empty()) {
    err.set(ErrorCode::Config, "serial_device is required for serial");
    return false;
  }
  if (cfg.transport == TransportKind::Serial && !baud_supported(cfg.baud)) {
    err.set(ErrorCode::Config, "unsupported baud " + std::to_string(cfg.baud));
    return false;
  }
  if (cfg.command_timeout_ms <= 0 || cfg.connect_timeout_ms <= 0) {
    err.set(ErrorCode::Config, "timeouts must be positive");
    return false;
  }
  if (cfg.reconnect_base_ms <= 0 || cfg.reconnect_base_ms > cfg.reconnect_max_ms) {
    err.set(ErrorCode::Config, "reconnect_base_ms must be in 1..reconnect_max_ms");
    return false;
  }
  return true;
}

// ---------------------------------------------------------------------------
// default_config_path()
// ---------------------
// $XDG_CONFIG_HOME wins when set and non-empty; otherwise ~/.config.
// ---------------------------------------------------------------------------
std::string default_config_path() {
  fs::path base;
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
    base = fs::path(xdg);
  } else {
    const char* home = std::getenv("HOME");
    base = fs::path(home ? home : "") / ".config";
  }
  return (base / "p100link" / "config.json").string();
}

} // namespace p100link
