#pragma once
/**
 * @file config.hpp
 * @brief Typed session configuration and its JSON file form.
 *
 * File location: $XDG_CONFIG_HOME/p100link/config.json, falling back to
 * $HOME/.config/p100link/config.json. Every key is optional:
 *
 *   {
 *     "host": "192.168.1.40",
 *     "port": 84,
 *     "transport": "tcp",              // or "serial"
 *     "serial_device": "/dev/ttyUSB0",
 *     "baud": 115200,
 *     "command_timeout_ms": 5000,
 *     "connect_timeout_ms": 10000,
 *     "reconnect_base_ms": 1000,
 *     "reconnect_max_ms": 30000,
 *     "reconnect_stable_ms": 60000,
 *     "feedback_level": 1              // 0 minimal, 1 status, 2 echo + status
 *   }
 *
 * Unknown keys are ignored. A key with the wrong type or an out-of-range
 * value rejects the whole file with ErrorCode::Config.
 */

#include "p100link/error.hpp"
#include "p100link/protocol.hpp"

#include <cstdint>
#include <string>

namespace p100link {

enum class TransportKind : uint8_t { Tcp, Serial };

const char* transport_kind_name(TransportKind k);
bool        parse_transport_kind(const std::string& s, TransportKind& out);

struct Config {
  std::string   host;
  uint16_t      port{DEFAULT_TCP_PORT};
  TransportKind transport{TransportKind::Tcp};
  std::string   serial_device;
  int           baud{DEFAULT_BAUD_RATE};

  int command_timeout_ms{DEFAULT_COMMAND_TIMEOUT_MS};
  int connect_timeout_ms{DEFAULT_CONNECT_TIMEOUT_MS};
  int reconnect_base_ms{1000};
  int reconnect_max_ms{30000};
  int reconnect_stable_ms{60000};

  FeedbackLevel feedback_level{FeedbackLevel::StatusUpdates};
};

/// Overlay the keys present in @p text onto @p cfg. On failure @p cfg is
/// left as it was.
bool parse_config_json(const std::string& text, Config& cfg, Error& err);

/// Read @p path and overlay it onto @p cfg. A missing file is an error here;
/// callers that treat the default path as optional check existence first.
bool load_config_file(const std::string& path, Config& cfg, Error& err);

/// Cross-field checks: endpoint present for the chosen transport, timeouts
/// positive, backoff base <= ceiling.
bool validate_config(const Config& cfg, Error& err);

std::string default_config_path();

} // namespace p100link
