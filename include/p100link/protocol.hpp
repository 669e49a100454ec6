#pragma once
/**
 * @file protocol.hpp
 * @brief Wire constants and small enums of the P100 control protocol.
 *
 * @details
 * The processor speaks ASCII lines:
 *
 *   host   -> device   !<command>\r          e.g. !VOL?\r, !POWERONMAIN\r
 *   device -> host     !<status>\r           e.g. !VOL(-350)\r, !POWERONMAIN\r
 *   device -> host     #<echo>\r             command echo, feedback level 2 only
 *
 * There are no request identifiers. A reply is tied to its command only by
 * its verb, which is why the correlator keeps a single command in flight.
 */

#include <cstdint>

namespace p100link {

static constexpr char COMMAND_SENTINEL = '!';
static constexpr char STATUS_SENTINEL  = '!';
static constexpr char ECHO_SENTINEL    = '#';
static constexpr char TERMINATOR       = '\r';

static constexpr uint16_t DEFAULT_TCP_PORT  = 84;
static constexpr int      DEFAULT_BAUD_RATE = 115200;

static constexpr int DEFAULT_COMMAND_TIMEOUT_MS = 5000;
static constexpr int DEFAULT_CONNECT_TIMEOUT_MS = 10000;

/// Volume limits in tenths of a dB (-99.9 dB .. +24.0 dB).
static constexpr int VOLUME_MIN_TENTHS  = -999;
static constexpr int VOLUME_MAX_TENTHS  = 240;
static constexpr int VOLUME_STEP_TENTHS = 5;   ///< default VOL+/VOL- step

enum class PowerState : uint8_t { Off = 0, On = 1 };

enum class Zone : uint8_t { Main = 0, Zone2 = 1 };

/**
 * @brief Verbosity of unsolicited device traffic, set with `VERB(n)`.
 *
 * - Minimal:       the device only answers queries.
 * - StatusUpdates: state changes are pushed as `!` status frames.
 * - EchoAndStatus: as above, plus every received command echoed with `#`.
 */
enum class FeedbackLevel : uint8_t { Minimal = 0, StatusUpdates = 1, EchoAndStatus = 2 };

inline const char* zone_name(Zone z) { return z == Zone::Main ? "main" : "zone2"; }

inline const char* feedback_level_name(FeedbackLevel l) {
  switch (l) {
    case FeedbackLevel::Minimal:       return "minimal";
    case FeedbackLevel::StatusUpdates: return "status";
    case FeedbackLevel::EchoAndStatus: return "echo";
  }
  return "status";
}

} // namespace p100link
