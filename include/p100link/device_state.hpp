#pragma once
/**
 * @file device_state.hpp
 * @brief Last known value of every observable the processor reports.
 *
 * @details
 * The cache is a pure data holder. It is mutated only from the read loop
 * (through the correlator) and read by copy, so callers never hold a lock
 * while they look at state. Every field stays empty until the device has
 * reported it at least once on any connection.
 *
 * Observables understood by apply():
 *
 *   POWER(n)  POWERZONE2(n)  POWERONMAIN  POWEROFFMAIN  POWERONZONE2  POWEROFFZONE2
 *   VOL(n)    ZVOL(n)        MUTE(n)      MUTEON        MUTEOFF
 *   ZMUTE(n)  ZMUTEON        ZMUTEOFF     SRC(n)["name"] ZSRC(n)["name"]
 *   AUDMODE(n)["name"]       AUDTYPE "text"
 *
 * Subscribers are called with the fresh snapshot after each applied update,
 * on the thread that called publish() (the read loop in a live session).
 */

#include "p100link/protocol.hpp"
#include "p100link/status_line.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace p100link {

struct ZoneState {
  std::optional<PowerState> power;
  std::optional<int>        volume_tenths;
  std::optional<bool>       muted;
  std::optional<int>        source_index;
  std::string               source_name;   ///< empty unless reported with the index
};

struct DeviceState {
  ZoneState          main;
  ZoneState          zone2;
  std::optional<int> audio_mode_index;
  std::string        audio_mode_name;
  std::string        audio_type;
  uint64_t           updates{0};           ///< number of applied frames

  const ZoneState& zone(Zone z) const { return z == Zone::Main ? main : zone2; }
  ZoneState&       zone(Zone z)       { return z == Zone::Main ? main : zone2; }
};

class DeviceStateCache {
public:
  using Listener = std::function<void(const DeviceState&)>;

  /// Apply one parsed status line. Returns false for verbs that are not
  /// observables (or carry the wrong field), leaving state untouched.
  bool apply(const StatusLine& line);

  DeviceState snapshot() const;

  int  subscribe(Listener fn);
  void unsubscribe(int id);

  /// Notify every listener with the current snapshot.
  void publish();

private:
  mutable std::mutex mu_;
  DeviceState state_;

  std::mutex listeners_mu_;
  std::map<int, Listener> listeners_;
  int next_id_{1};
};

} // namespace p100link
