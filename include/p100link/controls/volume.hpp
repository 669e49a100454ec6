#pragma once
/**
 * @file volume.hpp
 * @brief Volume and mute facade for one zone.
 *
 * Volume travels as a signed fixed-point value in tenths of a dB, exactly as
 * on the wire: -35.0 dB is `VOL(-350)`. The dB helpers below are for user
 * input and output only.
 */

#include "p100link/session.hpp"

#include <optional>
#include <string>

namespace p100link {

struct VolumeLimits {
  int min_tenths{VOLUME_MIN_TENTHS};
  int max_tenths{VOLUME_MAX_TENTHS};
  int step_tenths{VOLUME_STEP_TENTHS};
};

class VolumeControl {
public:
  VolumeControl(Session& session, Zone zone) : s_(session), zone_(zone) {}

  /// VOL? / ZVOL?
  bool get(int& tenths, Error& err, const CancelToken* cancel = nullptr);
  /// InvalidArgument outside the limits; nothing is sent in that case.
  bool set(int tenths, Error& err, const CancelToken* cancel = nullptr);

  bool up(Error& err, int step_tenths = VOLUME_STEP_TENTHS, const CancelToken* cancel = nullptr);
  bool down(Error& err, int step_tenths = VOLUME_STEP_TENTHS, const CancelToken* cancel = nullptr);

  bool mute(Error& err, const CancelToken* cancel = nullptr);
  bool unmute(Error& err, const CancelToken* cancel = nullptr);
  bool toggle_mute(Error& err, const CancelToken* cancel = nullptr);
  /// MUTE? / ZMUTE?
  bool is_muted(bool& out, Error& err, const CancelToken* cancel = nullptr);

  static VolumeLimits limits() { return VolumeLimits{}; }

  std::optional<int>  cached() const;
  std::optional<bool> cached_mute() const;

  Zone zone() const { return zone_; }

private:
  bool send(const Command& cmd, Error& err, const CancelToken* cancel);

  Session& s_;
  Zone     zone_;
};

/// "-35", "-35.5", "+3.25" (rounded to the nearest tenth). No range check.
bool parse_db(const std::string& s, int& tenths);

/// -355 -> "-35.5", 0 -> "0.0"
std::string format_db(int tenths);

/// Interpret a mute status line (MUTE(n) or MUTEON/MUTEOFF, zone 2 alike).
bool mute_from_line(const StatusLine& line, bool& out);

} // namespace p100link
