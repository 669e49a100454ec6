// ============================================================================
// volume_control.cpp — implementation for controls/volume.hpp
// ============================================================================

#include "p100link/controls/volume.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace p100link {

// ---------------------------------------------------------------------------
// dB text <-> tenths
// ---------------------------------------------------------------------------
bool parse_db(const std::string& s, int& tenths) {
  if (s.empty()) return false;
  char* e = nullptr;
  errno = 0;
  const double v = std::strtod(s.c_str(), &e);
  if (!e || *e || errno == ERANGE || !std::isfinite(v)) return false;
  if (std::fabs(v) > 1000.0) return false;
  tenths = static_cast<int>(std::lround(v * 10.0));
  return true;
}

std::string format_db(int tenths) {
  const int a = tenths < 0 ? -tenths : tenths;
  std::string out = tenths < 0 ? "-" : "";
  out += std::to_string(a / 10) + "." + std::to_string(a % 10);
  return out;
}

bool mute_from_line(const StatusLine& line, bool& out) {
  if (line.verb == "MUTE" || line.verb == "ZMUTE") {
    if (!line.has_value) return false;
    out = line.value != 0;
    return true;
  }
  if (line.verb == "MUTEON"  || line.verb == "ZMUTEON")  { out = true;  return true; }
  if (line.verb == "MUTEOFF" || line.verb == "ZMUTEOFF") { out = false; return true; }
  return false;
}

// ---------------------------------------------------------------------------
// VolumeControl
// ---------------------------------------------------------------------------
bool VolumeControl::send(const Command& cmd, Error& err, const CancelToken* cancel) {
  Response resp;
  return s_.execute(cmd, resp, err, cancel);
}

bool VolumeControl::get(int& tenths, Error& err, const CancelToken* cancel) {
  StatusLine line;
  if (!s_.query(make_volume_query(zone_, s_.command_timeout()), line, err, cancel)) return false;
  if (!line.has_value) {
    err.set(ErrorCode::MalformedFrame, "volume reply without value");
    return false;
  }
  tenths = line.value;
  return true;
}

bool VolumeControl::set(int tenths, Error& err, const CancelToken* cancel) {
  Command cmd;
  if (!make_volume_set(zone_, tenths, cmd, err)) return false;
  return send(cmd, err, cancel);
}

bool VolumeControl::up(Error& err, int step_tenths, const CancelToken* cancel) {
  Command cmd;
  if (!make_volume_step(zone_, true, step_tenths, cmd, err)) return false;
  return send(cmd, err, cancel);
}

bool VolumeControl::down(Error& err, int step_tenths, const CancelToken* cancel) {
  Command cmd;
  if (!make_volume_step(zone_, false, step_tenths, cmd, err)) return false;
  return send(cmd, err, cancel);
}

bool VolumeControl::mute(Error& err, const CancelToken* cancel) {
  return send(make_mute(zone_, MuteAction::On), err, cancel);
}

bool VolumeControl::unmute(Error& err, const CancelToken* cancel) {
  return send(make_mute(zone_, MuteAction::Off), err, cancel);
}

bool VolumeControl::toggle_mute(Error& err, const CancelToken* cancel) {
  return send(make_mute(zone_, MuteAction::Toggle), err, cancel);
}

bool VolumeControl::is_muted(bool& out, Error& err, const CancelToken* cancel) {
  StatusLine line;
  if (!s_.query(make_mute_query(zone_, s_.command_timeout()), line, err, cancel)) return false;
  if (!mute_from_line(line, out)) {
    err.set(ErrorCode::MalformedFrame, "mute reply " + line.verb);
    return false;
  }
  return true;
}

std::optional<int> VolumeControl::cached() const {
  return s_.state_snapshot().zone(zone_).volume_tenths;
}

std::optional<bool> VolumeControl::cached_mute() const {
  return s_.state_snapshot().zone(zone_).muted;
}

} // namespace p100link
