// ============================================================================
// power_control.cpp — implementation for controls/power.hpp
// ============================================================================

#include "p100link/controls/power.hpp"

namespace p100link {

bool power_from_line(const StatusLine& line, PowerState& out) {
  if (line.verb == "POWER" || line.verb == "POWERZONE2") {
    if (!line.has_value) return false;
    out = line.value != 0 ? PowerState::On : PowerState::Off;
    return true;
  }
  if (line.verb == "POWERONMAIN" || line.verb == "POWERONZONE2") {
    out = PowerState::On;
    return true;
  }
  if (line.verb == "POWEROFFMAIN" || line.verb == "POWEROFFZONE2") {
    out = PowerState::Off;
    return true;
  }
  return false;
}

bool PowerControl::on(Error& err, const CancelToken* cancel) {
  Response resp;
  return s_.execute(make_power_on(zone_), resp, err, cancel);
}

bool PowerControl::off(Error& err, const CancelToken* cancel) {
  Response resp;
  return s_.execute(make_power_off(zone_), resp, err, cancel);
}

bool PowerControl::status(PowerState& out, Error& err, const CancelToken* cancel) {
  StatusLine line;
  if (!s_.query(make_power_query(zone_, s_.command_timeout()), line, err, cancel)) return false;
  if (!power_from_line(line, out)) {
    err.set(ErrorCode::MalformedFrame, "power reply " + line.verb);
    return false;
  }
  return true;
}

bool PowerControl::toggle(PowerState& now, Error& err, const CancelToken* cancel) {
  PowerState cur;
  if (!status(cur, err, cancel)) return false;
  now = cur == PowerState::On ? PowerState::Off : PowerState::On;
  return now == PowerState::On ? on(err, cancel) : off(err, cancel);
}

std::optional<PowerState> PowerControl::cached() const {
  return s_.state_snapshot().zone(zone_).power;
}

} // namespace p100link
