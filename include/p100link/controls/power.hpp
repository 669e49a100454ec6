#pragma once
/**
 * @file power.hpp
 * @brief Power facade for one zone.
 *
 * on()/off() are fire-and-forget set-commands; the device confirms through
 * an unsolicited status that lands in the state cache. toggle() queries
 * first, then sends the opposite command.
 */

#include "p100link/session.hpp"

#include <optional>

namespace p100link {

class PowerControl {
public:
  PowerControl(Session& session, Zone zone) : s_(session), zone_(zone) {}

  bool on(Error& err, const CancelToken* cancel = nullptr);
  bool off(Error& err, const CancelToken* cancel = nullptr);

  /// Query, then switch to the opposite state. @p now is the state requested.
  bool toggle(PowerState& now, Error& err, const CancelToken* cancel = nullptr);

  /// POWER? / POWERZONE2?
  bool status(PowerState& out, Error& err, const CancelToken* cancel = nullptr);

  /// Last reported state, without touching the link.
  std::optional<PowerState> cached() const;

  Zone zone() const { return zone_; }

private:
  Session& s_;
  Zone     zone_;
};

/// Interpret a power status line (POWER(n) or POWERON.../POWEROFF...).
bool power_from_line(const StatusLine& line, PowerState& out);

} // namespace p100link
