// ============================================================================
// device_state.cpp — implementation for device_state.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "p100link/device_state.hpp"

#include <utility>
#include <vector>

namespace p100link {

// ---------------------------------------------------------------------------
// apply_locked()
// --------------
// One branch per observable. Anything unknown (VERB, SRCCOUNT, ...) returns
// false without touching the state.
// ---------------------------------------------------------------------------
static bool apply_locked(DeviceState& st, const StatusLine& l) {
  const std::string& v = l.verb;

  // power
  if (v == "POWER" || v == "POWERZONE2") {
    if (!l.has_value) return false;
    st.zone(v == "POWER" ? Zone::Main : Zone::Zone2).power =
        l.value != 0 ? PowerState::On : PowerState::Off;
    return true;
  }
  if (v == "POWERONMAIN")   { st.main.power  = PowerState::On;  return true; }
  if (v == "POWEROFFMAIN")  { st.main.power  = PowerState::Off; return true; }
  if (v == "POWERONZONE2")  { st.zone2.power = PowerState::On;  return true; }
  if (v == "POWEROFFZONE2") { st.zone2.power = PowerState::Off; return true; }

  // volume
  if (v == "VOL" || v == "ZVOL") {
    if (!l.has_value) return false;
    st.zone(v == "VOL" ? Zone::Main : Zone::Zone2).volume_tenths = l.value;
    return true;
  }

  // mute
  if (v == "MUTE" || v == "ZMUTE") {
    if (!l.has_value) return false;
    st.zone(v == "MUTE" ? Zone::Main : Zone::Zone2).muted = l.value != 0;
    return true;
  }
  if (v == "MUTEON")   { st.main.muted  = true;  return true; }
  if (v == "MUTEOFF")  { st.main.muted  = false; return true; }
  if (v == "ZMUTEON")  { st.zone2.muted = true;  return true; }
  if (v == "ZMUTEOFF") { st.zone2.muted = false; return true; }

  // source
  if (v == "SRC" || v == "ZSRC") {
    if (!l.has_value) return false;
    ZoneState& z = st.zone(v == "SRC" ? Zone::Main : Zone::Zone2);
    if (z.source_index != l.value) z.source_name.clear();
    z.source_index = l.value;
    if (l.has_text) z.source_name = l.text;
    return true;
  }

  // audio mode / input type
  if (v == "AUDMODE") {
    if (!l.has_value) return false;
    if (st.audio_mode_index != l.value) st.audio_mode_name.clear();
    st.audio_mode_index = l.value;
    if (l.has_text) st.audio_mode_name = l.text;
    return true;
  }
  if (v == "AUDTYPE") {
    if (!l.has_text) return false;
    st.audio_type = l.text;
    return true;
  }

  return false;
}

bool DeviceStateCache::apply(const StatusLine& line) {
  std::lock_guard<std::mutex> lk(mu_);
  if (!apply_locked(state_, line)) return false;
  ++state_.updates;
  return true;
}

DeviceState DeviceStateCache::snapshot() const {
  std::lock_guard<std::mutex> lk(mu_);
  return state_;
}

int DeviceStateCache::subscribe(Listener fn) {
  std::lock_guard<std::mutex> lk(listeners_mu_);
  const int id = next_id_++;
  listeners_.emplace(id, std::move(fn));
  return id;
}

void DeviceStateCache::unsubscribe(int id) {
  std::lock_guard<std::mutex> lk(listeners_mu_);
  listeners_.erase(id);
}

// publish()
// ---------
// Listeners are copied out first so a slow listener never holds the lock
// that subscribe()/unsubscribe() need.
void DeviceStateCache::publish() {
  std::vector<Listener> fns;
  {
    std::lock_guard<std::mutex> lk(listeners_mu_);
    if (listeners_.empty()) return;
    fns.reserve(listeners_.size());
    for (auto& kv : listeners_) fns.push_back(kv.second);
  }
  const DeviceState snap = snapshot();
  for (auto& fn : fns) {
    if (fn) fn(snap);
  }
}

} // namespace p100link
