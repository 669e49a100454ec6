// ============================================================================
// audio_mode_control.cpp — implementation for controls/audio_mode.hpp
// ============================================================================

#include "p100link/controls/audio_mode.hpp"

#include <utility>

namespace p100link {

bool AudioModeControl::list(std::vector<NamedEntry>& out, Error& err, bool force,
                            const CancelToken* cancel) {
  const uint64_t epoch = s_.connection_epoch();
  if (!force && have_list_ && list_epoch_ == epoch) {
    out = entries_;
    return true;
  }

  Response resp;
  if (!s_.execute(make_audio_mode_list(s_.command_timeout()), resp, err, cancel)) return false;
  std::vector<NamedEntry> fresh;
  if (!entries_from_response(resp, fresh, err)) return false;

  entries_ = fresh;
  have_list_ = true;
  list_epoch_ = epoch;
  out = std::move(fresh);
  return true;
}

bool AudioModeControl::current(NamedEntry& out, Error& err, const CancelToken* cancel) {
  StatusLine line;
  if (!s_.query(make_audio_mode_query(s_.command_timeout()), line, err, cancel)) return false;
  if (!line.has_value) {
    err.set(ErrorCode::MalformedFrame, "audio mode reply without index");
    return false;
  }
  out.index = line.value;
  out.name = line.text;
  if (out.name.empty()) {
    std::vector<NamedEntry> entries;
    Error lerr;
    if (list(entries, lerr, false, cancel)) out.name = name_for_index(entries, out.index);
  }
  return true;
}

bool AudioModeControl::select(int index, Error& err, const CancelToken* cancel) {
  Command cmd;
  if (!make_audio_mode_select(index, cmd, err)) return false;
  Response resp;
  return s_.execute(cmd, resp, err, cancel);
}

bool AudioModeControl::select_by_name(const std::string& selector, NamedEntry& chosen, Error& err,
                                      const CancelToken* cancel) {
  std::vector<NamedEntry> entries;
  if (!list(entries, err, false, cancel)) return false;
  if (!p100link::select_by_name(entries, selector, chosen, err)) return false;
  return select(chosen.index, err, cancel);
}

bool AudioModeControl::next(Error& err, const CancelToken* cancel) {
  Response resp;
  return s_.execute(make_audio_mode_step(true), resp, err, cancel);
}

bool AudioModeControl::previous(Error& err, const CancelToken* cancel) {
  Response resp;
  return s_.execute(make_audio_mode_step(false), resp, err, cancel);
}

bool AudioModeControl::audio_type(std::string& out, Error& err, const CancelToken* cancel) {
  StatusLine line;
  if (!s_.query(make_audio_type_query(s_.command_timeout()), line, err, cancel)) return false;
  out = line.text;
  return true;
}

} // namespace p100link
