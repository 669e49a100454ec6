// ============================================================================
// source_control.cpp — implementation for controls/source.hpp
// ============================================================================

#include "p100link/controls/source.hpp"

#include <string>
#include <utility>

namespace p100link {

bool SourceControl::list(std::vector<NamedEntry>& out, Error& err, bool force,
                         const CancelToken* cancel) {
  const uint64_t epoch = s_.connection_epoch();
  if (!force && have_list_ && list_epoch_ == epoch) {
    out = entries_;
    return true;
  }

  Response resp;
  if (!s_.execute(make_source_list(s_.command_timeout()), resp, err, cancel)) return false;
  std::vector<NamedEntry> fresh;
  if (!entries_from_response(resp, fresh, err)) return false;

  entries_ = fresh;
  have_list_ = true;
  list_epoch_ = epoch;
  out = std::move(fresh);
  return true;
}

bool SourceControl::current(NamedEntry& out, Error& err, const CancelToken* cancel) {
  StatusLine line;
  if (!s_.query(make_source_query(s_.command_timeout()), line, err, cancel)) return false;
  if (!line.has_value) {
    err.set(ErrorCode::MalformedFrame, "source reply without index");
    return false;
  }
  out.index = line.value;
  out.name = line.text;
  if (out.name.empty()) {
    std::vector<NamedEntry> entries;
    Error lerr;
    if (list(entries, lerr, false, cancel)) out.name = name_for_index(entries, out.index);
  }
  // Index missing from the catalogue (or the list failed): placeholder name.
  if (out.name.empty()) out.name = "Source " + std::to_string(out.index);
  return true;
}

bool SourceControl::select(int index, Error& err, const CancelToken* cancel) {
  Command cmd;
  if (!make_source_select(index, cmd, err)) return false;
  Response resp;
  return s_.execute(cmd, resp, err, cancel);
}

bool SourceControl::select_by_name(const std::string& selector, NamedEntry& chosen, Error& err,
                                   const CancelToken* cancel) {
  std::vector<NamedEntry> entries;
  if (!list(entries, err, false, cancel)) return false;
  if (!p100link::select_by_name(entries, selector, chosen, err)) return false;
  return select(chosen.index, err, cancel);
}

bool SourceControl::step(bool forward, NamedEntry& chosen, Error& err, const CancelToken* cancel) {
  std::vector<NamedEntry> entries;
  if (!list(entries, err, false, cancel)) return false;
  NamedEntry cur;
  if (!current(cur, err, cancel)) return false;
  if (!neighbour_entry(entries, cur.index, forward, chosen, err)) return false;
  return select(chosen.index, err, cancel);
}

bool SourceControl::next(NamedEntry& chosen, Error& err, const CancelToken* cancel) {
  return step(true, chosen, err, cancel);
}

bool SourceControl::previous(NamedEntry& chosen, Error& err, const CancelToken* cancel) {
  return step(false, chosen, err, cancel);
}

} // namespace p100link
