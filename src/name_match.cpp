// ============================================================================
// name_match.cpp — implementation for controls/name_match.hpp
// ============================================================================

#include "p100link/controls/name_match.hpp"

#include <cstddef>

namespace p100link {

static std::string to_lower_ascii(std::string s) {
  for (char& c : s) if (c >= 'A' && c <= 'Z') c = char(c - 'A' + 'a');
  return s;
}

static bool all_digits(const std::string& s) {
  if (s.empty()) return false;
  for (char c : s) if (c < '0' || c > '9') return false;
  return true;
}

bool select_by_name(const std::vector<NamedEntry>& entries, const std::string& selector,
                    NamedEntry& out, Error& err) {
  if (selector.empty()) {
    err.set(ErrorCode::InvalidArgument, "empty selector");
    return false;
  }

  if (all_digits(selector)) {
    int idx = 0;
    if (parse_int(selector, idx)) {
      for (const auto& e : entries) {
        if (e.index == idx) { out = e; return true; }
      }
    }
    err.set(ErrorCode::NotFound, "no entry with index " + selector);
    return false;
  }

  const std::string want = to_lower_ascii(selector);
  for (const auto& e : entries) {
    if (to_lower_ascii(e.name) == want) { out = e; return true; }
  }

  const NamedEntry* hit = nullptr;
  std::size_t hits = 0;
  std::string names;
  for (const auto& e : entries) {
    if (to_lower_ascii(e.name).find(want) == std::string::npos) continue;
    if (hits++) names += ", ";
    names += e.name;
    hit = &e;
  }
  if (hits == 0) {
    err.set(ErrorCode::NotFound, "\"" + selector + "\"");
    return false;
  }
  if (hits > 1) {
    err.set(ErrorCode::Ambiguous, "\"" + selector + "\" matches " + names);
    return false;
  }
  out = *hit;
  return true;
}

bool entries_from_response(const Response& resp, std::vector<NamedEntry>& out, Error& err) {
  out.clear();
  if (resp.lines.empty()) {
    err.set(ErrorCode::MalformedFrame, "empty list reply");
    return false;
  }
  for (std::size_t i = 1; i < resp.lines.size(); ++i) {
    const StatusLine& l = resp.lines[i];
    if (!l.has_value) {
      err.set(ErrorCode::MalformedFrame, "list item without index: " + resp.payloads[i]);
      return false;
    }
    out.push_back(NamedEntry{l.value, l.text});
  }
  return true;
}

bool neighbour_entry(const std::vector<NamedEntry>& entries, int current_index, bool forward,
                     NamedEntry& out, Error& err) {
  if (entries.empty()) {
    err.set(ErrorCode::NotFound, "empty list");
    return false;
  }
  const std::size_t n = entries.size();
  for (std::size_t i = 0; i < n; ++i) {
    if (entries[i].index != current_index) continue;
    out = entries[forward ? (i + 1) % n : (i + n - 1) % n];
    return true;
  }
  out = forward ? entries.front() : entries.back();
  return true;
}

std::string name_for_index(const std::vector<NamedEntry>& entries, int index) {
  for (const auto& e : entries) if (e.index == index) return e.name;
  return {};
}

} // namespace p100link
