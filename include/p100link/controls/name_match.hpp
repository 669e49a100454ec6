#pragma once
/**
 * @file name_match.hpp
 * @brief Indexed name catalogues (sources, audio modes) and name selection.
 *
 * Selection rules, in order:
 *   1. a selector made only of digits is an index and must exist
 *   2. exact match, ignoring ASCII case
 *   3. a single entry containing the selector, ignoring ASCII case
 * No match is NotFound; more than one substring match is Ambiguous.
 *
 *   ["Blu-ray", "DVD Player", "Tuner"]:  "dvd" -> 1,  "d" -> Ambiguous
 */

#include "p100link/command.hpp"
#include "p100link/error.hpp"

#include <string>
#include <vector>

namespace p100link {

struct NamedEntry {
  int         index{0};
  std::string name;
};

/// Resolve @p selector against @p entries; fills @p out on success.
bool select_by_name(const std::vector<NamedEntry>& entries, const std::string& selector,
                    NamedEntry& out, Error& err);

/// Turn a List response (count line + item lines) into entries, in the
/// order the device sent them.
bool entries_from_response(const Response& resp, std::vector<NamedEntry>& out, Error& err);

/// Entry following (or preceding) @p current_index, wrapping around. An
/// index not in the list starts from the first (or last) entry.
bool neighbour_entry(const std::vector<NamedEntry>& entries, int current_index, bool forward,
                     NamedEntry& out, Error& err);

/// Name for @p index, or empty.
std::string name_for_index(const std::vector<NamedEntry>& entries, int index);

} // namespace p100link
