#pragma once
/**
 * @file status_line.hpp
 * @brief Structural parser for status payloads (no regular expressions).
 *
 * @details
 * Status payloads seen on the wire (sentinel already removed):
 *
 *   POWERONMAIN              bare verb
 *   POWER(1)                 verb + integer field in parentheses
 *   VOL -350                 verb + integer field after a space
 *   SRC(2)"DVD Player"       verb + integer field + quoted text
 *   AUDTYPE("Dolby Atmos")   verb + quoted text in parentheses
 *
 * Grammar accepted by parse_status_line():
 *
 *   line   := verb [ '(' inner ')' | ' ' int ] [ quoted ]
 *   inner  := int | quoted
 *   verb   := [A-Z] [A-Z0-9_]*
 *
 * Anything left over after that is a malformed payload.
 */

#include <string>

namespace p100link {

struct StatusLine {
  std::string verb;
  bool        has_value{false};
  int         value{0};
  bool        has_text{false};
  std::string text;
};

/// Parse a status payload. Returns false (and leaves @p out unspecified) on
/// anything the grammar above does not cover.
bool parse_status_line(const std::string& payload, StatusLine& out);

/// Strict integer parse with optional sign; no surrounding junk allowed.
bool parse_int(const std::string& s, int& out);

} // namespace p100link
