// ============================================================================
// status_line.cpp — implementation for status_line.hpp
// Hand-written cursor parser; each step either consumes or leaves the input.
// ============================================================================

#include "p100link/status_line.hpp"

#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>

namespace p100link {

bool parse_int(const std::string& s, int& out) {
  if (s.empty()) return false;
  char* e = nullptr;
  errno = 0;
  long v = std::strtol(s.c_str(), &e, 10);
  if (!e || *e) return false;                 // leftover junk
  if (errno == ERANGE || v < INT_MIN || v > INT_MAX) return false;
  if (std::isspace(static_cast<unsigned char>(s[0]))) return false;
  out = static_cast<int>(v);
  return true;
}

namespace {

struct Cursor {
  const std::string& s;
  std::size_t i{0};

  bool done() const { return i >= s.size(); }
  char peek() const { return done() ? '\0' : s[i]; }
  void skip_spaces() { while (!done() && s[i] == ' ') ++i; }
};

bool is_upper(char c) { return c >= 'A' && c <= 'Z'; }
bool is_digit(char c) { return c >= '0' && c <= '9'; }

// Signed decimal run at the cursor.
bool take_int(Cursor& c, int& out) {
  std::size_t start = c.i;
  if (c.peek() == '-' || c.peek() == '+') ++c.i;
  std::size_t digits = c.i;
  while (!c.done() && is_digit(c.peek())) ++c.i;
  if (c.i == digits) { c.i = start; return false; }
  return parse_int(c.s.substr(start, c.i - start), out);
}

// "..." at the cursor; no escapes in this protocol.
bool take_quoted(Cursor& c, std::string& out) {
  if (c.peek() != '"') return false;
  std::size_t close = c.s.find('"', c.i + 1);
  if (close == std::string::npos) return false;
  out = c.s.substr(c.i + 1, close - c.i - 1);
  c.i = close + 1;
  return true;
}

} // namespace

bool parse_status_line(const std::string& payload, StatusLine& out) {
  out = StatusLine{};
  Cursor c{payload};

  // verb
  if (!is_upper(c.peek())) return false;
  while (!c.done() && (is_upper(c.peek()) || is_digit(c.peek()) || c.peek() == '_')) ++c.i;
  out.verb = payload.substr(0, c.i);

  if (c.peek() == '(') {
    ++c.i;
    if (c.peek() == '"') {
      if (!take_quoted(c, out.text)) return false;
      out.has_text = true;
    } else {
      if (!take_int(c, out.value)) return false;
      out.has_value = true;
    }
    if (c.peek() != ')') return false;
    ++c.i;
  } else if (c.peek() == ' ') {
    c.skip_spaces();
    if (c.peek() != '"') {
      if (!take_int(c, out.value)) return false;
      out.has_value = true;
    }
  }

  c.skip_spaces();
  if (c.peek() == '"') {
    if (out.has_text) return false;           // one text field at most
    if (!take_quoted(c, out.text)) return false;
    out.has_text = true;
  }

  c.skip_spaces();
  return c.done();
}

} // namespace p100link
