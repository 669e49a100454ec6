// ============================================================================
// frame_codec.cpp — implementation for frame_codec.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "p100link/frame_codec.hpp"
#include "p100link/protocol.hpp"

#include <cctype>

namespace p100link {

const char* frame_kind_name(FrameKind k) {
  switch (k) {
    case FrameKind::Status:       return "status";
    case FrameKind::Echo:         return "echo";
    case FrameKind::Unrecognized: return "unrecognized";
  }
  return "unrecognized";
}

std::string encode_command(const std::string& text) {
  std::string out;
  out.reserve(text.size() + 2);
  out.push_back(COMMAND_SENTINEL);
  out += text;
  out.push_back(TERMINATOR);
  return out;
}

// trim()
// ------
// Strip ASCII whitespace at both ends. A "\r\n" device leaves the '\n' at the
// front of the following line; this is where it goes away.
static std::string trim(const std::string& s) {
  std::size_t a = 0, b = s.size();
  while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) ++a;
  while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) --b;
  return s.substr(a, b - a);
}

Frame classify_line(const std::string& line) {
  Frame f;
  if (!line.empty() && line[0] == STATUS_SENTINEL) {
    f.kind = FrameKind::Status;
    f.payload = line.substr(1);
  } else if (!line.empty() && line[0] == ECHO_SENTINEL) {
    f.kind = FrameKind::Echo;
    f.payload = line.substr(1);
  } else {
    f.kind = FrameKind::Unrecognized;
    f.payload = line;
  }
  return f;
}

std::string frame_line(const Frame& frame) {
  switch (frame.kind) {
    case FrameKind::Status: return std::string(1, STATUS_SENTINEL) + frame.payload;
    case FrameKind::Echo:   return std::string(1, ECHO_SENTINEL) + frame.payload;
    case FrameKind::Unrecognized: break;
  }
  return frame.payload;
}

std::vector<Frame> FrameDecoder::feed(const uint8_t* data, std::size_t n) {
  std::vector<Frame> out;
  if (!data) return out;

  for (std::size_t i = 0; i < n; ++i) {
    const char c = static_cast<char>(data[i]);

    if (c == TERMINATOR) {
      if (discarding_) {              // tail of an oversized line; resync here
        discarding_ = false;
        buf_.clear();
        continue;
      }
      std::string line = trim(buf_);
      buf_.clear();
      if (line.empty()) continue;     // bare "\r" is a separator
      out.push_back(classify_line(line));
      continue;
    }

    if (discarding_) continue;

    buf_.push_back(c);
    if (buf_.size() > MAX_LINE) {     // no terminator in sight: drop and resync
      buf_.clear();
      discarding_ = true;
      ++overflows_;
    }
  }
  return out;
}

} // namespace p100link
