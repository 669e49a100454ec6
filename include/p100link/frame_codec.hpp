#pragma once

/**
 * @file frame_codec.hpp
 * @brief Line framing for the P100 protocol: sentinel + text + carriage return.
 *
 * @details
 * OVERVIEW
 * --------
 * The processor delimits every unit with a single terminator byte (`\r`) and
 * marks its class with the first character:
 *
 *   '!'  status frame (reply to a query, or an unsolicited state push)
 *   '#'  echo frame (the device repeating a command it received; level 2 only)
 *   else unrecognized (boot chatter, line noise) -> logged and discarded
 *
 * Encoding is trivial: `!` + command text + `\r`.
 *
 * Decoding is stateful because the transport may split or coalesce lines
 * arbitrarily. `FrameDecoder` keeps the unterminated tail between calls and
 * hands back every complete line of each chunk. It never blocks.
 *
 * DECODING RULES
 * --------------
 * - Bytes accumulate until a `\r` is seen; the accumulated line is a frame.
 * - Surrounding whitespace is trimmed (some firmware sends `\r\n`, which leaves
 *   a leading `\n` on the next line).
 * - Empty lines are separators and produce nothing.
 * - A partial line longer than MAX_LINE is dropped and counted as malformed;
 *   the decoder resynchronizes on the next terminator.
 *
 * EXAMPLE
 * -------
 * @code
 *   p100link::FrameDecoder dec;
 *   auto frames = dec.feed(reinterpret_cast<const uint8_t*>("!VOL(-3"), 7);  // none yet
 *   frames = dec.feed(reinterpret_cast<const uint8_t*>("50)\r#MU"), 8);      // one Status
 *   // frames[0].kind == FrameKind::Status, frames[0].payload == "VOL(-350)"
 * @endcode
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace p100link {

enum class FrameKind : uint8_t { Status = 0, Echo = 1, Unrecognized = 2 };

const char* frame_kind_name(FrameKind k);

/// One decoded protocol unit. `payload` excludes sentinel and terminator
/// (for Unrecognized frames it is the whole trimmed line).
struct Frame {
  FrameKind   kind{FrameKind::Unrecognized};
  std::string payload;
};

/// Wire bytes for a command: "!" + text + "\r".
std::string encode_command(const std::string& text);

/// Classify one complete, trimmed line.
Frame classify_line(const std::string& line);

/// Inverse of classify_line(): the line as it appeared on the wire, sentinel
/// included, terminator excluded. Used by the monitor tap.
std::string frame_line(const Frame& frame);

class FrameDecoder {
public:
  static constexpr std::size_t MAX_LINE = 4096;

  /// Consume a chunk; return all frames completed by it, in order.
  std::vector<Frame> feed(const uint8_t* data, std::size_t n);

  std::vector<Frame> feed(const std::string& chunk) {
    return feed(reinterpret_cast<const uint8_t*>(chunk.data()), chunk.size());
  }

  /// Bytes held back waiting for a terminator.
  std::size_t buffered() const { return buf_.size(); }

  /// Lines dropped for exceeding MAX_LINE.
  std::size_t overflow_count() const { return overflows_; }

private:
  std::string buf_;
  bool        discarding_{false};   // inside an oversized line; skip to next '\r'
  std::size_t overflows_{0};
};

} // namespace p100link
