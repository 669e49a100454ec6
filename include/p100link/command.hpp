#pragma once
/**
 * @file command.hpp
 * @brief Command values, response matchers, and per-verb builders.
 *
 * @details
 * PURPOSE
 * -------
 * A Command is what a facade hands to the session: the text to send, a
 * matcher describing which inbound status frame(s) answer it, and how long to
 * wait. The protocol has no request identifiers, so the matcher is the only
 * thing tying a reply to its command.
 *
 * MATCHER KINDS
 * -------------
 * - None : fire-and-forget. The command resolves as soon as it is written.
 *          Used for set-commands (POWERONMAIN, VOL(-350), SRC(2), ...); the
 *          resulting state change, if any, arrives as an unsolicited frame.
 * - Verb : exactly one status frame whose verb is in the accepted set.
 *          `VOL?` accepts `VOL(-350)` and `VOL -350`.
 * - List : a count frame followed by that many item frames, e.g.
 *          `SRCS?` -> `SRCCOUNT(3)`, `SRC(0)"Blu-ray"`, `SRC(1)"DVD"`, `SRC(2)"Tuner"`.
 *
 * Builders below are the single place where protocol verbs are spelled.
 * Adding a verb: add a builder here, then use it from a facade.
 *
 * EXAMPLE
 * -------
 *   auto cmd = p100link::make_volume_query(Zone::Main);
 *   // cmd.text == "VOL?", cmd.matcher.kind() == MatchKind::Verb
 */

#include "p100link/error.hpp"
#include "p100link/protocol.hpp"
#include "p100link/status_line.hpp"

#include <chrono>
#include <cstdint>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace p100link {

enum class MatchKind : uint8_t { None = 0, Verb = 1, List = 2 };

/// Outcome of offering one status frame to a pending command's matcher.
enum class MatchStep : uint8_t {
  Miss,     ///< not ours; the frame is unsolicited
  Collect,  ///< ours, more frames expected
  Done      ///< ours, the response is complete
};

/// Per-request progress of a List match. Lives in the pending request, so the
/// Command itself stays immutable.
struct MatchProgress {
  bool        have_count{false};
  std::size_t expected{0};
  std::size_t collected{0};
};

class ResponseMatcher {
public:
  static ResponseMatcher none();
  static ResponseMatcher verb(std::string v);
  static ResponseMatcher any_verb(std::vector<std::string> verbs);
  static ResponseMatcher list(std::string count_verb, std::string item_verb);

  MatchKind kind() const { return kind_; }
  const std::vector<std::string>& verbs() const { return verbs_; }
  const std::string& count_verb() const { return count_verb_; }
  const std::string& item_verb() const { return item_verb_; }

  /// Offer one parsed status line. Updates @p progress for List matchers.
  MatchStep step(const StatusLine& line, MatchProgress& progress) const;

  /// Whether a matched frame also describes current device state.
  /// List items are catalogue entries, not the current selection.
  bool applies_state() const { return kind_ == MatchKind::Verb; }

  /// Short form for logs: "none", "verb:VOL", "list:SRCCOUNT/SRC".
  std::string describe() const;

private:
  MatchKind kind_{MatchKind::None};
  std::vector<std::string> verbs_;
  std::string count_verb_;
  std::string item_verb_;
};

struct Command {
  std::string               text;      ///< without sentinel/terminator, e.g. "VOL?"
  ResponseMatcher           matcher;
  std::chrono::milliseconds timeout{DEFAULT_COMMAND_TIMEOUT_MS};

  Command() = default;
  Command(std::string t, ResponseMatcher m,
          std::chrono::milliseconds to = std::chrono::milliseconds(DEFAULT_COMMAND_TIMEOUT_MS))
  : text(std::move(t)), matcher(std::move(m)), timeout(to) {}
};

/// Frames that resolved a command, in arrival order. Empty for None matchers.
struct Response {
  std::vector<std::string> payloads;
  std::vector<StatusLine>  lines;

  bool empty() const { return lines.empty(); }
  const StatusLine* first() const { return lines.empty() ? nullptr : &lines.front(); }
};

// ---------- builders ----------
// Query builders take a timeout; set-commands are fire-and-forget.

using Millis = std::chrono::milliseconds;
static constexpr Millis DEFAULT_TIMEOUT{DEFAULT_COMMAND_TIMEOUT_MS};

Command make_power_on(Zone z);
Command make_power_off(Zone z);
Command make_power_query(Zone z, Millis timeout = DEFAULT_TIMEOUT);

/// VOL(n) / ZVOL(n); fails with InvalidArgument outside -999..240 tenths.
bool make_volume_set(Zone z, int tenths, Command& out, Error& err);
/// VOL+ / VOL- for the default step, VOL+(n) / VOL-(n) otherwise.
bool make_volume_step(Zone z, bool up, int step_tenths, Command& out, Error& err);
Command make_volume_query(Zone z, Millis timeout = DEFAULT_TIMEOUT);

enum class MuteAction : uint8_t { On, Off, Toggle };
Command make_mute(Zone z, MuteAction a);
Command make_mute_query(Zone z, Millis timeout = DEFAULT_TIMEOUT);

/// VERB(n). Answered by a VERB status on most firmware; see supervisor.
Command make_feedback_level(FeedbackLevel level, Millis timeout = DEFAULT_TIMEOUT);

bool    make_source_select(int index, Command& out, Error& err);
Command make_source_query(Millis timeout = DEFAULT_TIMEOUT);
Command make_source_list(Millis timeout = DEFAULT_TIMEOUT);

bool    make_audio_mode_select(int index, Command& out, Error& err);
Command make_audio_mode_step(bool next);
Command make_audio_mode_query(Millis timeout = DEFAULT_TIMEOUT);
Command make_audio_mode_list(Millis timeout = DEFAULT_TIMEOUT);
Command make_audio_type_query(Millis timeout = DEFAULT_TIMEOUT);

} // namespace p100link
