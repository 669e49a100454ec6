// ============================================================================
// command.cpp — implementation for command.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "p100link/command.hpp"

#include <algorithm>
#include <string>

namespace p100link {

// ============================================================================
// ResponseMatcher
// ============================================================================

ResponseMatcher ResponseMatcher::none() {
  return ResponseMatcher{};
}

ResponseMatcher ResponseMatcher::verb(std::string v) {
  ResponseMatcher m;
  m.kind_ = MatchKind::Verb;
  m.verbs_.push_back(std::move(v));
  return m;
}

ResponseMatcher ResponseMatcher::any_verb(std::vector<std::string> verbs) {
  ResponseMatcher m;
  m.kind_ = MatchKind::Verb;
  m.verbs_ = std::move(verbs);
  return m;
}

ResponseMatcher ResponseMatcher::list(std::string count_verb, std::string item_verb) {
  ResponseMatcher m;
  m.kind_ = MatchKind::List;
  m.count_verb_ = std::move(count_verb);
  m.item_verb_ = std::move(item_verb);
  return m;
}

// ---------------------------------------------------------------------------
// step()
// ------
// Verb: the first listed verb is the reply proper, the rest are bare-verb
// alternates. List: the count frame must come first; item frames seen before it are not
// ours. A count of zero completes immediately.
// ---------------------------------------------------------------------------
MatchStep ResponseMatcher::step(const StatusLine& line, MatchProgress& progress) const {
  switch (kind_) {
    case MatchKind::None:
      return MatchStep::Miss;

    case MatchKind::Verb: {
      auto it = std::find(verbs_.begin(), verbs_.end(), line.verb);
      if (it == verbs_.end()) return MatchStep::Miss;
      // The primary verb must carry a field; alternates (POWERONMAIN, MUTEON)
      // are complete as bare verbs.
      if (it == verbs_.begin() && !line.has_value && !line.has_text) return MatchStep::Miss;
      return MatchStep::Done;
    }

    case MatchKind::List:
      if (!progress.have_count) {
        if (line.verb != count_verb_ || !line.has_value || line.value < 0)
          return MatchStep::Miss;
        progress.have_count = true;
        progress.expected = static_cast<std::size_t>(line.value);
        progress.collected = 0;
        return progress.expected == 0 ? MatchStep::Done : MatchStep::Collect;
      }
      if (line.verb != item_verb_) return MatchStep::Miss;
      ++progress.collected;
      return progress.collected >= progress.expected ? MatchStep::Done : MatchStep::Collect;
  }
  return MatchStep::Miss;
}

std::string ResponseMatcher::describe() const {
  switch (kind_) {
    case MatchKind::None: return "none";
    case MatchKind::Verb: {
      std::string s = "verb:";
      for (std::size_t i = 0; i < verbs_.size(); ++i) {
        if (i) s += '|';
        s += verbs_[i];
      }
      return s;
    }
    case MatchKind::List: return "list:" + count_verb_ + "/" + item_verb_;
  }
  return "none";
}

// ============================================================================
// Builders
// ============================================================================

static inline bool is_main(Zone z) { return z == Zone::Main; }

// "(n)" suffix used by every parameterized command.
static inline std::string arg(int n) {
  return "(" + std::to_string(n) + ")";
}

// ---------------------------------------------------------------------------
// Power
// The device reports power either as POWER(n) / POWERZONE2(n) or by echoing
// the set-command name as a status, so queries accept both forms.
// ---------------------------------------------------------------------------
Command make_power_on(Zone z) {
  return Command(is_main(z) ? "POWERONMAIN" : "POWERONZONE2", ResponseMatcher::none());
}

Command make_power_off(Zone z) {
  return Command(is_main(z) ? "POWEROFFMAIN" : "POWEROFFZONE2", ResponseMatcher::none());
}

Command make_power_query(Zone z, Millis timeout) {
  if (is_main(z))
    return Command("POWER?",
                   ResponseMatcher::any_verb({"POWER", "POWERONMAIN", "POWEROFFMAIN"}),
                   timeout);
  return Command("POWERZONE2?",
                 ResponseMatcher::any_verb({"POWERZONE2", "POWERONZONE2", "POWEROFFZONE2"}),
                 timeout);
}

// ---------------------------------------------------------------------------
// Volume (tenths of a dB)
// ---------------------------------------------------------------------------
bool make_volume_set(Zone z, int tenths, Command& out, Error& err) {
  if (tenths < VOLUME_MIN_TENTHS || tenths > VOLUME_MAX_TENTHS) {
    err.set(ErrorCode::InvalidArgument,
            "volume " + std::to_string(tenths) + " outside " +
            std::to_string(VOLUME_MIN_TENTHS) + ".." + std::to_string(VOLUME_MAX_TENTHS));
    return false;
  }
  out = Command(std::string(is_main(z) ? "VOL" : "ZVOL") + arg(tenths), ResponseMatcher::none());
  return true;
}

bool make_volume_step(Zone z, bool up, int step_tenths, Command& out, Error& err) {
  if (step_tenths <= 0 || step_tenths > VOLUME_MAX_TENTHS - VOLUME_MIN_TENTHS) {
    err.set(ErrorCode::InvalidArgument, "volume step " + std::to_string(step_tenths));
    return false;
  }
  std::string text = is_main(z) ? "VOL" : "ZVOL";
  text += up ? '+' : '-';
  if (step_tenths != VOLUME_STEP_TENTHS) text += arg(step_tenths);
  out = Command(std::move(text), ResponseMatcher::none());
  return true;
}

Command make_volume_query(Zone z, Millis timeout) {
  return is_main(z) ? Command("VOL?", ResponseMatcher::verb("VOL"), timeout)
                    : Command("ZVOL?", ResponseMatcher::verb("ZVOL"), timeout);
}

// ---------------------------------------------------------------------------
// Mute
// ---------------------------------------------------------------------------
Command make_mute(Zone z, MuteAction a) {
  std::string text = is_main(z) ? "MUTE" : "ZMUTE";
  if (a == MuteAction::On)  text += "ON";
  if (a == MuteAction::Off) text += "OFF";
  return Command(std::move(text), ResponseMatcher::none());
}

Command make_mute_query(Zone z, Millis timeout) {
  if (is_main(z))
    return Command("MUTE?", ResponseMatcher::any_verb({"MUTE", "MUTEON", "MUTEOFF"}), timeout);
  return Command("ZMUTE?", ResponseMatcher::any_verb({"ZMUTE", "ZMUTEON", "ZMUTEOFF"}), timeout);
}

// ---------------------------------------------------------------------------
// Feedback level
// ---------------------------------------------------------------------------
Command make_feedback_level(FeedbackLevel level, Millis timeout) {
  return Command("VERB" + arg(static_cast<int>(level)), ResponseMatcher::verb("VERB"), timeout);
}

// ---------------------------------------------------------------------------
// Sources
// ---------------------------------------------------------------------------
bool make_source_select(int index, Command& out, Error& err) {
  if (index < 0) {
    err.set(ErrorCode::InvalidArgument, "source index " + std::to_string(index));
    return false;
  }
  out = Command("SRC" + arg(index), ResponseMatcher::none());
  return true;
}

Command make_source_query(Millis timeout) {
  return Command("SRC?", ResponseMatcher::verb("SRC"), timeout);
}

Command make_source_list(Millis timeout) {
  return Command("SRCS?", ResponseMatcher::list("SRCCOUNT", "SRC"), timeout);
}

// ---------------------------------------------------------------------------
// Audio modes
// ---------------------------------------------------------------------------
bool make_audio_mode_select(int index, Command& out, Error& err) {
  if (index < 0) {
    err.set(ErrorCode::InvalidArgument, "audio mode index " + std::to_string(index));
    return false;
  }
  out = Command("AUDMODE" + arg(index), ResponseMatcher::none());
  return true;
}

Command make_audio_mode_step(bool next) {
  return Command(next ? "AUDMODE+" : "AUDMODE-", ResponseMatcher::none());
}

Command make_audio_mode_query(Millis timeout) {
  return Command("AUDMODE?", ResponseMatcher::verb("AUDMODE"), timeout);
}

Command make_audio_mode_list(Millis timeout) {
  return Command("AUDMODEL?", ResponseMatcher::list("AUDMODECOUNT", "AUDMODE"), timeout);
}

Command make_audio_type_query(Millis timeout) {
  return Command("AUDTYPE?", ResponseMatcher::verb("AUDTYPE"), timeout);
}

} // namespace p100link
