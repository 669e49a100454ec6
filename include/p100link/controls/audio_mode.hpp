#pragma once
/**
 * @file audio_mode.hpp
 * @brief Audio (listening) mode facade and input audio type.
 *
 * Unlike sources, stepping is done by the device itself (`AUDMODE+` and
 * `AUDMODE-`); the new mode is reported as an unsolicited status. The mode
 * list (`AUDMODEL?`) is cached per connection epoch.
 */

#include "p100link/controls/name_match.hpp"
#include "p100link/session.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace p100link {

class AudioModeControl {
public:
  explicit AudioModeControl(Session& session) : s_(session) {}

  bool list(std::vector<NamedEntry>& out, Error& err, bool force = false,
            const CancelToken* cancel = nullptr);
  bool current(NamedEntry& out, Error& err, const CancelToken* cancel = nullptr);
  bool select(int index, Error& err, const CancelToken* cancel = nullptr);
  bool select_by_name(const std::string& selector, NamedEntry& chosen, Error& err,
                      const CancelToken* cancel = nullptr);
  bool next(Error& err, const CancelToken* cancel = nullptr);
  bool previous(Error& err, const CancelToken* cancel = nullptr);

  /// AUDTYPE?: description of the incoming stream, e.g. "Dolby Atmos".
  bool audio_type(std::string& out, Error& err, const CancelToken* cancel = nullptr);

private:
  Session& s_;
  std::vector<NamedEntry> entries_;
  bool     have_list_{false};
  uint64_t list_epoch_{0};
};

} // namespace p100link
