#pragma once
/**
 * @file source.hpp
 * @brief Input source facade (main zone).
 *
 * The source list (`SRCS?`) is cached per connection epoch: it is fetched
 * once after each (re)connect and reused until the link changes or the
 * caller forces a refresh. next()/previous() walk that list in device order
 * and wrap around.
 *
 * A facade instance is meant for one caller thread at a time.
 */

#include "p100link/controls/name_match.hpp"
#include "p100link/session.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace p100link {

class SourceControl {
public:
  explicit SourceControl(Session& session) : s_(session) {}

  bool list(std::vector<NamedEntry>& out, Error& err, bool force = false,
            const CancelToken* cancel = nullptr);

  /// SRC?; the name comes from the reply, or from the list when the device
  /// reports the index alone.
  bool current(NamedEntry& out, Error& err, const CancelToken* cancel = nullptr);

  bool select(int index, Error& err, const CancelToken* cancel = nullptr);
  bool select_by_name(const std::string& selector, NamedEntry& chosen, Error& err,
                      const CancelToken* cancel = nullptr);
  bool next(NamedEntry& chosen, Error& err, const CancelToken* cancel = nullptr);
  bool previous(NamedEntry& chosen, Error& err, const CancelToken* cancel = nullptr);

private:
  bool step(bool forward, NamedEntry& chosen, Error& err, const CancelToken* cancel);

  Session& s_;
  std::vector<NamedEntry> entries_;
  bool     have_list_{false};
  uint64_t list_epoch_{0};
};

} // namespace p100link
