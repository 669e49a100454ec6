#pragma once
/**
 * @file command_queue.hpp
 * @brief FIFO serialization point in front of the correlator.
 *
 * Callers take a ticket and are served in ticket order. When a caller's turn
 * comes it waits for the correlator slot to drain, submits, and waits for the
 * resolution. A caller that cancels while queued gives up its ticket; one
 * that cancels while its command is in flight returns at once and leaves the
 * correlator to resolve (or time out) the abandoned request.
 */

#include "p100link/command.hpp"
#include "p100link/correlator.hpp"
#include "p100link/error.hpp"

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <set>

namespace p100link {

class CommandQueue {
public:
  explicit CommandQueue(Correlator& correlator) : corr_(correlator) {}

  CommandQueue(const CommandQueue&) = delete;
  CommandQueue& operator=(const CommandQueue&) = delete;

  bool execute(const Command& cmd, Response& resp, Error& err,
               const CancelToken* cancel = nullptr);

  /// Callers holding a ticket, including the one being served.
  std::size_t depth() const;

private:
  void release_turn();

  Correlator& corr_;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  uint64_t next_ticket_{0};
  uint64_t serving_{0};
  std::set<uint64_t> abandoned_;
};

} // namespace p100link
