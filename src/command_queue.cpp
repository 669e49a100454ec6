// ============================================================================
// command_queue.cpp — implementation for command_queue.hpp
// ============================================================================

#include "p100link/command_queue.hpp"

#include <chrono>
#include <memory>

namespace p100link {

static constexpr std::chrono::milliseconds POLL_SLICE{50};

std::size_t CommandQueue::depth() const {
  std::lock_guard<std::mutex> lk(mu_);
  return static_cast<std::size_t>(next_ticket_ - serving_) - abandoned_.size();
}

// Hand the turn to the next live ticket, skipping any that were abandoned.
void CommandQueue::release_turn() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    ++serving_;
    while (abandoned_.erase(serving_)) ++serving_;
  }
  cv_.notify_all();
}

bool CommandQueue::execute(const Command& cmd, Response& resp, Error& err,
                           const CancelToken* cancel) {
  {
    std::unique_lock<std::mutex> lk(mu_);
    const uint64_t ticket = next_ticket_++;
    while (serving_ != ticket) {
      if (cancel && cancel->cancelled()) {
        abandoned_.insert(ticket);
        err.set(ErrorCode::Cancelled, "queued " + cmd.text);
        return false;
      }
      cv_.wait_for(lk, POLL_SLICE);
    }
  }

  // Our turn from here on; every exit path must release it.
  if (!corr_.wait_idle(cancel)) {
    release_turn();
    err.set(ErrorCode::Cancelled, "queued " + cmd.text);
    return false;
  }

  std::shared_ptr<PendingRequest> req;
  if (!corr_.submit(cmd, req, err)) {
    release_turn();
    return false;
  }

  const bool ok = corr_.wait(req, resp, err, cancel);
  release_turn();
  return ok;
}

} // namespace p100link
