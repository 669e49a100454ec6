// ============================================================================
// correlator.cpp — implementation for correlator.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "p100link/correlator.hpp"
#include "p100link/log.hpp"

#include <algorithm>
#include <utility>

namespace p100link {

static const char* COMPONENT = "correlator";

// Callers waiting on the slot wake at least this often to look at their
// cancel token and the deadline.
static constexpr std::chrono::milliseconds POLL_SLICE{50};

void Correlator::set_writer(Writer w) {
  std::lock_guard<std::mutex> lk(mu_);
  writer_ = std::move(w);
}

void Correlator::set_gate(Gate g) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    gate_ = g;
  }
  cv_.notify_all();
}

Correlator::Gate Correlator::gate() const {
  std::lock_guard<std::mutex> lk(mu_);
  return gate_;
}

bool Correlator::idle() const {
  std::lock_guard<std::mutex> lk(mu_);
  return !pending_;
}

Correlator::Counters Correlator::counters() const {
  std::lock_guard<std::mutex> lk(mu_);
  return counters_;
}

void Correlator::note_malformed(uint64_t n) {
  if (n == 0) return;
  {
    std::lock_guard<std::mutex> lk(mu_);
    counters_.malformed += n;
  }
  log::warn(COMPONENT, "msg=frame_dropped reason=malformed_frame detail=oversized_line count=" +
                       std::to_string(n));
}

// ---------------------------------------------------------------------------
// resolve_locked()
// ----------------
// Single point where a request completes. Frees the slot if it still holds
// this request and wakes everyone blocked in wait()/wait_idle().
// ---------------------------------------------------------------------------
void Correlator::resolve_locked(const std::shared_ptr<PendingRequest>& req, ErrorCode code,
                                const std::string& detail) {
  if (!req || req->resolved) return;
  req->resolved = true;
  if (code != ErrorCode::None) req->error.set(code, detail);
  if (pending_ == req) pending_.reset();
  ++counters_.resolved;
  cv_.notify_all();
}

// ---------------------------------------------------------------------------
// submit()
// --------
// The deadline is armed before the write so a stalled write still counts
// against the command's own timeout.
// ---------------------------------------------------------------------------
bool Correlator::submit(const Command& cmd, std::shared_ptr<PendingRequest>& out, Error& err,
                        bool handshake) {
  Writer writer;
  std::shared_ptr<PendingRequest> req;
  {
    std::lock_guard<std::mutex> lk(mu_);
    const bool allowed = gate_ == Gate::Open || (handshake && gate_ == Gate::Handshake);
    if (!allowed || !writer_) {
      err.set(ErrorCode::NotConnected, cmd.text);
      return false;
    }
    if (pending_) {
      err.set(ErrorCode::Busy, "awaiting " + pending_->cmd.text);
      return false;
    }
    req = std::make_shared<PendingRequest>();
    req->cmd = cmd;
    req->deadline = Clock::now() + cmd.timeout;
    pending_ = req;
    writer = writer_;
    ++counters_.submitted;
  }

  log::debug(COMPONENT, "msg=submit cmd=" + cmd.text + " match=" + cmd.matcher.describe());

  Error werr;
  const bool wrote = writer(encode_command(cmd.text), werr);

  {
    std::lock_guard<std::mutex> lk(mu_);
    if (!wrote) {
      resolve_locked(req, ErrorCode::ConnectionLost,
                     werr.detail.empty() ? "write failed" : werr.detail);
    } else if (cmd.matcher.kind() == MatchKind::None) {
      resolve_locked(req, ErrorCode::None, {});
    }
  }

  out = std::move(req);
  return true;
}

// ---------------------------------------------------------------------------
// wait()
// ------
// The caller enforces its own deadline as well as the read loop, so a
// request never outlives its timeout even with no traffic at all.
// ---------------------------------------------------------------------------
bool Correlator::wait(const std::shared_ptr<PendingRequest>& req, Response& resp, Error& err,
                      const CancelToken* cancel) {
  if (!req) {
    err.set(ErrorCode::InvalidArgument, "no request");
    return false;
  }

  std::unique_lock<std::mutex> lk(mu_);
  while (!req->resolved) {
    if (cancel && cancel->cancelled()) {
      err.set(ErrorCode::Cancelled, req->cmd.text);
      return false;
    }
    const auto now = Clock::now();
    if (now >= req->deadline) {
      ++counters_.timeouts;
      log::warn(COMPONENT, "msg=timeout cmd=" + req->cmd.text + " ms=" +
                           std::to_string(req->cmd.timeout.count()));
      resolve_locked(req, ErrorCode::Timeout,
                     req->cmd.text + " after " + std::to_string(req->cmd.timeout.count()) + " ms");
      break;
    }
    cv_.wait_until(lk, std::min(req->deadline, now + POLL_SLICE));
  }

  if (!req->error.ok()) {
    err = req->error;
    return false;
  }
  resp = req->response;
  return true;
}

bool Correlator::wait_idle(const CancelToken* cancel) {
  std::unique_lock<std::mutex> lk(mu_);
  while (pending_) {
    if (cancel && cancel->cancelled()) return false;
    if (Clock::now() >= pending_->deadline) {
      ++counters_.timeouts;
      log::warn(COMPONENT, "msg=timeout cmd=" + pending_->cmd.text + " abandoned=1");
      auto req = pending_;
      resolve_locked(req, ErrorCode::Timeout, req->cmd.text);
      break;
    }
    cv_.wait_for(lk, POLL_SLICE);
  }
  return true;
}

void Correlator::check_deadline(Clock::time_point now) {
  std::lock_guard<std::mutex> lk(mu_);
  if (!pending_ || now < pending_->deadline) return;
  ++counters_.timeouts;
  log::warn(COMPONENT, "msg=timeout cmd=" + pending_->cmd.text + " ms=" +
                       std::to_string(pending_->cmd.timeout.count()));
  auto req = pending_;
  resolve_locked(req, ErrorCode::Timeout,
                 req->cmd.text + " after " + std::to_string(req->cmd.timeout.count()) + " ms");
}

void Correlator::abort(ErrorCode code, const std::string& detail) {
  std::lock_guard<std::mutex> lk(mu_);
  gate_ = Gate::Closed;
  if (pending_) {
    log::info(COMPONENT, "msg=abort cmd=" + pending_->cmd.text + " reason=" + to_reason(code));
    auto req = pending_;
    resolve_locked(req, code, detail);
  }
  cv_.notify_all();
}

// ---------------------------------------------------------------------------
// on_frame()
// ----------
// Frames arrive here strictly in read order. State is applied while the slot
// lock is held so a reply and an interleaved push can never be reordered.
// ---------------------------------------------------------------------------
void Correlator::on_frame(const Frame& frame) {
  if (frame.kind == FrameKind::Echo) {
    {
      std::lock_guard<std::mutex> lk(mu_);
      ++counters_.echoes;
    }
    log::debug(COMPONENT, "msg=echo payload=" + frame.payload);
    return;
  }

  StatusLine line;
  if (frame.kind != FrameKind::Status || !parse_status_line(frame.payload, line)) {
    {
      std::lock_guard<std::mutex> lk(mu_);
      ++counters_.malformed;
    }
    log::warn(COMPONENT, std::string("msg=frame_dropped reason=malformed_frame kind=") +
                         frame_kind_name(frame.kind) + " payload=\"" + frame.payload + "\"");
    return;
  }

  bool changed = false;
  {
    std::lock_guard<std::mutex> lk(mu_);
    bool apply = true;

    if (pending_ && !pending_->resolved) {
      auto req = pending_;
      switch (req->cmd.matcher.step(line, req->progress)) {
        case MatchStep::Miss:
          ++counters_.unsolicited;
          break;
        case MatchStep::Collect:
          req->response.payloads.push_back(frame.payload);
          req->response.lines.push_back(line);
          apply = false;
          break;
        case MatchStep::Done:
          req->response.payloads.push_back(frame.payload);
          req->response.lines.push_back(line);
          apply = req->cmd.matcher.applies_state();
          resolve_locked(req, ErrorCode::None, {});
          break;
      }
    } else {
      ++counters_.unsolicited;
    }

    if (apply) {
      changed = cache_.apply(line);
      if (!changed) log::debug(COMPONENT, "msg=ignored verb=" + line.verb);
    }
  }

  if (changed) cache_.publish();
}

} // namespace p100link
