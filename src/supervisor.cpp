// ============================================================================
// supervisor.cpp — implementation for supervisor.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "p100link/supervisor.hpp"
#include "p100link/command.hpp"
#include "p100link/frame_codec.hpp"
#include "p100link/log.hpp"

#include <algorithm>
#include <utility>

namespace p100link {

using transport::ITransport;
using transport::RxResult;
using transport::TxResult;

static const char* COMPONENT = "supervisor";

const char* connection_state_name(ConnectionState s) {
  switch (s) {
    case ConnectionState::Disconnected: return "disconnected";
    case ConnectionState::Connecting:   return "connecting";
    case ConnectionState::Connected:    return "connected";
    case ConnectionState::Reconnecting: return "reconnecting";
  }
  return "disconnected";
}

ReconnectSupervisor::ReconnectSupervisor(Correlator& correlator, TransportFactory factory,
                                         SupervisorOptions opts)
: corr_(correlator), factory_(std::move(factory)), opts_(opts),
  backoff_(opts.reconnect_base_ms), feedback_(opts.feedback_level) {
  corr_.set_writer([this](const std::string& wire, Error& err) { return write_frame(wire, err); });
}

ReconnectSupervisor::~ReconnectSupervisor() {
  stop();
  corr_.set_writer(nullptr);
}

// ---------------------------------------------------------------------------
// Accessors
// ---------------------------------------------------------------------------
ConnectionState ReconnectSupervisor::state() const {
  std::lock_guard<std::mutex> lk(mu_);
  return state_;
}

bool ReconnectSupervisor::running() const {
  std::lock_guard<std::mutex> lk(mu_);
  return running_;
}

std::chrono::milliseconds ReconnectSupervisor::backoff() const {
  std::lock_guard<std::mutex> lk(mu_);
  return backoff_;
}

bool ReconnectSupervisor::wait_for_state(ConnectionState s, std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lk(mu_);
  return cv_.wait_for(lk, timeout, [&] { return state_ == s; });
}

void ReconnectSupervisor::set_state_listener(StateListener fn) {
  std::lock_guard<std::mutex> lk(mu_);
  state_listener_ = std::move(fn);
}

void ReconnectSupervisor::set_tap(Tap fn) {
  std::lock_guard<std::mutex> lk(tap_mu_);
  tap_ = std::move(fn);
}

void ReconnectSupervisor::set_feedback_level(FeedbackLevel level) {
  std::lock_guard<std::mutex> lk(mu_);
  feedback_ = level;
}

FeedbackLevel ReconnectSupervisor::feedback_level() const {
  std::lock_guard<std::mutex> lk(mu_);
  return feedback_;
}

void ReconnectSupervisor::set_state(ConnectionState s) {
  StateListener fn;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (state_ == s) return;
    state_ = s;
    fn = state_listener_;
  }
  cv_.notify_all();
  log::info(COMPONENT, std::string("msg=state state=") + connection_state_name(s));
  if (fn) fn(s);
}

void ReconnectSupervisor::tap(Direction d, const std::string& line) {
  std::lock_guard<std::mutex> lk(tap_mu_);
  if (tap_) tap_(d, line);
}

// ---------------------------------------------------------------------------
// start() / stop()
// ---------------------------------------------------------------------------
bool ReconnectSupervisor::start(Error& err) {
  {
    std::unique_lock<std::mutex> lk(mu_);
    if (running_) return true;
  }
  if (thread_.joinable()) thread_.join();   // previous run that stopped itself

  {
    std::lock_guard<std::mutex> lk(mu_);
    running_ = true;
    stop_ = false;
    lost_ = false;
    first_done_ = false;
    first_ok_ = false;
    first_err_.clear();
    backoff_ = std::chrono::milliseconds(opts_.reconnect_base_ms);
  }
  set_state(ConnectionState::Connecting);
  thread_ = std::thread([this] { run(); });

  std::unique_lock<std::mutex> lk(mu_);
  cv_.wait(lk, [&] { return first_done_; });
  if (first_ok_) return true;

  err = first_err_;
  lk.unlock();
  if (thread_.joinable()) thread_.join();
  return false;
}

void ReconnectSupervisor::stop() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    stop_ = true;
  }
  cv_.notify_all();
  corr_.abort(ErrorCode::ConnectionLost, "disconnect requested");
  if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) thread_.join();
  {
    std::lock_guard<std::mutex> lk(mu_);
    running_ = false;
  }
  set_state(ConnectionState::Disconnected);
}

// ---------------------------------------------------------------------------
// run()
// -----
// Supervisor thread body. The first attempt is special: its outcome is
// handed back to start(), and a failure ends the thread.
// ---------------------------------------------------------------------------
void ReconnectSupervisor::run() {
  bool first = true;

  for (;;) {
    Error err;
    const bool ok = connect_once(err);

    if (first) {
      first = false;
      {
        std::lock_guard<std::mutex> lk(mu_);
        first_done_ = true;
        first_ok_ = ok;
        first_err_ = err;
        if (!ok) running_ = false;
      }
      cv_.notify_all();
      if (!ok) {
        log::warn(COMPONENT, std::string("msg=connect_failed reason=") + err.reason() +
                             " detail=\"" + err.detail + "\"");
        set_state(ConnectionState::Disconnected);
        return;
      }
    }

    if (ok) {
      const auto up_since = Clock::now();
      {
        std::unique_lock<std::mutex> lk(mu_);
        cv_.wait(lk, [&] { return stop_ || lost_; });
      }
      teardown("link lost");

      std::lock_guard<std::mutex> lk(mu_);
      if (stop_) break;
      if (Clock::now() - up_since >= std::chrono::milliseconds(opts_.reconnect_stable_ms))
        backoff_ = std::chrono::milliseconds(opts_.reconnect_base_ms);
    } else {
      log::warn(COMPONENT, std::string("msg=connect_failed reason=") + err.reason() +
                           " detail=\"" + err.detail + "\"");
    }

    std::chrono::milliseconds delay;
    {
      std::lock_guard<std::mutex> lk(mu_);
      if (stop_) break;
      delay = backoff_;
    }
    set_state(ConnectionState::Reconnecting);
    log::warn(COMPONENT, "msg=reconnect_in ms=" + std::to_string(delay.count()));

    std::unique_lock<std::mutex> lk(mu_);
    if (cv_.wait_for(lk, delay, [&] { return stop_; })) break;
    backoff_ = std::min(backoff_ * 2, std::chrono::milliseconds(opts_.reconnect_max_ms));
  }

  teardown("stopped");
}

// ---------------------------------------------------------------------------
// connect_once()
// --------------
// One attempt: open a fresh transport, start its reader, negotiate the
// feedback level behind the handshake gate, then open the gate.
// ---------------------------------------------------------------------------
bool ReconnectSupervisor::connect_once(Error& err) {
  std::unique_ptr<ITransport> t = factory_ ? factory_() : nullptr;
  if (!t) {
    err.set(ErrorCode::InvalidArgument, "no transport configured");
    return false;
  }
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (stop_) { err.set(ErrorCode::ConnectionLost, "stopped"); return false; }
  }

  log::info(COMPONENT, std::string("msg=connecting transport=") + t->name() +
                       " endpoint=" + t->endpoint());
  if (!t->connect(err)) return false;

  ITransport* raw = t.get();
  {
    std::lock_guard<std::mutex> lk(tx_mu_);
    transport_ = std::move(t);
  }
  {
    std::lock_guard<std::mutex> lk(mu_);
    lost_ = false;
  }
  reader_stop_.store(false);
  corr_.set_gate(Correlator::Gate::Handshake);
  reader_ = std::thread([this, raw] { reader_loop(raw); });

  if (!negotiate(err)) {
    teardown("handshake failed");
    return false;
  }

  bool abandoned;
  {
    std::lock_guard<std::mutex> lk(mu_);
    abandoned = stop_ || lost_;
  }
  if (abandoned) {
    err.set(ErrorCode::ConnectionLost, "link lost during handshake");
    teardown("handshake aborted");
    return false;
  }
  corr_.set_gate(Correlator::Gate::Open);
  ++epoch_;
  set_state(ConnectionState::Connected);
  log::info(COMPONENT, "msg=connected epoch=" + std::to_string(epoch_.load()));
  return true;
}

// ---------------------------------------------------------------------------
// negotiate()
// -----------
// VERB(n) fixes the feedback level for this physical connection. Some
// firmware never answers it; a timeout is tolerated and the level is taken
// as set. Anything else (the link dropping) fails the attempt.
// ---------------------------------------------------------------------------
bool ReconnectSupervisor::negotiate(Error& err) {
  const FeedbackLevel level = feedback_level();
  Command cmd = make_feedback_level(level, std::chrono::milliseconds(opts_.command_timeout_ms));

  std::shared_ptr<PendingRequest> req;
  Response resp;
  Error e;
  if (corr_.submit(cmd, req, e, /*handshake*/true) && corr_.wait(req, resp, e)) {
    log::info(COMPONENT, std::string("msg=feedback_level level=") + feedback_level_name(level));
    return true;
  }
  if (e.code == ErrorCode::Timeout) {
    log::info(COMPONENT, std::string("msg=feedback_level level=") + feedback_level_name(level) +
                         " unacknowledged=1");
    return true;
  }
  err = e;
  return false;
}

// ---------------------------------------------------------------------------
// reader_loop()
// -------------
// Per-connection thread: read, decode, route. Also the second place where
// command deadlines are enforced, so an abandoned request still expires.
// ---------------------------------------------------------------------------
void ReconnectSupervisor::reader_loop(ITransport* t) {
  FrameDecoder dec;
  uint8_t buf[512];
  std::size_t overflows_seen = 0;

  while (!reader_stop_.load()) {
    std::size_t n = 0;
    const RxResult r = t->read(buf, sizeof(buf), n, opts_.read_timeout_ms);

    if (r == RxResult::Error) {
      signal_lost("read failed");
      break;
    }
    if (r == RxResult::Ok && n > 0) {
      for (const Frame& f : dec.feed(buf, n)) {
        tap(Direction::Rx, frame_line(f));
        corr_.on_frame(f);
      }
      if (dec.overflow_count() != overflows_seen) {
        corr_.note_malformed(dec.overflow_count() - overflows_seen);
        overflows_seen = dec.overflow_count();
      }
    }
    corr_.check_deadline();
  }
}

bool ReconnectSupervisor::write_frame(const std::string& wire, Error& err) {
  TxResult r;
  {
    std::lock_guard<std::mutex> lk(tx_mu_);
    if (!transport_) {
      err.set(ErrorCode::NotConnected, "no link");
      return false;
    }
    r = transport_->write(reinterpret_cast<const uint8_t*>(wire.data()), wire.size());
  }
  if (r == TxResult::Ok) {
    std::string line = wire;
    if (!line.empty() && line.back() == TERMINATOR) line.pop_back();
    tap(Direction::Tx, line);
    return true;
  }
  err.set(ErrorCode::ConnectionLost, r == TxResult::Busy ? "write stalled" : "write failed");
  signal_lost(err.detail);
  return false;
}

// signal_lost()
// -------------
// Called from the reader or a writer. Fails the pending command right away;
// the supervisor thread does the actual teardown.
void ReconnectSupervisor::signal_lost(const std::string& detail) {
  log::warn(COMPONENT, "msg=link_lost reason=connection_lost detail=\"" + detail + "\"");
  corr_.abort(ErrorCode::ConnectionLost, detail);
  {
    std::lock_guard<std::mutex> lk(mu_);
    lost_ = true;
  }
  cv_.notify_all();
}

// teardown()
// ----------
// Order matters: close the gate first so nothing new is written, then join
// the reader, and only then destroy the transport it was using.
void ReconnectSupervisor::teardown(const std::string& detail) {
  corr_.abort(ErrorCode::ConnectionLost, detail);
  reader_stop_.store(true);
  if (reader_.joinable()) reader_.join();
  std::lock_guard<std::mutex> lk(tx_mu_);
  if (transport_) {
    transport_->close();
    transport_.reset();
  }
}

} // namespace p100link
