#pragma once
/**
 * @file supervisor.hpp
 * @brief Owns the transport, runs the read loop, reconnects with backoff.
 *
 * @details
 * PURPOSE
 * -------
 * The supervisor is the only component that knows a physical link exists.
 * It creates a fresh transport per attempt through a factory, runs one
 * reader thread per connection that feeds decoded frames to the correlator,
 * negotiates the feedback level, and opens the correlator gate. When the
 * link drops it closes the gate (the pending command fails with
 * ConnectionLost), tears the link down and tries again.
 *
 * STATE MACHINE
 * -------------
 *   Disconnected --start()--> Connecting --ok + VERB(n)--> Connected
 *        ^                        |                          |
 *        |       first attempt failed                   link lost
 *        |                        v                          v
 *        +------ stop() ------ Disconnected       Reconnecting --ok--> Connected
 *
 * BACKOFF
 * -------
 * After a failed attempt or a dropped link the supervisor sleeps the current
 * backoff (interruptible by stop()), then doubles it up to the ceiling. A
 * link that stayed up for the stable period resets it to the base first.
 *
 * THREADS
 * -------
 * One supervisor thread for the lifetime between start() and stop(), one
 * reader thread per physical connection. Callbacks (state listener, monitor
 * tap) run on those threads and must not call stop().
 */

#include "p100link/correlator.hpp"
#include "p100link/error.hpp"
#include "p100link/protocol.hpp"
#include "p100link/transport/transport_base.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace p100link {

enum class ConnectionState : uint8_t { Disconnected, Connecting, Connected, Reconnecting };

const char* connection_state_name(ConnectionState s);

/// Direction of a monitored line.
enum class Direction : uint8_t { Tx, Rx };

struct SupervisorOptions {
  int reconnect_base_ms{1000};
  int reconnect_max_ms{30000};
  int reconnect_stable_ms{60000};
  int command_timeout_ms{DEFAULT_COMMAND_TIMEOUT_MS};   ///< used for the VERB(n) handshake
  int read_timeout_ms{100};                             ///< read loop poll period
  FeedbackLevel feedback_level{FeedbackLevel::StatusUpdates};
};

class ReconnectSupervisor {
public:
  using TransportFactory = std::function<std::unique_ptr<transport::ITransport>()>;
  using StateListener    = std::function<void(ConnectionState)>;
  using Tap              = std::function<void(Direction, const std::string& line)>;

  ReconnectSupervisor(Correlator& correlator, TransportFactory factory, SupervisorOptions opts);
  ~ReconnectSupervisor();

  ReconnectSupervisor(const ReconnectSupervisor&) = delete;
  ReconnectSupervisor& operator=(const ReconnectSupervisor&) = delete;

  /// Start the supervisor and block until the first attempt's outcome.
  /// On failure the supervisor is stopped again and @p err says why.
  bool start(Error& err);

  /// Stop reconnecting, abort pending work, close the link. Idempotent.
  void stop();

  ConnectionState state() const;
  uint64_t        epoch() const { return epoch_.load(); }
  bool            running() const;

  bool wait_for_state(ConnectionState s, std::chrono::milliseconds timeout) const;

  void set_state_listener(StateListener fn);
  void set_tap(Tap fn);

  /// Level negotiated on the next (re)connect.
  void          set_feedback_level(FeedbackLevel level);
  FeedbackLevel feedback_level() const;

  /// Current backoff delay (what the next failure will sleep).
  std::chrono::milliseconds backoff() const;

private:
  void run();
  bool connect_once(Error& err);
  bool negotiate(Error& err);
  void reader_loop(transport::ITransport* t);
  void signal_lost(const std::string& detail);
  void teardown(const std::string& detail);
  void set_state(ConnectionState s);
  void tap(Direction d, const std::string& line);
  bool write_frame(const std::string& wire, Error& err);

  Correlator&       corr_;
  TransportFactory  factory_;
  SupervisorOptions opts_;

  // Lifecycle, state and wakeups for the supervisor thread.
  mutable std::mutex mu_;
  mutable std::condition_variable cv_;
  std::thread thread_;
  bool running_{false};
  bool stop_{false};
  bool lost_{false};
  bool first_done_{false};
  bool first_ok_{false};
  Error first_err_;
  ConnectionState state_{ConnectionState::Disconnected};
  std::chrono::milliseconds backoff_{1000};
  FeedbackLevel feedback_{FeedbackLevel::StatusUpdates};
  StateListener state_listener_;

  // The live link. Writers hold tx_mu_; the reader only runs while the
  // transport exists and is joined before it is destroyed.
  std::mutex tx_mu_;
  std::unique_ptr<transport::ITransport> transport_;
  std::thread reader_;
  std::atomic<bool> reader_stop_{false};

  std::mutex tap_mu_;
  Tap tap_;

  std::atomic<uint64_t> epoch_{0};
};

} // namespace p100link
