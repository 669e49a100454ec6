#pragma once
/**
 * @file session.hpp
 * @brief One controlled processor: the object every facade is built on.
 *
 * @details
 * A Session is constructed explicitly (there is no global instance) and owns
 * the whole engine for one device:
 *
 *   DeviceStateCache  <- Correlator <- CommandQueue      (callers)
 *                           ^
 *                   ReconnectSupervisor -> ITransport    (read loop)
 *
 * Facades keep a reference to the Session and must not outlive it.
 *
 * EXAMPLE
 * -------
 *   p100link::Config cfg;
 *   cfg.host = "192.168.1.40";
 *   p100link::Session s(cfg);
 *   p100link::Error err;
 *   if (!s.connect(err)) { ... err.reason() ... }
 *   p100link::VolumeControl vol(s, p100link::Zone::Main);
 *   int tenths = 0;
 *   vol.get(tenths, err);   // -350 == -35.0 dB
 */

#include "p100link/command.hpp"
#include "p100link/command_queue.hpp"
#include "p100link/config.hpp"
#include "p100link/correlator.hpp"
#include "p100link/device_state.hpp"
#include "p100link/error.hpp"
#include "p100link/supervisor.hpp"
#include "p100link/transport/transport_base.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <utility>

namespace p100link {

/// Build the transport named by @p cfg (TCP or serial). Never null.
std::unique_ptr<transport::ITransport> make_transport(const Config& cfg);

class Session {
public:
  using TransportFactory = ReconnectSupervisor::TransportFactory;
  using Monitor          = ReconnectSupervisor::Tap;
  using StateListener    = DeviceStateCache::Listener;

  explicit Session(Config cfg);
  Session(Config cfg, TransportFactory factory);
  ~Session();

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  /// Blocks until the first connection attempt succeeded or failed.
  bool connect(Error& err);
  void disconnect();

  /// Run one command through the FIFO queue and wait for its response.
  bool execute(const Command& cmd, Response& resp, Error& err,
               const CancelToken* cancel = nullptr);

  /// execute() for single-reply queries: yields the first resolving line,
  /// or MalformedFrame if the command resolved without one.
  bool query(const Command& cmd, StatusLine& line, Error& err,
             const CancelToken* cancel = nullptr);

  DeviceState state_snapshot() const { return cache_.snapshot(); }
  int  subscribe(StateListener fn) { return cache_.subscribe(std::move(fn)); }
  void unsubscribe(int id) { cache_.unsubscribe(id); }

  /// Raw TX/RX line tap; pass an empty function to remove it.
  void set_monitor(Monitor fn) { supervisor_.set_tap(std::move(fn)); }

  /// The level is fixed for one physical connection: a change is recorded
  /// here and negotiated with VERB(n) on the next connect or reconnect.
  void set_feedback_level(FeedbackLevel level) { supervisor_.set_feedback_level(level); }
  FeedbackLevel feedback_level() const { return supervisor_.feedback_level(); }

  ConnectionState connection_state() const { return supervisor_.state(); }
  uint64_t        connection_epoch() const { return supervisor_.epoch(); }
  bool wait_for_state(ConnectionState s, std::chrono::milliseconds timeout) const {
    return supervisor_.wait_for_state(s, timeout);
  }
  void set_connection_listener(ReconnectSupervisor::StateListener fn) {
    supervisor_.set_state_listener(std::move(fn));
  }

  Correlator::Counters counters() const { return correlator_.counters(); }

  const Config& config() const { return cfg_; }
  std::chrono::milliseconds command_timeout() const {
    return std::chrono::milliseconds(cfg_.command_timeout_ms);
  }

private:
  Config           cfg_;
  DeviceStateCache cache_;
  Correlator       correlator_;
  CommandQueue     queue_;
  ReconnectSupervisor supervisor_;   // last: stopped before the rest go away
};

} // namespace p100link
