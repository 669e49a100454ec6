#pragma once
/**
 * @file correlator.hpp
 * @brief Single-slot command/response correlation over an unlabelled stream.
 *
 * @details
 * PURPOSE
 * -------
 * The processor never tags a reply with the command that caused it, and
 * unsolicited status pushes share the same stream. The correlator therefore
 * keeps exactly one command in flight and decides, frame by frame, whether an
 * inbound status belongs to it (by the command's ResponseMatcher) or is an
 * unsolicited update for the device state cache.
 *
 * STATES
 * ------
 *   Idle  --submit()-->  Awaiting  --match | timeout | abort-->  Idle
 *
 * Independently of Idle/Awaiting there is a gate, driven by the supervisor:
 *
 *   Closed     no link; submit() fails with NotConnected
 *   Handshake  link up, feedback level being negotiated; only handshake
 *              submits are accepted
 *   Open       normal operation
 *
 * FRAME ROUTING
 * -------------
 * - Status, Awaiting: offered to the matcher. Miss => unsolicited (applied to
 *   state, slot kept). Collect => appended to the response. Done => resolves;
 *   a single-frame reply is applied to state too, list items are not.
 * - Status, Idle: unsolicited; applied when it names an observable.
 * - Echo: counted and logged at debug level, never resolves anything.
 * - Unrecognized, or an unparsable status payload: counted as malformed.
 *
 * THREADING
 * ---------
 * on_frame() and check_deadline() come from the read loop; submit() and
 * wait() from callers. One mutex guards the slot. The writer is called with
 * that mutex released, and subscribers are published after it is released.
 */

#include "p100link/command.hpp"
#include "p100link/device_state.hpp"
#include "p100link/error.hpp"
#include "p100link/frame_codec.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace p100link {

/// Caller-owned cancellation flag, polled by every blocking wait.
class CancelToken {
public:
  void cancel() { flag_.store(true); }
  bool cancelled() const { return flag_.load(); }
private:
  std::atomic<bool> flag_{false};
};

using Clock = std::chrono::steady_clock;

/// The in-flight command. Fields other than `cmd` are guarded by the
/// correlator mutex; callers only hold the pointer as a handle for wait().
struct PendingRequest {
  Command           cmd;
  Clock::time_point deadline;
  MatchProgress     progress;
  Response          response;
  bool              resolved{false};
  Error             error;
};

class Correlator {
public:
  enum class Gate : uint8_t { Closed, Handshake, Open };

  /// Writes one encoded frame. Returns false and fills @p err on failure.
  using Writer = std::function<bool(const std::string& wire, Error& err)>;

  struct Counters {
    uint64_t submitted{0};
    uint64_t resolved{0};
    uint64_t timeouts{0};
    uint64_t unsolicited{0};
    uint64_t echoes{0};
    uint64_t malformed{0};
  };

  explicit Correlator(DeviceStateCache& cache) : cache_(cache) {}

  Correlator(const Correlator&) = delete;
  Correlator& operator=(const Correlator&) = delete;

  void set_writer(Writer w);
  void set_gate(Gate g);
  Gate gate() const;

  /// Arm the slot and write the command. Fails with NotConnected (gate) or
  /// Busy (slot taken). A None-matcher command is resolved before returning.
  bool submit(const Command& cmd, std::shared_ptr<PendingRequest>& out, Error& err,
              bool handshake = false);

  /// Block until @p req resolves, its deadline passes, or @p cancel fires.
  /// Cancelling leaves the request armed; it still resolves on its own.
  bool wait(const std::shared_ptr<PendingRequest>& req, Response& resp, Error& err,
            const CancelToken* cancel = nullptr);

  /// Block until the slot is free. False only when cancelled.
  bool wait_idle(const CancelToken* cancel = nullptr);

  bool idle() const;

  void on_frame(const Frame& frame);
  void check_deadline(Clock::time_point now = Clock::now());

  /// Close the gate and resolve the pending request (if any) with @p code.
  void abort(ErrorCode code, const std::string& detail);

  /// Account for frames the decoder dropped before they reached us.
  void note_malformed(uint64_t n);

  Counters counters() const;

private:
  // Requires mu_. Resolves @p req once; later calls are no-ops.
  void resolve_locked(const std::shared_ptr<PendingRequest>& req, ErrorCode code,
                      const std::string& detail);

  DeviceStateCache& cache_;
  Writer writer_;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::shared_ptr<PendingRequest> pending_;
  Gate gate_{Gate::Closed};
  Counters counters_;
};

} // namespace p100link
