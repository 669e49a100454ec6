#pragma once
/**
 * @file transport_base.hpp
 * @brief Byte-stream transport interface used by the reconnection supervisor.
 *
 * One instance represents one physical connection attempt. It is not
 * restartable: after close() or a read/write error, the supervisor discards it
 * and asks its factory for a fresh one.
 */

#include "p100link/error.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace p100link::transport {

enum class TxResult : uint8_t { Ok=0, Busy=1, Error=2 };
enum class RxResult : uint8_t { None=0, Ok=1, Error=2 };

/**
 * @brief Transport trait every link implementation provides.
 *
 * Contract:
 *  - connect(err) opens the socket/port; false + err on failure. No retries.
 *  - write(buf,len) writes all bytes or reports Error/Busy. Never blocks for long.
 *  - read(buf,cap,n,timeout_ms) waits up to timeout_ms for data.
 *      None  : nothing arrived in time (the caller loops)
 *      Ok    : n > 0 bytes placed in buf
 *      Error : I/O failure or peer closed; the connection is gone
 *  - close() releases the handle; idempotent.
 *  - name() is a short identifier for logs ("tcp", "serial").
 *
 * Threading: one reader thread calls read() while callers may write();
 * close() is only called after the reader has been joined.
 */
class ITransport {
public:
  virtual ~ITransport() = default;
  virtual bool        connect(Error& err) = 0;
  virtual void        close() = 0;
  virtual TxResult    write(const uint8_t* data, std::size_t len) = 0;
  virtual RxResult    read(uint8_t* out, std::size_t cap, std::size_t& out_len, int timeout_ms) = 0;
  virtual const char* name() const = 0;
  virtual std::string endpoint() const = 0;
};

} // namespace p100link::transport
