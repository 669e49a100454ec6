// ============================================================================
// transport_serial.cpp — implementation for transport/transport_serial.hpp
// ============================================================================

#include "p100link/transport/transport_serial.hpp"
#include "p100link/serial_io.hpp"

#include <cerrno>
#include <cstring>
#include <string>

namespace p100link::transport {

bool SerialTransport::connect(Error& err) {
  if (fd_ >= 0) return true;
  if (dev_path_.empty()) {
    err.set(ErrorCode::InvalidArgument, "serial device path is empty");
    return false;
  }
  if (!baud_supported(baud_)) {
    err.set(ErrorCode::InvalidArgument, "unsupported baud rate " + std::to_string(baud_));
    return false;
  }
  fd_ = open_serial(dev_path_, baud_);
  if (fd_ < 0) {
    err.set(ErrorCode::ConnectionLost,
            "open " + dev_path_ + " failed: " + std::strerror(errno));
    return false;
  }
  return true;
}

void SerialTransport::close() {
  close_fd(fd_);
  fd_ = -1;
}

TxResult SerialTransport::write(const uint8_t* data, std::size_t len) {
  return write_all(fd_, data, len);
}

RxResult SerialTransport::read(uint8_t* out, std::size_t cap, std::size_t& out_len, int timeout_ms) {
  return read_some(fd_, out, cap, out_len, timeout_ms);
}

} // namespace p100link::transport
