#pragma once
/**
 * @file transport_serial.hpp
 * @brief RS-232 transport (termios, non-blocking, poll-driven).
 */

#if !defined(__linux__)
#  error "transport_serial.hpp is Linux-only."
#endif

#include "p100link/transport/transport_base.hpp"

#include <string>
#include <utility>

namespace p100link::transport {

class SerialTransport : public ITransport {
public:
  explicit SerialTransport(std::string dev_path, int baud = 115200)
  : dev_path_(std::move(dev_path)), baud_(baud) {}

  ~SerialTransport() override { close(); }

  SerialTransport(const SerialTransport&) = delete;
  SerialTransport& operator=(const SerialTransport&) = delete;

  bool        connect(Error& err) override;
  void        close() override;
  TxResult    write(const uint8_t* data, std::size_t len) override;
  RxResult    read(uint8_t* out, std::size_t cap, std::size_t& out_len, int timeout_ms) override;
  const char* name() const override { return "serial"; }
  std::string endpoint() const override { return dev_path_ + "@" + std::to_string(baud_); }

private:
  int fd_{-1};
  std::string dev_path_;
  int baud_{115200};
};

} // namespace p100link::transport
