#pragma once
/**
 * @file transport_tcp.hpp
 * @brief TCP transport to the processor's control port (default 84).
 *
 * Resolves with getaddrinfo(), connects non-blocking with a bounded wait,
 * disables Nagle (lines are tiny and latency-sensitive) and enables
 * keepalive so a silently dead peer is eventually noticed by read().
 */

#include "p100link/transport/transport_base.hpp"

#include <cstdint>
#include <string>
#include <utility>

namespace p100link::transport {

class TcpTransport : public ITransport {
public:
  TcpTransport(std::string host, uint16_t port, int connect_timeout_ms)
  : host_(std::move(host)), port_(port), connect_timeout_ms_(connect_timeout_ms) {}

  ~TcpTransport() override { close(); }

  TcpTransport(const TcpTransport&) = delete;
  TcpTransport& operator=(const TcpTransport&) = delete;

  bool        connect(Error& err) override;
  void        close() override;
  TxResult    write(const uint8_t* data, std::size_t len) override;
  RxResult    read(uint8_t* out, std::size_t cap, std::size_t& out_len, int timeout_ms) override;
  const char* name() const override { return "tcp"; }
  std::string endpoint() const override { return host_ + ":" + std::to_string(port_); }

private:
  // Try one resolved address; returns a connected fd or -1 (errno-ish code in last_err).
  int connect_one(const void* addr, unsigned addrlen, int family, int& last_err);

  int fd_{-1};
  std::string host_;
  uint16_t port_{84};
  int connect_timeout_ms_{10000};
};

} // namespace p100link::transport
