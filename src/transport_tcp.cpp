// ============================================================================
// transport_tcp.cpp — implementation for transport/transport_tcp.hpp
// ============================================================================

#include "p100link/transport/transport_tcp.hpp"
#include "p100link/serial_io.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace p100link::transport {

// connect_one()
// -------------
// Non-blocking connect so the wait is bounded by connect_timeout_ms_; the
// outcome is read back with SO_ERROR once the socket turns writable.
int TcpTransport::connect_one(const void* addr, unsigned addrlen, int family, int& last_err) {
  int fd = ::socket(family, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd < 0) { last_err = errno; return -1; }

  int flags = ::fcntl(fd, F_GETFL, 0);
  ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);

  int rc = ::connect(fd, static_cast<const sockaddr*>(addr), static_cast<socklen_t>(addrlen));
  if (rc != 0 && errno != EINPROGRESS) {
    last_err = errno;
    ::close(fd);
    return -1;
  }

  if (rc != 0) {
    pollfd pfd{fd, POLLOUT, 0};
    int pr;
    do {
      pr = ::poll(&pfd, 1, connect_timeout_ms_);
    } while (pr < 0 && errno == EINTR);

    if (pr == 0) { last_err = ETIMEDOUT; ::close(fd); return -1; }
    if (pr < 0)  { last_err = errno;     ::close(fd); return -1; }

    int so_err = 0;
    socklen_t len = sizeof(so_err);
    if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_err, &len) != 0) so_err = errno;
    if (so_err != 0) { last_err = so_err; ::close(fd); return -1; }
  }

  int one = 1;
  ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
  ::setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &one, sizeof(one));
  return fd;
}

bool TcpTransport::connect(Error& err) {
  if (fd_ >= 0) return true;
  if (host_.empty()) {
    err.set(ErrorCode::InvalidArgument, "host is empty");
    return false;
  }

  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  addrinfo* res = nullptr;
  const std::string port = std::to_string(port_);
  int gai = ::getaddrinfo(host_.c_str(), port.c_str(), &hints, &res);
  if (gai != 0 || !res) {
    err.set(ErrorCode::ConnectionLost,
            "resolve " + host_ + " failed: " + ::gai_strerror(gai));
    if (res) ::freeaddrinfo(res);
    return false;
  }

  int last_err = 0;
  for (addrinfo* ai = res; ai && fd_ < 0; ai = ai->ai_next) {
    fd_ = connect_one(ai->ai_addr, ai->ai_addrlen, ai->ai_family, last_err);
  }
  ::freeaddrinfo(res);

  if (fd_ < 0) {
    err.set(ErrorCode::ConnectionLost,
            "connect " + endpoint() + " failed: " + std::strerror(last_err));
    return false;
  }
  return true;
}

void TcpTransport::close() {
  if (fd_ >= 0) ::shutdown(fd_, SHUT_RDWR);
  close_fd(fd_);
  fd_ = -1;
}

TxResult TcpTransport::write(const uint8_t* data, std::size_t len) {
  return write_all(fd_, data, len, 1000, /*is_socket*/true);
}

RxResult TcpTransport::read(uint8_t* out, std::size_t cap, std::size_t& out_len, int timeout_ms) {
  return read_some(fd_, out, cap, out_len, timeout_ms);
}

} // namespace p100link::transport
