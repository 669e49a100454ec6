// ============================================================================
// serial_io.cpp — implementation for serial_io.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "p100link/serial_io.hpp"

#include <fcntl.h>
#include <poll.h>
#include <sys/socket.h>    // ::send + MSG_NOSIGNAL for sockets
#include <termios.h>
#include <unistd.h>
#include <cerrno>

namespace p100link {

using transport::RxResult;
using transport::TxResult;

// ---------------------------------------------------------------------------
// configure_tty()
// ---------------
// Raw 8N1 at @p speed, no RTS/CTS and no XON/XOFF (the processor's port uses
// neither). VMIN/VTIME are zero because read_some() does its own waiting.
// Stale input from before the open is discarded.
// ---------------------------------------------------------------------------
static bool configure_tty(int fd, speed_t speed) {
    termios t{};
    if (tcgetattr(fd, &t) != 0) return false;

    cfmakeraw(&t);
    if (cfsetispeed(&t, speed) != 0 || cfsetospeed(&t, speed) != 0) return false;

    t.c_cflag |= CLOCAL | CREAD;
    t.c_cflag &= ~CRTSCTS;
    t.c_iflag &= ~(IXON | IXOFF | IXANY);
    t.c_cc[VMIN]  = 0;
    t.c_cc[VTIME] = 0;

    if (tcsetattr(fd, TCSANOW, &t) != 0) return false;
    return tcflush(fd, TCIOFLUSH) == 0;
}

struct BaudEntry { int rate; speed_t code; };

static const BaudEntry BAUD_TABLE[] = {
    {9600, B9600}, {19200, B19200}, {38400, B38400}, {57600, B57600},
    {115200, B115200},
#ifdef B230400
    {230400, B230400},
#endif
};

static const BaudEntry* find_baud(int baud) {
    for (const auto& e : BAUD_TABLE)
        if (e.rate == baud) return &e;
    return nullptr;
}

bool baud_supported(int baud) { return find_baud(baud) != nullptr; }

std::vector<int> supported_baud_rates() {
    std::vector<int> out;
    for (const auto& e : BAUD_TABLE) out.push_back(e.rate);
    return out;
}


// ---------------------------------------------------------------------------
// open_serial()
// -------------
// An unsupported rate fails with EINVAL before the port is touched.
// O_NOCTTY keeps the port from becoming our controlling terminal. A port
// that refuses raw mode is closed again; errno is preserved for the caller.
// ---------------------------------------------------------------------------
int open_serial(const std::string& dev, int baud) {
    const BaudEntry* rate = find_baud(baud);
    if (!rate) {
        errno = EINVAL;
        return -1;
    }
    const int fd = ::open(dev.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd < 0) return -1;

    if (!configure_tty(fd, rate->code)) {
        int saved = errno;
        ::close(fd);
        errno = saved;
        return -1;
    }
    return fd;
}


// ---------------------------------------------------------------------------
// write_all()
// -----------
// Lines are short (a few dozen bytes) so a single write() nearly always
// suffices; the loop covers the odd partial write on a congested socket.
// ---------------------------------------------------------------------------
TxResult write_all(int fd, const uint8_t* data, std::size_t len, int timeout_ms, bool is_socket) {
    if (fd < 0 || !data) return TxResult::Error;

    std::size_t off = 0;
    while (off < len) {
        ssize_t w = is_socket ? ::send(fd, data + off, len - off, MSG_NOSIGNAL)
                              : ::write(fd, data + off, len - off);
        if (w > 0) { off += static_cast<std::size_t>(w); continue; }
        if (w < 0 && errno == EINTR) continue;
        if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            pollfd pfd{fd, POLLOUT, 0};
            int pr = ::poll(&pfd, 1, timeout_ms);
            if (pr == 0) return TxResult::Busy;   // peer not draining
            if (pr < 0 && errno != EINTR) return TxResult::Error;
            if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) return TxResult::Error;
            continue;
        }
        return TxResult::Error;
    }
    return TxResult::Ok;
}


// ---------------------------------------------------------------------------
// read_some()
// -----------
// One poll() + one read(). The descriptor is non-blocking, so poll() owns
// the waiting and read() just drains what is there.
// ---------------------------------------------------------------------------
RxResult read_some(int fd, uint8_t* out, std::size_t cap, std::size_t& out_len, int timeout_ms) {
    out_len = 0;
    if (fd < 0 || !out || cap == 0) return RxResult::Error;

    pollfd pfd{fd, POLLIN, 0};
    int pr = ::poll(&pfd, 1, timeout_ms);
    if (pr == 0) return RxResult::None;           // timeout expired
    if (pr < 0) return errno == EINTR ? RxResult::None : RxResult::Error;

    if (pfd.revents & POLLIN) {
        ssize_t n = ::read(fd, out, cap);
        if (n > 0) { out_len = static_cast<std::size_t>(n); return RxResult::Ok; }
        if (n == 0) return RxResult::Error;       // orderly shutdown by peer
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return RxResult::None;
        return RxResult::Error;
    }
    if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) return RxResult::Error;
    return RxResult::None;
}


// ---------------------------------------------------------------------------
// close_fd()
// ----------
// Close a fd if valid (>=0).
// ---------------------------------------------------------------------------
void close_fd(int fd) {
    if (fd >= 0) ::close(fd);
}

} // namespace p100link
