/**
 * @file serial_io.hpp
 * @brief POSIX descriptor helpers shared by the TCP and serial transports.
 *
 * @details
 * PURPOSE
 * -------
 * Both links end up as a plain file descriptor: a TCP socket or a TTY in raw
 * mode. This header declares the small set of syscalls-with-poll needed to
 * move bytes over either one, so the transports only differ in how they open
 * the descriptor.
 *
 * - p100link::open_serial: acquire a descriptor to a TTY, set raw 8N1 mode,
 *   flush whatever the port buffered before we opened it.
 * - p100link::write_all: write a whole buffer, waiting (bounded) for POLLOUT.
 * - p100link::read_some: wait up to a timeout for readable bytes and read them.
 * - p100link::close_fd: close the descriptor if valid.
 *
 * OPERATIONAL NOTES
 * -----------------
 * - Device selection: prefer /dev/serial/by-id/... paths for RS-232 adapters.
 * - Permissions: the runtime user needs the dialout group (or equivalent).
 * - read_some distinguishes a clean timeout (None) from a dead link (Error):
 *   EOF on a socket or POLLHUP/POLLERR is reported as Error.
 * - Concurrency: one reader plus one writer per descriptor is fine; two
 *   writers need external synchronization (the supervisor provides it).
 *
 * @note Linux-first. Baud table covers the rates the processor supports.
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "p100link/transport/transport_base.hpp"

namespace p100link {

/**
 * @brief Open a TTY, configure raw 8N1 at @p baud, return its descriptor.
 *
 * Opens with O_RDWR | O_NOCTTY | O_NONBLOCK, applies raw mode (no echo, no
 * line processing, no flow control), maps the baud through a small table
 * (9600..230400) and flushes stale input.
 *
 * @return descriptor (>= 0) or -1 with errno set (EINVAL for a baud rate
 *         outside the table).
 */
int open_serial(const std::string& dev, int baud = 115200);

/// Whether @p baud is one of the rates open_serial() accepts.
bool baud_supported(int baud);

/// The accepted rates, ascending.
std::vector<int> supported_baud_rates();

/**
 * @brief Write all @p len bytes to @p fd.
 *
 * Loops over partial writes. When the descriptor would block, waits up to
 * @p timeout_ms for POLLOUT before giving up with TxResult::Busy.
 * With @p is_socket the bytes go out through send(MSG_NOSIGNAL) so a reset
 * peer yields EPIPE instead of killing the process with SIGPIPE.
 */
transport::TxResult write_all(int fd, const uint8_t* data, std::size_t len,
                              int timeout_ms = 1000, bool is_socket = false);

/**
 * @brief Wait up to @p timeout_ms for input and read what is available.
 *
 * @return None on timeout (or EINTR), Ok with out_len > 0 on data,
 *         Error on EOF, hangup or a read/poll failure.
 */
transport::RxResult read_some(int fd, uint8_t* out, std::size_t cap, std::size_t& out_len, int timeout_ms);

/// Close @p fd if non-negative.
void close_fd(int fd);

} // namespace p100link
