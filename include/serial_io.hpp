/**
 * @page nv-serial-io-hdr NanoVNA Serial I/O API (Header)
 * @file serial_io.hpp
 * @brief POSIX helpers for opening a Linux TTY in raw mode and moving text bytes.
 *
 * @details
 * PURPOSE
 * -------
 * This header declares the small set of syscalls wrappers the Linux serial
 * transport is built from. It pairs with serial_io.cpp for the termios work
 * and with nanovna/transport/transport_linux_serial.hpp, which wraps these
 * functions behind the ITransport interface the driver core consumes.
 *
 * ROLE IN THE DRIVER
 * ------------------
 * - nanovna::open_serial: acquire a descriptor, set raw mode with the requested
 *   baud, data bits, parity and stop bits, flush any boot chatter.
 * - nanovna::write_bytes: push a command line out, looping over partial writes.
 * - nanovna::read_bytes: wait up to a timeout for readable bytes, then read
 *   whatever is available.
 * - nanovna::flush_input: drop stale bytes left over from an earlier reply.
 * - nanovna::close_serial: close the descriptor cleanly.
 *
 * DESIGN CHOICES
 * --------------
 * - Free functions, no class hierarchy, no hidden threads.
 * - Non-blocking descriptor; poll(2) provides the read timeout. The NanoVNA
 *   protocol is text, so there is no framing layer here: bytes in, bytes out.
 *
 * OPERATIONAL NOTES
 * -----------------
 * - Device selection: prefer /dev/serial/by-id/... for stable paths.
 * - Permissions: the runtime user must be in the dialout group (or similar).
 * - The NanoVNA enumerates as USB CDC ACM; the baud rate is nominal but
 *   must still be one termios accepts. Unknown values fall back to 9600.
 *
 * EXAMPLE
 * -------
 * @code
 *   nanovna::transport::SerialConfig cfg;
 *   cfg.path = "/dev/ttyACM0";
 *   std::string why;
 *   int fd = nanovna::open_serial(cfg, why);
 *   if (fd < 0) { // handle open failure (why says which step failed) }
 *
 *   const char cmd[] = "info\r";
 *   std::size_t n = 0;
 *   nanovna::write_bytes(fd, reinterpret_cast<const uint8_t*>(cmd), 5, n);
 *
 *   uint8_t buf[256];
 *   if (nanovna::read_bytes(fd, buf, sizeof buf, n, 1000) == nanovna::transport::IoResult::Ok) {
 *       // n bytes of reply in buf
 *   }
 *   nanovna::close_serial(fd);
 * @endcode
 *
 * Concurrency: do not share a single fd between threads without external
 * synchronization. The firmware is single-command-at-a-time anyway.
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

#include "nanovna/transport/transport_base.hpp"

namespace nanovna {

/**
 * @brief Open a Linux TTY device and configure it for raw I/O.
 *
 * What it does:
 *   - Opens cfg.path with O_RDWR | O_NOCTTY | O_NONBLOCK.
 *   - Applies raw mode with cfg.baud, cfg.data_bits, cfg.parity, cfg.stop_bits,
 *     no hardware flow control.
 *   - Flushes both directions so boot chatter does not look like a reply.
 *
 * @param cfg  Port settings. Only path is mandatory.
 * @param err  Receives a short reason ("open_failed:<errno text>", "termios_failed") on failure.
 * @return File descriptor (non-negative) on success, -1 on failure.
 */
int open_serial(const transport::SerialConfig& cfg, std::string& err);

/**
 * @brief Write all @p len bytes, waiting for the driver when it reports EAGAIN.
 *
 * @return Ok when every byte was accepted, Timeout when the driver stayed full
 *         for @p timeout_ms, Error on any other failure. @p written reports progress.
 */
transport::IoResult write_bytes(int fd, const uint8_t* data, std::size_t len,
                                std::size_t& written, int timeout_ms = 1000);

/**
 * @brief Wait up to @p timeout_ms for input and read what is available (max @p cap).
 *
 * @return Ok with out_len>0, Timeout when nothing arrived in time, Error on
 *         poll/read failure or hang-up.
 */
transport::IoResult read_bytes(int fd, uint8_t* out, std::size_t cap,
                               std::size_t& out_len, int timeout_ms);

/// Discard bytes received but not yet read.
void flush_input(int fd);

/// Close a descriptor from open_serial(). Negative fds are ignored.
bool close_serial(int fd);

} // namespace nanovna
