// ============================================================================
// serial_io.cpp - implementation for serial_io.hpp
// For API/overview see the matching .hpp. For usage, see transport_linux_serial.hpp.
// ============================================================================

/**
 * @file serial_io.cpp
 */

#include "serial_io.hpp"   // declarations for open_serial(), write_bytes(), read_bytes(), close_serial()

// POSIX / termios headers for low-level serial port handling
#include <fcntl.h>         // ::open flags (O_RDWR, O_NOCTTY, etc.)
#include <unistd.h>        // ::read, ::write, ::close
#include <termios.h>       // termios struct + raw mode helpers
#include <poll.h>          // poll(2) for timeout-based reads
#include <cerrno>          // errno classification (EAGAIN, EINTR)
#include <cstring>         // strerror for open failures

namespace nanovna {

using transport::IoResult;
using transport::Parity;

// ---------------------------------------------------------------------------
// speed_for()
// -----------
// Map an integer baud to the termios constant. CDC ACM ignores the value but
// tcsetattr still rejects nonsense, so unknown rates fall back to 9600.
// ---------------------------------------------------------------------------
static speed_t speed_for(int baud) {
    switch (baud) {
        case 9600:   return B9600;
        case 19200:  return B19200;
        case 38400:  return B38400;
        case 57600:  return B57600;
        case 115200: return B115200;
#ifdef B230400
        case 230400: return B230400;
#endif
#ifdef B460800
        case 460800: return B460800;
#endif
        default:     return B9600;
    }
}

static tcflag_t size_flag(int data_bits) {
    switch (data_bits) {
        case 5:  return CS5;
        case 6:  return CS6;
        case 7:  return CS7;
        default: return CS8;
    }
}

// ---------------------------------------------------------------------------
// set_raw()
// ----------
// Configure a file descriptor for raw serial I/O.
// - Disables echo, line buffering, and flow control.
// - Applies data bits / parity / stop bits from the config (8N1 by default).
// - Sets VMIN=0, VTIME=0 (non-blocking reads; poll() handles timing).
// - Flushes both input/output buffers after applying settings.
// ---------------------------------------------------------------------------
static bool set_raw(int fd, const transport::SerialConfig& cfg) {
    termios tio{};
    if (tcgetattr(fd, &tio) != 0) return false;   // fetch current settings

    cfmakeraw(&tio);                              // wipe into raw mode
    const speed_t sp = speed_for(cfg.baud);
    cfsetispeed(&tio, sp);
    cfsetospeed(&tio, sp);

    tio.c_cflag &= ~CSIZE;
    tio.c_cflag |= size_flag(cfg.data_bits);

    tio.c_cflag &= ~(PARENB | PARODD);
    if (cfg.parity == Parity::Even) tio.c_cflag |= PARENB;
    if (cfg.parity == Parity::Odd)  tio.c_cflag |= (PARENB | PARODD);

    if (cfg.stop_bits == 2) tio.c_cflag |= CSTOPB;
    else                    tio.c_cflag &= ~CSTOPB;

    tio.c_cflag |= (CLOCAL | CREAD);              // ignore modem ctrl, enable read
    tio.c_cflag &= ~CRTSCTS;                      // no hardware flow control
    tio.c_cc[VMIN]  = 0;
    tio.c_cc[VTIME] = 0;

    if (tcsetattr(fd, TCSANOW, &tio) != 0) return false;
    tcflush(fd, TCIOFLUSH);
    return true;
}


// ---------------------------------------------------------------------------
// open_serial()
// -------------
// Open and initialize a serial port with the requested settings.
// Returns: file descriptor (>=0) or -1 on failure, with err filled.
// ---------------------------------------------------------------------------
int open_serial(const transport::SerialConfig& cfg, std::string& err) {
    if (cfg.path.empty()) { err = "open_failed:empty_path"; return -1; }

    int fd = ::open(cfg.path.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd < 0) {                                 // perm, missing, busy...
        err = std::string("open_failed:") + std::strerror(errno);
        return -1;
    }

    if (!set_raw(fd, cfg)) {
        err = "termios_failed";
        ::close(fd);
        return -1;
    }
    return fd;
}


// ---------------------------------------------------------------------------
// write_bytes()
// -------------
// Loop until every byte is accepted. The fd is non-blocking, so a full
// driver buffer shows up as EAGAIN; wait for POLLOUT and keep going.
// ---------------------------------------------------------------------------
IoResult write_bytes(int fd, const uint8_t* data, std::size_t len,
                     std::size_t& written, int timeout_ms) {
    written = 0;
    if (fd < 0) return IoResult::Error;

    while (written < len) {
        ssize_t w = ::write(fd, data + written, len - written);
        if (w > 0) { written += static_cast<std::size_t>(w); continue; }
        if (w < 0 && errno == EINTR) continue;
        if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            pollfd pfd{fd, POLLOUT, 0};
            int pr = ::poll(&pfd, 1, timeout_ms);
            if (pr == 0) return IoResult::Timeout;
            if (pr < 0 && errno != EINTR) return IoResult::Error;
            continue;
        }
        return IoResult::Error;
    }
    return IoResult::Ok;
}


// ---------------------------------------------------------------------------
// read_bytes()
// ------------
// Block in poll() for at most timeout_ms, then read whatever is there.
// A zero-length read after POLLIN means the device went away (USB unplug).
// ---------------------------------------------------------------------------
IoResult read_bytes(int fd, uint8_t* out, std::size_t cap,
                    std::size_t& out_len, int timeout_ms) {
    out_len = 0;
    if (fd < 0 || cap == 0) return IoResult::Error;

    pollfd pfd{fd, POLLIN, 0};
    int pr = 0;
    do {
        pr = ::poll(&pfd, 1, timeout_ms);
    } while (pr < 0 && errno == EINTR);

    if (pr == 0) return IoResult::Timeout;
    if (pr < 0)  return IoResult::Error;
    if (pfd.revents & (POLLERR | POLLNVAL)) return IoResult::Error;

    ssize_t n = ::read(fd, out, cap);
    if (n > 0) { out_len = static_cast<std::size_t>(n); return IoResult::Ok; }
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return IoResult::Timeout;
    return IoResult::Error;                       // n == 0: hang-up
}


void flush_input(int fd) {
    if (fd >= 0) tcflush(fd, TCIFLUSH);
}


bool close_serial(int fd) {
    if (fd < 0) return true;
    return ::close(fd) == 0;
}

} // namespace nanovna
