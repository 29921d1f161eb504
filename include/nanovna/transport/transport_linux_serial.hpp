#pragma once
/**
 * @file transport_linux_serial.hpp
 * @brief Linux USB/tty transport (header-only, termios; blocking reads with poll timeout).
 *
 * Depends on: serial_io.hpp (open_serial, read_bytes, write_bytes). Linux-only.
 */

#if !defined(__linux__)
#  error "transport_linux_serial.hpp is Linux-only."
#endif

#include "nanovna/error.hpp"
#include "nanovna/transport/transport_base.hpp"
#include "serial_io.hpp"

#include <memory>
#include <string>
#include <utility>

namespace nanovna::transport {

class LinuxSerial : public ITransport {
public:
  explicit LinuxSerial(SerialConfig cfg) : cfg_(std::move(cfg)) {}
  ~LinuxSerial() override { close(); }

  LinuxSerial(const LinuxSerial&) = delete;
  LinuxSerial& operator=(const LinuxSerial&) = delete;

  bool begin(std::string& err) {
    close();
    fd_ = nanovna::open_serial(cfg_, err);
    return fd_ >= 0;
  }

  IoResult write(const uint8_t* data, std::size_t len, std::size_t& written) override {
    return nanovna::write_bytes(fd_, data, len, written, cfg_.read_timeout_ms);
  }

  IoResult read(uint8_t* out, std::size_t cap, std::size_t& out_len) override {
    return nanovna::read_bytes(fd_, out, cap, out_len, cfg_.read_timeout_ms);
  }

  void discard_input() override { nanovna::flush_input(fd_); }

  bool close() override {
    if (fd_ < 0) return true;
    bool ok = nanovna::close_serial(fd_);
    fd_ = -1;
    return ok;
  }

  bool is_open() const override { return fd_ >= 0; }
  const char* name() const override { return "linux-serial"; }
  const SerialConfig& config() const { return cfg_; }

private:
  SerialConfig cfg_;
  int fd_{-1};
};

/**
 * @brief Default transport opener: a LinuxSerial on cfg.path.
 *
 * Returns nullptr and fills @p err with ErrorCode::Io when the port cannot be opened.
 */
inline std::unique_ptr<ITransport> open_transport(const SerialConfig& cfg, Error& err) {
  auto port = std::make_unique<LinuxSerial>(cfg);
  std::string why;
  if (!port->begin(why)) {
    fail(err, ErrorCode::Io, cfg.path + ":" + why);
    return nullptr;
  }
  return port;
}

} // namespace nanovna::transport
