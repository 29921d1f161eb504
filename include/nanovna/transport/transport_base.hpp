#pragma once
/**
 * @file transport_base.hpp
 * @brief Minimal duplex byte channel the NanoVNA driver talks through.
 *
 * Header-only on purpose. The driver core never sees file descriptors; it
 * sees ITransport. Linux serial, test scripts and debug wrappers all plug in
 * here.
 */

#include <cstddef>
#include <cstdint>
#include <string>

namespace nanovna::transport {

// Return codes kept simple. Timeout must stay distinguishable from Error:
// the command channel treats "timeout after some bytes" as end-of-response.
enum class IoResult : uint8_t { Ok=0, Timeout=1, Error=2 };

enum class Parity : uint8_t { None=0, Odd=1, Even=2 };

// Port settings owned by the transport opener, not the protocol client.
static constexpr int DEFAULT_BAUD            = 9600;
static constexpr int DEFAULT_READ_TIMEOUT_MS = 5000;
static constexpr int DEFAULT_DATA_BITS       = 8;
static constexpr int DEFAULT_STOP_BITS       = 1;

struct SerialConfig {
  std::string path;                          // e.g. /dev/ttyACM0
  int    baud{DEFAULT_BAUD};
  int    read_timeout_ms{DEFAULT_READ_TIMEOUT_MS};
  int    data_bits{DEFAULT_DATA_BITS};
  Parity parity{Parity::None};
  int    stop_bits{DEFAULT_STOP_BITS};
};

/**
 * @brief Transport trait the command channel relies on.
 *
 * Contract:
 *  - write(buf,len,written) blocks until the bytes are handed to the driver.
 *  - read(buf,cap,out_len) blocks up to the transport's read timeout.
 *    Ok with out_len>0 on data, Timeout when nothing arrived, Error otherwise.
 *  - discard_input() drops bytes already buffered (stale replies).
 *  - close() releases the handle; further I/O returns Error.
 *  - name() is a short identifier for logs/diagnostics.
 */
class ITransport {
public:
  virtual ~ITransport() = default;
  virtual IoResult    write(const uint8_t* data, std::size_t len, std::size_t& written) = 0;
  virtual IoResult    read(uint8_t* out, std::size_t cap, std::size_t& out_len) = 0;
  virtual void        discard_input() = 0;
  virtual bool        close() = 0;
  virtual bool        is_open() const = 0;
  virtual const char* name() const = 0;
};

} // namespace nanovna::transport
