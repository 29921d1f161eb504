#pragma once
/**
 * @page nv-port-scan NanoVNA Port Scan and Auto-Connect
 * @file port_scan.hpp
 * @brief Find serial devices that may be NanoVNAs, probe them, and connect to the first one that answers.
 *
 * @details
 * PURPOSE
 * -------
 * Users rarely know whether their analyzer came up as /dev/ttyACM0 or
 * /dev/ttyACM3. This layer finds the candidates, probes each one with the same
 * detection the session uses, and either reports what it found (`--scan`) or
 * connects to the first match (auto-connect).
 *
 * WHAT THIS DOES
 * --------------
 * - list_serial_ports(): candidate device paths.
 *   - Prefers `/dev/serial/by-id` symlinks, resolved to canonical device
 *     paths (stable names across reboots and port swaps).
 *   - Falls back to `/dev/ttyACM*` and `/dev/ttyUSB*` when that directory is
 *     absent. NanoVNA v1/H enumerate as ACM; many V2 clones use a CH340 (USB).
 * - discover_devices(): open and detect every candidate, one PortInfo each.
 * - auto_detect(): open and detect candidates in order; keep the first one
 *   that is recognized, close the rest.
 *
 * RELIABILITY AND TRADE-OFFS
 * --------------------------
 * - No libudev dependency: filesystem inspection and glob(3) only.
 * - Probing costs up to one read timeout per silent port. Candidates that are
 *   not analyzers are skipped, never reported as errors.
 * - Users need permission on the device nodes (`dialout` group or similar).
 *
 * EXAMPLE
 * -------
 * @code
 *   nanovna::Device dev;
 *   nanovna::Error err;
 *   if (!nanovna::auto_detect(dev, err)) {
 *       std::cerr << "status=error reason=" << err.to_string() << "\n";
 *   } else {
 *       std::cout << "connected to " << dev.port() << " as " << dev.version() << "\n";
 *   }
 * @endcode
 */

#include "nanovna/device.hpp"
#include "nanovna/error.hpp"
#include "nanovna/hardware.hpp"
#include "nanovna/transport/transport_base.hpp"

#include <string>
#include <vector>

namespace nanovna {

/**
 * @struct PortInfo
 * @brief One scanned candidate: where it is and what answered there.
 */
struct PortInfo {
    std::string     dev_path;                           ///< e.g. "/dev/ttyACM0"
    bool            online{false};                      ///< recognized as an analyzer
    HardwareVariant variant{HardwareVariant::Unknown};
    std::string     version;                            ///< version label when online
    std::string     reason;                             ///< Error::to_string() when not online
};

/// Candidate serial device paths, by-id first; empty when nothing is attached.
std::vector<std::string> list_serial_ports();

/**
 * @brief Probe every candidate and report what each one is.
 *
 * @param base    Serial settings applied to each candidate (path is replaced).
 * @param opener  Transport factory; transport::open_transport for real ports.
 * @param timing  Channel timing used for the probe sessions.
 */
std::vector<PortInfo> discover_devices(const std::vector<std::string>& candidates,
                                       const transport::SerialConfig& base,
                                       const TransportOpener& opener,
                                       const ChannelTiming& timing = {});

/// discover_devices() over list_serial_ports() with default serial settings.
std::vector<PortInfo> discover_devices();

/**
 * @brief Connect @p device to the first candidate that opens and is recognized.
 *
 * Ports that fail to open are skipped; ports that open but fail detection are
 * closed and skipped. An empty list, or no match, is NoDeviceFound.
 */
bool auto_detect(Device& device, const std::vector<std::string>& candidates,
                 const transport::SerialConfig& base, const TransportOpener& opener,
                 Error& err);

/// auto_detect() over list_serial_ports() with the Linux serial opener.
bool auto_detect(Device& device, Error& err);

} // namespace nanovna
