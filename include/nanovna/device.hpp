#pragma once
/**
 * @page nv-device NanoVNA Device Session
 * @file device.hpp
 * @brief One connection to one instrument: transport, detected variant, and the operations on it.
 *
 * @details
 * PURPOSE
 * -------
 * `Device` is the object callers hold. It owns the transport, runs detection,
 * keeps the active `HardwareInfo`, and turns high-level requests (configure a
 * sweep, run a sweep, read device info) into the variant's command dialect via
 * the command channel.
 *
 * LIFECYCLE
 * ---------
 *
 *   Closed --open()/attach()--> Open --detect_version()--> Identified
 *     ^                          |  \--force_variant()-----^
 *     +--------close()-----------+----------------------------+
 *
 * - Open: a transport is attached. The session uses the conservative Unknown
 *   defaults (50 kHz - 900 MHz, 101 points, S11, "ch>").
 * - Identified: a variant is known, either detected or forced.
 * - Closed: no transport. Every I/O call fails with NotConnected.
 *
 * A failed detection leaves the session Open with the defaults; the caller
 * can retry, force a variant, or close.
 *
 * ERROR MODEL
 * -----------
 * Every operation returns `bool` and fills `Error&` on failure. The only
 * failures swallowed internally are the `info` exchange during detection
 * (treated as empty text) and the S21 exchange during a sweep (zero padding);
 * both are logged at warn.
 *
 * THREADING
 * ---------
 * None. A Device is single-threaded and blocking; use one per thread.
 * Independent Devices share nothing mutable.
 *
 * EXAMPLE
 * -------
 * @code
 *   nanovna::Device dev;
 *   nanovna::Error err;
 *   std::string label;
 *   if (!dev.open("/dev/ttyACM0", err) || !dev.detect_version(label, err)) {
 *       std::cerr << "status=error reason=" << err.to_string() << "\n";
 *       return 1;
 *   }
 *   nanovna::SweepData data;
 *   if (dev.set_sweep_config(1000000, 900000000, 101, err) && dev.run_sweep(data, err)) {
 *       // data.frequencies.size() == data.s11.size() == data.s21.size()
 *   }
 * @endcode
 */

#include "nanovna/command_channel.hpp"
#include "nanovna/device_info.hpp"
#include "nanovna/error.hpp"
#include "nanovna/hardware.hpp"
#include "nanovna/sweep.hpp"
#include "nanovna/transport/transport_base.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace nanovna {

enum class SessionState : uint8_t { Closed = 0, Open, Identified };

const char* session_state_name(SessionState state);

/// Calibration coefficients. Empty: calibration storage is not implemented.
struct CalibrationData {};

/// Factory the session uses to open a port. Returns nullptr and fills err on failure.
using TransportOpener = std::function<std::unique_ptr<transport::ITransport>(
    const transport::SerialConfig&, Error&)>;

class Device {
public:
    explicit Device(ChannelTiming timing = {});
    ~Device();

    Device(const Device&) = delete;
    Device& operator=(const Device&) = delete;

    // ---- connection ----

    /// Open @p port with the default SerialConfig through the Linux serial opener.
    bool open(const std::string& port, Error& err);
    bool open(const transport::SerialConfig& cfg, Error& err);
    bool open(const transport::SerialConfig& cfg, const TransportOpener& opener, Error& err);

    /// open(), then force @p variant without probing.
    bool open_with_variant(const std::string& port, HardwareVariant variant, Error& err);
    bool open_with_variant(const transport::SerialConfig& cfg, HardwareVariant variant,
                           const TransportOpener& opener, Error& err);

    /**
     * @brief Take ownership of an already-open transport (tests, wrappers, other OSes).
     *
     * Resets the session to Open with Unknown defaults. No serial config is
     * recorded, so port_details() reports "(config not available)".
     */
    void attach(std::unique_ptr<transport::ITransport> io, std::string port = {});

    /**
     * @brief Swap the transport, keeping the detected variant.
     *
     * Used to wrap the live channel (e.g. a logging decorator). Passing
     * nullptr closes the session.
     */
    void set_transport(std::unique_ptr<transport::ITransport> io);
    transport::ITransport* transport() const { return io_.get(); }

    /// Release the transport. Safe to call twice. False if the OS close failed.
    bool close();

    // ---- identification ----

    /**
     * @brief Probe the device and classify it.
     *
     * @param label  Receives the version label ("v1", "vh", "v2", ...).
     * @param err    NotConnected, Timeout/Io from the probe, or
     *               UnrecognizedDevice carrying the raw probe text.
     */
    bool detect_version(std::string& label, Error& err);

    /// Adopt @p variant's registry entry without talking to the device.
    void force_variant(HardwareVariant variant);

    // ---- measurement ----

    /**
     * @brief Configure the sweep range, retrying scoped commands if the primary form fails.
     *
     * Bounds are checked before the connection, so an invalid request is
     * OutOfRange even on a closed session.
     */
    bool set_sweep_config(int64_t start_hz, int64_t stop_hz, int points, Error& err);

    bool run_sweep(SweepData& data, Error& err);
    bool get_info(DeviceInfo& info, Error& err);

    // ---- calibration (unimplemented: succeed without effect) ----

    bool get_calibration(CalibrationData& out, Error& err);
    bool set_calibration(const CalibrationData& cal, Error& err);
    bool save_calibration(int slot, Error& err);
    bool load_calibration(int slot, Error& err);

    // ---- accessors ----

    const std::string& port() const { return port_; }
    /// Serial settings of the opened port, or nullptr for attached transports.
    const transport::SerialConfig* port_config() const { return has_config_ ? &config_ : nullptr; }
    std::string port_details() const;

    HardwareVariant hardware_variant() const { return hw_.variant; }
    const HardwareInfo& hardware_info() const { return hw_; }
    const FrequencyRange& frequency_range() const { return hw_.frequency_range; }
    int max_sweep_points() const { return hw_.max_sweep_points; }
    const std::vector<std::string>& supported_ports() const { return hw_.supported_ports; }
    const HardwareCapabilities& capabilities() const { return hw_.capabilities; }
    bool is_port_supported(const std::string& port) const { return nanovna::is_port_supported(hw_, port); }

    /// Version label, empty until identified.
    const std::string& version() const { return version_; }
    SessionState state() const { return state_; }

    void set_timing(const ChannelTiming& timing) { channel_.set_timing(timing); }
    const ChannelTiming& timing() const { return channel_.timing(); }

private:
    bool require_io(const char* op, Error& err) const;
    void apply_variant(HardwareVariant variant);
    void reset_identity();

    std::unique_ptr<transport::ITransport> io_;
    CommandChannel          channel_;
    std::string             port_;
    transport::SerialConfig config_;
    bool                    has_config_{false};
    SessionState            state_{SessionState::Closed};
    std::string             version_;
    HardwareInfo            hw_;
};

} // namespace nanovna
