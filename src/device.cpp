// -----------------------------------------------------------------------------
// Implementation for device.hpp
//
// - Lifecycle and error model are described in device.hpp.
// - Parsing and formatting live in sweep.cpp / device_info.cpp; this file is
//   the glue between them, the command channel, and the session state.
// - See tests/test_device.cpp for scripted sessions.
// -----------------------------------------------------------------------------

#include "nanovna/device.hpp"
#include "nanovna/detector.hpp"
#include "nanovna/transport/transport_linux_serial.hpp"

#include <spdlog/spdlog.h>

#include <sstream>
#include <utility>

namespace nanovna {

const char* session_state_name(SessionState state) {
    switch (state) {
        case SessionState::Closed:     return "closed";
        case SessionState::Open:       return "open";
        case SessionState::Identified: return "identified";
    }
    return "closed";
}

static char parity_letter(transport::Parity p) {
    switch (p) {
        case transport::Parity::Odd:  return 'O';
        case transport::Parity::Even: return 'E';
        default:                      return 'N';
    }
}

Device::Device(ChannelTiming timing) : channel_(timing) {
    reset_identity();
}

Device::~Device() { close(); }

// ---------- connection ----------

bool Device::open(const std::string& port, Error& err) {
    transport::SerialConfig cfg;
    cfg.path = port;
    return open(cfg, transport::open_transport, err);
}

bool Device::open(const transport::SerialConfig& cfg, Error& err) {
    return open(cfg, transport::open_transport, err);
}

bool Device::open(const transport::SerialConfig& cfg, const TransportOpener& opener, Error& err) {
    close();
    if (!opener) return fail(err, ErrorCode::Io, cfg.path + ":no_opener");

    std::unique_ptr<transport::ITransport> io = opener(cfg, err);
    if (!io) {
        if (err.ok()) fail(err, ErrorCode::Io, cfg.path);
        return false;
    }

    attach(std::move(io), cfg.path);
    config_ = cfg;
    has_config_ = true;
    spdlog::debug("opened {}", port_details());
    return true;
}

bool Device::open_with_variant(const std::string& port, HardwareVariant variant, Error& err) {
    transport::SerialConfig cfg;
    cfg.path = port;
    return open_with_variant(cfg, variant, transport::open_transport, err);
}

bool Device::open_with_variant(const transport::SerialConfig& cfg, HardwareVariant variant,
                               const TransportOpener& opener, Error& err) {
    if (!open(cfg, opener, err)) return false;
    force_variant(variant);
    return true;
}

void Device::attach(std::unique_ptr<transport::ITransport> io, std::string port) {
    close();
    io_ = std::move(io);
    port_ = std::move(port);
    has_config_ = false;
    config_ = transport::SerialConfig{};
    channel_.bind(io_.get());
    reset_identity();
    state_ = io_ ? SessionState::Open : SessionState::Closed;
}

void Device::set_transport(std::unique_ptr<transport::ITransport> io) {
    if (!io) {
        close();
        return;
    }
    io_ = std::move(io);
    channel_.bind(io_.get());
    if (state_ == SessionState::Closed) state_ = SessionState::Open;
}

bool Device::close() {
    channel_.bind(nullptr);
    state_ = SessionState::Closed;
    if (!io_) return true;

    const bool ok = io_->close();
    if (!ok) spdlog::warn("close failed on {}", port_);
    io_.reset();
    return ok;
}

// ---------- session helpers ----------

bool Device::require_io(const char* op, Error& err) const {
    if (state_ == SessionState::Closed || !channel_.connected())
        return fail(err, ErrorCode::NotConnected, op);
    return true;
}

void Device::reset_identity() {
    hw_ = lookup_hardware(HardwareVariant::Unknown);
    version_.clear();
    channel_.set_prompt(hw_.command_set.prompt);
}

void Device::apply_variant(HardwareVariant variant) {
    hw_ = lookup_hardware(variant);
    version_ = version_label(variant);
    channel_.set_prompt(hw_.command_set.prompt);
}

// ---------- identification ----------

bool Device::detect_version(std::string& label, Error& err) {
    label.clear();
    if (!require_io("detect", err)) return false;

    std::string raw;
    if (!channel_.probe(raw, err)) return false;

    std::string info;
    Error info_err;
    if (!channel_.exchange(hw_.command_set.info, info, info_err)) {
        spdlog::warn("info query during detection failed: {}", info_err.to_string());
        info.clear();
    }

    const HardwareVariant variant = classify_variant(raw, info);
    if (variant == HardwareVariant::Unknown) {
        reset_identity();
        state_ = SessionState::Open;
        return fail(err, ErrorCode::UnrecognizedDevice, raw);
    }

    apply_variant(variant);
    state_ = SessionState::Identified;
    label = version_;
    spdlog::info("detected {} ({}) on {}", variant_name(variant), version_, port_);
    return true;
}

void Device::force_variant(HardwareVariant variant) {
    apply_variant(variant);
    if (state_ != SessionState::Closed) state_ = SessionState::Identified;
    spdlog::info("variant forced to {} ({})", variant_name(variant), version_);
}

// ---------- measurement ----------

bool Device::set_sweep_config(int64_t start_hz, int64_t stop_hz, int points, Error& err) {
    if (!validate_sweep(hw_, start_hz, stop_hz, points, err)) return false;
    if (!require_io("sweep_config", err)) return false;

    std::string reply;
    Error primary;
    const std::string cmd = format_sweep_command(hw_.command_set, start_hz, stop_hz, points);
    if (channel_.exchange(cmd, reply, primary)) return true;

    spdlog::warn("'{}' failed ({}), trying scoped commands", cmd, primary.to_string());

    // The first accepted scoped command ends the retry.
    for (const auto& fallback : fallback_sweep_commands(hw_.variant, start_hz, stop_hz, points)) {
        Error e;
        if (channel_.exchange(fallback, reply, e)) return true;
        spdlog::warn("'{}' failed ({})", fallback, e.to_string());
    }

    return fail(err, ErrorCode::CommandFailed, primary.to_string());
}

bool Device::run_sweep(SweepData& data, Error& err) {
    data = SweepData{};
    if (!require_io("sweep", err)) return false;

    const CommandSet& cmds = hw_.command_set;
    const std::string& prompt = channel_.prompt();
    const std::string data_token = command_token(cmds.data);

    // 1) frequency list
    std::string reply;
    if (!channel_.exchange(cmds.frequencies, reply, err)) return false;
    data.frequencies = parse_frequency_lines(reply, cmds.frequencies, prompt);

    // 2) S11
    const std::string s11_cmd = fill_template(cmds.data, {0});
    if (!channel_.exchange(s11_cmd, reply, err)) return false;
    data.s11 = parse_complex_lines(reply, s11_cmd, prompt, data_token);

    // 3) S21 when the model measures it; zeros otherwise
    if (hw_.capabilities.has_s21 && nanovna::is_port_supported(hw_, "S21")) {
        const std::string s21_cmd = fill_template(cmds.data, {1});
        Error s21_err;
        if (channel_.exchange(s21_cmd, reply, s21_err)) {
            data.s21 = parse_complex_lines(reply, s21_cmd, prompt, data_token);
        } else {
            spdlog::warn("S21 query failed ({}), padding with zeros", s21_err.to_string());
            data.s21.assign(data.s11.size(), {0.0, 0.0});
        }
    }

    spdlog::debug("sweep parsed: {} freqs, {} s11, {} s21",
                  data.frequencies.size(), data.s11.size(), data.s21.size());

    // 4-6) pad, check, truncate
    return reconcile_sweep(data, err);
}

bool Device::get_info(DeviceInfo& info, Error& err) {
    if (!require_io("info", err)) return false;

    std::string reply;
    if (!channel_.exchange(hw_.command_set.info, reply, err)) return false;
    info = parse_device_info(hw_, reply);
    return true;
}

// ---------- calibration ----------

bool Device::get_calibration(CalibrationData& out, Error& err) {
    (void)err;
    out = CalibrationData{};
    return true;
}

bool Device::set_calibration(const CalibrationData& cal, Error& err) {
    (void)cal;
    (void)err;
    return true;
}

bool Device::save_calibration(int slot, Error& err) {
    (void)err;
    spdlog::debug("save_calibration({}) is not implemented", slot);
    return true;
}

bool Device::load_calibration(int slot, Error& err) {
    (void)err;
    spdlog::debug("load_calibration({}) is not implemented", slot);
    return true;
}

// ---------- accessors ----------

std::string Device::port_details() const {
    std::ostringstream os;
    if (!has_config_) {
        os << "Port: " << port_ << " (config not available)";
        return os.str();
    }
    os << "Port: " << config_.path
       << ", Baud: " << config_.baud
       << ", ReadTimeout: " << config_.read_timeout_ms << "ms"
       << ", Size: " << config_.data_bits
       << ", Parity: " << parity_letter(config_.parity)
       << ", StopBits: " << config_.stop_bits;
    return os.str();
}

} // namespace nanovna
