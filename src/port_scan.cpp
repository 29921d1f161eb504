// ============================================================================
// port_scan.cpp - implementation for port_scan.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "port_scan.hpp"
#include "nanovna/transport/transport_linux_serial.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>         // walking /dev/serial/by-id
#include <system_error>       // non-throwing filesystem ops
#include <glob.h>             // glob(3) for tty fallbacks

namespace fs = std::filesystem;
namespace nanovna {

// -------- helpers --------

/*
 * append_glob()
 * -------------
 * Append the matches of a glob() pattern. globfree() runs even on partial
 * success.
 */
static void append_glob(std::vector<std::string>& out, const char* pattern) {
    glob_t g{};
    if (glob(pattern, 0, nullptr, &g) == 0) {
        for (size_t i = 0; i < g.gl_pathc; ++i)
            out.emplace_back(g.gl_pathv[i]);
    }
    globfree(&g);
}

/*
 * probe_port()
 * ------------
 * Open one candidate into @p device and run detection. On detection failure
 * the port is closed again. Returns the error that disqualified it.
 */
static bool probe_port(Device& device, const std::string& path,
                       const transport::SerialConfig& base,
                       const TransportOpener& opener, std::string& label, Error& err) {
    transport::SerialConfig cfg = base;
    cfg.path = path;

    if (!device.open(cfg, opener, err)) {
        spdlog::debug("skip {}: {}", path, err.to_string());
        return false;
    }
    if (!device.detect_version(label, err)) {
        spdlog::debug("skip {}: {}", path, err.to_string());
        device.close();
        return false;
    }
    return true;
}

// -------- public API --------

std::vector<std::string> list_serial_ports() {
    std::vector<std::string> candidates;

    const fs::path by_id("/dev/serial/by-id");
    std::error_code ec;
    if (fs::exists(by_id, ec)) {
        for (const auto& e : fs::directory_iterator(by_id, ec)) {
            if (!e.is_symlink(ec)) continue;
            auto canon = fs::canonical(e.path(), ec);
            if (!ec) candidates.push_back(canon.string());
        }
    } else {
        append_glob(candidates, "/dev/ttyACM*");
        append_glob(candidates, "/dev/ttyUSB*");
    }
    return candidates;
}

std::vector<PortInfo> discover_devices(const std::vector<std::string>& candidates,
                                       const transport::SerialConfig& base,
                                       const TransportOpener& opener,
                                       const ChannelTiming& timing) {
    std::vector<PortInfo> result;
    for (const auto& path : candidates) {
        Device device(timing);
        PortInfo info;
        info.dev_path = path;

        std::string label;
        Error err;
        if (probe_port(device, path, base, opener, label, err)) {
            info.online  = true;
            info.variant = device.hardware_variant();
            info.version = label;
            device.close();
        } else {
            info.reason = err.to_string();
        }
        result.push_back(info);
    }
    return result;
}

std::vector<PortInfo> discover_devices() {
    return discover_devices(list_serial_ports(), transport::SerialConfig{},
                            transport::open_transport);
}

bool auto_detect(Device& device, const std::vector<std::string>& candidates,
                 const transport::SerialConfig& base, const TransportOpener& opener,
                 Error& err) {
    for (const auto& path : candidates) {
        std::string label;
        Error probe_err;
        if (probe_port(device, path, base, opener, label, probe_err)) {
            spdlog::info("auto-detect: {} on {}", label, path);
            return true;
        }
    }
    return fail(err, ErrorCode::NoDeviceFound,
                "candidates=" + std::to_string(candidates.size()));
}

bool auto_detect(Device& device, Error& err) {
    return auto_detect(device, list_serial_ports(), transport::SerialConfig{},
                       transport::open_transport, err);
}

} // namespace nanovna
