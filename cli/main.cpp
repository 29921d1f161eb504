/**
 * @file main.cpp
 * @brief nanovna-cli: scan for analyzers, read device info, and run one sweep.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11); optionally overlay serial/timing settings from a JSON file.
 *  - Route spdlog output to stderr at the requested level so stdout stays parseable.
 *  - Resolve the target: explicit --dev, or auto-connect over the scanned ports.
 *  - Identify it: detect, or force with --variant.
 *  - Run --info and/or --sweep and print as pretty text, JSON, or CSV.
 *
 * Exit codes:
 *   0 ok, 1 open/io failure, 2 usage/validation, 3 no data/timeout,
 *   4 device not recognized, 6 no device found.
 *
 * Errors are printed as one line on stderr: `status=error reason=<code[:detail]>`.
 */

#include <complex>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include <unistd.h> // isatty

#include "CLI/CLI11.hpp"
#include "nlohmann/json.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

#include "nanovna/device.hpp"
#include "nanovna/transport/transport_linux_serial.hpp"
#include "port_scan.hpp"

using json = nlohmann::json;
using namespace nanovna;

// ---------- small utilities ----------

static bool is_tty_stdout() { return ::isatty(fileno(stdout)); }

struct Ansi {
  bool enabled{true};
  std::string bold(const std::string& s) const { return enabled ? "\033[1m"+s+"\033[0m" : s; }
  std::string dim (const std::string& s) const { return enabled ? "\033[2m"+s+"\033[0m" : s; }
};

static int exit_code_for(ErrorCode code) {
  switch (code) {
    case ErrorCode::None:               return 0;
    case ErrorCode::OutOfRange:         return 2;
    case ErrorCode::NoData:
    case ErrorCode::Timeout:            return 3;
    case ErrorCode::UnrecognizedDevice: return 4;
    case ErrorCode::NoDeviceFound:      return 6;
    case ErrorCode::NotConnected:
    case ErrorCode::CommandFailed:
    case ErrorCode::Io:                 return 1;
  }
  return 1;
}

static int report(const Error& err) {
  std::cerr << "status=error reason=" << err.to_string() << "\n";
  return exit_code_for(err.code);
}

static void setup_logging(const std::string& level, bool color) {
  auto logger = color ? spdlog::stderr_color_mt("nanovna")
                      : spdlog::stderr_logger_mt("nanovna");
  spdlog::set_default_logger(logger);
  spdlog::set_level(spdlog::level::from_str(level));
}

/*
 * load_config()
 * -------------
 * Overlay settings from a JSON file:
 *   { "serial": { "baud": 115200, "read_timeout_ms": 2000 },
 *     "timing": { "grace_ms": 50, "inter_read_ms": 20, "max_read_attempts": 10,
 *                 "read_chunk": 1024 } }
 * Missing keys keep their defaults. Unreadable or malformed files are errors.
 * One reply is capped at max_read_attempts * read_chunk bytes; V2 sweeps near
 * 4000 points need about 100 KB, e.g. "max_read_attempts": 120.
 */
static bool load_config(const std::string& path, transport::SerialConfig& serial,
                        ChannelTiming& timing, std::string& why) {
  std::ifstream in(path);
  if (!in) { why = "config_unreadable:" + path; return false; }

  try {
    json j = json::parse(in);
    if (j.contains("serial")) {
      const json& s = j.at("serial");
      serial.baud            = s.value("baud", serial.baud);
      serial.read_timeout_ms = s.value("read_timeout_ms", serial.read_timeout_ms);
    }
    if (j.contains("timing")) {
      const json& t = j.at("timing");
      timing.grace_ms          = t.value("grace_ms", timing.grace_ms);
      timing.inter_read_ms     = t.value("inter_read_ms", timing.inter_read_ms);
      timing.max_read_attempts = t.value("max_read_attempts", timing.max_read_attempts);
      timing.read_chunk        = t.value("read_chunk", timing.read_chunk);
    }
  } catch (const json::exception& e) {
    why = std::string("config_invalid:") + e.what();
    return false;
  }
  return true;
}

static json complex_array(const std::vector<std::complex<double>>& v) {
  json a = json::array();
  for (const auto& c : v) a.push_back(json::array({c.real(), c.imag()}));
  return a;
}

// ---------- output ----------

static void print_scan(const std::vector<PortInfo>& ports, const std::string& format) {
  if (format == "json") {
    json arr = json::array();
    for (const auto& p : ports) {
      json j;
      j["dev"] = p.dev_path;
      j["online"] = p.online;
      j["variant"] = variant_name(p.variant);
      j["version"] = p.version;
      if (!p.online) j["reason"] = p.reason;
      arr.push_back(j);
    }
    std::cout << arr.dump(2) << "\n";
  } else if (format == "csv") {
    std::cout << "dev,online,variant,version\n";
    for (const auto& p : ports)
      std::cout << p.dev_path << "," << (p.online ? 1 : 0) << ","
                << variant_name(p.variant) << "," << p.version << "\n";
  } else {
    for (const auto& p : ports) {
      std::cout << "dev=" << p.dev_path << " online=" << (p.online ? 1 : 0);
      if (p.online) std::cout << " variant=\"" << variant_name(p.variant) << "\" version=" << p.version;
      else          std::cout << " reason=" << p.reason;
      std::cout << "\n";
    }
  }
}

static void print_info(const Device& dev, const DeviceInfo& info, const std::string& format,
                       const Ansi& ansi) {
  const HardwareInfo& hw = dev.hardware_info();
  if (format == "json") {
    json j;
    j["port"]          = dev.port();
    j["variant"]       = variant_name(hw.variant);
    j["version"]       = dev.version();
    j["model"]         = info.model;
    j["firmware"]      = info.firmware;
    j["serial_number"] = info.serial_number;
    j["min_hz"]        = hw.frequency_range.min_hz;
    j["max_hz"]        = hw.frequency_range.max_hz;
    j["max_points"]    = hw.max_sweep_points;
    j["ports"]         = hw.supported_ports;
    std::cout << j.dump(2) << "\n";
  } else if (format == "csv") {
    std::cout << "port,variant,version,model,firmware,serial_number\n"
              << dev.port() << "," << variant_name(hw.variant) << "," << dev.version() << ","
              << info.model << "," << info.firmware << "," << info.serial_number << "\n";
  } else {
    auto kv = [&](const char* k, const std::string& v) {
      std::cout << "  " << ansi.bold(std::string("[") + k + "] ");
      if (v.empty()) std::cout << ansi.dim("(empty)") << "\n";
      else           std::cout << v << "\n";
    };
    std::ostringstream range;
    range << std::fixed << std::setprecision(0)
          << hw.frequency_range.min_hz << " - " << hw.frequency_range.max_hz << " Hz";
    std::string ports;
    for (const auto& p : hw.supported_ports) ports += (ports.empty() ? "" : ",") + p;

    kv("PORT", dev.port_details());
    kv("VARIANT", std::string(variant_name(hw.variant)) + " (" + dev.version() + ")");
    kv("MODEL", info.model);
    kv("FIRMWARE", info.firmware);
    kv("SERIAL", info.serial_number);
    kv("RANGE", range.str());
    kv("POINTS", std::to_string(hw.max_sweep_points));
    kv("S-PARAMS", ports);
  }
}

static void print_sweep(const SweepData& d, const std::string& format, const Ansi& ansi) {
  if (format == "json") {
    json j;
    j["frequencies"] = d.frequencies;
    j["s11"] = complex_array(d.s11);
    j["s21"] = complex_array(d.s21);
    std::cout << j.dump(2) << "\n";
    return;
  }

  const bool csv = (format == "csv");
  if (csv) std::cout << "frequency_hz,s11_re,s11_im,s21_re,s21_im\n";
  else     std::cout << ansi.bold("frequency_hz      s11_re        s11_im        s21_re        s21_im") << "\n";

  for (size_t i = 0; i < d.frequencies.size(); ++i) {
    if (csv) {
      std::cout << std::setprecision(12) << d.frequencies[i] << ","
                << d.s11[i].real() << "," << d.s11[i].imag() << ","
                << d.s21[i].real() << "," << d.s21[i].imag() << "\n";
    } else {
      std::cout << std::left << std::fixed
                << std::setw(16) << std::setprecision(0) << d.frequencies[i] << "  "
                << std::setprecision(6)
                << std::setw(12) << d.s11[i].real() << "  " << std::setw(12) << d.s11[i].imag() << "  "
                << std::setw(12) << d.s21[i].real() << "  " << std::setw(12) << d.s21[i].imag() << "\n";
    }
  }
  if (!csv) std::cout << ansi.dim(std::to_string(d.frequencies.size()) + " point(s)") << "\n";
}

// ---------- main ----------

int main(int argc, char** argv) {
  bool opt_scan = false, opt_info = false, opt_sweep = false, opt_no_color = false;
  std::string opt_dev, opt_variant, opt_config;
  std::string opt_format = "pretty";      // pretty|json|csv
  std::string opt_log_level = "warn";
  int64_t opt_start = 1000000;
  int64_t opt_stop = 900000000;
  int opt_points = 101;

  transport::SerialConfig serial;
  ChannelTiming timing;

  CLI::App app{"NanoVNA command line"};

  app.add_flag("--scan", opt_scan, "Probe every candidate serial port and list what answers");
  app.add_option("--dev", opt_dev, "Serial device (default: auto-connect to the first analyzer)");
  app.add_option("--variant", opt_variant, "Skip detection and force a model (v1, vh, v2, v2plus, v2plus4, saa2, tinysa, litevna)");
  app.add_flag("--info", opt_info, "Print model, firmware, serial number and limits");
  app.add_flag("--sweep", opt_sweep, "Configure and run one sweep");
  app.add_option("--start", opt_start, "Sweep start (Hz)")->capture_default_str();
  app.add_option("--stop", opt_stop, "Sweep stop (Hz)")->capture_default_str();
  app.add_option("--points", opt_points, "Sweep points")->capture_default_str()->check(CLI::PositiveNumber);
  app.add_option("--format", opt_format, "Output format: pretty|json|csv")->check(CLI::IsMember({"pretty","json","csv"}));
  app.add_option("--config", opt_config, "JSON file with serial/timing overrides")->check(CLI::ExistingFile);
  app.add_option("--baud", serial.baud, "Baud rate")->capture_default_str();
  app.add_option("--timeout", serial.read_timeout_ms, "Read timeout (ms)")->capture_default_str();
  app.add_option("--log-level", opt_log_level, "trace|debug|info|warn|error|critical|off")
      ->check(CLI::IsMember({"trace","debug","info","warn","error","critical","off"}));
  app.add_flag("--no-color", opt_no_color, "Disable ANSI colors");

  CLI11_PARSE(app, argc, argv);

  Ansi ansi;
  ansi.enabled = !opt_no_color && is_tty_stdout() && (opt_format == "pretty");
  setup_logging(opt_log_level, !opt_no_color);

  // Config file first; explicit --baud/--timeout win over it.
  if (!opt_config.empty()) {
    transport::SerialConfig from_file = serial;
    std::string why;
    if (!load_config(opt_config, from_file, timing, why)) {
      std::cerr << "status=error reason=" << why << "\n";
      return 2;
    }
    if (app.count("--baud") == 0)    serial.baud = from_file.baud;
    if (app.count("--timeout") == 0) serial.read_timeout_ms = from_file.read_timeout_ms;
  }

  HardwareVariant forced = HardwareVariant::Unknown;
  if (!opt_variant.empty() && !parse_variant(opt_variant, forced)) {
    std::cerr << "status=error reason=unknown_variant:" << opt_variant << "\n";
    return 2;
  }

  // -------- scan mode --------
  if (opt_scan) {
    auto ports = discover_devices(list_serial_ports(), serial, transport::open_transport, timing);
    print_scan(ports, opt_format);
    return 0;
  }

  if (!opt_info && !opt_sweep) {
    std::cerr << "status=error reason=need_command (--scan, --info or --sweep)\n";
    return 2;
  }

  // -------- connect + identify --------
  Device dev(timing);
  Error err;

  if (!opt_dev.empty()) {
    serial.path = opt_dev;
    if (!opt_variant.empty()) {
      if (!dev.open_with_variant(serial, forced, transport::open_transport, err)) return report(err);
    } else {
      std::string label;
      if (!dev.open(serial, err)) return report(err);
      if (!dev.detect_version(label, err)) return report(err);
    }
  } else {
    if (!auto_detect(dev, list_serial_ports(), serial, transport::open_transport, err))
      return report(err);
    if (!opt_variant.empty()) dev.force_variant(forced);
  }

  // -------- commands --------
  if (opt_info) {
    DeviceInfo info;
    if (!dev.get_info(info, err)) return report(err);
    print_info(dev, info, opt_format, ansi);
  }

  if (opt_sweep) {
    SweepData data;
    if (!dev.set_sweep_config(opt_start, opt_stop, opt_points, err)) return report(err);
    if (!dev.run_sweep(data, err)) return report(err);
    print_sweep(data, opt_format, ansi);
  }

  if (!dev.close()) spdlog::warn("close reported an error on {}", dev.port());
  return 0;
}
