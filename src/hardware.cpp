// ============================================================================
// hardware.cpp - implementation for nanovna/hardware.hpp
// The registry is a switch, not a map: one place to read every model's limits.
// ============================================================================

#include "nanovna/hardware.hpp"

#include <cctype>          // std::tolower for parse_variant()
#include <utility>         // std::move into registry entries

namespace nanovna {

const HardwareVariant ALL_VARIANTS[9] = {
    HardwareVariant::Unknown, HardwareVariant::V1,     HardwareVariant::VH,
    HardwareVariant::V2,      HardwareVariant::V2Plus, HardwareVariant::V2Plus4,
    HardwareVariant::SAA2,    HardwareVariant::TinySA, HardwareVariant::LiteVNA,
};

// ---------------------------------------------------------------------------
// Command dialects.
// Every model answers the same verbs; they differ in the frequency query and
// the prompt printed after each reply.
// ---------------------------------------------------------------------------
static CommandSet ch_dialect() {
    CommandSet c;
    c.sweep            = "sweep %d %d %d";
    c.frequencies      = "frequencies";
    c.data             = "data %d";
    c.info             = "info";
    c.version          = "version";
    c.calibration_save = "save %d";
    c.calibration_load = "recall %d";
    c.prompt           = "ch>";
    return c;
}

static CommandSet v2_dialect() {
    CommandSet c = ch_dialect();
    c.frequencies = "freq";
    c.prompt      = "2>";
    return c;
}

static HardwareCapabilities caps(bool s21, bool time_domain, bool cal,
                                 bool multi_port, bool generator, bool spectrum) {
    HardwareCapabilities c;
    c.has_s21            = s21;
    c.has_time_domain    = time_domain;
    c.has_calibration    = cal;
    c.has_multiple_ports = multi_port;
    c.has_generator      = generator;
    c.has_spectrum_mode  = spectrum;
    return c;
}

static HardwareInfo entry(HardwareVariant v, double min_hz, double max_hz, int points,
                          std::vector<std::string> ports, CommandSet cmds,
                          HardwareCapabilities c) {
    HardwareInfo h;
    h.variant          = v;
    h.frequency_range  = FrequencyRange{min_hz, max_hz};
    h.max_sweep_points = points;
    h.supported_ports  = std::move(ports);
    h.command_set      = std::move(cmds);
    h.capabilities     = c;
    return h;
}

HardwareInfo lookup_hardware(HardwareVariant variant) {
    switch (variant) {
        case HardwareVariant::V1:      // 50 kHz .. 900 MHz
            return entry(variant, 50e3, 900e6, 101, {"S11", "S21"}, ch_dialect(),
                         caps(true, false, true, false, false, false));
        case HardwareVariant::VH:      // 50 kHz .. 1.5 GHz
            return entry(variant, 50e3, 1.5e9, 201, {"S11", "S21"}, ch_dialect(),
                         caps(true, true, true, false, true, false));
        case HardwareVariant::V2:      // 50 kHz .. 3 GHz
        case HardwareVariant::SAA2:
            return entry(variant, 50e3, 3e9, 4000, {"S11", "S21"}, v2_dialect(),
                         caps(true, true, true, false, true, true));
        case HardwareVariant::V2Plus:  // 50 kHz .. 6 GHz
            return entry(variant, 50e3, 6e9, 4000, {"S11", "S21"}, v2_dialect(),
                         caps(true, true, true, false, true, true));
        case HardwareVariant::V2Plus4:
            return entry(variant, 50e3, 6e9, 4000, {"S11", "S21", "S12", "S22"}, v2_dialect(),
                         caps(true, true, true, true, true, true));
        case HardwareVariant::TinySA:  // 100 kHz .. 960 MHz, reflection only
            return entry(variant, 100e3, 960e6, 500, {"S11"}, ch_dialect(),
                         caps(false, false, true, false, true, true));
        case HardwareVariant::LiteVNA: // 50 kHz .. 6.3 GHz
            return entry(variant, 50e3, 6.3e9, 1024, {"S11", "S21"}, ch_dialect(),
                         caps(true, true, true, false, false, false));
        case HardwareVariant::Unknown:
            break;
    }
    // Conservative defaults until detection succeeds.
    return entry(HardwareVariant::Unknown, 50e3, 900e6, 101, {"S11"}, ch_dialect(),
                 caps(false, false, true, false, false, false));
}

const char* variant_name(HardwareVariant variant) {
    switch (variant) {
        case HardwareVariant::V1:      return "NanoVNA v1";
        case HardwareVariant::VH:      return "NanoVNA-H";
        case HardwareVariant::V2:      return "NanoVNA v2";
        case HardwareVariant::V2Plus:  return "NanoVNA v2 Plus";
        case HardwareVariant::V2Plus4: return "NanoVNA v2 Plus4";
        case HardwareVariant::SAA2:    return "SAA2";
        case HardwareVariant::TinySA:  return "TinySA";
        case HardwareVariant::LiteVNA: return "LiteVNA";
        case HardwareVariant::Unknown: break;
    }
    return "Unknown";
}

const char* version_label(HardwareVariant variant) {
    switch (variant) {
        case HardwareVariant::V1:      return "v1";
        case HardwareVariant::VH:      return "vh";
        case HardwareVariant::V2:
        case HardwareVariant::V2Plus:
        case HardwareVariant::V2Plus4:
        case HardwareVariant::SAA2:    return "v2";
        case HardwareVariant::TinySA:  return "tinysa";
        case HardwareVariant::LiteVNA: return "litevna";
        case HardwareVariant::Unknown: break;
    }
    return "unknown";
}

bool is_v2_family(HardwareVariant variant) {
    return variant == HardwareVariant::V2 || variant == HardwareVariant::V2Plus ||
           variant == HardwareVariant::V2Plus4 || variant == HardwareVariant::SAA2;
}

// ---------- lowercase + strip normalizer ----------
// "NanoVNA v2 Plus4", "nanovna-v2-plus4" and "V2PLUS4" all collapse to the
// same key so the CLI accepts whatever the user copies from a label.
static std::string squash(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == ' ' || c == '-' || c == '_') continue;
        out.push_back((char)std::tolower((unsigned char)c));
    }
    return out;
}

bool parse_variant(const std::string& text, HardwareVariant& out) {
    const std::string key = squash(text);
    if (key.empty()) return false;

    for (HardwareVariant v : ALL_VARIANTS) {
        std::string name = squash(variant_name(v));
        // "nanovnav2plus4" -> also accept the bare "v2plus4"
        std::string bare = name.rfind("nanovna", 0) == 0 ? name.substr(7) : name;
        if (key == name || key == bare) { out = v; return true; }
    }
    if (key == "vh" || key == "h") { out = HardwareVariant::VH; return true; }
    return false;
}

bool is_port_supported(const HardwareInfo& info, const std::string& port) {
    for (const auto& p : info.supported_ports) {
        if (p == port) return true;
    }
    return false;
}

std::string fill_template(const std::string& tmpl, std::initializer_list<int64_t> values) {
    std::string out;
    out.reserve(tmpl.size() + 32);
    auto next = values.begin();

    for (std::size_t i = 0; i < tmpl.size(); ++i) {
        if (tmpl[i] == '%' && i + 1 < tmpl.size()) {
            if (tmpl[i + 1] == '%') { out.push_back('%'); ++i; continue; }
            if (tmpl[i + 1] == 'd' && next != values.end()) {
                out += std::to_string(*next++);
                ++i;
                continue;
            }
        }
        out.push_back(tmpl[i]);
    }
    return out;
}

} // namespace nanovna
