// -----------------------------------------------------------------------------
// Implementation for detector.hpp
//
// classify_variant() is a pure function over the probe and info replies;
// Device::detect_version() does the I/O and feeds it.
// -----------------------------------------------------------------------------

#include "nanovna/detector.hpp"
#include "nanovna/text.hpp"

namespace nanovna {

HardwareVariant classify_variant(const std::string& probe, const std::string& info) {
    const std::string li = to_lower_ascii(info);
    auto has = [&li](const char* needle) { return li.find(needle) != std::string::npos; };

    // Plain "ch> " prompt: v1 firmware and its descendants.
    if (starts_with(probe, "ch> ")) {
        if (has("tinysa"))  return HardwareVariant::TinySA;
        if (has("litevna")) return HardwareVariant::LiteVNA;
        return HardwareVariant::V1;
    }

    // NanoVNA-H echoes the empty line (and sometimes a "?") before the prompt.
    if (starts_with(probe, "\r\nch> ") || starts_with(probe, "\r\n?\r\nch> ")) {
        if (has("nanovna v1")) return HardwareVariant::V1;
        return HardwareVariant::VH;
    }

    // V2 family. Most specific banner first.
    if (starts_with(probe, "2") || probe.find("2>") != std::string::npos) {
        if (has("plus4")) return HardwareVariant::V2Plus4;
        if (has("plus"))  return HardwareVariant::V2Plus;
        if (has("saa2"))  return HardwareVariant::SAA2;
        return HardwareVariant::V2;
    }

    return HardwareVariant::Unknown;
}

} // namespace nanovna
