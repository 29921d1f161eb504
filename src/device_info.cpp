// -----------------------------------------------------------------------------
// Implementation for device_info.hpp
//
// Best-effort: fields the reply does not carry stay empty.
// -----------------------------------------------------------------------------

#include "nanovna/device_info.hpp"
#include "nanovna/text.hpp"

namespace nanovna {

// V2 firmware prints "key: value" pairs. The value is the field between the
// first and second colon, so "Version: 1.0 built 12:30" yields "1.0 built 12".
static void parse_v2_line(const std::string& line, DeviceInfo& info) {
    if (contains_nocase(line, "nanovna") || contains_nocase(line, "saa2")) {
        info.model = line;
    }
    if (contains_nocase(line, "firmware") || contains_nocase(line, "version")) {
        const auto colon = line.find(':');
        if (colon != std::string::npos) {
            const auto next = line.find(':', colon + 1);
            info.firmware = trim(line.substr(colon + 1,
                next == std::string::npos ? std::string::npos : next - colon - 1));
        }
    }
}

// ChibiOS shells print a banner first, then "Serial: ..." and build lines.
static void parse_ch_line(const std::string& line, const std::string& default_model,
                          DeviceInfo& info) {
    if (info.model == default_model) info.model = line;

    if (starts_with(to_lower_ascii(line), "serial")) {
        std::string rest = line;
        if (starts_with(rest, "Serial:")) rest = rest.substr(7);
        info.serial_number = trim(rest);
    }

    if (info.firmware.empty()) {
        for (const auto& tok : split_fields(line)) {
            if (tok.size() > 1 && tok[0] == 'v') { info.firmware = tok; break; }
        }
    }
}

DeviceInfo parse_device_info(const HardwareInfo& hw, const std::string& reply) {
    const std::string default_model = variant_name(hw.variant);
    const std::string& echo   = hw.command_set.info;
    const std::string& prompt = hw.command_set.prompt;
    const bool v2 = is_v2_family(hw.variant);

    DeviceInfo info;
    info.model = default_model;

    for (const auto& raw : split_lines(reply)) {
        const std::string line = trim(raw);
        if (line.empty() || line == echo) continue;
        if (!prompt.empty() && line.find(prompt) != std::string::npos) continue;

        if (v2) parse_v2_line(line, info);
        else    parse_ch_line(line, default_model, info);
    }

    if (info.model.empty() || info.model == default_model)
        info.model = default_model + " (detected)";
    return info;
}

} // namespace nanovna
