#pragma once
/**
 * @page nv-hardware NanoVNA Capability Registry
 * @file hardware.hpp
 * @brief Hardware variants, their command dialects, and their capability limits.
 *
 * @details
 * PURPOSE
 * -------
 * The NanoVNA family shares one text protocol, but every model bends it a
 * little: different prompts ("ch>" vs "2>"), different frequency query
 * commands ("frequencies" vs "freq"), different point limits and ranges.
 * This header is the single table that records those differences so the
 * channel, detector and parsers never hard-code a model.
 *
 * WHAT THIS DOES
 * --------------
 * - Declares the closed `HardwareVariant` enumeration.
 * - Declares the per-variant data: `FrequencyRange`, `CommandSet`,
 *   `HardwareCapabilities`, bundled into `HardwareInfo`.
 * - `lookup_hardware()` returns the entry for a variant. It is total: every
 *   enumeration value (Unknown included) has an entry. Unknown gets the
 *   conservative defaults: narrowest range, 101 points, S11 only.
 *
 * HOW IT FITS
 * -----------
 *   detector.hpp  -> classify_variant() -> lookup_hardware() -> Device state
 *   sweep.hpp     -> CommandSet templates + range/point validation
 *   device_info   -> variant display name as the default model
 *
 * The registry is immutable. Entries are returned by value so sessions can
 * hold their own copy without synchronization.
 *
 * COMMAND TEMPLATES
 * -----------------
 * Templates use printf-like `%d` slots filled left to right by
 * fill_template(). Values are 64-bit so 6 GHz stop frequencies fit.
 */

#include <cstdint>
#include <initializer_list>
#include <string>
#include <vector>

namespace nanovna {

enum class HardwareVariant : uint8_t {
  Unknown = 0,
  V1,       ///< Original NanoVNA v1
  VH,       ///< NanoVNA-H
  V2,       ///< NanoVNA v2 (S-A-A-2 based)
  V2Plus,   ///< NanoVNA v2 Plus
  V2Plus4,  ///< NanoVNA v2 Plus4
  SAA2,     ///< Standalone SAA2
  TinySA,   ///< TinySA spectrum analyzer
  LiteVNA   ///< LiteVNA
};

/// Every variant, in enumeration order. Handy for table-driven callers.
extern const HardwareVariant ALL_VARIANTS[9];

struct FrequencyRange {
  double min_hz{0.0};
  double max_hz{0.0};
};

struct CommandSet {
  std::string sweep;             ///< "sweep %d %d %d" (start, stop, points)
  std::string frequencies;       ///< frequency list query
  std::string data;              ///< "data %d" (port index)
  std::string info;
  std::string version;
  std::string calibration_save;  ///< "save %d" (slot)
  std::string calibration_load;  ///< "recall %d" (slot)
  std::string prompt;            ///< end-of-response marker
};

struct HardwareCapabilities {
  bool has_s21{false};
  bool has_time_domain{false};
  bool has_calibration{false};
  bool has_multiple_ports{false};
  bool has_generator{false};
  bool has_spectrum_mode{false};
};

struct HardwareInfo {
  HardwareVariant          variant{HardwareVariant::Unknown};
  FrequencyRange           frequency_range;
  int                      max_sweep_points{0};
  std::vector<std::string> supported_ports;   ///< ordered, never empty
  CommandSet               command_set;
  HardwareCapabilities     capabilities;
};

/**
 * @brief Registry lookup. Total over HardwareVariant; no side effects.
 */
HardwareInfo lookup_hardware(HardwareVariant variant);

/// Human-readable model name ("NanoVNA v2 Plus4", "TinySA", "Unknown").
const char* variant_name(HardwareVariant variant);

/// Short session label: v1, vh, v2 (whole V2 family), tinysa, litevna, unknown.
const char* version_label(HardwareVariant variant);

/// True for V2, V2Plus, V2Plus4 and SAA2, which share the "2>" dialect.
bool is_v2_family(HardwareVariant variant);

/**
 * @brief Map a user string back to a variant (case-insensitive).
 *
 * Accepts display names ("NanoVNA-H") and compact tokens ("vh", "v2plus4",
 * "saa2", "tinysa", "litevna"). Returns false when nothing matches.
 */
bool parse_variant(const std::string& text, HardwareVariant& out);

/// Exact, case-sensitive membership test on HardwareInfo::supported_ports.
bool is_port_supported(const HardwareInfo& info, const std::string& port);

/**
 * @brief Fill each `%d` in @p tmpl with the next value from @p values.
 *
 * Extra slots stay literal; extra values are ignored. "%%" yields "%".
 */
std::string fill_template(const std::string& tmpl, std::initializer_list<int64_t> values);

} // namespace nanovna
