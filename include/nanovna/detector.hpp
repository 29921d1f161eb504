#pragma once
/**
 * @file detector.hpp
 * @brief Variant classification from the raw probe reply and the `info` text.
 *
 * @details
 * Firmware does not announce its model in any fixed format, so detection is
 * heuristic. All of the rules live in classify_variant() so a new firmware
 * quirk is patched here, without touching the channel or the parsers.
 *
 * Rules, first match wins (info checks are case-insensitive substrings):
 *
 *   probe starts with "ch> "                         -> V1
 *       info has "tinysa"                            -> TinySA
 *       else info has "litevna"                      -> LiteVNA
 *   probe starts with "\r\nch> " or "\r\n?\r\nch> "  -> VH
 *       info has "nanovna v1"                        -> V1
 *   probe starts with "2" or contains "2>"           -> V2
 *       info has "plus4"                             -> V2Plus4
 *       else info has "plus"                         -> V2Plus
 *       else info has "saa2"                         -> SAA2
 *   otherwise                                        -> Unknown
 *
 * "plus4" is tested before "plus": every Plus4 banner also contains "plus".
 * The prompt strings are what current firmware prints; they are best-effort,
 * not a protocol guarantee.
 */

#include "nanovna/hardware.hpp"

#include <string>

namespace nanovna {

/// Pure and deterministic: same inputs, same variant.
HardwareVariant classify_variant(const std::string& probe, const std::string& info);

} // namespace nanovna
