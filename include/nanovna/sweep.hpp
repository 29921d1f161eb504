#pragma once
/**
 * @page nv-sweep NanoVNA Sweep Commands and Parsing
 * @file sweep.hpp
 * @brief Sweep command formatting, fallback forms, and text-to-sample parsing.
 *
 * @details
 * PURPOSE
 * -------
 * Everything about a sweep that does not need a serial port lives here, so
 * it can be tested against captured replies:
 *
 *   - validate_sweep():          range / point checks against HardwareInfo.
 *   - format_sweep_command():    the variant's primary "sweep %d %d %d".
 *   - fallback_sweep_commands(): the three scoped commands tried when the
 *                                primary form is rejected.
 *   - parse_frequency_lines():   "frequencies" reply -> Hz values.
 *   - parse_complex_lines():     "data N" reply      -> complex samples.
 *   - reconcile_sweep():         S21 padding, emptiness check, truncation.
 *
 * Device::set_sweep_config() and Device::run_sweep() glue these to the
 * command channel.
 *
 * LINE FILTER
 * -----------
 * Replies echo the command, may contain the prompt, and use "?" for errors.
 * Every parser trims each line and skips: blank lines, the echoed command,
 * lines containing the prompt, lines containing "?". Data replies also skip
 * lines starting with the data command token ("data").
 *
 * LENGTH INVARIANT
 * ----------------
 * After reconcile_sweep() succeeds: frequencies, s11 and s21 have the same
 * length, equal to min(#frequencies, #s11). Missing S21 samples are 0+0i.
 */

#include "nanovna/error.hpp"
#include "nanovna/hardware.hpp"

#include <complex>
#include <cstdint>
#include <string>
#include <vector>

namespace nanovna {

struct SweepData {
    std::vector<double>               frequencies;
    std::vector<std::complex<double>> s11;
    std::vector<std::complex<double>> s21;
};

/**
 * @brief Check a request against the active capability bounds.
 *
 * Order: start below min, stop above max, points above max. The first
 * violation is reported as OutOfRange with a detail like
 * "start_hz=10<min=50000".
 */
bool validate_sweep(const HardwareInfo& hw, int64_t start_hz, int64_t stop_hz,
                    int points, Error& err);

std::string format_sweep_command(const CommandSet& cmds, int64_t start_hz,
                                 int64_t stop_hz, int points);

/**
 * @brief Scoped per-parameter commands, in send order (start, stop, points).
 *
 * V2 family: "sweep start N", "sweep stop N", "sweep points N".
 * Others:    "start N", "stop N", "points N".
 */
std::vector<std::string> fallback_sweep_commands(HardwareVariant variant, int64_t start_hz,
                                                 int64_t stop_hz, int points);

/// Split on '\n', trim, apply the shared filter. Returns the surviving lines.
std::vector<std::string> filter_reply_lines(const std::string& reply,
                                            const std::string& echo,
                                            const std::string& prompt,
                                            const std::string& skip_prefix = {});

/// One frequency per surviving line; lines that are not a number are dropped.
std::vector<double> parse_frequency_lines(const std::string& reply,
                                          const std::string& echo,
                                          const std::string& prompt);

/**
 * @brief "re im" per surviving line; lines with fewer than two numeric tokens are dropped.
 *
 * @param data_token  First word of the data command ("data"); lines starting with it are skipped.
 */
std::vector<std::complex<double>> parse_complex_lines(const std::string& reply,
                                                      const std::string& echo,
                                                      const std::string& prompt,
                                                      const std::string& data_token);

/**
 * @brief Pad S21 to S11, fail NoData on empty frequencies/S11, truncate to common length.
 */
bool reconcile_sweep(SweepData& data, Error& err);

/// Parse a whole token as a double (strtod, no trailing junk). False on failure.
bool parse_double(const std::string& token, double& out);

/// First whitespace-delimited word of a command template ("data %d" -> "data").
std::string command_token(const std::string& tmpl);

} // namespace nanovna
