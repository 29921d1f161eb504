// -----------------------------------------------------------------------------
// Implementation for sweep.hpp
//
// Anything that is not a clean number is dropped line by line;
// reconcile_sweep() restores the three-array invariant at the end.
// -----------------------------------------------------------------------------

#include "nanovna/sweep.hpp"
#include "nanovna/text.hpp"

#include <algorithm>             // std::min
#include <cstdlib>               // strtod
#include <sstream>               // fmt_hz()

namespace nanovna {

// ---------- local helpers ----------

static std::string fmt_hz(double hz) {
    std::ostringstream os;
    os.precision(12);
    os << hz;
    return os.str();
}

bool parse_double(const std::string& token, double& out) {
    if (token.empty()) return false;
    char* e = nullptr;
    double v = std::strtod(token.c_str(), &e);
    if (!e || *e) return false;                   // leftover junk
    out = v;
    return true;
}

std::string command_token(const std::string& tmpl) {
    const auto fields = split_fields(tmpl);
    return fields.empty() ? std::string{} : fields.front();
}

// ---------- validation + formatting ----------

bool validate_sweep(const HardwareInfo& hw, int64_t start_hz, int64_t stop_hz,
                    int points, Error& err) {
    const FrequencyRange& r = hw.frequency_range;
    if (static_cast<double>(start_hz) < r.min_hz) {
        return fail(err, ErrorCode::OutOfRange,
                    "start_hz=" + std::to_string(start_hz) + "<min=" + fmt_hz(r.min_hz));
    }
    if (static_cast<double>(stop_hz) > r.max_hz) {
        return fail(err, ErrorCode::OutOfRange,
                    "stop_hz=" + std::to_string(stop_hz) + ">max=" + fmt_hz(r.max_hz));
    }
    if (points > hw.max_sweep_points) {
        return fail(err, ErrorCode::OutOfRange,
                    "points=" + std::to_string(points) + ">max=" + std::to_string(hw.max_sweep_points));
    }
    return true;
}

std::string format_sweep_command(const CommandSet& cmds, int64_t start_hz,
                                 int64_t stop_hz, int points) {
    return fill_template(cmds.sweep, {start_hz, stop_hz, static_cast<int64_t>(points)});
}

std::vector<std::string> fallback_sweep_commands(HardwareVariant variant, int64_t start_hz,
                                                 int64_t stop_hz, int points) {
    const std::string scope = is_v2_family(variant) ? "sweep " : "";
    return {
        scope + "start "  + std::to_string(start_hz),
        scope + "stop "   + std::to_string(stop_hz),
        scope + "points " + std::to_string(points),
    };
}

// ---------- reply parsing ----------

std::vector<std::string> filter_reply_lines(const std::string& reply,
                                            const std::string& echo,
                                            const std::string& prompt,
                                            const std::string& skip_prefix) {
    std::vector<std::string> out;
    for (const auto& raw : split_lines(reply)) {
        const std::string line = trim(raw);
        if (line.empty()) continue;
        if (line == echo) continue;                                   // command echo
        if (!prompt.empty() && line.find(prompt) != std::string::npos) continue;
        if (line.find('?') != std::string::npos) continue;            // firmware error marker
        if (!skip_prefix.empty() && starts_with(line, skip_prefix)) continue;
        out.push_back(line);
    }
    return out;
}

std::vector<double> parse_frequency_lines(const std::string& reply,
                                          const std::string& echo,
                                          const std::string& prompt) {
    std::vector<double> freqs;
    for (const auto& line : filter_reply_lines(reply, echo, prompt)) {
        double hz = 0.0;
        if (parse_double(line, hz)) freqs.push_back(hz);
    }
    return freqs;
}

std::vector<std::complex<double>> parse_complex_lines(const std::string& reply,
                                                      const std::string& echo,
                                                      const std::string& prompt,
                                                      const std::string& data_token) {
    std::vector<std::complex<double>> samples;
    for (const auto& line : filter_reply_lines(reply, echo, prompt, data_token)) {
        const auto fields = split_fields(line);
        if (fields.size() < 2) continue;          // need "re im"

        double re = 0.0, im = 0.0;
        if (parse_double(fields[0], re) && parse_double(fields[1], im))
            samples.emplace_back(re, im);
    }
    return samples;
}

// ---------- length reconciliation ----------

static void pad_s21(SweepData& d, std::size_t n) {
    while (d.s21.size() < n) d.s21.emplace_back(0.0, 0.0);
}

bool reconcile_sweep(SweepData& data, Error& err) {
    pad_s21(data, data.s11.size());

    if (data.frequencies.empty()) return fail(err, ErrorCode::NoData, "frequencies");
    if (data.s11.empty())         return fail(err, ErrorCode::NoData, "s11");

    const std::size_t n = std::min(data.frequencies.size(), data.s11.size());
    data.frequencies.resize(n);
    data.s11.resize(n);
    if (data.s21.size() > n) data.s21.resize(n);
    else                     pad_s21(data, n);
    return true;
}

} // namespace nanovna
