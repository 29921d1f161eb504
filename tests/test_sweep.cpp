#include <doctest/doctest.h>
#include "nanovna/sweep.hpp"

using namespace nanovna;

TEST_CASE("validate_sweep() reports the first violated bound") {
    const HardwareInfo v1 = lookup_hardware(HardwareVariant::V1);
    Error err;

    CHECK_FALSE(validate_sweep(v1, 10, 900000000, 101, err));
    CHECK(err.code == ErrorCode::OutOfRange);
    CHECK(err.detail == "start_hz=10<min=50000");

    err.clear();
    CHECK_FALSE(validate_sweep(v1, 50000, 1000000000, 101, err));
    CHECK(err.detail == "stop_hz=1000000000>max=900000000");

    err.clear();
    CHECK_FALSE(validate_sweep(v1, 50000, 900000000, 102, err));
    CHECK(err.detail == "points=102>max=101");

    // start is checked before stop and points
    err.clear();
    CHECK_FALSE(validate_sweep(v1, 1, 2000000000, 5000, err));
    CHECK(err.detail == "start_hz=1<min=50000");
}

TEST_CASE("validate_sweep() accepts requests on the bounds") {
    Error err;
    CHECK(validate_sweep(lookup_hardware(HardwareVariant::V1), 50000, 900000000, 101, err));
    CHECK(validate_sweep(lookup_hardware(HardwareVariant::V2Plus4), 50000, 6000000000LL, 4000, err));
    CHECK(err.ok());
}

TEST_CASE("format_sweep_command() fills start/stop/points") {
    const CommandSet cmds = lookup_hardware(HardwareVariant::V2Plus).command_set;
    CHECK(format_sweep_command(cmds, 1000000, 6000000000LL, 201) == "sweep 1000000 6000000000 201");
}

TEST_CASE("Fallback commands are scoped by family") {
    auto v2 = fallback_sweep_commands(HardwareVariant::SAA2, 1000, 2000, 11);
    REQUIRE(v2.size() == 3);
    CHECK(v2[0] == "sweep start 1000");
    CHECK(v2[1] == "sweep stop 2000");
    CHECK(v2[2] == "sweep points 11");

    auto v1 = fallback_sweep_commands(HardwareVariant::VH, 1000, 2000, 11);
    REQUIRE(v1.size() == 3);
    CHECK(v1[0] == "start 1000");
    CHECK(v1[1] == "stop 2000");
    CHECK(v1[2] == "points 11");
}

TEST_CASE("filter_reply_lines() drops echo, prompt, error and blank lines") {
    const std::string reply = "frequencies\r\n1000000\r\n\r\n?\r\nbad?\r\n2000000\r\nch> ";
    auto lines = filter_reply_lines(reply, "frequencies", "ch>");
    REQUIRE(lines.size() == 2);
    CHECK(lines[0] == "1000000");
    CHECK(lines[1] == "2000000");
}

TEST_CASE("parse_frequency_lines() keeps whole-number tokens only") {
    const std::string reply = "frequencies\r\n 50000 \r\n12abc\r\n1.5e6\r\nch> ";
    auto f = parse_frequency_lines(reply, "frequencies", "ch>");
    REQUIRE(f.size() == 2);
    CHECK(f[0] == doctest::Approx(50000.0));
    CHECK(f[1] == doctest::Approx(1500000.0));
}

TEST_CASE("parse_complex_lines() reads re/im pairs and skips the data echo") {
    const std::string reply =
        "data 0\r\n"
        "0.5 -0.2\r\n"
        "0.25\r\n"            // one token
        "x 1\r\n"             // not numeric
        "data 1\r\n"          // stray data line
        "-1e-3 4e-3 extra\r\n"
        "2> ";
    auto s = parse_complex_lines(reply, "data 0", "2>", "data");
    REQUIRE(s.size() == 2);
    CHECK(s[0].real() == doctest::Approx(0.5));
    CHECK(s[0].imag() == doctest::Approx(-0.2));
    CHECK(s[1].real() == doctest::Approx(-0.001));
    CHECK(s[1].imag() == doctest::Approx(0.004));
}

TEST_CASE("reconcile_sweep() truncates to the shorter of frequencies and S11 and pads S21") {
    SweepData d;
    d.frequencies = {1000000.0, 2000000.0};
    d.s11 = {{0.5, -0.2}};
    Error err;
    REQUIRE(reconcile_sweep(d, err));
    CHECK(d.frequencies.size() == 1);
    CHECK(d.s11.size() == 1);
    REQUIRE(d.s21.size() == 1);
    CHECK(d.s21[0] == std::complex<double>(0.0, 0.0));
}

TEST_CASE("reconcile_sweep() trims a long S21 and pads a short one") {
    SweepData d;
    d.frequencies = {1.0, 2.0, 3.0};
    d.s11 = {{1, 0}, {2, 0}, {3, 0}};
    d.s21 = {{9, 9}, {8, 8}, {7, 7}, {6, 6}};
    Error err;
    REQUIRE(reconcile_sweep(d, err));
    CHECK(d.s21.size() == 3);
    CHECK(d.s21[2] == std::complex<double>(7, 7));

    SweepData e;
    e.frequencies = {1.0, 2.0};
    e.s11 = {{1, 0}, {2, 0}};
    e.s21 = {{5, 5}};
    REQUIRE(reconcile_sweep(e, err));
    REQUIRE(e.s21.size() == 2);
    CHECK(e.s21[0] == std::complex<double>(5, 5));
    CHECK(e.s21[1] == std::complex<double>(0, 0));
}

TEST_CASE("reconcile_sweep() fails with NoData on empty frequencies or S11") {
    Error err;
    SweepData no_freq;
    no_freq.s11 = {{1, 0}};
    CHECK_FALSE(reconcile_sweep(no_freq, err));
    CHECK(err.code == ErrorCode::NoData);
    CHECK(err.detail == "frequencies");

    err.clear();
    SweepData no_s11;
    no_s11.frequencies = {1.0};
    CHECK_FALSE(reconcile_sweep(no_s11, err));
    CHECK(err.code == ErrorCode::NoData);
    CHECK(err.detail == "s11");
}

TEST_CASE("parse_double() rejects partial tokens") {
    double v = 0;
    CHECK(parse_double("3.25", v));
    CHECK(v == doctest::Approx(3.25));
    CHECK_FALSE(parse_double("3.25MHz", v));
    CHECK_FALSE(parse_double("", v));
    CHECK(command_token("data %d") == "data");
    CHECK(command_token("") == "");
}
