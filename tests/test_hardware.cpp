#include <doctest/doctest.h>
#include "nanovna/hardware.hpp"

using namespace nanovna;

TEST_CASE("Every variant has a sane, deterministic registry entry") {
    for (HardwareVariant v : ALL_VARIANTS) {
        CAPTURE(variant_name(v));
        HardwareInfo a = lookup_hardware(v);
        HardwareInfo b = lookup_hardware(v);

        CHECK(a.variant == v);
        CHECK(a.frequency_range.min_hz >= 0.0);
        CHECK(a.frequency_range.min_hz <= a.frequency_range.max_hz);
        CHECK(a.max_sweep_points > 0);
        CHECK_FALSE(a.supported_ports.empty());
        CHECK_FALSE(a.command_set.prompt.empty());

        CHECK(a.frequency_range.max_hz == b.frequency_range.max_hz);
        CHECK(a.max_sweep_points == b.max_sweep_points);
        CHECK(a.supported_ports == b.supported_ports);
        CHECK(a.command_set.frequencies == b.command_set.frequencies);
    }
}

TEST_CASE("V2Plus4 exposes four S-parameters") {
    HardwareInfo hw = lookup_hardware(HardwareVariant::V2Plus4);
    CHECK(hw.supported_ports == std::vector<std::string>{"S11", "S21", "S12", "S22"});
    CHECK(hw.capabilities.has_multiple_ports);
    CHECK(is_port_supported(hw, "S12"));
    CHECK_FALSE(is_port_supported(hw, "S33"));
    CHECK_FALSE(is_port_supported(hw, "s12"));   // exact match only
}

TEST_CASE("Unknown gets the conservative defaults") {
    HardwareInfo hw = lookup_hardware(HardwareVariant::Unknown);
    CHECK(hw.frequency_range.min_hz == 50000.0);
    CHECK(hw.frequency_range.max_hz == 900000000.0);
    CHECK(hw.max_sweep_points == 101);
    CHECK(hw.supported_ports == std::vector<std::string>{"S11"});
    CHECK(hw.command_set.prompt == "ch>");
    CHECK(hw.capabilities.has_calibration);
    CHECK_FALSE(hw.capabilities.has_s21);
    CHECK_FALSE(hw.capabilities.has_generator);
}

TEST_CASE("V2 family shares the 2> dialect") {
    for (HardwareVariant v : {HardwareVariant::V2, HardwareVariant::V2Plus,
                              HardwareVariant::V2Plus4, HardwareVariant::SAA2}) {
        CAPTURE(variant_name(v));
        HardwareInfo hw = lookup_hardware(v);
        CHECK(is_v2_family(v));
        CHECK(hw.command_set.prompt == "2>");
        CHECK(hw.command_set.frequencies == "freq");
        CHECK(hw.max_sweep_points == 4000);
        CHECK(std::string(version_label(v)) == "v2");
    }
    CHECK_FALSE(is_v2_family(HardwareVariant::VH));
    CHECK_FALSE(is_v2_family(HardwareVariant::LiteVNA));
}

TEST_CASE("Per-variant limits") {
    CHECK(lookup_hardware(HardwareVariant::VH).max_sweep_points == 201);
    CHECK(lookup_hardware(HardwareVariant::VH).frequency_range.max_hz == 1500000000.0);
    CHECK(lookup_hardware(HardwareVariant::V2Plus).frequency_range.max_hz == 6000000000.0);

    HardwareInfo tiny = lookup_hardware(HardwareVariant::TinySA);
    CHECK(tiny.frequency_range.min_hz == 100000.0);
    CHECK(tiny.max_sweep_points == 500);
    CHECK_FALSE(tiny.capabilities.has_s21);
    CHECK(tiny.capabilities.has_spectrum_mode);

    HardwareInfo lite = lookup_hardware(HardwareVariant::LiteVNA);
    CHECK(lite.frequency_range.max_hz == 6300000000.0);
    CHECK(lite.max_sweep_points == 1024);
    CHECK(lite.command_set.prompt == "ch>");
}

TEST_CASE("Names and labels") {
    CHECK(std::string(variant_name(HardwareVariant::VH)) == "NanoVNA-H");
    CHECK(std::string(variant_name(HardwareVariant::V2Plus4)) == "NanoVNA v2 Plus4");
    CHECK(std::string(version_label(HardwareVariant::V1)) == "v1");
    CHECK(std::string(version_label(HardwareVariant::VH)) == "vh");
    CHECK(std::string(version_label(HardwareVariant::TinySA)) == "tinysa");
    CHECK(std::string(version_label(HardwareVariant::LiteVNA)) == "litevna");
    CHECK(std::string(version_label(HardwareVariant::Unknown)) == "unknown");
}

TEST_CASE("parse_variant() accepts display names and compact tokens") {
    HardwareVariant v = HardwareVariant::Unknown;
    CHECK(parse_variant("NanoVNA-H", v));   CHECK(v == HardwareVariant::VH);
    CHECK(parse_variant("vh", v));          CHECK(v == HardwareVariant::VH);
    CHECK(parse_variant("v2plus4", v));     CHECK(v == HardwareVariant::V2Plus4);
    CHECK(parse_variant("V2 Plus", v));     CHECK(v == HardwareVariant::V2Plus);
    CHECK(parse_variant("SAA2", v));        CHECK(v == HardwareVariant::SAA2);
    CHECK(parse_variant("tinysa", v));      CHECK(v == HardwareVariant::TinySA);
    CHECK(parse_variant("LiteVNA", v));     CHECK(v == HardwareVariant::LiteVNA);
    CHECK(parse_variant("v1", v));          CHECK(v == HardwareVariant::V1);

    v = HardwareVariant::V1;
    CHECK_FALSE(parse_variant("hp8753", v));
    CHECK_FALSE(parse_variant("", v));
    CHECK(v == HardwareVariant::V1);        // untouched on failure
}

TEST_CASE("fill_template() fills %d slots left to right with 64-bit values") {
    CHECK(fill_template("sweep %d %d %d", {50000, 6000000000LL, 101}) == "sweep 50000 6000000000 101");
    CHECK(fill_template("data %d", {1}) == "data 1");
    CHECK(fill_template("data %d", {}) == "data %d");
    CHECK(fill_template("100%% %d", {7, 8}) == "100% 7");
}
