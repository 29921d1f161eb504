#include <doctest/doctest.h>
#include "port_scan.hpp"
#include "mock_transport.hpp"

#include <map>

using namespace nanovna;
using namespace nanovna::testing;

namespace {

// Opener over a fixed bench: path -> script. Paths not on the bench fail to open.
struct Bench {
    std::map<std::string, std::shared_ptr<MockScript>> ports;

    TransportOpener opener() {
        return [this](const transport::SerialConfig& cfg, Error& err)
                   -> std::unique_ptr<transport::ITransport> {
            auto it = ports.find(cfg.path);
            if (it == ports.end()) {
                fail(err, ErrorCode::Io, cfg.path + ":No such file or directory");
                return nullptr;
            }
            return make_mock(it->second);
        };
    }
};

std::shared_ptr<MockScript> modem() {
    auto s = make_script();
    s->replies[""] = "OK\r\n";
    return s;
}

std::shared_ptr<MockScript> nanovna_v2() {
    auto s = make_script();
    s->prompt = "2>";
    s->replies[""] = "2> ";
    return s;
}

std::shared_ptr<MockScript> nanovna_h() {
    auto s = make_script();
    s->replies[""] = "\r\nch> ";
    return s;
}

} // namespace

TEST_CASE("auto_detect() skips unopenable and unrecognized ports") {
    Bench bench;
    bench.ports["/dev/ttyACM1"] = modem();
    bench.ports["/dev/ttyACM2"] = nanovna_v2();

    Device dev(fast_timing());
    Error err;
    REQUIRE(auto_detect(dev, {"/dev/ttyACM0", "/dev/ttyACM1", "/dev/ttyACM2"},
                        transport::SerialConfig{}, bench.opener(), err));
    CHECK(dev.port() == "/dev/ttyACM2");
    CHECK(dev.hardware_variant() == HardwareVariant::V2);
    CHECK(dev.state() == SessionState::Identified);
    CHECK(bench.ports["/dev/ttyACM1"]->closed);      // rejected port is released
    CHECK_FALSE(bench.ports["/dev/ttyACM2"]->closed);
}

TEST_CASE("auto_detect() takes the first recognized port") {
    Bench bench;
    bench.ports["/dev/ttyACM0"] = nanovna_h();
    bench.ports["/dev/ttyACM1"] = nanovna_v2();

    Device dev(fast_timing());
    Error err;
    REQUIRE(auto_detect(dev, {"/dev/ttyACM0", "/dev/ttyACM1"},
                        transport::SerialConfig{}, bench.opener(), err));
    CHECK(dev.port() == "/dev/ttyACM0");
    CHECK(dev.version() == "vh");
    CHECK(bench.ports["/dev/ttyACM1"]->writes.empty());
}

TEST_CASE("auto_detect() with nothing usable is NoDeviceFound") {
    Bench bench;
    bench.ports["/dev/ttyUSB0"] = modem();

    Device dev(fast_timing());
    Error err;
    CHECK_FALSE(auto_detect(dev, {"/dev/ttyUSB0", "/dev/ttyUSB1"},
                            transport::SerialConfig{}, bench.opener(), err));
    CHECK(err.code == ErrorCode::NoDeviceFound);
    CHECK(dev.state() == SessionState::Closed);

    err.clear();
    CHECK_FALSE(auto_detect(dev, {}, transport::SerialConfig{}, bench.opener(), err));
    CHECK(err.code == ErrorCode::NoDeviceFound);
}

TEST_CASE("auto_detect() passes the base serial settings to the opener") {
    int seen_baud = 0;
    auto script = nanovna_h();
    TransportOpener opener = [&](const transport::SerialConfig& cfg, Error&) {
        seen_baud = cfg.baud;
        return make_mock(script);
    };
    transport::SerialConfig base;
    base.baud = 115200;

    Device dev(fast_timing());
    Error err;
    REQUIRE(auto_detect(dev, {"/dev/ttyACM0"}, base, opener, err));
    CHECK(seen_baud == 115200);
    REQUIRE(dev.port_config() != nullptr);
    CHECK(dev.port_config()->path == "/dev/ttyACM0");
}

TEST_CASE("discover_devices() reports every candidate") {
    Bench bench;
    bench.ports["/dev/ttyACM0"] = nanovna_v2();
    bench.ports["/dev/ttyACM1"] = modem();

    auto found = discover_devices({"/dev/ttyACM0", "/dev/ttyACM1", "/dev/ttyACM9"},
                                  transport::SerialConfig{}, bench.opener(), fast_timing());
    REQUIRE(found.size() == 3);

    CHECK(found[0].online);
    CHECK(found[0].variant == HardwareVariant::V2);
    CHECK(found[0].version == "v2");
    CHECK(bench.ports["/dev/ttyACM0"]->closed);      // probe sessions do not linger

    CHECK_FALSE(found[1].online);
    CHECK(found[1].reason.find("unrecognized_device") == 0);

    CHECK_FALSE(found[2].online);
    CHECK(found[2].reason.find("io:/dev/ttyACM9") == 0);
}

TEST_CASE("list_serial_ports() only returns device paths") {
    for (const auto& p : list_serial_ports()) CHECK(p.rfind("/dev/", 0) == 0);
}
