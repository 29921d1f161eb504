#include <doctest/doctest.h>
#include "nanovna/error.hpp"

using namespace nanovna;

TEST_CASE("Error defaults to ok and renders the bare reason") {
    Error e;
    CHECK(e.ok());
    CHECK(e.to_string() == "ok");
}

TEST_CASE("fail() fills the error and returns false") {
    Error e;
    CHECK(fail(e, ErrorCode::OutOfRange, "start_hz=10<min=50000") == false);
    CHECK_FALSE(e.ok());
    CHECK(e.code == ErrorCode::OutOfRange);
    CHECK(e.to_string() == "out_of_range:start_hz=10<min=50000");

    e.clear();
    CHECK(e.ok());
    CHECK(e.detail.empty());
}

TEST_CASE("error_code_name() gives stable snake_case tokens") {
    CHECK(std::string(error_code_name(ErrorCode::NotConnected))       == "not_connected");
    CHECK(std::string(error_code_name(ErrorCode::CommandFailed))      == "command_failed");
    CHECK(std::string(error_code_name(ErrorCode::NoData))             == "no_data");
    CHECK(std::string(error_code_name(ErrorCode::UnrecognizedDevice)) == "unrecognized_device");
    CHECK(std::string(error_code_name(ErrorCode::NoDeviceFound))      == "no_device_found");
    CHECK(std::string(error_code_name(ErrorCode::Timeout))            == "timeout");
    CHECK(std::string(error_code_name(ErrorCode::Io))                 == "io");
}
