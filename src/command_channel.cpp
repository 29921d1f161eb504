// -----------------------------------------------------------------------------
// Implementation for command_channel.hpp
//
// - See command_channel.hpp for the exchange contract and timeout rules.
// - See tests/test_command_channel.cpp for scripted cases.
// -----------------------------------------------------------------------------

#include "nanovna/command_channel.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <thread>
#include <utility>
#include <vector>

namespace nanovna {

using transport::IoResult;

CommandChannel::CommandChannel(ChannelTiming timing) : timing_(timing) {}

void CommandChannel::sleep_ms(uint32_t ms) {
    if (ms) std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

void CommandChannel::drain() {
    if (io_) io_->discard_input();
}

// Write "<line>\r" in full. Anything short of all bytes is an Io failure.
bool CommandChannel::send_line(const std::string& line, Error& err) {
    std::string wire = line;
    wire.push_back('\r');

    std::size_t written = 0;
    IoResult rc = io_->write(reinterpret_cast<const uint8_t*>(wire.data()), wire.size(), written);
    if (rc != IoResult::Ok || written != wire.size()) {
        return fail(err, ErrorCode::Io, "write_failed:" + line);
    }
    return true;
}

bool CommandChannel::exchange(const std::string& command, std::string& response, Error& err) {
    response.clear();
    if (!connected()) return fail(err, ErrorCode::NotConnected, command);

    drain();                                      // stale bytes from an earlier reply
    if (!send_line(command, err)) return false;
    sleep_ms(timing_.grace_ms);

    std::vector<uint8_t> buf(timing_.read_chunk ? timing_.read_chunk : DEFAULT_READ_CHUNK);

    for (uint32_t attempt = 0; attempt < timing_.max_read_attempts; ++attempt) {
        std::size_t n = 0;
        IoResult rc = io_->read(buf.data(), buf.size(), n);

        if (rc == IoResult::Timeout) {
            if (!response.empty()) break;         // reply ended without a prompt
            return fail(err, ErrorCode::Timeout, command);
        }
        if (rc == IoResult::Error) {
            return fail(err, ErrorCode::Io, "read_failed:" + command);
        }

        if (n > 0) {
            response.append(reinterpret_cast<const char*>(buf.data()), n);
            if (!prompt_.empty() && response.find(prompt_) != std::string::npos) break;
        }
        sleep_ms(timing_.inter_read_ms);
    }

    spdlog::debug("exchange '{}' -> {} bytes", command, response.size());
    return true;
}

bool CommandChannel::probe(std::string& raw, Error& err) {
    raw.clear();
    if (!connected()) return fail(err, ErrorCode::NotConnected, "probe");

    drain();
    if (!send_line("", err)) return false;        // bare terminator
    sleep_ms(timing_.grace_ms);

    std::vector<uint8_t> buf(timing_.read_chunk ? timing_.read_chunk : DEFAULT_READ_CHUNK);
    std::size_t n = 0;
    IoResult rc = io_->read(buf.data(), buf.size(), n);
    if (rc == IoResult::Timeout) return fail(err, ErrorCode::Timeout, "probe");
    if (rc == IoResult::Error)   return fail(err, ErrorCode::Io, "read_failed:probe");

    raw.assign(reinterpret_cast<const char*>(buf.data()), n);
    spdlog::debug("probe -> {} bytes", raw.size());
    return true;
}

} // namespace nanovna
