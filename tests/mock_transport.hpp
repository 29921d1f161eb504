#pragma once
/**
 * @file mock_transport.hpp
 * @brief Scripted in-memory ITransport for driver tests.
 *
 * Each written line ("<cmd>\r") selects a canned reply from the script. The
 * reply is handed out by read() in chunks of at most `chunk` bytes; once it is
 * exhausted read() reports Timeout. The script lives in a shared_ptr so tests
 * can inspect writes after the Device has taken ownership of the transport.
 */

#include "nanovna/command_channel.hpp"
#include "nanovna/transport/transport_base.hpp"

#include <algorithm>
#include <cstring>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace nanovna::testing {

struct MockScript {
    std::map<std::string, std::string> replies;  ///< command (no "\r") -> raw reply; "" is the probe
    std::set<std::string> write_fails;           ///< commands whose write() returns Error
    std::set<std::string> read_fails;            ///< commands whose first read() returns Error
    bool echo_unscripted{true};                  ///< unknown commands reply "<cmd>\r\n<prompt> "
    std::string prompt{"ch>"};
    std::size_t chunk{1024};                     ///< max bytes per read()

    std::vector<std::string> writes;             ///< every command written, in order
    std::string pending;                         ///< bytes not yet read
    std::string current;                         ///< last command written
    int  discards{0};
    int  reads{0};
    bool closed{false};

    bool sent(const std::string& cmd) const {
        return std::find(writes.begin(), writes.end(), cmd) != writes.end();
    }
};

class MockTransport : public transport::ITransport {
public:
    explicit MockTransport(std::shared_ptr<MockScript> script) : s_(std::move(script)) {}

    transport::IoResult write(const uint8_t* data, std::size_t len, std::size_t& written) override {
        written = 0;
        if (s_->closed) return transport::IoResult::Error;

        std::string line(reinterpret_cast<const char*>(data), len);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        s_->writes.push_back(line);
        s_->current = line;

        if (s_->write_fails.count(line)) return transport::IoResult::Error;

        auto it = s_->replies.find(line);
        if (it != s_->replies.end())    s_->pending += it->second;
        else if (s_->echo_unscripted)  s_->pending += line + "\r\n" + s_->prompt + " ";

        written = len;
        return transport::IoResult::Ok;
    }

    transport::IoResult read(uint8_t* out, std::size_t cap, std::size_t& out_len) override {
        out_len = 0;
        ++s_->reads;
        if (s_->closed) return transport::IoResult::Error;
        if (s_->read_fails.count(s_->current)) return transport::IoResult::Error;
        if (s_->pending.empty()) return transport::IoResult::Timeout;

        const std::size_t n = std::min({cap, s_->chunk, s_->pending.size()});
        std::memcpy(out, s_->pending.data(), n);
        s_->pending.erase(0, n);
        out_len = n;
        return transport::IoResult::Ok;
    }

    void discard_input() override {
        ++s_->discards;
        s_->pending.clear();
    }

    bool close() override { s_->closed = true; return true; }
    bool is_open() const override { return !s_->closed; }
    const char* name() const override { return "mock"; }

private:
    std::shared_ptr<MockScript> s_;
};

/// No sleeps; tests run at memory speed.
inline ChannelTiming fast_timing() {
    ChannelTiming t;
    t.grace_ms = 0;
    t.inter_read_ms = 0;
    return t;
}

inline std::shared_ptr<MockScript> make_script() { return std::make_shared<MockScript>(); }

inline std::unique_ptr<transport::ITransport> make_mock(const std::shared_ptr<MockScript>& s) {
    return std::make_unique<MockTransport>(s);
}

} // namespace nanovna::testing
