#pragma once
/**
 * @page nv-command-channel NanoVNA Command Channel
 * @file command_channel.hpp
 * @brief Synchronous request/response over a text shell that ends each reply with a prompt.
 *
 * @details
 * PURPOSE
 * -------
 * The NanoVNA firmware is a tiny shell: you type a command, it prints lines,
 * then prints its prompt ("ch> " or "2> ") and waits. There is no length
 * prefix and no end-of-reply byte other than that prompt. The channel turns
 * this into one call: `exchange("frequencies", reply, err)`.
 *
 * PROCESS FLOW
 * ------------
 * 1. discard_input(): drop anything a previous, half-read reply left behind.
 * 2. write "<command>\r".
 * 3. sleep grace_ms so the firmware starts talking.
 * 4. read chunks, appending, until the accumulated text contains the prompt
 *    or max_read_attempts reads have been made (inter_read_ms between them).
 *
 * Timeout rules:
 *   - timeout after at least one byte  -> normal end of reply.
 *   - timeout with zero bytes          -> ErrorCode::Timeout.
 *   - running out of attempts          -> whatever arrived, not an error.
 *
 * The prompt is per-variant. Device calls set_prompt() whenever its
 * HardwareInfo changes, so V2-family replies stop at "2>" instead of waiting
 * out every attempt.
 *
 * The channel does not own the transport; Device does. bind(nullptr) makes
 * every call fail with NotConnected.
 */

#include "nanovna/error.hpp"
#include "nanovna/transport/transport_base.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

namespace nanovna {

static constexpr uint32_t DEFAULT_GRACE_MS          = 50;
static constexpr uint32_t DEFAULT_INTER_READ_MS     = 20;
static constexpr uint32_t DEFAULT_MAX_READ_ATTEMPTS = 10;
static constexpr std::size_t DEFAULT_READ_CHUNK     = 1024;

/**
 * @brief Pacing and size limits for one exchange.
 *
 * A reply is capped at max_read_attempts * read_chunk bytes (10 KiB with the
 * defaults). That covers the ChibiOS shells, but a 4000-point V2 `data 0`
 * reply runs to roughly 100 KB and is cut short, possibly mid-line. Raise
 * max_read_attempts or read_chunk (see nanovna-cli --config) for long sweeps.
 */
struct ChannelTiming {
    uint32_t    grace_ms{DEFAULT_GRACE_MS};                   ///< after write, before first read
    uint32_t    inter_read_ms{DEFAULT_INTER_READ_MS};         ///< between read attempts
    uint32_t    max_read_attempts{DEFAULT_MAX_READ_ATTEMPTS};
    std::size_t read_chunk{DEFAULT_READ_CHUNK};               ///< bytes per read call
};

class CommandChannel {
public:
    explicit CommandChannel(ChannelTiming timing = {});

    void bind(transport::ITransport* io) { io_ = io; }
    bool connected() const { return io_ != nullptr && io_->is_open(); }

    void set_prompt(std::string prompt) { prompt_ = std::move(prompt); }
    const std::string& prompt() const { return prompt_; }

    void set_timing(const ChannelTiming& timing) { timing_ = timing; }
    const ChannelTiming& timing() const { return timing_; }

    /**
     * @brief Send one command and collect its reply.
     *
     * @param command   Command text without terminator ("data 0").
     * @param response  Receives the raw accumulated text (echo and prompt included).
     * @param err       NotConnected, Io (write/read failure) or Timeout (no bytes).
     */
    bool exchange(const std::string& command, std::string& response, Error& err);

    /**
     * @brief Detection probe: drain, bare "\r", grace period, exactly one read.
     *
     * Captures the prompt the firmware prints in response to an empty line,
     * without waiting for any particular marker.
     */
    bool probe(std::string& raw, Error& err);

    /// Drop buffered input. No-op when unbound.
    void drain();

private:
    bool send_line(const std::string& line, Error& err);
    static void sleep_ms(uint32_t ms);

    transport::ITransport* io_{nullptr};
    std::string            prompt_{"ch>"};
    ChannelTiming          timing_;
};

} // namespace nanovna
