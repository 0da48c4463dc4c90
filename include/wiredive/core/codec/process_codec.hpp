#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <chrono>

#include "wiredive/core/codec/codec_concept.hpp"
#include "wiredive/core/codec/error.hpp"
#include "wiredive/core/transport/frame.hpp"
#include "lcr/log/logger.hpp"


namespace wiredive::core::codec {

/*
===============================================================================
 ProcessCodec
===============================================================================

Frame codec backed by two external commands, typically protobuf.js scripts
compiled against the vendor schema:

    encoder: <cmd...> <schema>   stdin: JSON document   stdout: raw frame bytes
    decoder: <cmd...> <schema>   stdin: base64 frame    stdout: JSON document

Text frames never reach the decoder. A text payload that is valid JSON is
returned unchanged; any other text is wrapped as {"text": "<payload>"}.

Every call spawns a fresh process, so one ProcessCodec may be shared by
concurrent runs.
===============================================================================
*/
class ProcessCodec {
public:
    static constexpr std::chrono::milliseconds DEFAULT_TIMEOUT{30000};

    ProcessCodec(std::vector<std::string> encoder,
                 std::vector<std::string> decoder,
                 lcr::log::Logger& log,
                 std::chrono::milliseconds timeout = DEFAULT_TIMEOUT);

    [[nodiscard]]
    Error encode(std::string_view json, std::string_view schema, std::string& out) noexcept;

    [[nodiscard]]
    Error decode(const transport::Frame& frame, std::string_view schema, std::string& out) noexcept;

    [[nodiscard]] const std::vector<std::string>& encoder() const noexcept { return encoder_; }
    [[nodiscard]] const std::vector<std::string>& decoder() const noexcept { return decoder_; }

private:
    [[nodiscard]]
    Error run_(const std::vector<std::string>& cmd, std::string_view schema, std::string_view input, std::string& out, bool text_output) noexcept;

private:
    std::vector<std::string> encoder_;
    std::vector<std::string> decoder_;
    lcr::log::Logger& log_;
    std::chrono::milliseconds timeout_;
};

static_assert(CodecConcept<ProcessCodec>);

// -----------------------------------------------------------------------------
// Text frames
// -----------------------------------------------------------------------------
//
// Valid JSON is copied to `out`; anything else becomes {"text": "<payload>"}.
// Returns true when the payload was already JSON.
// -----------------------------------------------------------------------------
bool decode_text(std::string_view payload, std::string& out);

} // namespace wiredive::core::codec
