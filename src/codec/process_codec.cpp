#include <utility>

#include "simdjson.h"

#include "wiredive/core/codec/process_codec.hpp"
#include "wiredive/core/codec/process.hpp"
#include "wiredive/core/codec/base64.hpp"
#include "lcr/json.hpp"


namespace wiredive::core::codec {

ProcessCodec::ProcessCodec(std::vector<std::string> encoder,
                           std::vector<std::string> decoder,
                           lcr::log::Logger& log,
                           std::chrono::milliseconds timeout)
    : encoder_(std::move(encoder))
    , decoder_(std::move(decoder))
    , log_(log)
    , timeout_(timeout)
{
}

Error ProcessCodec::encode(std::string_view json, std::string_view schema, std::string& out) noexcept {
    out.clear();
    if (json.empty()) {
        return Error::InvalidInput;
    }
    const Error err = run_(encoder_, schema, json, out, false);
    if (err != Error::None) {
        WD_ERROR(log_, "[CODEC] encode(" << schema << ") failed: " << to_string(err));
        return err;
    }
    WD_TRACE(log_, "[CODEC] encode(" << schema << ") " << json.size() << " -> " << out.size() << " bytes");
    return Error::None;
}

Error ProcessCodec::decode(const transport::Frame& frame, std::string_view schema, std::string& out) noexcept {
    out.clear();
    if (frame.payload.empty()) {
        return Error::InvalidInput;
    }

    try {
        if (frame.is_text()) {
            decode_text(frame.payload, out);
            return Error::None;
        }

        const std::string encoded = base64::encode(frame.payload);
        const Error err = run_(decoder_, schema, encoded, out, true);
        if (err != Error::None) {
            WD_WARN(log_, "[CODEC] decode(" << schema << ") of " << frame.size() << " bytes failed: " << to_string(err));
            return err;
        }
        return Error::None;
    }
    catch (const std::exception& e) {
        WD_WARN(log_, "[CODEC] decode(" << schema << ") failed: " << e.what());
        return Error::IoError;
    }
}

Error ProcessCodec::run_(const std::vector<std::string>& cmd, std::string_view schema, std::string_view input, std::string& out, bool text_output) noexcept {
    if (cmd.empty()) {
        return Error::SpawnFailed;
    }
    try {
        std::vector<std::string> argv = cmd;
        if (!schema.empty()) {
            argv.emplace_back(schema);
        }

        ProcessResult result;
        const Error err = run_process(argv, input, result, timeout_);
        if (err != Error::None) {
            if (!result.err.empty()) {
                WD_DEBUG(log_, "[CODEC] " << argv.front() << " stderr: " << result.err);
            }
            if (result.timed_out) {
                WD_WARN(log_, "[CODEC] " << argv.front() << " killed after " << timeout_.count() << " ms");
            }
            return err;
        }

        // Trailing newline from console.log and friends
        while (text_output && !result.out.empty() && (result.out.back() == '\n' || result.out.back() == '\r')) {
            result.out.pop_back();
        }
        if (result.out.empty()) {
            return Error::EmptyOutput;
        }
        out = std::move(result.out);
        return Error::None;
    }
    catch (const std::exception& e) {
        WD_ERROR(log_, "[CODEC] " << e.what());
        return Error::IoError;
    }
}

bool decode_text(std::string_view payload, std::string& out) {
    simdjson::dom::parser parser;
    const simdjson::padded_string padded(payload);
    simdjson::dom::element doc;
    if (parser.parse(padded).get(doc) == simdjson::SUCCESS) {
        out.assign(payload.data(), payload.size());
        return true;
    }
    out.clear();
    out += "{\"text\":";
    lcr::json::append_string(out, payload);
    out += '}';
    return false;
}

} // namespace wiredive::core::codec
