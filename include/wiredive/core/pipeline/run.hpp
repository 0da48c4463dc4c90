#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

#include "wiredive/core/codec/codec_concept.hpp"
#include "wiredive/core/codec/error.hpp"
#include "wiredive/core/config/run.hpp"
#include "wiredive/core/extractor/user_record.hpp"
#include "wiredive/core/pipeline/assembler.hpp"
#include "wiredive/core/pipeline/frame_dump.hpp"
#include "wiredive/core/protocol/streamlit/request.hpp"
#include "wiredive/core/session/config.hpp"
#include "wiredive/core/session/pool.hpp"
#include "wiredive/core/session/state.hpp"
#include "wiredive/core/transport/frame.hpp"
#include "wiredive/core/transport/websocket_concept.hpp"
#include "lcr/log/logger.hpp"


namespace wiredive::core::pipeline {

/*
===============================================================================
 run_extraction
===============================================================================

One request, one record:

  1. encode the request (BackMsg)
  2. lease a session (pooled, or direct when the pool is exhausted)
  3. send the request; a failed send closes the session and fails the run
     (there is no automatic resend)
  4. wait for the settle delay
  5. pull frames in arrival order until the terminal signal or a limit;
     each frame is decoded (ForwardMsg) and fed to an Assembler.
     Undecodable frames are logged and skipped
  6. hand the session back: after the terminal signal any frames already
     queued are discarded and the session returns to the pool; otherwise
     unread frames of this request may still arrive, so it is closed
  7. return what was assembled

Never throws. A run that fails still returns its partial record.

  success   the request went out and the stream ended without a transport
            fault (terminal signal, frame budget or total deadline)
  complete  the terminal signal was observed
===============================================================================
*/

struct RunOptions {
    session::StreamLimits limits{
        config::run::MAX_FRAMES,
        config::run::FRAME_TIMEOUT,
        config::run::TOTAL_TIMEOUT
    };
    std::chrono::milliseconds settle_delay = config::run::SETTLE_DELAY;

    // Per-run debug dump directory (disabled when absent)
    std::optional<std::filesystem::path> dump_dir{};
};

struct RunResult {
    extractor::UserRecord record{};
    bool success = false;
    bool complete = false;
    std::size_t frames_processed = 0;
    std::size_t decode_errors = 0;
    session::StopReason stop_reason = session::StopReason::None;
    std::string error{};
};

template <transport::WebSocketConcept WS, codec::CodecConcept Codec>
[[nodiscard]]
RunResult run_extraction(session::Pool<WS>& pool,
                         Codec& codec,
                         const protocol::streamlit::Request& request,
                         const RunOptions& options,
                         lcr::log::Logger& log,
                         std::string_view label = {}) noexcept
{
    RunResult result;

    try {
        // 1) Encode
        std::string payload;
        const codec::Error enc = codec.encode(request.to_json(), config::run::OUTBOUND_SCHEMA, payload);
        if (enc != codec::Error::None) {
            result.error = "encode failed: " + std::string(codec::to_string(enc));
            WD_ERROR(log, "[RUN] " << label << " " << result.error);
            return result;
        }

        // 2) Lease
        session::Lease<WS> lease(pool);
        if (!lease) {
            result.error = "no session";
            WD_ERROR(log, "[RUN] " << label << " could not obtain a session");
            return result;
        }
        session::Session<WS>& session = *lease.get();

        // 3) Send, no resend
        if (!session.send(payload, transport::FrameKind::Binary)) {
            session.close();
            result.error = "send failed";
            WD_ERROR(log, "[RUN] " << label << " request not delivered, session #" << session.id() << " closed");
            return result;
        }
        WD_DEBUG(log, "[RUN] " << label << " request sent (" << payload.size() << " bytes) on session #" << session.id());

        // 4) Settle
        if (options.settle_delay.count() > 0) {
            std::this_thread::sleep_for(options.settle_delay);
        }

        // 5) Stream
        std::optional<FrameDump> dump;
        if (options.dump_dir) {
            dump.emplace(*options.dump_dir, log);
        }

        Assembler assembler;
        auto stream = session.receive_stream(options.limits);
        transport::Frame frame;
        std::string decoded;

        while (stream.next(frame)) {
            const codec::Error dec = codec.decode(frame, config::run::INBOUND_SCHEMA, decoded);
            if (dec != codec::Error::None) {
                ++result.decode_errors;
                WD_WARN(log, "[RUN] " << label << " frame " << stream.count() << " ("
                             << frame.size() << " bytes, " << transport::to_string(frame.kind)
                             << ") skipped: " << codec::to_string(dec));
                continue;
            }
            if (dump) {
                dump->write(stream.count() - 1, decoded);
            }

            const Assembler::Step step = assembler.feed(decoded);
            WD_TRACE(log, "[RUN] " << label << " frame " << stream.count() << " -> " << classifier::to_string(step.tag));
            if (step.terminal) {
                stream.stop();
            }
        }

        result.frames_processed = stream.count();
        result.stop_reason = stream.stop_reason();
        result.complete = assembler.finished();
        result.success = result.complete ||
                         result.stop_reason == session::StopReason::MaxFrames ||
                         result.stop_reason == session::StopReason::TotalTimeout;
        result.record = assembler.take();

        // 6) Keep the next lessee clear of this request's frames
        if (result.complete) {
            session.discard_pending(options.limits.max_frames);
        } else if (session.is_alive()) {
            WD_DEBUG(log, "[RUN] " << label << " closing session #" << session.id() << " before the terminal signal");
            session.close();
        }

        if (!result.success) {
            result.error = "stream ended: " + std::string(session::to_string(result.stop_reason));
        }

        WD_INFO(log, "[RUN] " << label << " " << result.frames_processed << " frame(s), "
                     << result.record.present() << " field(s), "
                     << (result.complete ? "complete" : "incomplete")
                     << " (" << session::to_string(result.stop_reason) << ")");
        return result;
    }
    catch (const std::exception& e) {
        result.success = false;
        result.error = e.what();
        WD_ERROR(log, "[RUN] " << label << " aborted: " << e.what());
        return result;
    }
}

} // namespace wiredive::core::pipeline
