#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <semaphore>
#include <system_error>
#include <thread>
#include <vector>

#include "wiredive/bulk/document.hpp"
#include "wiredive/bulk/sink.hpp"
#include "wiredive/bulk/target_list.hpp"
#include "wiredive/core/codec/codec_concept.hpp"
#include "wiredive/core/config/run.hpp"
#include "wiredive/core/pipeline/run.hpp"
#include "wiredive/core/protocol/streamlit/request.hpp"
#include "wiredive/core/session/pool.hpp"
#include "wiredive/core/transport/websocket_concept.hpp"
#include "lcr/log/logger.hpp"


namespace wiredive::bulk {

/*
===============================================================================
 Bulk driver
===============================================================================

Runs one extraction per target over a shared session pool.

  • Targets whose complete record already exists are skipped unless
    refetch is set.
  • A counting semaphore bounds the number of runs in flight; each run
    executes on its own worker thread.
  • Dispatches are paced: consecutive runs start at least `pacing` apart.
  • Idle pooled sessions past their TTL are swept between dispatches and
    every session is closed when the batch is done.
  • Every run writes a document: <id>.json when complete, otherwise
    <id>.partial.json so a failed run is not silently lost.

Individual failures never stop the batch; they are counted in the Summary.
===============================================================================
*/

struct DriverOptions {
    std::size_t concurrency = 1;
    std::chrono::milliseconds pacing = core::config::run::PACING_DELAY;
    bool refetch = false;
    core::pipeline::RunOptions run{};

    // Root of per-target frame dumps (<debug_dir>/<id>/frame_<i>.json)
    std::optional<std::filesystem::path> debug_dir{};
};

struct Summary {
    std::size_t total = 0;
    std::size_t succeeded = 0;
    std::size_t skipped = 0;
    std::size_t failed = 0;
    std::size_t cancelled = 0;
};

template <core::transport::WebSocketConcept WS, core::codec::CodecConcept Codec>
class Driver {
public:
    Driver(core::session::Pool<WS>& pool,
           Codec& codec,
           const core::protocol::streamlit::Request& tmpl,
           DirectorySink& sink,
           const DriverOptions& options,
           lcr::log::Logger& log,
           const std::atomic<bool>* running = nullptr)
        : pool_(pool)
        , codec_(codec)
        , tmpl_(tmpl)
        , sink_(sink)
        , options_(options)
        , log_(log)
        , running_(running)
    {}

    Summary run(const std::vector<Target>& targets) {
        const std::size_t total = targets.size();
        const std::size_t concurrency = options_.concurrency == 0 ? 1 : options_.concurrency;

        summary_ = Summary{};
        summary_.total = total;

        std::counting_semaphore<> gate(static_cast<std::ptrdiff_t>(concurrency));
        std::list<Worker> workers;

        WD_INFO(log_, "[BULK] Starting fetch for " << total << " target(s), concurrency " << concurrency
                      << ", refetch " << (options_.refetch ? "on" : "off"));

        for (std::size_t i = 0; i < total; ++i) {
            const Target& target = targets[i];
            const std::size_t index = i + 1;

            if (running_ && !running_->load()) {
                std::lock_guard<std::mutex> lock(mutex_);
                summary_.cancelled = total - i;
                WD_WARN(log_, "[BULK] Interrupted, " << summary_.cancelled << " target(s) not dispatched");
                break;
            }

            // Ids name output files and dump directories
            if (!is_safe_id(target.id)) {
                std::lock_guard<std::mutex> lock(mutex_);
                ++summary_.failed;
                WD_ERROR(log_, "[BULK] [" << index << "/" << total << "] Rejected target id '" << target.id
                               << "' (not a plain file name)");
                continue;
            }

            if (!options_.refetch && sink_.exists(target.id)) {
                std::lock_guard<std::mutex> lock(mutex_);
                ++summary_.skipped;
                WD_INFO(log_, "[BULK] [" << index << "/" << total << "] Skipping " << target.id << " (already exists)");
                continue;
            }

            gate.acquire();
            reap_(workers);

            auto done = std::make_shared<std::atomic<bool>>(false);
            try {
                workers.push_back(Worker{
                    std::thread([this, &gate, &target, index, total, done] {
                        process_(target, index, total);
                        done->store(true, std::memory_order_release);
                        gate.release();
                    }),
                    done
                });
            }
            catch (const std::system_error& e) {
                gate.release();
                std::lock_guard<std::mutex> lock(mutex_);
                ++summary_.failed;
                WD_ERROR(log_, "[BULK] [" << index << "/" << total << "] Could not start worker: " << e.what());
                continue;
            }

            const std::size_t swept = pool_.sweep_expired();
            if (swept > 0) {
                WD_DEBUG(log_, "[BULK] Swept " << swept << " expired session(s)");
            }

            if (options_.pacing.count() > 0 && index < total) {
                std::this_thread::sleep_for(options_.pacing);
            }
        }

        for (auto& w : workers) {
            if (w.thread.joinable()) {
                w.thread.join();
            }
        }
        pool_.close_all();

        WD_INFO(log_, "[BULK] === Summary ===");
        WD_INFO(log_, "[BULK] Total targets : " << summary_.total);
        WD_INFO(log_, "[BULK] Succeeded     : " << summary_.succeeded);
        WD_INFO(log_, "[BULK] Skipped       : " << summary_.skipped);
        WD_INFO(log_, "[BULK] Failed        : " << summary_.failed);
        if (summary_.cancelled > 0) {
            WD_INFO(log_, "[BULK] Not dispatched: " << summary_.cancelled);
        }
        return summary_;
    }

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    // Joins workers that already finished
    static void reap_(std::list<Worker>& workers) {
        for (auto it = workers.begin(); it != workers.end();) {
            if (it->done->load(std::memory_order_acquire)) {
                it->thread.join();
                it = workers.erase(it);
            } else {
                ++it;
            }
        }
    }

    void process_(const Target& target, std::size_t index, std::size_t total) noexcept {
        WD_INFO(log_, "[BULK] [" << index << "/" << total << "] Fetching " << target.id);

        bool ok = false;
        try {
            core::pipeline::RunOptions run = options_.run;
            if (options_.debug_dir) {
                run.dump_dir = *options_.debug_dir / target.id;
            }

            const auto request = core::protocol::streamlit::with_target(tmpl_, target.id);
            const core::pipeline::RunResult result =
                core::pipeline::run_extraction(pool_, codec_, request, run, log_, target.id);

            ok = result.success && result.complete;
            if (result.frames_processed > 0 || ok) {
                const std::string doc = make_document(target, result, std::chrono::system_clock::now());
                if (!sink_.write(target.id, doc, ok)) {
                    ok = false;
                }
            }

            if (ok) {
                WD_INFO(log_, "[BULK] [" << index << "/" << total << "] Saved " << target.id
                              << " (" << result.frames_processed << " frames, " << result.record.present() << " fields)");
            } else {
                WD_ERROR(log_, "[BULK] [" << index << "/" << total << "] Failed " << target.id
                               << (result.error.empty() ? "" : ": ") << result.error);
            }
        }
        catch (const std::exception& e) {
            ok = false;
            WD_ERROR(log_, "[BULK] [" << index << "/" << total << "] Error processing " << target.id << ": " << e.what());
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (ok) ++summary_.succeeded;
        else    ++summary_.failed;
    }

private:
    core::session::Pool<WS>& pool_;
    Codec& codec_;
    const core::protocol::streamlit::Request& tmpl_;
    DirectorySink& sink_;
    const DriverOptions options_;
    lcr::log::Logger& log_;
    const std::atomic<bool>* running_;

    std::mutex mutex_;
    Summary summary_{};
};

} // namespace wiredive::bulk
