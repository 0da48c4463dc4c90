#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include "common/cli/fetch_params.hpp"

#include "wiredive/bulk/driver.hpp"
#include "wiredive/bulk/sink.hpp"
#include "wiredive/bulk/target_list.hpp"
#include "wiredive/core/codec/process_codec.hpp"
#include "wiredive/core/config/endpoint.hpp"
#include "wiredive/core/config/session.hpp"
#include "wiredive/core/credentials/handshake.hpp"
#include "wiredive/core/credentials/source.hpp"
#include "wiredive/core/protocol/streamlit/request.hpp"
#include "wiredive/core/session/config.hpp"
#include "wiredive/core/session/pool.hpp"
#include "wiredive/core/transport/beast/websocket.hpp"
#include "lcr/log/logger.hpp"

using namespace wiredive;
using namespace wiredive::core;

// -----------------------------------------------------------------------------
// Ctrl+C handling
// -----------------------------------------------------------------------------
std::atomic<bool> running{true};

void on_signal(int) {
    running.store(false);
}

// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------
int main(int argc, char** argv) {
    // -------------------------------------------------------------
    // CLI parsing
    // -------------------------------------------------------------
    const auto params = apps::cli::fetch::configure(argc, argv,
        "wiredive - bulk Analyze_User fetcher\n"
        "Fetches one record per user_address of the input CSV over the app's streaming protocol.\n");

    // -------------------------------------------------------------
    // Logging
    // -------------------------------------------------------------
    lcr::log::Logger log(lcr::log::parse_level(params.log_level));
    log.add_output(std::cout, true);

    std::ofstream log_file;
    if (!params.log_file.empty()) {
        std::error_code ec;
        const std::filesystem::path log_path(params.log_file);
        if (log_path.has_parent_path()) {
            std::filesystem::create_directories(log_path.parent_path(), ec);
        }
        log_file.open(log_path, std::ios::app);
        if (!log_file) {
            WD_FATAL(log, "Cannot open log file " << params.log_file);
            return EXIT_FAILURE;
        }
        log.add_output(log_file, false);
    }

    params.dump("=== wiredive fetch_users ===", std::cout);
    std::cout << std::endl;

    // -------------------------------------------------------------
    // Signal handling
    // -------------------------------------------------------------
    std::signal(SIGINT, on_signal);
    std::signal(SIGPIPE, SIG_IGN);   // codec processes may exit before reading stdin

    // -------------------------------------------------------------
    // Credentials
    // -------------------------------------------------------------
    credentials::CookieFile jar;
    if (const auto err = jar.load(params.cookies); err != credentials::LoadError::None) {
        WD_FATAL(log, "Cannot load cookies from " << params.cookies << ": " << credentials::to_string(err));
        return EXIT_FAILURE;
    }
    const credentials::Cookies cookies = jar.get(config::endpoint::COOKIE_DOMAIN, config::endpoint::REQUIRED_COOKIES);
    if (const auto absent = credentials::missing(cookies, config::endpoint::REQUIRED_COOKIES); !absent.empty()) {
        std::string names;
        for (const auto& n : absent) {
            names += names.empty() ? n : ", " + n;
        }
        WD_FATAL(log, "Missing required cookies for " << config::endpoint::COOKIE_DOMAIN << ": " << names);
        return EXIT_FAILURE;
    }
    WD_INFO(log, "Loaded " << cookies.size() << " cookies for " << config::endpoint::COOKIE_DOMAIN);

    session::Endpoint endpoint;
    if (const auto err = session::make_endpoint(params.url, credentials::make_handshake(cookies), endpoint);
        err != transport::Error::None) {
        WD_FATAL(log, "Invalid endpoint " << params.url << ": " << transport::to_string(err));
        return EXIT_FAILURE;
    }

    // -------------------------------------------------------------
    // Request template
    // -------------------------------------------------------------
    protocol::streamlit::Request tmpl;
    if (!params.request_template.empty()) {
        if (const auto err = protocol::streamlit::load_request(params.request_template, tmpl);
            err != protocol::streamlit::TemplateError::None) {
            WD_FATAL(log, "Cannot load request template " << params.request_template << ": " << protocol::streamlit::to_string(err));
            return EXIT_FAILURE;
        }
    }

    // -------------------------------------------------------------
    // Targets and output
    // -------------------------------------------------------------
    std::vector<bulk::Target> targets;
    const std::optional<std::size_t> limit = params.limit ? std::optional<std::size_t>(params.limit) : std::nullopt;
    if (const auto err = bulk::load_targets(params.csv, params.offset, limit, targets);
        err != bulk::ListError::None && err != bulk::ListError::Empty) {
        WD_FATAL(log, "Cannot read targets from " << params.csv << ": " << bulk::to_string(err));
        return EXIT_FAILURE;
    }
    WD_INFO(log, "Loaded " << targets.size() << " target(s) (offset " << params.offset
                 << ", limit " << (params.limit ? std::to_string(params.limit) : std::string("all")) << ")");

    bulk::DirectorySink sink(params.output, log);
    if (!sink.prepare()) {
        return EXIT_FAILURE;
    }

    // -------------------------------------------------------------
    // Codec, pool, driver
    // -------------------------------------------------------------
    codec::ProcessCodec codec(apps::cli::fetch::split_command(params.encoder),
                              apps::cli::fetch::split_command(params.decoder),
                              log);

    session::PoolConfig pool_cfg;
    pool_cfg.capacity = params.pool_size;
    session::Pool<transport::beast::WebSocket> pool(endpoint, pool_cfg, log);

    bulk::DriverOptions options;
    options.concurrency = params.concurrency;
    options.pacing = std::chrono::milliseconds(params.delay_ms);
    options.refetch = params.refetch;
    options.run.limits.max_frames = params.max_frames;
    options.run.limits.frame_timeout = std::chrono::milliseconds(params.frame_timeout_ms);
    options.run.limits.total_timeout = std::chrono::milliseconds(params.total_timeout_ms);
    if (!params.debug_dir.empty()) {
        options.debug_dir = std::filesystem::path(params.debug_dir);
    }

    bulk::Driver<transport::beast::WebSocket, codec::ProcessCodec> driver(pool, codec, tmpl, sink, options, log, &running);
    driver.run(targets);

    return EXIT_SUCCESS;
}
