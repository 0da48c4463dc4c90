#pragma once

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <CLI/CLI.hpp>

#include "common/cli/validators.hpp"
#include "wiredive/core/config/endpoint.hpp"
#include "wiredive/core/config/run.hpp"
#include "wiredive/core/config/session.hpp"


namespace wiredive::apps::cli::fetch {

// logs/fetch_users_<YYYYmmdd_HHMMSS>.log
[[nodiscard]]
inline std::string default_log_file() {
    const auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[64];
    std::strftime(buf, sizeof(buf), "logs/fetch_users_%Y%m%d_%H%M%S.log", &tm);
    return buf;
}

// "node encoder.js" -> {"node", "encoder.js"}
[[nodiscard]]
inline std::vector<std::string> split_command(const std::string& command) {
    std::vector<std::string> argv;
    std::istringstream is(command);
    for (std::string word; is >> word;) {
        argv.push_back(word);
    }
    return argv;
}

struct Params {
    std::string url               = std::string(core::config::endpoint::URL);
    std::string csv               = "data/pages/final/combined_21-99ss.csv";
    std::string output            = "data/users";
    std::size_t limit             = 0;   // 0: all
    std::size_t offset            = 0;
    bool refetch                  = false;
    std::size_t pool_size         = core::config::session::POOL_CAPACITY;
    std::size_t concurrency       = 1;
    std::int64_t delay_ms         = core::config::run::PACING_DELAY.count();
    std::size_t max_frames        = core::config::run::MAX_FRAMES;
    std::int64_t frame_timeout_ms = core::config::run::FRAME_TIMEOUT.count();
    std::int64_t total_timeout_ms = core::config::run::TOTAL_TIMEOUT.count();
    std::string cookies           = "cookies.txt";
    std::string request_template;        // empty: built-in
    std::string encoder           = "node protobuf_encoder.js";
    std::string decoder           = "node protobuf_decoder.js";
    std::string debug_dir;               // empty: no frame dumps
    std::string log_level         = "info";
    std::string log_file          = default_log_file();   // empty: console only

    inline void dump(const std::string& header, std::ostream& os) const {
        os << header << ":\n"
           << "  URL            : " << url << "\n"
           << "  CSV            : " << csv << "\n"
           << "  Output         : " << output << "\n"
           << "  Limit          : " << (limit ? std::to_string(limit) : std::string("all")) << "\n"
           << "  Offset         : " << offset << "\n"
           << "  Refetch        : " << (refetch ? "yes" : "no") << "\n"
           << "  Pool size      : " << pool_size << "\n"
           << "  Concurrency    : " << concurrency << "\n"
           << "  Delay          : " << delay_ms << " ms\n"
           << "  Max frames     : " << max_frames << "\n"
           << "  Frame timeout  : " << frame_timeout_ms << " ms\n"
           << "  Total timeout  : " << total_timeout_ms << " ms\n"
           << "  Cookies        : " << cookies << "\n"
           << "  Template       : " << (request_template.empty() ? std::string("(built-in)") : request_template) << "\n"
           << "  Encoder        : " << encoder << "\n"
           << "  Decoder        : " << decoder << "\n"
           << "  Debug dir      : " << (debug_dir.empty() ? std::string("(off)") : debug_dir) << "\n"
           << "  Log level      : " << log_level << "\n"
           << "  Log file       : " << (log_file.empty() ? std::string("(none)") : log_file) << "\n";
    }
};

[[nodiscard]]
inline Params configure(int argc, char** argv, std::string_view description) {
    CLI::App app{std::string(description)};
    Params params{};

    app.add_option("--url", params.url, "Streaming endpoint")->check(ws_url_validator)->default_val(params.url);
    app.add_option("--csv", params.csv, "Input CSV with a user_address column")->default_val(params.csv);
    app.add_option("-o,--output", params.output, "Output directory for <user_address>.json files")->default_val(params.output);
    app.add_option("--limit", params.limit, "Number of users to fetch (0: all)")->check(CLI::NonNegativeNumber)->default_val(params.limit);
    app.add_option("--offset", params.offset, "Rows to skip before fetching")->check(CLI::NonNegativeNumber)->default_val(params.offset);
    app.add_flag("--refetch", params.refetch, "Refetch users that already have an output file");
    app.add_option("--pool-size", params.pool_size, "Maximum pooled sessions")->check(CLI::Range(std::size_t{1}, std::size_t{64}))->default_val(params.pool_size);
    app.add_option("--concurrency", params.concurrency, "Runs in flight")->check(CLI::Range(std::size_t{1}, std::size_t{64}))->default_val(params.concurrency);
    app.add_option("--delay-ms", params.delay_ms, "Pause between dispatches")->check(CLI::NonNegativeNumber)->default_val(params.delay_ms);
    app.add_option("--max-frames", params.max_frames, "Frame budget per run")->check(CLI::PositiveNumber)->default_val(params.max_frames);
    app.add_option("--frame-timeout", params.frame_timeout_ms, "Per-frame timeout in ms before a keepalive ping")->check(CLI::PositiveNumber)->default_val(params.frame_timeout_ms);
    app.add_option("--total-timeout", params.total_timeout_ms, "Overall timeout per run in ms")->check(CLI::PositiveNumber)->default_val(params.total_timeout_ms);
    app.add_option("--cookies", params.cookies, "Netscape cookies.txt holding the session cookies")->default_val(params.cookies);
    app.add_option("--template", params.request_template, "Request template JSON (rerunScript)");
    app.add_option("--encoder", params.encoder, "Encoder command, schema name appended")->check(command_validator)->default_val(params.encoder);
    app.add_option("--decoder", params.decoder, "Decoder command, schema name appended")->check(command_validator)->default_val(params.decoder);
    app.add_option("--debug-dir", params.debug_dir, "Dump decoded frames under <dir>/<user_address>/");
    app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error | fatal")->check(log_level_validator)->default_val(params.log_level);
    app.add_option("--log-file", params.log_file, "Log file (empty string: console only)")->default_val(params.log_file);

    app.footer(
        "Exit code is 0 once the batch ran, whatever the per-user outcomes.\n"
        "Setup failures (credentials, template, input list, output directory) exit with 1."
    );

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e, std::cout, std::cerr));
    }

    return params;
}

} // namespace wiredive::apps::cli::fetch
