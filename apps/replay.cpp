#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "common/cli/validators.hpp"

#include "wiredive/core/classifier/tag.hpp"
#include "wiredive/core/extractor/user_record.hpp"
#include "wiredive/core/pipeline/assembler.hpp"
#include "wiredive/core/pipeline/frame_dump.hpp"
#include "wiredive/core/protocol/streamlit/parser/result.hpp"
#include "lcr/log/logger.hpp"

using namespace wiredive::core;

// -----------------------------------------------------------------------------
// Re-runs classification and extraction over a frame dump written by
// fetch_users --debug-dir, and prints the record plus a tag histogram.
// Two replays of the same dump print the same record.
// -----------------------------------------------------------------------------
int main(int argc, char** argv) {
    CLI::App app{"wiredive - replay a frame dump through the extraction pipeline"};

    std::string dir;
    std::string log_level = "warn";
    bool histogram = true;

    app.add_option("dump-dir", dir, "Directory holding frame_<i>.json files")->required()->check(CLI::ExistingDirectory);
    app.add_option("-l,--log-level", log_level, "Log level: trace | debug | info | warn | error | fatal")
        ->check(wiredive::apps::cli::log_level_validator)->default_val(log_level);
    app.add_flag("!--no-histogram", histogram, "Do not print the tag histogram");

    CLI11_PARSE(app, argc, argv);

    lcr::log::Logger log(lcr::log::parse_level(log_level));
    log.add_output(std::cerr, true);

    std::vector<std::string> frames;
    if (const auto err = pipeline::load_dump(dir, frames); err != pipeline::DumpError::None) {
        WD_FATAL(log, "Cannot load frame dump " << dir << ": " << pipeline::to_string(err));
        return EXIT_FAILURE;
    }

    pipeline::Assembler assembler;
    for (std::size_t i = 0; i < frames.size(); ++i) {
        const auto step = assembler.feed(frames[i]);
        if (step.result != protocol::streamlit::parser::Result::Ok) {
            WD_WARN(log, "frame_" << i << ".json rejected: " << protocol::streamlit::parser::to_string(step.result));
            continue;
        }
        WD_DEBUG(log, "frame_" << i << ".json -> " << classifier::to_string(step.tag));
        if (step.terminal) {
            break;
        }
    }

    std::cout << extractor::to_json(assembler.record()) << std::endl;

    if (histogram) {
        const auto& counts = assembler.classifier().histogram();
        std::cerr << "\n=== Tags (" << assembler.frames() << " frames, "
                  << (assembler.finished() ? "complete" : "incomplete") << ") ===\n";
        for (std::size_t t = 0; t < classifier::TAG_COUNT; ++t) {
            if (counts[t] > 0) {
                std::cerr << "  " << classifier::to_string(static_cast<classifier::Tag>(t)) << ": " << counts[t] << "\n";
            }
        }
    }
    return EXIT_SUCCESS;
}
