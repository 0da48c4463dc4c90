#pragma once

#include <string>

#include <CLI/CLI.hpp>


namespace wiredive::apps::cli {

// -------------------------------------------------------------
// WebSocket URL validator
// -------------------------------------------------------------
inline auto ws_url_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (value.rfind("ws://", 0) == 0 || value.rfind("wss://", 0) == 0) {
            return {};
        }
        return "URL must start with ws:// or wss://";
    },
    "WebSocket URL validator"
);

// -------------------------------------------------------------
// Log level validator
// -------------------------------------------------------------
inline auto log_level_validator = CLI::IsMember({"trace", "debug", "info", "warn", "error", "fatal"});

// -------------------------------------------------------------
// Command validator (non-empty, whitespace separated)
// -------------------------------------------------------------
inline auto command_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (value.find_first_not_of(" \t") != std::string::npos) {
            return {};
        }
        return "Command must not be empty";
    },
    "Command validator"
);

} // namespace wiredive::apps::cli
