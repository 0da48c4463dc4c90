#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <chrono>

#include "wiredive/core/codec/error.hpp"


namespace wiredive::core::codec {

struct ProcessResult {
    int exit_status = -1;   // valid when !signalled
    bool signalled = false;
    bool timed_out = false;
    std::string out;
    std::string err;
};

// -----------------------------------------------------------------------------
// run_process
// -----------------------------------------------------------------------------
//
// Spawns argv[0] (PATH lookup) with `input` on stdin and collects stdout and
// stderr until the child exits. stdin is written and both outputs are read
// concurrently, so large payloads in either direction cannot deadlock.
// A child still running after `timeout` is killed.
//
// SIGPIPE must be ignored by the process (a child that exits early would
// otherwise terminate the caller on the next write).
// -----------------------------------------------------------------------------
[[nodiscard]]
Error run_process(const std::vector<std::string>& argv,
                  std::string_view input,
                  ProcessResult& result,
                  std::chrono::milliseconds timeout) noexcept;

} // namespace wiredive::core::codec
