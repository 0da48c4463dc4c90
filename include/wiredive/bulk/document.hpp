#pragma once

#include <chrono>
#include <string>

#include "wiredive/bulk/target_list.hpp"
#include "wiredive/core/pipeline/run.hpp"


namespace wiredive::bulk {

// "2025-01-31T09:15:02.123456+00:00"
[[nodiscard]]
std::string iso8601_utc(std::chrono::system_clock::time_point tp);

// -----------------------------------------------------------------------------
// Output document for one target
// -----------------------------------------------------------------------------
//
//   {
//     "user_address": "...",
//     <numeric input columns>,
//     "fetched_at": "...",
//     "frames_processed": N,
//     "complete": true|false,
//     <record fields>
//   }
// -----------------------------------------------------------------------------
[[nodiscard]]
std::string make_document(const Target& target,
                          const core::pipeline::RunResult& run,
                          std::chrono::system_clock::time_point fetched_at);

} // namespace wiredive::bulk
