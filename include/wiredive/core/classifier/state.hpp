#pragma once

#include <cstdint>

#include "wiredive/core/classifier/tag.hpp"


namespace wiredive::core::classifier {

// -----------------------------------------------------------------------------
// State
// -----------------------------------------------------------------------------
//
// Memory carried from one frame to the next within a single extraction run.
// A value type: classify() takes the previous state and returns the next one.
// A default-constructed State is the start of a run.
//
//   last                 Tag of the previous element frame
//   rank_index           0 outside a ranked window, 1..3 = ranks seen so far
//   active_table_seen    One-shot: the active bets table slot is consumed
//   finished_table_seen  One-shot: the finished bets table slot is consumed
// -----------------------------------------------------------------------------
struct State {
    Tag last = Tag::Unknown;
    std::uint8_t rank_index = 0;
    bool active_table_seen = false;
    bool finished_table_seen = false;

    friend bool operator==(const State&, const State&) = default;
};

} // namespace wiredive::core::classifier
