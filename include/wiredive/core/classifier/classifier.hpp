#pragma once

#include <array>
#include <cstdint>
#include <string_view>
#include <vector>

#include "wiredive/core/classifier/tag.hpp"
#include "wiredive/core/classifier/state.hpp"
#include "wiredive/core/protocol/streamlit/element.hpp"


namespace wiredive::core::classifier {

/*
===============================================================================
 Message classification
===============================================================================

classify(element, state) -> { tag, next state }

A pure function: the same element and the same prior state always produce
the same tag and the same next state. Classification sniffs content markers
(see signature()) and consults State where content alone is ambiguous:

  • Type label description
      A plain markdown frame matching no signature is a TypeLabelDescription
      when the previous element frame was a TypeLabel, Unknown otherwise.

  • Ranked windows
      The four rank frames look alike. The first one seen starts the window
      (Rank1d); the next three rank-shaped frames become Rank7d, Rank30d and
      RankAllTime. The window then closes so a later rank-shaped frame starts
      over at Rank1d. A non-rank frame inside the window closes it early.

  • Bet tables
      The frame right after an ActiveBetsSummary (FinishedBetsSummary) is
      that category's table when it carries a data frame. The slot is
      consumed by the first frame after the first summary, table or not.

  • Frames without an element (session, page, cache and status messages)
      are Unknown and leave the state untouched, so any amount of such
      chatter never disturbs the sequences above.

  • scriptFinished == FINISHED_SUCCESSFULLY is the terminal signal.
===============================================================================
*/

struct Classification {
    Tag tag = Tag::Unknown;
    State state{};
};

// Tag whose content markers `content` carries, Unknown when none match.
// First match wins; stateless.
[[nodiscard]]
Tag signature(std::string_view content) noexcept;

[[nodiscard]]
Classification classify(const protocol::streamlit::Element& element, const State& state) noexcept;

// -----------------------------------------------------------------------------
// ClassifiedMessage
// -----------------------------------------------------------------------------
struct ClassifiedMessage {
    Tag tag = Tag::Unknown;
    const protocol::streamlit::Element* element = nullptr;   // valid while the element lives
    std::vector<std::int64_t> path;
};

// -----------------------------------------------------------------------------
// Classifier
// -----------------------------------------------------------------------------
//
// Threads State through successive classify() calls for one run and keeps a
// per-tag histogram. reset() starts a new run.
// -----------------------------------------------------------------------------
class Classifier {
public:
    [[nodiscard]]
    ClassifiedMessage next(const protocol::streamlit::Element& element) {
        const Classification c = classify(element, state_);
        state_ = c.state;
        ++histogram_[index_of(c.tag)];
        return ClassifiedMessage{c.tag, &element, element.delta_path};
    }

    void reset() noexcept {
        state_ = State{};
        histogram_.fill(0);
    }

    [[nodiscard]] const State& state() const noexcept { return state_; }

    [[nodiscard]]
    std::uint32_t seen(Tag t) const noexcept { return histogram_[index_of(t)]; }

    [[nodiscard]]
    const std::array<std::uint32_t, TAG_COUNT>& histogram() const noexcept { return histogram_; }

private:
    State state_{};
    std::array<std::uint32_t, TAG_COUNT> histogram_{};
};

} // namespace wiredive::core::classifier
