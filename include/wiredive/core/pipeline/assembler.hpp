#pragma once

#include <cstddef>
#include <string_view>
#include <utility>

#include "wiredive/core/classifier/classifier.hpp"
#include "wiredive/core/extractor/user_record.hpp"
#include "wiredive/core/protocol/streamlit/element.hpp"
#include "wiredive/core/protocol/streamlit/parser/frame_parser.hpp"
#include "wiredive/core/protocol/streamlit/parser/result.hpp"


namespace wiredive::core::pipeline {

/*
===============================================================================
 Assembler
===============================================================================

decoded frame -> parse -> classify -> extract -> merge

Owns everything that is per-run state: the frame parser, the classifier
state and the record under construction. Frames must be fed in arrival
order. One Assembler per run; reset() prepares it for the next one.

A frame that fails to parse is counted and skipped. It does not reach the
classifier, so it cannot disturb order-dependent tags.
===============================================================================
*/
class Assembler {
public:
    struct Step {
        protocol::streamlit::parser::Result result = protocol::streamlit::parser::Result::Ok;
        classifier::Tag tag = classifier::Tag::Unknown;
        bool terminal = false;
    };

    Step feed(std::string_view decoded_json);

    void reset() noexcept;

    [[nodiscard]] const extractor::UserRecord& record() const noexcept { return record_; }
    [[nodiscard]] extractor::UserRecord take() noexcept { return std::move(record_); }

    [[nodiscard]] const classifier::Classifier& classifier() const noexcept { return classifier_; }

    [[nodiscard]] std::size_t frames() const noexcept { return frames_; }
    [[nodiscard]] std::size_t rejected() const noexcept { return rejected_; }
    [[nodiscard]] bool finished() const noexcept { return finished_; }

private:
    protocol::streamlit::parser::FrameParser parser_;
    protocol::streamlit::Element element_;
    classifier::Classifier classifier_;
    extractor::UserRecord record_;

    std::size_t frames_ = 0;
    std::size_t rejected_ = 0;
    bool finished_ = false;
};

} // namespace wiredive::core::pipeline
