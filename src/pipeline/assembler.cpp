#include "wiredive/core/pipeline/assembler.hpp"
#include "wiredive/core/extractor/extract.hpp"


namespace wiredive::core::pipeline {

Assembler::Step Assembler::feed(std::string_view decoded_json) {
    using protocol::streamlit::parser::Result;

    Step step;
    ++frames_;

    step.result = parser_.parse(decoded_json, element_);
    if (step.result != Result::Ok) {
        ++rejected_;
        return step;
    }

    const classifier::ClassifiedMessage msg = classifier_.next(element_);
    step.tag = msg.tag;

    if (msg.tag == classifier::Tag::ScriptFinished) {
        finished_ = true;
        step.terminal = true;
        return step;
    }

    extractor::merge(record_, extractor::extract(msg.tag, element_));
    return step;
}

void Assembler::reset() noexcept {
    classifier_.reset();
    element_.clear();
    record_ = extractor::UserRecord{};
    frames_ = 0;
    rejected_ = 0;
    finished_ = false;
}

} // namespace wiredive::core::pipeline
