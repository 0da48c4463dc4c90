#pragma once

#include <string>
#include <vector>
#include <cstdint>


namespace wiredive::core::protocol::streamlit {

// -----------------------------------------------------------------------------
// Element
// -----------------------------------------------------------------------------
//
// The parts of one decoded ForwardMsg that classification and extraction
// look at. Owning copy, so it outlives the parser document it came from.
//
//   delta.newElement.markdown.body        -> markdown
//   delta.newElement.metric.{label,body}  -> metric_label / metric_body
//   delta.newElement.plotlyChart.spec     -> chart_spec
//   delta.newElement.arrowDataFrame       -> has_dataframe / dataframe_columns
//   metadata.deltaPath                    -> delta_path
//   scriptFinished                        -> script_finished
// -----------------------------------------------------------------------------
struct Element {
    bool has_element = false;

    bool has_markdown = false;
    std::string markdown;

    bool has_metric = false;
    std::string metric_label;
    std::string metric_body;

    bool has_chart = false;
    std::string chart_spec;

    bool has_dataframe = false;
    std::string dataframe_columns;

    std::vector<std::int64_t> delta_path;

    std::string script_finished;

    // Markers of every present part joined by single spaces
    [[nodiscard]]
    std::string content() const {
        std::string out;
        auto add = [&out](const std::string& part) {
            if (part.empty()) {
                return;
            }
            if (!out.empty()) {
                out += ' ';
            }
            out += part;
        };
        if (has_markdown) {
            add(markdown);
        }
        if (has_metric) {
            add(metric_label);
            add(metric_body);
        }
        if (has_chart) {
            add(chart_spec);
        }
        if (has_dataframe) {
            add(dataframe_columns);
        }
        return out;
    }

    void clear() noexcept {
        *this = Element{};
    }
};

} // namespace wiredive::core::protocol::streamlit
