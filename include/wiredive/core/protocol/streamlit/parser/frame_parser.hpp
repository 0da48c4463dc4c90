#pragma once

#include <string_view>

#include "wiredive/core/protocol/streamlit/element.hpp"
#include "wiredive/core/protocol/streamlit/parser/result.hpp"
#include "wiredive/core/protocol/streamlit/parser/helpers.hpp"

#include "simdjson.h"

/*
================================================================================
FrameParser
================================================================================

Turns one decoded ForwardMsg (JSON text) into a streamlit::Element.

  • Reuses one simdjson DOM parser across frames (not thread-safe; one
    FrameParser per extraction run).
  • Frames without a delta.newElement (session status, page info, script
    finished, ...) parse successfully with has_element == false.
  • Element parts of an unexpected type are skipped individually; only a
    document that is not JSON or not an object is rejected.

================================================================================
*/

namespace wiredive::core::protocol::streamlit::parser {

class FrameParser {
public:
    [[nodiscard]]
    Result parse(std::string_view json, Element& out) noexcept {
        out.clear();

        simdjson::dom::element root;
        try {
            if (parser_.parse(json.data(), json.size(), true).get(root) != simdjson::SUCCESS) {
                return Result::InvalidJson;
            }
            if (helper::require_object(root) != Result::Ok) {
                return Result::InvalidSchema;
            }

            (void)helper::parse_string_optional(root, "scriptFinished", out.script_finished);

            simdjson::dom::element metadata;
            if (helper::parse_object_optional(root, "metadata", metadata) == Result::Ok) {
                (void)helper::parse_int64_array_optional(metadata, "deltaPath", out.delta_path);
            }

            simdjson::dom::element delta;
            simdjson::dom::element element;
            if (helper::parse_object_optional(root, "delta", delta) != Result::Ok ||
                helper::parse_object_optional(delta, "newElement", element) != Result::Ok) {
                return Result::Ok;
            }
            out.has_element = true;
            parse_element_(element, out);
            return Result::Ok;
        }
        catch (const std::exception&) {
            return Result::InvalidJson;
        }
    }

private:
    static void parse_element_(const simdjson::dom::element& element, Element& out) {
        simdjson::dom::element part;

        if (helper::parse_object_optional(element, "markdown", part) == Result::Ok) {
            out.has_markdown = helper::parse_string_optional(part, "body", out.markdown) == Result::Ok;
        }

        if (helper::parse_object_optional(element, "metric", part) == Result::Ok) {
            const bool label = helper::parse_string_optional(part, "label", out.metric_label) == Result::Ok;
            const bool body  = helper::parse_string_optional(part, "body", out.metric_body) == Result::Ok;
            out.has_metric = label || body;
        }

        if (helper::parse_object_optional(element, "plotlyChart", part) == Result::Ok) {
            out.has_chart = helper::parse_string_optional(part, "spec", out.chart_spec) == Result::Ok;
        }

        if (helper::parse_object_optional(element, "arrowDataFrame", part) == Result::Ok) {
            out.has_dataframe = true;
            const Result r = helper::parse_string_optional(part, "columns", out.dataframe_columns);
            if (r == Result::InvalidSchema) {
                // Column config emitted as an object instead of a JSON string
                auto columns = part["columns"];
                if (!columns.error()) {
                    out.dataframe_columns = helper::to_json(columns.value());
                }
            }
        }
    }

private:
    simdjson::dom::parser parser_;
};

} // namespace wiredive::core::protocol::streamlit::parser
