#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "wiredive/core/protocol/streamlit/parser/result.hpp"
#include "wiredive/core/protocol/streamlit/parser/helpers.hpp"

#include "simdjson.h"

/*
================================================================================
ChartParser
================================================================================

Reads the first trace of a Plotly figure specification (the JSON string held
in plotlyChart.spec) as an ordered list of (label, value) points.

  • Bar charts      : labels = data[0].x,     values = data[0].y
  • Radar charts    : labels = data[0].theta, values = data[0].r

Pairs are zipped up to the shorter of the two arrays. Numeric labels are
kept in their JSON spelling; points whose value is not a number are skipped.

================================================================================
*/

namespace wiredive::core::protocol::streamlit::parser {

using Series = std::vector<std::pair<std::string, double>>;

class ChartParser {
public:
    [[nodiscard]]
    Result parse(std::string_view spec, const char* labels_key, const char* values_key, Series& out) noexcept {
        out.clear();

        simdjson::dom::element root;
        try {
            if (parser_.parse(spec.data(), spec.size(), true).get(root) != simdjson::SUCCESS) {
                return Result::InvalidJson;
            }

            simdjson::dom::array data;
            if (helper::parse_array_optional(root, "data", data) != Result::Ok) {
                return Result::InvalidSchema;
            }
            simdjson::dom::element trace;
            if (data.at(0).get(trace) != simdjson::SUCCESS) {
                return Result::InvalidSchema;
            }

            simdjson::dom::array labels;
            simdjson::dom::array values;
            if (helper::parse_array_optional(trace, labels_key, labels) != Result::Ok ||
                helper::parse_array_optional(trace, values_key, values) != Result::Ok) {
                return Result::InvalidSchema;
            }

            auto v = values.begin();
            for (auto l = labels.begin(); l != labels.end() && v != values.end(); ++l, ++v) {
                double value = 0.0;
                if (!helper::as_double(*v, value)) {
                    continue;
                }
                std::string_view name;
                if ((*l).get(name) == simdjson::SUCCESS) {
                    out.emplace_back(std::string(name), value);
                }
                else {
                    out.emplace_back(helper::to_json(*l), value);
                }
            }
            return Result::Ok;
        }
        catch (const std::exception&) {
            out.clear();
            return Result::InvalidJson;
        }
    }

private:
    simdjson::dom::parser parser_;
};

} // namespace wiredive::core::protocol::streamlit::parser
