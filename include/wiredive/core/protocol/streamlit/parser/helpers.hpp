#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <cstdint>

#include "wiredive/core/protocol/streamlit/parser/result.hpp"

#include "simdjson.h"

/*
================================================================================
JSON Parsing Helpers (Low-Level Primitives)
================================================================================

Low-level helpers used by the decoded-frame parser, the chart-spec reader and
the request-template loader to extract values from simdjson DOM elements.

Responsibilities:
  • Enforce basic JSON structural rules (object presence, type correctness)
  • Parse primitive field types (bool, integer, double, string)
  • Provide strict optional-field handling semantics

IMPORTANT:
  - Helpers MUST NOT interpret values semantically
  - Helpers MUST NOT emit logs
  - Helpers MUST NOT throw exceptions (string copies aside)

================================================================================
*/


namespace wiredive::core::protocol::streamlit::parser::helper {

// ============================================================================
// ROOT TYPE
// ============================================================================

[[nodiscard]]
inline Result require_object(const simdjson::dom::element& root) noexcept {
    return (root.type() == simdjson::dom::element_type::OBJECT) ? Result::Ok : Result::InvalidSchema;
}

// ------------------------------------------------------------
// OPTIONAL OBJECT FIELD
// ------------------------------------------------------------
// Ok: present and an object. Ignored: absent or null.
[[nodiscard]]
inline Result parse_object_optional(const simdjson::dom::element& parent, const char* key, simdjson::dom::element& out) noexcept {
    if (require_object(parent) != Result::Ok) {
        return Result::InvalidSchema;
    }
    auto field = parent[key];
    if (field.error() || field.value().is_null()) {
        return Result::Ignored;
    }
    out = field.value();
    return require_object(out);
}

// ------------------------------------------------------------
// OPTIONAL ARRAY FIELD
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_array_optional(const simdjson::dom::element& parent, const char* key, simdjson::dom::array& out) noexcept {
    if (require_object(parent) != Result::Ok) {
        return Result::InvalidSchema;
    }
    auto field = parent[key];
    if (field.error() || field.value().is_null()) {
        return Result::Ignored;
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    return Result::Ok;
}

// ------------------------------------------------------------
// OPTIONAL STRING FIELD
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_string_optional(const simdjson::dom::element& obj, const char* key, std::string& out) {
    if (require_object(obj) != Result::Ok) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (field.error() || field.value().is_null()) {
        return Result::Ignored;
    }
    std::string_view sv;
    if (field.get(sv)) {
        return Result::InvalidSchema;
    }
    out.assign(sv.data(), sv.size());
    return Result::Ok;
}

// ------------------------------------------------------------
// OPTIONAL BOOL FIELD
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_bool_optional(const simdjson::dom::element& obj, const char* key, bool& out) noexcept {
    if (require_object(obj) != Result::Ok) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (field.error() || field.value().is_null()) {
        return Result::Ignored;
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    return Result::Ok;
}

// ------------------------------------------------------------
// OPTIONAL INT64 FIELD
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_int64_optional(const simdjson::dom::element& obj, const char* key, std::int64_t& out) noexcept {
    if (require_object(obj) != Result::Ok) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (field.error() || field.value().is_null()) {
        return Result::Ignored;
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    return Result::Ok;
}

// ------------------------------------------------------------
// NUMBER (int, uint or double) as double
// ------------------------------------------------------------
[[nodiscard]]
inline bool as_double(const simdjson::dom::element& el, double& out) noexcept {
    switch (el.type()) {
    case simdjson::dom::element_type::DOUBLE:
        return !el.get(out);
    case simdjson::dom::element_type::INT64: {
        std::int64_t v = 0;
        if (el.get(v)) return false;
        out = static_cast<double>(v);
        return true;
    }
    case simdjson::dom::element_type::UINT64: {
        std::uint64_t v = 0;
        if (el.get(v)) return false;
        out = static_cast<double>(v);
        return true;
    }
    default:
        return false;
    }
}

// ------------------------------------------------------------
// INT64 ARRAY (elements of other types are skipped)
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_int64_array_optional(const simdjson::dom::element& obj, const char* key, std::vector<std::int64_t>& out) {
    out.clear();
    simdjson::dom::array arr;
    const Result r = parse_array_optional(obj, key, arr);
    if (r != Result::Ok) {
        return r;
    }
    for (auto item : arr) {
        std::int64_t v = 0;
        if (!item.get(v)) {
            out.push_back(v);
        }
    }
    return Result::Ok;
}

// ------------------------------------------------------------
// RAW JSON of any element (minified)
// ------------------------------------------------------------
[[nodiscard]]
inline std::string to_json(const simdjson::dom::element& el) {
    return simdjson::minify(el);
}

} // namespace wiredive::core::protocol::streamlit::parser::helper
