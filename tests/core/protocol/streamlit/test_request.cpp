/*
===============================================================================
 streamlit::Request — Unit Tests
===============================================================================

Scope:
------
Validates the rerunScript request: serialization, per-target query string,
and template loading.

-------------------------------------------------------------------------------
Covered Contracts
-------------------------------------------------------------------------------

T1. to_json() wraps the request in {"rerunScript":{...}} and is valid JSON
T2. with_target() sets "user_address=<id>" and percent-encodes the id
T3. with_target() keeps every other template field
T4. parse_request() accepts wrapped and bare templates, defaults kept
T5. parse_request() rejects malformed templates
T6. load_request() reports a missing file

===============================================================================
*/

#include <iostream>
#include <string>

#include "simdjson.h"

#include "common/test_check.hpp"

#include "wiredive/core/protocol/streamlit/request.hpp"

using namespace wiredive::core::protocol::streamlit;


void test_to_json() {
    std::cout << "[TEST] Group T1: to_json\n";

    Request req;
    req.query_string = "user_address=0xabc";
    req.page_script_hash = "a1b2c3";

    const std::string json = req.to_json();
    TEST_CHECK(json.rfind("{\"rerunScript\":{", 0) == 0);

    simdjson::dom::parser parser;
    simdjson::dom::element root;
    TEST_CHECK(parser.parse(json).get(root) == simdjson::SUCCESS);

    std::string_view sv;
    TEST_CHECK(root["rerunScript"]["queryString"].get(sv) == simdjson::SUCCESS);
    TEST_CHECK(sv == "user_address=0xabc");
    TEST_CHECK(root["rerunScript"]["pageName"].get(sv) == simdjson::SUCCESS);
    TEST_CHECK(sv == "Analyze_User");
    TEST_CHECK(root["rerunScript"]["pageScriptHash"].get(sv) == simdjson::SUCCESS);
    TEST_CHECK(sv == "a1b2c3");

    simdjson::dom::object widgets;
    TEST_CHECK(root["rerunScript"]["widgetStates"].get(widgets) == simdjson::SUCCESS);

    std::int64_t offset = 0;
    TEST_CHECK(root["rerunScript"]["contextInfo"]["timezoneOffset"].get(offset) == simdjson::SUCCESS);
    TEST_CHECK(offset == -180);
    bool embedded = true;
    TEST_CHECK(root["rerunScript"]["contextInfo"]["isEmbedded"].get(embedded) == simdjson::SUCCESS);
    TEST_CHECK(!embedded);

    // Empty widget states still serialize as an object
    req.widget_states.clear();
    TEST_CHECK(parser.parse(req.to_json()).get(root) == simdjson::SUCCESS);
    TEST_CHECK(root["rerunScript"]["widgetStates"].get(widgets) == simdjson::SUCCESS);

    std::cout << "[TEST] OK\n";
}

void test_with_target() {
    std::cout << "[TEST] Group T2: with_target\n";

    const Request tmpl;
    TEST_CHECK(with_target(tmpl, "0xAbC123").query_string == "user_address=0xAbC123");
    TEST_CHECK(with_target(tmpl, "a b&c=d").query_string == "user_address=a%20b%26c%3Dd");
    TEST_CHECK(with_target(tmpl, "x-y_z.~").query_string == "user_address=x-y_z.~");
    TEST_CHECK(with_target(tmpl, "\xC3\xA9").query_string == "user_address=%C3%A9");
    TEST_CHECK(with_target(tmpl, "").query_string == "user_address=");
    TEST_CHECK(with_target(tmpl, "42", "id").query_string == "id=42");

    std::cout << "[TEST] OK\n";
}

void test_with_target_keeps_template() {
    std::cout << "[TEST] Group T3: with_target keeps template fields\n";

    Request tmpl;
    tmpl.query_string = "user_address=old";
    tmpl.page_script_hash = "hash";
    tmpl.widget_states = R"({"widgets":[]})";
    tmpl.context.timezone = "UTC";
    tmpl.context.timezone_offset = 0;

    const Request req = with_target(tmpl, "new");
    TEST_CHECK(req.query_string == "user_address=new");
    TEST_CHECK(req.page_script_hash == "hash");
    TEST_CHECK(req.widget_states == R"({"widgets":[]})");
    TEST_CHECK(req.context.timezone == "UTC");
    TEST_CHECK(req.context.timezone_offset == 0);

    // Template untouched
    TEST_CHECK(tmpl.query_string == "user_address=old");

    std::cout << "[TEST] OK\n";
}

void test_parse_request() {
    std::cout << "[TEST] Group T4: parse_request\n";

    {
        Request req;
        TEST_CHECK(parse_request(R"({"rerunScript":{"queryString":"","pageScriptHash":"ff00","pageName":"Analyze_User",
            "widgetStates":{"widgets":[{"id":"w1","stringValue":"x"}]},
            "contextInfo":{"timezone":"UTC","timezoneOffset":0,"isEmbedded":true}}})", req) == TemplateError::None);
        TEST_CHECK(req.page_script_hash == "ff00");
        TEST_CHECK(req.widget_states == R"({"widgets":[{"id":"w1","stringValue":"x"}]})");
        TEST_CHECK(req.context.timezone == "UTC");
        TEST_CHECK(req.context.timezone_offset == 0);
        TEST_CHECK(req.context.is_embedded);
        // Absent fields keep their defaults
        TEST_CHECK(req.context.locale == "en-US");
        TEST_CHECK(req.context.color_scheme == "light");
    }
    {
        Request req;
        TEST_CHECK(parse_request(R"({"pageName":"Other","pageScriptHash":"01"})", req) == TemplateError::None);
        TEST_CHECK(req.page_name == "Other");
        TEST_CHECK(req.page_script_hash == "01");
        TEST_CHECK(req.widget_states == "{}");
    }

    std::cout << "[TEST] OK\n";
}

void test_parse_request_errors() {
    std::cout << "[TEST] Group T5: malformed templates\n";

    Request req;
    TEST_CHECK(parse_request("", req) == TemplateError::InvalidJson);
    TEST_CHECK(parse_request("{oops", req) == TemplateError::InvalidJson);
    TEST_CHECK(parse_request("[]", req) == TemplateError::InvalidSchema);
    TEST_CHECK(parse_request(R"({"rerunScript":"x"})", req) == TemplateError::InvalidSchema);
    TEST_CHECK(parse_request(R"({"something":"else"})", req) == TemplateError::InvalidSchema);

    std::cout << "[TEST] OK\n";
}

void test_load_request() {
    std::cout << "[TEST] Group T6: load_request\n";

    Request req;
    TEST_CHECK(load_request("/nonexistent/wiredive/template.json", req) == TemplateError::NotFound);

    std::cout << "[TEST] OK\n";
}

int main() {
    test_to_json();
    test_with_target();
    test_with_target_keeps_template();
    test_parse_request();
    test_parse_request_errors();
    test_load_request();

    std::cout << "\n[REQUEST TESTS PASSED]\n";
    return 0;
}
