/*
===============================================================================
 transport::parse_url — Unit Tests
===============================================================================

Scope:
------
Validates the minimal ws:// / wss:// URL parser used to build an Endpoint.

-------------------------------------------------------------------------------
Covered Contracts
-------------------------------------------------------------------------------

U1. Scheme selects security and default port
U2. Explicit ports, paths and query strings are preserved
U3. Malformed inputs are rejected with InvalidUrl
U4. Host header omits the default port

-------------------------------------------------------------------------------
Non-Goals
-------------------------------------------------------------------------------
- IPv6 literals
- Userinfo and fragments

===============================================================================
*/

#include <iostream>

#include "common/test_check.hpp"
#include "wiredive/core/transport/parse_url.hpp"

using namespace wiredive::core::transport;


// -----------------------------------------------------------------------------
// U1. Scheme and default port
// -----------------------------------------------------------------------------
void test_scheme_defaults() {
    std::cout << "[TEST] Group U1: scheme selects security and default port\n";

    ParsedUrl url;
    TEST_CHECK(parse_url("wss://hashdive.com/_stcore/stream", url) == Error::None);
    TEST_CHECK(url.secure);
    TEST_CHECK(url.host == "hashdive.com");
    TEST_CHECK(url.port == "443");
    TEST_CHECK(url.target == "/_stcore/stream");

    TEST_CHECK(parse_url("ws://localhost", url) == Error::None);
    TEST_CHECK(!url.secure);
    TEST_CHECK(url.port == "80");
    TEST_CHECK(url.target == "/");

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// U2. Ports, paths, queries
// -----------------------------------------------------------------------------
void test_explicit_parts() {
    std::cout << "[TEST] Group U2: explicit port, path and query\n";

    ParsedUrl url;
    TEST_CHECK(parse_url("ws://127.0.0.1:8501/_stcore/stream", url) == Error::None);
    TEST_CHECK(url.host == "127.0.0.1");
    TEST_CHECK(url.port == "8501");
    TEST_CHECK(url.target == "/_stcore/stream");

    TEST_CHECK(parse_url("ws://localhost:9000?debug=1", url) == Error::None);
    TEST_CHECK(url.target == "/?debug=1");

    TEST_CHECK(parse_url("wss://example.com/a/b?x=1&y=2", url) == Error::None);
    TEST_CHECK(url.target == "/a/b?x=1&y=2");

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// U3. Rejections
// -----------------------------------------------------------------------------
void test_rejections() {
    std::cout << "[TEST] Group U3: malformed URLs are rejected\n";

    ParsedUrl url;
    TEST_CHECK(parse_url("https://hashdive.com", url) == Error::InvalidUrl);
    TEST_CHECK(parse_url("wss://", url) == Error::InvalidUrl);
    TEST_CHECK(parse_url("wss://:443/path", url) == Error::InvalidUrl);
    TEST_CHECK(parse_url("wss://host:/path", url) == Error::InvalidUrl);
    TEST_CHECK(parse_url("wss://host:abc", url) == Error::InvalidUrl);
    TEST_CHECK(parse_url("wss://host:0", url) == Error::InvalidUrl);
    TEST_CHECK(parse_url("wss://host:70000", url) == Error::InvalidUrl);
    TEST_CHECK(parse_url("wss://user@host/", url) == Error::InvalidUrl);
    TEST_CHECK(parse_url("", url) == Error::InvalidUrl);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// U4. Host header
// -----------------------------------------------------------------------------
void test_host_header() {
    std::cout << "[TEST] Group U4: host header\n";

    ParsedUrl url;
    TEST_CHECK(parse_url("wss://hashdive.com/_stcore/stream", url) == Error::None);
    TEST_CHECK(url.host_header() == "hashdive.com");

    TEST_CHECK(parse_url("wss://hashdive.com:8443/_stcore/stream", url) == Error::None);
    TEST_CHECK(url.host_header() == "hashdive.com:8443");

    TEST_CHECK(parse_url("ws://localhost:80/", url) == Error::None);
    TEST_CHECK(url.host_header() == "localhost");

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
int main() {
    test_scheme_defaults();
    test_explicit_parts();
    test_rejections();
    test_host_header();

    std::cout << "\n[PARSE_URL TESTS PASSED]\n";
    return 0;
}
