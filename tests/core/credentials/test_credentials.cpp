/*
===============================================================================
 credentials — Unit Tests
 CookieFile / StaticSource / missing / make_handshake
===============================================================================

Scope:
------
Validates how session cookies are read and turned into the WebSocket
upgrade request.

-------------------------------------------------------------------------------
Covered Contracts
-------------------------------------------------------------------------------

K1. cookies.txt parsing
    - Comments and blank lines skipped, "#HttpOnly_" lines kept
    - CRLF line endings, malformed lines skipped
    - A file without a valid line is Malformed

K2. Domain matching (leading dot, sub-domains, parents, look-alikes)

K3. CookieFile::get filters by domain and name, later lines win

K4. missing() reports absent required cookies in order

K5. StaticSource returns only requested names

K6. make_handshake: headers, sub-protocols with the XSRF token

K7. load() reports a missing file

===============================================================================
*/

#include <array>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "common/test_check.hpp"

#include "wiredive/core/config/endpoint.hpp"
#include "wiredive/core/credentials/handshake.hpp"
#include "wiredive/core/credentials/source.hpp"

using namespace wiredive::core;
using namespace wiredive::core::credentials;

namespace {

constexpr std::string_view JAR =
    "# Netscape HTTP Cookie File\n"
    "# https://curl.se/docs/http-cookies.html\n"
    "\n"
    ".hashdive.com\tTRUE\t/\tFALSE\t1790000000\tajs_anonymous_id\tanon-42\n"
    "#HttpOnly_hashdive.com\tFALSE\t/\tTRUE\t0\t_streamlit_user\tuser-token\r\n"
    "hashdive.com\tFALSE\t/\tTRUE\t0\t_streamlit_xsrf\t2|abc|def|123\n"
    "example.org\tFALSE\t/\tFALSE\t0\t_streamlit_xsrf\tforeign\n"
    "hashdive.com\tFALSE\t/\tFALSE\n"
    "hashdive.com\tFALSE\t/\tFALSE\t0\ttheme\tdark\n";

constexpr std::array<std::string_view, 2> AUTH = {"_streamlit_user", "_streamlit_xsrf"};

} // namespace


void test_parse_cookie_file() {
    std::cout << "[TEST] Group K1: cookies.txt parsing\n";

    std::vector<Cookie> cookies;
    TEST_CHECK(parse_cookie_file(JAR, cookies) == LoadError::None);
    TEST_CHECK(cookies.size() == 5);

    TEST_CHECK(cookies[0].domain == ".hashdive.com");
    TEST_CHECK(cookies[0].name == "ajs_anonymous_id");
    TEST_CHECK(cookies[0].value == "anon-42");
    TEST_CHECK(cookies[0].expires == 1790000000);
    TEST_CHECK(!cookies[0].secure);

    // "#HttpOnly_" prefix stripped, CR removed
    TEST_CHECK(cookies[1].domain == "hashdive.com");
    TEST_CHECK(cookies[1].name == "_streamlit_user");
    TEST_CHECK(cookies[1].value == "user-token");
    TEST_CHECK(cookies[1].secure);

    TEST_CHECK(cookies[2].value == "2|abc|def|123");

    TEST_CHECK(parse_cookie_file("", cookies) == LoadError::Malformed);
    TEST_CHECK(cookies.empty());
    TEST_CHECK(parse_cookie_file("# only a comment\nnot a cookie line\n", cookies) == LoadError::Malformed);

    // Empty value is allowed, empty name is not
    TEST_CHECK(parse_cookie_file("a.com\tFALSE\t/\tFALSE\t0\tflag\t\n"
                                 "a.com\tFALSE\t/\tFALSE\t0\t\tvalue\n", cookies) == LoadError::None);
    TEST_CHECK(cookies.size() == 1);
    TEST_CHECK(cookies[0].name == "flag");
    TEST_CHECK(cookies[0].value.empty());

    std::cout << "[TEST] OK\n";
}

void test_domain_matches() {
    std::cout << "[TEST] Group K2: domain matching\n";

    TEST_CHECK(domain_matches("hashdive.com", "hashdive.com"));
    TEST_CHECK(domain_matches(".hashdive.com", "hashdive.com"));
    TEST_CHECK(domain_matches(".hashdive.com", "www.hashdive.com"));
    TEST_CHECK(domain_matches("www.hashdive.com", "hashdive.com"));

    TEST_CHECK(!domain_matches("nothashdive.com", "hashdive.com"));
    TEST_CHECK(!domain_matches("hashdive.com", "nothashdive.com"));
    TEST_CHECK(!domain_matches("example.org", "hashdive.com"));
    TEST_CHECK(!domain_matches("", "hashdive.com"));
    TEST_CHECK(!domain_matches(".", "hashdive.com"));
    TEST_CHECK(!domain_matches("hashdive.com", ""));

    std::cout << "[TEST] OK\n";
}

void test_cookie_file_get() {
    std::cout << "[TEST] Group K3: CookieFile::get\n";

    CookieFile jar;
    TEST_CHECK(jar.parse(JAR) == LoadError::None);
    TEST_CHECK(jar.size() == 5);

    const Cookies auth = jar.get("hashdive.com", AUTH);
    TEST_CHECK(auth.size() == 2);
    TEST_CHECK(auth.at("_streamlit_user") == "user-token");
    // example.org line does not leak in
    TEST_CHECK(auth.at("_streamlit_xsrf") == "2|abc|def|123");

    const Cookies all = jar.get("hashdive.com", config::endpoint::REQUIRED_COOKIES);
    TEST_CHECK(all.size() == 3);
    TEST_CHECK(all.count("theme") == 0);

    TEST_CHECK(jar.get("example.org", AUTH).at("_streamlit_xsrf") == "foreign");
    TEST_CHECK(jar.get("other.net", AUTH).empty());

    // Later line wins
    CookieFile dup;
    TEST_CHECK(dup.parse("hashdive.com\tFALSE\t/\tFALSE\t0\t_streamlit_user\told\n"
                         ".hashdive.com\tTRUE\t/\tFALSE\t0\t_streamlit_user\tnew\n") == LoadError::None);
    TEST_CHECK(dup.get("hashdive.com", AUTH).at("_streamlit_user") == "new");

    std::cout << "[TEST] OK\n";
}

void test_missing() {
    std::cout << "[TEST] Group K4: missing()\n";

    Cookies cookies{{"_streamlit_user", "u"}};
    const auto absent = missing(cookies, config::endpoint::REQUIRED_COOKIES);
    TEST_CHECK(absent == (std::vector<std::string>{"ajs_anonymous_id", "_streamlit_xsrf"}));

    cookies.emplace("ajs_anonymous_id", "a");
    cookies.emplace("_streamlit_xsrf", "x");
    TEST_CHECK(missing(cookies, config::endpoint::REQUIRED_COOKIES).empty());

    std::cout << "[TEST] OK\n";
}

void test_static_source() {
    std::cout << "[TEST] Group K5: StaticSource\n";

    StaticSource src(Cookies{{"_streamlit_user", "u"}, {"other", "o"}});
    src.set("_streamlit_xsrf", "x1");
    src.set("_streamlit_xsrf", "x2");

    const Cookies got = src.get("any.domain", AUTH);
    TEST_CHECK(got.size() == 2);
    TEST_CHECK(got.at("_streamlit_xsrf") == "x2");
    TEST_CHECK(got.count("other") == 0);

    TEST_CHECK(StaticSource{}.get("hashdive.com", AUTH).empty());

    std::cout << "[TEST] OK\n";
}

void test_make_handshake() {
    std::cout << "[TEST] Group K6: make_handshake\n";

    const Cookies cookies{{"_streamlit_user", "u"}, {"_streamlit_xsrf", "2|abc"}, {"ajs_anonymous_id", "a"}};
    const transport::Handshake hs = make_handshake(cookies);

    auto header = [&hs](std::string_view name) -> std::string {
        for (const auto& [k, v] : hs.headers) {
            if (k == name) {
                return v;
            }
        }
        return {};
    };

    TEST_CHECK(header("Origin") == "https://hashdive.com");
    TEST_CHECK(header("User-Agent").find("Mozilla/5.0") == 0);
    // Map order
    TEST_CHECK(header("Cookie") == "_streamlit_user=u; _streamlit_xsrf=2|abc; ajs_anonymous_id=a");

    TEST_CHECK(hs.subprotocols == (std::vector<std::string>{"streamlit", "2|abc"}));
    TEST_CHECK(hs.subprotocol_header() == "streamlit, 2|abc");
    TEST_CHECK(hs.max_message_size == config::endpoint::MAX_MESSAGE_SIZE);

    // Without cookies: no Cookie header, no XSRF token
    const transport::Handshake bare = make_handshake(Cookies{}, "https://example.com", "ua");
    TEST_CHECK(bare.headers.size() == 2);
    TEST_CHECK(bare.subprotocols == (std::vector<std::string>{"streamlit"}));

    std::cout << "[TEST] OK\n";
}

void test_load_missing_file() {
    std::cout << "[TEST] Group K7: load() of a missing file\n";

    CookieFile jar;
    TEST_CHECK(jar.load("/nonexistent/wiredive/cookies.txt") == LoadError::NotFound);
    TEST_CHECK(jar.size() == 0);

    std::cout << "[TEST] OK\n";
}

int main() {
    test_parse_cookie_file();
    test_domain_matches();
    test_cookie_file_get();
    test_missing();
    test_static_source();
    test_make_handshake();
    test_load_missing_file();

    std::cout << "\n[CREDENTIALS TESTS PASSED]\n";
    return 0;
}
