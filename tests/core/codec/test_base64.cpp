/*
===============================================================================
 codec::base64 — Unit Tests
===============================================================================

Scope:
------
Validates the base64 text form used to hand binary frames to the decoder.

-------------------------------------------------------------------------------
Covered Contracts
-------------------------------------------------------------------------------

B1. Padding for every input length modulo 3 (RFC 4648 vectors)
B2. Binary bytes (0x00, 0xFF) survive encode -> decode
B3. Decoder skips whitespace and stops at padding
B4. Decoder rejects characters outside the alphabet

===============================================================================
*/

#include <iostream>
#include <string>

#include "common/test_check.hpp"

#include "wiredive/core/codec/base64.hpp"

using namespace wiredive::core::codec;


void test_rfc_vectors() {
    std::cout << "[TEST] Group B1: RFC 4648 vectors\n";

    TEST_CHECK(base64::encode("") == "");
    TEST_CHECK(base64::encode("f") == "Zg==");
    TEST_CHECK(base64::encode("fo") == "Zm8=");
    TEST_CHECK(base64::encode("foo") == "Zm9v");
    TEST_CHECK(base64::encode("foob") == "Zm9vYg==");
    TEST_CHECK(base64::encode("fooba") == "Zm9vYmE=");
    TEST_CHECK(base64::encode("foobar") == "Zm9vYmFy");

    std::string out;
    TEST_CHECK(base64::decode("Zm9vYmE=", out));
    TEST_CHECK(out == "fooba");
    TEST_CHECK(base64::decode("Zg==", out));
    TEST_CHECK(out == "f");
    TEST_CHECK(base64::decode("", out));
    TEST_CHECK(out.empty());

    std::cout << "[TEST] OK\n";
}

void test_binary_bytes() {
    std::cout << "[TEST] Group B2: binary bytes\n";

    const std::string bin("\x00\xFF\x10\x80\x7F\x00\x0A", 7);
    const std::string enc = base64::encode(bin);
    TEST_CHECK(enc == "AP8QgH8ACg==");

    std::string out;
    TEST_CHECK(base64::decode(enc, out));
    TEST_CHECK(out == bin);

    TEST_CHECK(base64::encode("\xFB\xFF") == "+/8=");

    std::cout << "[TEST] OK\n";
}

void test_whitespace_and_padding() {
    std::cout << "[TEST] Group B3: whitespace and padding\n";

    std::string out;
    TEST_CHECK(base64::decode("Zm9v\r\nYmFy\n", out));
    TEST_CHECK(out == "foobar");
    TEST_CHECK(base64::decode("Zm 9v\tYg", out));
    TEST_CHECK(out == "foob");
    TEST_CHECK(base64::decode("Zm8=ignored!", out));
    TEST_CHECK(out == "fo");

    std::cout << "[TEST] OK\n";
}

void test_invalid_characters() {
    std::cout << "[TEST] Group B4: invalid characters\n";

    std::string out;
    TEST_CHECK(!base64::decode("Zm9v*mFy", out));
    TEST_CHECK(!base64::decode("Zm9v-_", out));

    std::cout << "[TEST] OK\n";
}

int main() {
    test_rfc_vectors();
    test_binary_bytes();
    test_whitespace_and_padding();
    test_invalid_characters();

    std::cout << "\n[BASE64 TESTS PASSED]\n";
    return 0;
}
