#include <iostream>
#include <string>

#include "relaygate/core/request/percent_encoding.hpp"
#include "common/test_check.hpp"

using namespace relaygate::core::request;


void test_unreserved_pass_through() {
    std::cout << "[TEST] Unreserved characters are copied\n";

    TEST_CHECK(percent_encode("AZaz09-._~") == "AZaz09-._~");
    TEST_CHECK(percent_encode("") == "");

    std::cout << "[TEST] OK\n";
}

void test_reserved_encoded() {
    std::cout << "[TEST] Reserved characters are escaped with uppercase hex\n";

    TEST_CHECK(percent_encode("urn:li:activity:1") == "urn%3Ali%3Aactivity%3A1");
    TEST_CHECK(percent_encode("(a,b)") == "%28a%2Cb%29");
    TEST_CHECK(percent_encode("a/b?c=d&e") == "a%2Fb%3Fc%3Dd%26e");
    TEST_CHECK(percent_encode(" ") == "%20");
    TEST_CHECK(percent_encode("+") == "%2B");

    std::cout << "[TEST] OK\n";
}

void test_utf8_bytewise() {
    std::cout << "[TEST] Non-ASCII is encoded byte by byte\n";

    // U+00E9 LATIN SMALL LETTER E WITH ACUTE
    TEST_CHECK(percent_encode("caf\xC3\xA9") == "caf%C3%A9");

    std::cout << "[TEST] OK\n";
}

void test_append_form() {
    std::cout << "[TEST] Appending form writes after existing content\n";

    std::string out = "x=";
    percent_encode(out, "1 2");
    TEST_CHECK(out == "x=1%202");

    static_assert(is_unreserved('~'));
    static_assert(!is_unreserved(':'));

    std::cout << "[TEST] OK\n";
}


int main() {
    test_unreserved_pass_through();
    test_reserved_encoded();
    test_utf8_bytewise();
    test_append_form();

    std::cout << "\n[PERCENT ENCODING TESTS PASSED]\n";
    return 0;
}
