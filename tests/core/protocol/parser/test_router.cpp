/*
===============================================================================
 protocol::parser::Router
===============================================================================

Covered:
- Dispatch of every client → gateway type
- Structural failures (bad JSON, non-object, missing / non-string type)
- Unknown and outbound-only types
- Field-level rejections surfaced through the router

===============================================================================
*/

#include <iostream>
#include <string>
#include <variant>

#include "relaygate/core/protocol/parser/router.hpp"
#include "common/test_check.hpp"

using namespace relaygate::core::protocol;
using namespace relaygate::core::protocol::parser;


void test_dispatch_inbound_types() {
    std::cout << "[TEST] Inbound types dispatch to typed schemas\n";

    Router router;
    MessageType type;
    Inbound msg;

    TEST_CHECK(router.parse(R"({"type":"auth","token":"t-1"})", type, msg) == Result::Parsed);
    TEST_CHECK(type == MessageType::Auth);
    TEST_CHECK(std::get<schema::Auth>(msg).token == "t-1");

    TEST_CHECK(router.parse(R"({"type":"ping","id":"p7"})", type, msg) == Result::Parsed);
    TEST_CHECK(type == MessageType::Ping);
    TEST_CHECK(std::get<schema::PingIn>(msg).id.value() == "p7");

    TEST_CHECK(router.parse(R"({"type":"ping"})", type, msg) == Result::Parsed);
    TEST_CHECK(!std::get<schema::PingIn>(msg).id.has());

    TEST_CHECK(router.parse(R"({"type":"pong","id":3})", type, msg) == Result::Parsed);
    TEST_CHECK(type == MessageType::Pong);
    TEST_CHECK(std::get<schema::Pong>(msg).id.value() == "3");

    TEST_CHECK(router.parse(R"({"type":"response","request_id":"c-1","success":true,"payload":{"a": 1}})", type, msg) == Result::Parsed);
    TEST_CHECK(type == MessageType::Response);
    TEST_CHECK(std::get<schema::Response>(msg).payload == R"({"a":1})");

    TEST_CHECK(router.parse(R"({"type":"error","message":"boom","code":17})", type, msg) == Result::Parsed);
    TEST_CHECK(type == MessageType::Error);
    TEST_CHECK(std::get<schema::ErrorNotice>(msg).message == "boom");
    TEST_CHECK(std::get<schema::ErrorNotice>(msg).code.value() == 17);

    std::cout << "[TEST] OK\n";
}

void test_structural_failures() {
    std::cout << "[TEST] Structural failures\n";

    Router router;
    MessageType type;
    Inbound msg;

    TEST_CHECK(router.parse("{not json", type, msg) == Result::InvalidJson);
    TEST_CHECK(router.parse("", type, msg) == Result::InvalidJson);
    TEST_CHECK(router.parse("[1,2,3]", type, msg) == Result::InvalidSchema);
    TEST_CHECK(router.parse(R"({"token":"x"})", type, msg) == Result::InvalidSchema);
    TEST_CHECK(router.parse(R"({"type":5})", type, msg) == Result::InvalidSchema);
    TEST_CHECK(std::holds_alternative<std::monostate>(msg));

    std::cout << "[TEST] OK\n";
}

void test_unknown_and_outbound_types() {
    std::cout << "[TEST] Unknown and gateway-only types are rejected\n";

    Router router;
    MessageType type;
    Inbound msg;

    TEST_CHECK(router.parse(R"({"type":"subscribe"})", type, msg) == Result::InvalidSchema);
    TEST_CHECK(type == MessageType::Unknown);

    TEST_CHECK(router.parse(R"({"type":"request","request_id":"x"})", type, msg) == Result::InvalidValue);
    TEST_CHECK(type == MessageType::Request);

    TEST_CHECK(router.parse(R"({"type":"auth_success","user_id":"alice"})", type, msg) == Result::InvalidValue);
    TEST_CHECK(router.parse(R"({"type":"notification","message":"m"})", type, msg) == Result::InvalidValue);

    std::cout << "[TEST] OK\n";
}

void test_field_rejections() {
    std::cout << "[TEST] Field-level rejections\n";

    Router router;
    MessageType type;
    Inbound msg;

    TEST_CHECK(router.parse(R"({"type":"auth"})", type, msg) == Result::InvalidSchema);
    TEST_CHECK(type == MessageType::Auth);
    TEST_CHECK(router.parse(R"({"type":"auth","token":""})", type, msg) == Result::InvalidValue);
    TEST_CHECK(router.parse(R"({"type":"auth","token":42})", type, msg) == Result::InvalidSchema);

    TEST_CHECK(router.parse(R"({"type":"ping","id":{"x":1}})", type, msg) == Result::InvalidSchema);
    TEST_CHECK(router.parse(R"({"type":"error","code":"E1"})", type, msg) == Result::InvalidSchema);

    std::cout << "[TEST] OK\n";
}

void test_parser_reuse() {
    std::cout << "[TEST] One router parses many frames\n";

    Router router;
    MessageType type;
    Inbound msg;
    for (int i = 0; i < 100; ++i) {
        const std::string frame = R"({"type":"pong","id":")" + std::to_string(i) + R"("})";
        TEST_CHECK(router.parse(frame, type, msg) == Result::Parsed);
        TEST_CHECK(std::get<schema::Pong>(msg).id.value() == std::to_string(i));
    }

    std::cout << "[TEST] OK\n";
}


#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Error);

    test_dispatch_inbound_types();
    test_structural_failures();
    test_unknown_and_outbound_types();
    test_field_rejections();
    test_parser_reuse();

    std::cout << "\n[PARSER ROUTER TESTS PASSED]\n";
    return 0;
}
