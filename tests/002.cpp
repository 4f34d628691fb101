#include "utils.hpp"

namespace conduit::test {

    namespace detail {
        static void require_malformed(std::string_view line) {
            INFO("line: " << line);
            try {
                (void)parse_message(line);
                FAIL("expected malformed_response");
            } catch (const session_error& e) {
                CHECK(e.kind() == error_kind::malformed_response);
            }
        }
    }  // namespace detail

    TEST_CASE("002: responses, requests and notifications are classified", "[002][protocol]") {
        auto result = parse_message(R"({"jsonrpc":"2.0","id":1,"result":{"tools":[]}})"sv);
        REQUIRE(std::holds_alternative<response_message>(result));
        const auto& resp = std::get<response_message>(result);
        CHECK(resp.has_id(1));
        CHECK_FALSE(resp.has_id(2));
        REQUIRE(resp.result);
        CHECK_FALSE(resp.error);

        auto error = parse_message(R"({"jsonrpc":"2.0","id":4,"error":{"code":-32601,"message":"Unknown method"}})"sv);
        REQUIRE(std::holds_alternative<response_message>(error));
        const auto& err = std::get<response_message>(error);
        CHECK(err.has_id(4));
        REQUIRE(err.error);
        CHECK(err.error->code == -32601);
        CHECK(err.error->message == "Unknown method");

        auto note = parse_message(R"({"jsonrpc":"2.0","method":"notifications/progress","params":{"p":1}})"sv);
        REQUIRE(std::holds_alternative<notification_message>(note));
        CHECK(std::get<notification_message>(note).method == "notifications/progress");

        auto req = parse_message(R"({"jsonrpc":"2.0","id":"abc","method":"sampling/createMessage"})"sv);
        REQUIRE(std::holds_alternative<request_message>(req));
        CHECK(std::get<request_message>(req).method == "sampling/createMessage");
        CHECK(describe_id(std::get<request_message>(req).id) == "\"abc\"");
    }

    TEST_CASE("002: error replies to unparsable requests carry a null id", "[002][protocol]") {
        auto msg = parse_message(R"({"jsonrpc":"2.0","id":null,"error":{"code":-32700,"message":"JSON parse error"}})"sv);
        REQUIRE(std::holds_alternative<response_message>(msg));
        const auto& resp = std::get<response_message>(msg);
        CHECK_FALSE(resp.has_id(1));
        CHECK(describe_id(resp.id) == "null");
    }

    TEST_CASE("002: a null result is still a response", "[002][protocol]") {
        auto msg = parse_message(R"({"jsonrpc":"2.0","id":1,"result":null})"sv);
        REQUIRE(std::holds_alternative<response_message>(msg));
        const auto& resp = std::get<response_message>(msg);
        CHECK(resp.has_id(1));
        REQUIRE(resp.result);
        CHECK(resp.result->str == "null");
        CHECK_FALSE(resp.error);
    }

    TEST_CASE("002: malformed lines are rejected", "[002][protocol]") {
        detail::require_malformed("not json at all"sv);
        detail::require_malformed(R"({"jsonrpc":"2.0","id":1,"result":)"sv);
        detail::require_malformed(R"({"id":1,"result":{}})"sv);
        detail::require_malformed(R"({"jsonrpc":"1.0","id":1,"result":{}})"sv);
        detail::require_malformed(R"({"jsonrpc":"2.0","id":1,"result":{},"error":{"code":1,"message":"x"}})"sv);
        detail::require_malformed(R"({"jsonrpc":"2.0","id":1})"sv);
        detail::require_malformed(R"({"jsonrpc":"2.0","result":{}})"sv);
        detail::require_malformed(R"({"jsonrpc":"2.0","id":1,"method":"x","result":{}})"sv);
    }

    TEST_CASE("002: outbound frames", "[002][protocol]") {
        auto request = serialize_request(3, methods::tools_list, std::nullopt);
        CHECK(request.find('\n') == std::string::npos);
        auto parsed = parse_json(request);
        CHECK(field(parsed, "jsonrpc").get<std::string>() == "2.0");
        CHECK(field(parsed, "id").get<double>() == 3.0);
        CHECK(field(parsed, "method").get<std::string>() == "tools/list");
        CHECK_FALSE(has_field(parsed, "params"));

        tool_call_params params{.name = "echo", .arguments = glz::generic::object_t{{"message", std::string{"hi"}}}};
        auto call = parse_json(serialize_request(4, methods::tools_call, to_raw_json(params)));
        const auto& sent = field(call, "params");
        CHECK(field(sent, "name").get<std::string>() == "echo");
        CHECK(field(field(sent, "arguments"), "message").get<std::string>() == "hi");

        auto note = parse_json(serialize_notification(methods::initialized, std::nullopt));
        CHECK(field(note, "method").get<std::string>() == "notifications/initialized");
        CHECK_FALSE(has_field(note, "id"));
    }

    TEST_CASE("002: payload reads report malformed responses", "[002][protocol]") {
        auto ok = read_payload<tool_call_result>(glz::raw_json{text_result_json("Echo: hi")}, "tools/call");
        REQUIRE(ok.content.size() == 1U);
        CHECK(ok.content[0].text == "Echo: hi");
        CHECK_FALSE(ok.isError);

        try {
            (void)read_payload<tool_call_result>(glz::raw_json{R"({"content":"nope"})"}, "tools/call");
            FAIL("expected malformed_response");
        } catch (const session_error& e) {
            CHECK(e.kind() == error_kind::malformed_response);
        }
    }

}  // namespace conduit::test
