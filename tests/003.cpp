#include "utils.hpp"

namespace conduit::test {

    namespace detail {
        static error_kind send_failure_kind(correlator& rpc, std::string_view method) {
            try {
                (void)rpc.send(method);
            } catch (const session_error& e) {
                return e.kind();
            }
            FAIL("expected send to throw");
            return error_kind::transport_failure;
        }
    }  // namespace detail

    TEST_CASE("003: request ids increase from 1 and responses pair in order", "[003][correlator]") {
        spy_transport spy{};
        correlator rpc{spy};
        spy.script = {result_line(1, "{}"), result_line(2, R"({"tools":[]})"), result_line(3, "{}")};

        CHECK(rpc.send(methods::initialize).has_id(1));
        CHECK(rpc.send(methods::tools_list).has_id(2));
        CHECK(rpc.send(methods::tools_call).has_id(3));
        CHECK(rpc.last_issued_id() == 3);
        CHECK_FALSE(rpc.pending());

        REQUIRE(spy.writes.size() == 3U);
        for (std::size_t i = 0; i < spy.writes.size(); ++i) {
            auto frame = parse_json(spy.writes[i]);
            CHECK(field(frame, "id").get<double>() == static_cast<double>(i + 1));
            CHECK(spy.writes[i].find('\n') == std::string::npos);
        }
    }

    TEST_CASE("003: a response for another id is a protocol violation", "[003][correlator]") {
        spy_transport spy{};
        correlator rpc{spy};
        spy.script = {result_line(7, "{}")};

        CHECK(detail::send_failure_kind(rpc, methods::tools_list) == error_kind::protocol_violation);
        CHECK_FALSE(rpc.pending());
    }

    TEST_CASE("003: server-initiated traffic during a request is rejected", "[003][correlator]") {
        spy_transport spy{};
        correlator rpc{spy};
        spy.script = {R"({"jsonrpc":"2.0","method":"notifications/message","params":{"level":"info"}})"};
        CHECK(detail::send_failure_kind(rpc, methods::tools_list) == error_kind::protocol_violation);

        spy.script = {R"({"jsonrpc":"2.0","id":"srv-1","method":"roots/list"})"};
        CHECK(detail::send_failure_kind(rpc, methods::tools_list) == error_kind::protocol_violation);
    }

    TEST_CASE("003: blank lines between messages are skipped", "[003][correlator]") {
        spy_transport spy{};
        correlator rpc{spy};
        spy.script = {"", "   ", result_line(1, R"({"ok":true})")};

        auto resp = rpc.send(methods::tools_list);
        CHECK(resp.has_id(1));
        CHECK(spy.script.empty());
    }

    TEST_CASE("003: end of stream and garbage lines", "[003][correlator]") {
        spy_transport spy{};
        correlator rpc{spy};
        CHECK(detail::send_failure_kind(rpc, methods::tools_list) == error_kind::transport_failure);

        spy.script = {"Traceback (most recent call last):"};
        CHECK(detail::send_failure_kind(rpc, methods::tools_list) == error_kind::malformed_response);
        CHECK(rpc.last_issued_id() == 2);
    }

    TEST_CASE("003: a failed write still consumes its id", "[003][correlator]") {
        spy_transport spy{};
        correlator rpc{spy};
        spy.fail_writes = true;
        CHECK(detail::send_failure_kind(rpc, methods::tools_list) == error_kind::transport_failure);
        CHECK(rpc.last_issued_id() == 1);
        CHECK_FALSE(rpc.pending());

        spy.fail_writes = false;
        spy.script = {result_line(2, "{}")};
        CHECK(rpc.send(methods::tools_list).has_id(2));
    }

    TEST_CASE("003: notifications carry no id and read nothing", "[003][correlator]") {
        spy_transport spy{};
        correlator rpc{spy};
        spy.script = {result_line(1, "{}")};

        rpc.notify(methods::initialized);
        REQUIRE(spy.writes.size() == 1U);
        auto frame = parse_json(spy.writes[0]);
        CHECK(field(frame, "method").get<std::string>() == "notifications/initialized");
        CHECK_FALSE(has_field(frame, "id"));
        CHECK(spy.script.size() == 1U);
        CHECK(rpc.last_issued_id() == 0);
    }

    TEST_CASE("003: error responses are returned to the caller", "[003][correlator]") {
        spy_transport spy{};
        correlator rpc{spy};
        spy.script = {error_line(1, -32601, "Unknown method: tools/frobnicate")};

        auto resp = rpc.send("tools/frobnicate");
        REQUIRE(resp.error);
        CHECK(resp.error->code == -32601);
        CHECK_FALSE(resp.result);
    }

}  // namespace conduit::test
