#include "utils.hpp"

namespace conduit::test {

    namespace detail {
        static session_config served_config() {
            session_config cfg{};
            cfg.server_command = {CONDUIT_CLI_PATH, "serve"};
            cfg.settle_ms = 50;
            cfg.grace_ms = 2000;
            cfg.response_timeout_ms = 15000;
            return cfg;
        }

        static session_config shell_config(std::string_view script) {
            session_config cfg{};
            cfg.server_command = {"/bin/sh", "-c", std::string{script}};
            cfg.settle_ms = 100;
            cfg.grace_ms = 500;
            cfg.response_timeout_ms = 5000;
            return cfg;
        }

        template <typename F>
        static session_error expect_failure(F&& op) {
            try {
                op();
            } catch (const session_error& e) {
                return e;
            }
            FAIL("expected a session_error");
            return session_error{error_kind::transport_failure, "unreachable"};
        }
    }  // namespace detail

    TEST_CASE("008: end to end against conduit serve", "[008][e2e]") {
        session client{detail::served_config()};
        client.start();

        const auto& hs = client.initialize();
        CHECK(hs.server.name == "conduit-hello-server");
        CHECK(hs.protocol_version == "2024-11-05");
        CHECK(client.state() == session_state::ready);

        auto tools = client.discover_tools();
        std::vector<std::string> names{};
        for (const auto& t : tools) {
            names.push_back(t.name);
            auto found = client.lookup_tool(t.name);
            REQUIRE(found);
            CHECK(*found == t);
        }
        CHECK(names == std::vector<std::string>{"hello", "echo", "get_time", "add_numbers"});

        auto sum = client.invoke_tool("add_numbers", {{"a", 42.0}, {"b", 8.0}});
        CHECK(sum.primary_text() == "42.0 + 8.0 = 50.0");
        CHECK_FALSE(sum.is_error);

        auto coerced = client.invoke_tool("add_numbers", {{"a", std::string{"2.5"}}, {"b", std::string{"0.5"}}});
        CHECK(coerced.primary_text() == "2.5 + 0.5 = 3.0");

        auto hello = client.invoke_tool("hello", {{"name", std::string{"Ada"}}});
        CHECK(hello.primary_text() == "Hello, Ada! Welcome to the MCP Hello Server!");

        auto echo = client.invoke_tool("echo", {{"message", std::string{"line one"}}});
        CHECK(echo.primary_text() == "Echo: line one");

        auto now = client.invoke_tool("get_time", {});
        REQUIRE(now.primary_text());
        CHECK(now.primary_text()->starts_with("Current time: "));

        CHECK(detail::expect_failure([&] { (void)client.invoke_tool("nope", {}); }).kind() == error_kind::unknown_tool);
        CHECK(detail::expect_failure([&] { (void)client.invoke_tool("echo", {}); }).kind() ==
              error_kind::missing_argument);
        CHECK(client.state() == session_state::ready);

        client.cleanup();
        CHECK(client.state() == session_state::terminated);
        client.cleanup();
        CHECK(client.state() == session_state::terminated);
    }

    TEST_CASE("008: a dead server turns the next request into a transport failure", "[008][e2e]") {
        auto channel = std::make_unique<process_transport>();
        auto* proc = channel.get();
        session client{detail::served_config(), std::move(channel)};
        client.start();
        client.initialize();
        (void)client.discover_tools();

        auto pid = proc->pid();
        REQUIRE(pid > 0);
        REQUIRE(::kill(pid, SIGKILL) == 0);
        // let the kernel deliver the signal before the next write
        std::this_thread::sleep_for(std::chrono::milliseconds{100});

        auto err = detail::expect_failure([&] { (void)client.invoke_tool("echo", {{"message", std::string{"hi"}}}); });
        CHECK(err.kind() == error_kind::transport_failure);
        CHECK(client.state() == session_state::terminated);
        CHECK_FALSE(proc->running());

        client.cleanup();
        CHECK(client.state() == session_state::terminated);
    }

    TEST_CASE("008: spawn failures", "[008][e2e]") {
        session_config missing{};
        missing.server_command = {"/nonexistent/conduit-server-binary"};
        missing.settle_ms = 0;
        session a{missing};
        auto err = detail::expect_failure([&] { a.start(); });
        CHECK(err.kind() == error_kind::spawn_failure);
        CHECK(std::string_view{err.what()}.find("/nonexistent/conduit-server-binary") != std::string_view::npos);
        CHECK(a.state() == session_state::terminated);

        auto early_exit = detail::shell_config("echo 'no config found' >&2; exit 3");
        early_exit.settle_ms = 500;
        session b{early_exit};
        auto exited = detail::expect_failure([&] { b.start(); });
        CHECK(exited.kind() == error_kind::spawn_failure);
        CHECK(std::string_view{exited.what()}.find("status 3") != std::string_view::npos);
        CHECK(std::string_view{exited.what()}.find("no config found") != std::string_view::npos);

        auto bad_cwd = detail::served_config();
        bad_cwd.working_directory = "/nonexistent/conduit-cwd";
        session c{bad_cwd};
        CHECK(detail::expect_failure([&] { c.start(); }).kind() == error_kind::spawn_failure);
    }

    TEST_CASE("008: garbage on stdout is a malformed response", "[008][e2e]") {
        session client{detail::shell_config("read line; echo 'Traceback (most recent call last):'; sleep 5")};
        client.start();
        CHECK(detail::expect_failure([&] { client.initialize(); }).kind() == error_kind::malformed_response);
        client.cleanup();
        CHECK(client.state() == session_state::terminated);
    }

    TEST_CASE("008: a server that stops answering times out", "[008][e2e]") {
        auto cfg = detail::shell_config("exec sleep 30");
        cfg.response_timeout_ms = 200;
        session client{cfg};
        client.start();

        auto started = std::chrono::steady_clock::now();
        CHECK(detail::expect_failure([&] { client.initialize(); }).kind() == error_kind::transport_failure);
        CHECK(std::chrono::steady_clock::now() - started < std::chrono::seconds{5});
        CHECK(client.state() == session_state::terminated);
    }

    TEST_CASE("008: process transport lines and diagnostics", "[008][transport]") {
        process_transport proc{};
        proc.start(
                launch_options{
                        .command = {"/bin/sh", "-c", "echo starting >&2; exec cat"},
                        .settle = std::chrono::milliseconds{50},
                        .read_timeout = std::chrono::milliseconds{5000}});
        REQUIRE(proc.running());

        proc.write_line(R"({"jsonrpc":"2.0","id":1,"result":{}})");
        proc.write_line("second\r");
        CHECK(proc.read_line() == R"({"jsonrpc":"2.0","id":1,"result":{}})");
        CHECK(proc.read_line() == "second");

        proc.terminate(std::chrono::milliseconds{1000});
        CHECK_FALSE(proc.running());
        CHECK(proc.exit_status());
        CHECK(proc.diagnostics().find("starting") != std::string::npos);

        CHECK_THROWS_AS(proc.write_line("late"), session_error);
        proc.terminate(std::chrono::milliseconds{1000});
    }

    TEST_CASE("008: terminate escalates when SIGTERM is ignored", "[008][transport]") {
        process_transport proc{};
        proc.start(
                launch_options{
                        .command = {"/bin/sh", "-c", "trap '' TERM; while true; do sleep 1; done"},
                        .settle = std::chrono::milliseconds{100}});

        auto started = std::chrono::steady_clock::now();
        proc.terminate(std::chrono::milliseconds{200});
        CHECK_FALSE(proc.running());
        CHECK(std::chrono::steady_clock::now() - started < std::chrono::seconds{5});
        REQUIRE(proc.exit_status());
        CHECK(*proc.exit_status() == 128 + SIGKILL);
    }

}  // namespace conduit::test
