#include "utils.hpp"

#include <limits>

namespace conduit::test {

    TEST_CASE("001: output mode and log level parsing", "[001][config]") {
        output_mode mode = output_mode::text;
        REQUIRE(try_parse_output_mode("JSON"sv, mode));
        CHECK(mode == output_mode::json);
        REQUIRE(try_parse_output_mode("text"sv, mode));
        CHECK(mode == output_mode::text);
        CHECK_FALSE(try_parse_output_mode("yaml"sv, mode));

        log_level level = log_level::warn;
        REQUIRE(try_parse_log_level("DEBUG"sv, level));
        CHECK(level == log_level::debug);
        REQUIRE(try_parse_log_level("warning"sv, level));
        CHECK(level == log_level::warn);
        REQUIRE(try_parse_log_level("none"sv, level));
        CHECK(level == log_level::off);
        CHECK_FALSE(try_parse_log_level("verbose"sv, level));
        CHECK(level == log_level::off);

        CHECK(to_string(output_mode::json) == "json"sv);
        CHECK(to_string(log_level::error) == "error"sv);
    }

    TEST_CASE("001: log threshold gates levels", "[001][config]") {
        auto previous = log_threshold();
        set_log_threshold(log_level::warn);
        CHECK_FALSE(log_enabled(log_level::info));
        CHECK(log_enabled(log_level::warn));
        CHECK(log_enabled(log_level::error));
        CHECK_FALSE(log_enabled(log_level::off));

        set_log_threshold(log_level::off);
        CHECK_FALSE(log_enabled(log_level::error));
        set_log_threshold(previous);
    }

    TEST_CASE("001: defaults", "[001][config]") {
        startup_config cfg{};
        CHECK(cfg.session.server_command.empty());
        CHECK(cfg.session.settle_ms == 500);
        CHECK(cfg.session.grace_ms == 5000);
        CHECK(cfg.session.protocol_version == "2024-11-05");
        CHECK(cfg.server.server_name == "conduit-hello-server");
        CHECK(cfg.server.supported_protocol_versions.size() == 3U);
        CHECK(cfg.output == output_mode::text);
    }

    TEST_CASE("001: floats render with a fractional part or exponent", "[001][utils]") {
        CHECK(utils::format_float(42.0) == "42.0");
        CHECK(utils::format_float(50.0) == "50.0");
        CHECK(utils::format_float(0.5) == "0.5");
        CHECK(utils::format_float(-3.0) == "-3.0");
        CHECK(utils::format_float(0.0) == "0.0");
        CHECK(utils::format_float(1.25) == "1.25");
        CHECK(utils::format_float(1e16) == "1e+16");
        CHECK(utils::format_float(2.5e-5) == "2.5e-05");
        CHECK(utils::format_float(std::numeric_limits<double>::infinity()) == "inf");
    }

    TEST_CASE("001: string helpers", "[001][utils]") {
        CHECK(utils::trim_view("  call hello \r\n"sv) == "call hello"sv);
        CHECK(utils::trim_view(" \t "sv).empty());
        CHECK(utils::str_case_eq("Text"sv, "tEXT"sv));
        CHECK_FALSE(utils::str_case_eq("text"sv, "texts"sv));

        auto words = utils::split_whitespace("  call  add_numbers a=1\tb=2 "sv);
        REQUIRE(words.size() == 4U);
        CHECK(words[0] == "call");
        CHECK(words[3] == "b=2");
        CHECK(utils::join_with_separator(words, "|"sv) == "call|add_numbers|a=1|b=2");
        CHECK(utils::join_with_separator({}, ", "sv).empty());

        CHECK(utils::parse_arithmetic<int>("42"sv) == 42);
        CHECK(utils::parse_arithmetic<double>("2.5"sv) == 2.5);
        CHECK_FALSE(utils::parse_arithmetic<double>("2.5x"sv));
        CHECK_FALSE(utils::parse_arithmetic<int>(""sv));
    }

    TEST_CASE("001: session errors carry their kind", "[001][errors]") {
        session_error err{error_kind::remote_tool_error, "boom", -32602};
        CHECK(err.kind() == error_kind::remote_tool_error);
        CHECK(err.remote_code() == -32602);
        CHECK(std::string_view{err.what()} == "boom"sv);
        CHECK(err.to_string() == "remote tool error: boom");

        CHECK(is_fatal(error_kind::transport_failure));
        CHECK(is_fatal(error_kind::protocol_violation));
        CHECK_FALSE(is_fatal(error_kind::unknown_tool));
        CHECK_FALSE(is_fatal(error_kind::remote_tool_error));
        CHECK_FALSE(is_fatal(error_kind::out_of_order));
    }

    TEST_CASE("001: config file layers onto the session settings", "[001][config]") {
        detail::temp_dir temp{"conduit_config"};
        auto path = temp.path / "conduit.json";
        detail::write_file(
                path,
                R"({"schema_version":1,"server_command":["python3","-m","server"],"working_directory":"/tmp",)"
                R"("settle_ms":50,"grace_ms":250,"response_timeout_ms":0,"output":"json","log_level":"info"})");

        startup_config cfg{};
        load_config_file(path, cfg);

        REQUIRE(cfg.session.server_command.size() == 3U);
        CHECK(cfg.session.server_command[0] == "python3");
        REQUIRE(cfg.session.working_directory);
        CHECK(cfg.session.working_directory->string() == "/tmp");
        CHECK(cfg.session.settle_ms == 50);
        CHECK(cfg.session.grace_ms == 250);
        CHECK(cfg.session.response_timeout_ms == 0);
        CHECK(cfg.session.protocol_version == "2024-11-05");
        CHECK(cfg.output == output_mode::json);
        CHECK(cfg.log_threshold == log_level::info);
        REQUIRE(cfg.config_file);
        CHECK(*cfg.config_file == path);
    }

    TEST_CASE("001: invalid config files are rejected", "[001][config]") {
        detail::temp_dir temp{"conduit_config_bad"};
        startup_config cfg{};

        CHECK_THROWS_AS(load_config_file(temp.path / "missing.json", cfg), std::runtime_error);

        auto unknown = temp.path / "unknown.json";
        detail::write_file(unknown, R"({"schema_version":1,"colour":"red"})");
        CHECK_THROWS_AS(load_config_file(unknown, cfg), std::runtime_error);

        auto version = temp.path / "version.json";
        detail::write_file(version, R"({"schema_version":2})");
        CHECK_THROWS_AS(load_config_file(version, cfg), std::runtime_error);

        auto negative = temp.path / "negative.json";
        detail::write_file(negative, R"({"schema_version":1,"grace_ms":-1})");
        CHECK_THROWS_AS(load_config_file(negative, cfg), std::runtime_error);

        auto output = temp.path / "output.json";
        detail::write_file(output, R"({"schema_version":1,"output":"table"})");
        CHECK_THROWS_AS(load_config_file(output, cfg), std::runtime_error);
    }

}  // namespace conduit::test
