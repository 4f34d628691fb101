#include "cli.hpp"

#include <CLI/CLI.hpp>

#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace conduit::cli {

    namespace detail {

        using namespace std::string_view_literals;

        static void print_config(const startup_config& cfg, std::ostream& os) {
            const auto& s = cfg.session;
            os << "server_command="
               << (s.server_command.empty() ? std::string{"<self> serve"}
                                            : utils::join_with_separator(s.server_command, " "sv))
               << '\n';
            os << "working_directory=" << (s.working_directory ? s.working_directory->string() : "<inherited>")
               << '\n';
            os << "settle_ms=" << s.settle_ms << '\n';
            os << "grace_ms=" << s.grace_ms << '\n';
            os << "response_timeout_ms=" << s.response_timeout_ms << '\n';
            os << "protocol_version=" << s.protocol_version << '\n';
            os << "client=" << s.client_name << ' ' << s.client_version << '\n';
            os << "output=" << to_string(cfg.output) << '\n';
            os << "log_level=" << to_string(cfg.log_threshold) << '\n';
            os << "config_file=" << (cfg.config_file ? cfg.config_file->string() : "<none>") << '\n';
        }

    }  // namespace detail

    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg, command_request& cmd) {
        CLI::App app{"conduit: MCP-style tool server client and reference server"};
        app.fallthrough();

        bool show_version = false;
        bool print_config = false;
        std::string config_arg{};
        std::string server_arg{};
        std::string cwd_arg{};
        std::string output_arg{};
        std::string log_level_arg{};
        int settle_ms = cfg.session.settle_ms;
        int grace_ms = cfg.session.grace_ms;
        int timeout_ms = cfg.session.response_timeout_ms;

        app.add_flag("--version", show_version, "Print version and exit");
        app.add_flag("--print-config", print_config, "Print resolved config and exit");
        app.add_option("--config", config_arg, "JSON config file layered under command-line options");
        app.add_option("--server", server_arg, "Tool server command line (default: '<self> serve')");
        app.add_option("--cwd", cwd_arg, "Working directory for the tool server");
        app.add_option("--output", output_arg, "Output mode: text|json");
        app.add_option("--log-level", log_level_arg, "Log level: debug|info|warn|error|off");
        app.add_option("--settle-ms", settle_ms, "Delay after spawn before the liveness check")
                ->check(CLI::NonNegativeNumber);
        app.add_option("--grace-ms", grace_ms, "Wait after SIGTERM before SIGKILL")->check(CLI::NonNegativeNumber);
        app.add_option("--timeout-ms", timeout_ms, "Max wait for one response; 0 waits forever")
                ->check(CLI::NonNegativeNumber);

        auto* serve_cmd = app.add_subcommand("serve", "Run the built-in tool server over stdin/stdout");
        auto* list_cmd = app.add_subcommand("list", "List the tools a server offers");
        auto* info_cmd = app.add_subcommand("info", "Show one tool's parameters");
        info_cmd->add_option("tool", cmd.tool, "Tool name")->required();
        auto* call_cmd = app.add_subcommand("call", "Call a tool with key=value arguments");
        call_cmd->add_option("tool", cmd.tool, "Tool name")->required();
        call_cmd->add_option("arguments", cmd.arguments, "Arguments as key=value");
        auto* shell_cmd = app.add_subcommand("shell", "Interactive shell (default)");
        app.require_subcommand(0, 1);

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return std::optional<int>{app.exit(e)};
        }

        if (show_version) {
            std::cout << "conduit 0.1.0\n";
            return std::optional<int>{0};
        }

        if (!config_arg.empty()) {
            load_config_file(config_arg, cfg);
        }

        if (!server_arg.empty()) {
            cfg.session.server_command = utils::split_whitespace(server_arg);
            if (cfg.session.server_command.empty()) {
                std::cerr << "invalid --server value: command is empty\n";
                return std::optional<int>{2};
            }
        }
        if (!cwd_arg.empty()) {
            cfg.session.working_directory = std::filesystem::path{cwd_arg};
        }
        if (!output_arg.empty() && !try_parse_output_mode(output_arg, cfg.output)) {
            std::cerr << "invalid --output value: " << output_arg << " (expected text|json)\n";
            return std::optional<int>{2};
        }
        if (!log_level_arg.empty() && !try_parse_log_level(log_level_arg, cfg.log_threshold)) {
            std::cerr << "invalid --log-level value: " << log_level_arg << " (expected debug|info|warn|error|off)\n";
            return std::optional<int>{2};
        }
        if (app.get_option("--settle-ms")->count() > 0U) {
            cfg.session.settle_ms = settle_ms;
        }
        if (app.get_option("--grace-ms")->count() > 0U) {
            cfg.session.grace_ms = grace_ms;
        }
        if (app.get_option("--timeout-ms")->count() > 0U) {
            cfg.session.response_timeout_ms = timeout_ms;
        }

        set_log_threshold(cfg.log_threshold);

        if (print_config) {
            detail::print_config(cfg, std::cout);
            return std::optional<int>{0};
        }

        if (serve_cmd->parsed()) {
            cmd.kind = command_kind::serve;
        }
        else if (list_cmd->parsed()) {
            cmd.kind = command_kind::list;
        }
        else if (info_cmd->parsed()) {
            cmd.kind = command_kind::info;
        }
        else if (call_cmd->parsed()) {
            cmd.kind = command_kind::call;
        }
        else if (shell_cmd->parsed()) {
            cmd.kind = command_kind::shell;
        }
        else {
            cmd.kind = command_kind::shell;
        }

        return std::nullopt;
    }

    int execute(const command_request& cmd, const startup_config& cfg) {
        switch (cmd.kind) {
            case command_kind::serve: {
                server::tool_registry registry{};
                server::register_builtin_tools(registry);
                return server::run(registry, cfg.server, std::cin, std::cout);
            }
            case command_kind::list:
                return run_list(cfg, std::cout, std::cerr);
            case command_kind::info:
                return run_info(cfg, cmd.tool, std::cout, std::cerr);
            case command_kind::call:
                return run_call(cfg, cmd.tool, cmd.arguments, std::cout, std::cerr);
            case command_kind::shell:
                return run_shell(cfg);
        }
        return 2;
    }

}  // namespace conduit::cli
