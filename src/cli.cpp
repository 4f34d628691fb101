#include "conduit/cli.hpp"

#include "conduit/format.hpp"
#include "editor.hpp"
#include "internal/platform.hpp"

#include <glaze/glaze.hpp>

#if CONDUIT_PLATFORM_MACOS
#include <mach-o/dyld.h>
#endif

#include <climits>
#include <cstdint>
#include <iostream>
#include <stdexcept>

using namespace conduit::literals;

namespace conduit::cli {

    namespace fs = std::filesystem;

    namespace detail {

        using namespace std::string_view_literals;

        struct tool_listing {
            std::string name{};
            std::string description{};
            glz::generic inputSchema = glz::generic::object_t{};
            struct glaze {
                using T = tool_listing;
                static constexpr auto value =
                        glz::object(&T::name, &T::description, "inputSchema", &T::inputSchema);
            };
        };

        struct parameter_view {
            std::string name{};
            std::string type{};
            std::string description{};
            bool required{false};
            struct glaze {
                using T = parameter_view;
                static constexpr auto value = glz::object(&T::name, &T::type, &T::description, &T::required);
            };
        };

        struct tool_details {
            std::string name{};
            std::string description{};
            std::vector<parameter_view> parameters{};
            struct glaze {
                using T = tool_details;
                static constexpr auto value = glz::object(&T::name, &T::description, &T::parameters);
            };
        };

        template <typename T>
        static void write_json_line(const T& value, std::ostream& os) {
            std::string json{};
            if (auto ec = glz::write<glz::opts{.prettify = true}>(value, json)) {
                throw std::runtime_error("failed to render json output");
            }
            os << json << '\n';
        }

        static void print_help(std::ostream& os) {
            static constexpr auto help_text = R"(commands:
  list                        list available tools
  info <tool>                 show a tool's parameters
  call <tool> [key=value ...] call a tool; prompts for parameters when none are given
  help
  quit
examples:
  info add_numbers
  call hello name=Ada
  call add_numbers a=42 b=8
)";
            os << help_text;
        }

        static int report_failure(session& client, const session_error& e, std::ostream& err) {
            err << "error: " << e.to_string() << '\n';
            if (e.kind() == error_kind::spawn_failure || e.kind() == error_kind::transport_failure) {
                auto diag = client.diagnostics();
                auto trimmed = utils::trim_view(diag);
                if (!trimmed.empty()) {
                    err << "server stderr:\n" << trimmed << '\n';
                }
            }
            return 1;
        }

        // Runs `body` against a ready session with a discovered catalog
        template <typename F>
        static int with_session(const startup_config& cfg, std::ostream& err, F&& body) {
            session client{effective_session_config(cfg)};
            try {
                client.start();
                client.initialize();
                client.discover_tools();
                auto rc = body(client);
                client.cleanup();
                return rc;
            } catch (const session_error& e) {
                auto rc = report_failure(client, e, err);
                client.cleanup();
                return rc;
            }
        }

        static std::optional<glz::generic::object_t> prompt_arguments(
                line_editor& editor, const tool& target, std::ostream& out) {
            glz::generic::object_t arguments{};
            for (const auto& param : target.parameters()) {
                std::string prompt = "  {}"_format(param.name);
                if (!param.description.empty()) {
                    prompt += " ({})"_format(param.description);
                }
                if (!param.required) {
                    prompt += " [optional]";
                }
                prompt += ": ";

                auto line = editor.read_line(prompt);
                if (!line) {
                    out << '\n';
                    return std::nullopt;
                }
                auto value = utils::trim_view(*line);
                if (value.empty()) {
                    if (param.required) {
                        out << "required parameter '" << param.name << "' not provided\n";
                        return std::nullopt;
                    }
                    continue;
                }
                arguments[param.name] = std::string{value};
            }
            return arguments;
        }

        // Returns false once the session is no longer usable
        static bool shell_call(
                session& client,
                line_editor& editor,
                const std::vector<std::string>& words,
                output_mode mode,
                std::ostream& out,
                std::ostream& err) {
            if (words.size() < 2U) {
                err << "usage: call <tool> [key=value ...]\n";
                return true;
            }
            const auto& name = words[1];
            auto target = client.lookup_tool(name);
            if (!target) {
                err << "tool '" << name << "' not found\n";
                return true;
            }

            glz::generic::object_t arguments{};
            if (words.size() > 2U) {
                try {
                    arguments = parse_assignments(std::vector<std::string>{words.begin() + 2, words.end()});
                } catch (const std::invalid_argument& e) {
                    err << e.what() << '\n';
                    return true;
                }
            }
            else {
                auto prompted = prompt_arguments(editor, *target, out);
                if (!prompted) {
                    return true;
                }
                arguments = std::move(*prompted);
            }

            try {
                render_result(client.invoke_tool(name, arguments), mode, out);
            } catch (const session_error& e) {
                report_failure(client, e, err);
                if (is_fatal(e.kind())) {
                    err << "session closed\n";
                    return false;
                }
            }
            return true;
        }

    }  // namespace detail

    glz::generic::object_t parse_assignments(const std::vector<std::string>& pairs) {
        glz::generic::object_t arguments{};
        for (const auto& pair : pairs) {
            auto eq = pair.find('=');
            if (eq == std::string::npos) {
                throw std::invalid_argument("invalid argument '{}', expected key=value"_format(pair));
            }
            auto key = utils::trim_view(std::string_view{pair}.substr(0, eq));
            if (key.empty()) {
                throw std::invalid_argument("invalid argument '{}', key must be non-empty"_format(pair));
            }
            arguments[std::string{key}] = pair.substr(eq + 1U);
        }
        return arguments;
    }

    fs::path resolve_self_exe() {
        if constexpr (internal::platform::is_linux) {
            std::error_code ec{};
            auto path = fs::read_symlink("/proc/self/exe", ec);
            if (!ec) {
                return path;
            }
        }
#if CONDUIT_PLATFORM_MACOS
        if constexpr (internal::platform::is_macos) {
            char buf[PATH_MAX]{};
            uint32_t size = sizeof(buf);
            if (_NSGetExecutablePath(buf, &size) == 0) {
                return fs::canonical(buf);
            }
        }
#endif
        return fs::path{internal::platform::executable_name};
    }

    session_config effective_session_config(const startup_config& cfg) {
        auto session_cfg = cfg.session;
        if (session_cfg.server_command.empty()) {
            session_cfg.server_command = {
                    resolve_self_exe().string(), std::string{internal::platform::serve_subcommand}};
        }
        return session_cfg;
    }

    void render_tools(const std::vector<tool>& tools, output_mode mode, std::ostream& os) {
        if (mode == output_mode::json) {
            std::vector<detail::tool_listing> listing{};
            for (const auto& t : tools) {
                listing.push_back(
                        detail::tool_listing{.name = t.name, .description = t.description, .inputSchema = t.input_schema});
            }
            detail::write_json_line(listing, os);
            return;
        }

        os << tools.size() << (tools.size() == 1U ? " tool" : " tools") << " available:\n";
        for (const auto& t : tools) {
            os << "  - " << t.name << ": " << t.description << '\n';
        }
    }

    void render_tool_info(const tool& target, output_mode mode, std::ostream& os) {
        auto params = target.parameters();
        if (mode == output_mode::json) {
            detail::tool_details details{.name = target.name, .description = target.description};
            for (auto& p : params) {
                details.parameters.push_back(
                        detail::parameter_view{
                                .name = std::move(p.name),
                                .type = std::move(p.type),
                                .description = std::move(p.description),
                                .required = p.required});
            }
            detail::write_json_line(details, os);
            return;
        }

        os << target.name << ": " << target.description << '\n';
        if (params.empty()) {
            os << "parameters: none\n";
            return;
        }
        os << "parameters:\n";
        for (const auto& p : params) {
            os << "  " << p.name << " (" << (p.type.empty() ? "any"sv : std::string_view{p.type})
               << (p.required ? ", required" : ", optional") << ")";
            if (!p.description.empty()) {
                os << ": " << p.description;
            }
            os << '\n';
        }
    }

    void render_result(const tool_result& result, output_mode mode, std::ostream& os) {
        if (mode == output_mode::json) {
            detail::write_json_line(tool_call_result{.content = result.content, .isError = result.is_error}, os);
            return;
        }

        auto text = result.primary_text();
        if (!text) {
            os << "(tool returned no content)\n";
            return;
        }
        os << *text << '\n';
    }

    int run_list(const startup_config& cfg, std::ostream& out, std::ostream& err) {
        return detail::with_session(cfg, err, [&](session& client) {
            render_tools(client.tools(), cfg.output, out);
            return 0;
        });
    }

    int run_info(const startup_config& cfg, std::string_view tool_name, std::ostream& out, std::ostream& err) {
        return detail::with_session(cfg, err, [&](session& client) {
            auto target = client.lookup_tool(tool_name);
            if (!target) {
                err << "tool '" << tool_name << "' not found\n";
                return 1;
            }
            render_tool_info(*target, cfg.output, out);
            return 0;
        });
    }

    int run_call(
            const startup_config& cfg,
            std::string_view tool_name,
            const std::vector<std::string>& pairs,
            std::ostream& out,
            std::ostream& err) {
        glz::generic::object_t arguments{};
        try {
            arguments = parse_assignments(pairs);
        } catch (const std::invalid_argument& e) {
            err << e.what() << '\n';
            return 2;
        }

        return detail::with_session(cfg, err, [&](session& client) {
            auto result = client.invoke_tool(tool_name, arguments);
            render_result(result, cfg.output, out);
            return result.is_error ? 1 : 0;
        });
    }

    int run_shell(const startup_config& cfg) {
        session client{effective_session_config(cfg)};
        try {
            client.start();
            const auto& hs = client.initialize();
            client.discover_tools();
            std::cout << "connected to " << hs.server.name << ' ' << hs.server.version << " (protocol "
                      << hs.protocol_version << ")\n";
        } catch (const session_error& e) {
            auto rc = detail::report_failure(client, e, std::cerr);
            client.cleanup();
            return rc;
        }

        line_editor editor{};
        std::vector<std::string> names{};
        for (const auto& t : client.tools()) {
            names.push_back(t.name);
        }
        editor.set_tool_names(std::move(names));

        std::cout << client.tools().size() << " tools available; type help for commands\n";

        int rc = 0;
        while (true) {
            auto next_line = editor.read_line("conduit> "sv);
            if (!next_line) {
                std::cout << '\n';
                break;
            }
            auto trimmed = utils::trim_view(*next_line);
            if (trimmed.empty()) {
                continue;
            }
            editor.record_history(trimmed);

            auto words = utils::split_whitespace(trimmed);
            const auto& cmd = words.front();
            if (cmd == "quit"sv || cmd == "exit"sv || cmd == "q"sv) {
                break;
            }
            if (cmd == "help"sv) {
                detail::print_help(std::cout);
                continue;
            }
            if (cmd == "list"sv) {
                render_tools(client.tools(), cfg.output, std::cout);
                continue;
            }
            if (cmd == "info"sv) {
                if (words.size() != 2U) {
                    std::cerr << "usage: info <tool>\n";
                    continue;
                }
                if (auto target = client.lookup_tool(words[1])) {
                    render_tool_info(*target, cfg.output, std::cout);
                }
                else {
                    std::cerr << "tool '" << words[1] << "' not found\n";
                }
                continue;
            }
            if (cmd == "call"sv) {
                if (!detail::shell_call(client, editor, words, cfg.output, std::cout, std::cerr)) {
                    rc = 1;
                    break;
                }
                continue;
            }
            std::cerr << "unknown command: " << cmd << " (type help for commands)\n";
        }

        client.cleanup();
        return rc;
    }

}  // namespace conduit::cli
