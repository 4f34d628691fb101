#include "conduit/server.hpp"

#include "conduit/format.hpp"

#include <ctime>
#include <string>
#include <string_view>

using namespace conduit::literals;
using namespace std::string_view_literals;

namespace conduit::server {

    namespace detail {

        static constexpr auto hello_schema =
                R"json({"type": "object","properties": {"name": {"type": "string","description": "The name of the person to greet"}},"required": ["name"]})json";
        static constexpr auto echo_schema =
                R"json({"type": "object","properties": {"message": {"type": "string","description": "The message to echo back"}},"required": ["message"]})json";
        static constexpr auto get_time_schema = R"json({"type": "object","properties": {}})json";
        static constexpr auto add_numbers_schema =
                R"json({"type": "object","properties": {"a": {"type": "number","description": "First number"},"b": {"type": "number","description": "Second number"}},"required": ["a", "b"]})json";

        static tool_call_result text(std::string value, bool is_error = false) {
            tool_call_result result{};
            result.content.push_back(content_block{.text = std::move(value)});
            result.isError = is_error;
            return result;
        }

        // Strings are taken verbatim, anything else as its JSON text
        static std::string argument_text(
                const glz::generic::object_t& args, std::string_view key, std::string_view fallback) {
            auto it = args.find(key);
            if (it == args.end() || it->second.is_null()) {
                return std::string{fallback};
            }
            if (it->second.is_string()) {
                return it->second.get<std::string>();
            }
            auto json = glz::write_json(it->second);
            return json ? *json : std::string{fallback};
        }

        // Missing operands count as 0; returns an error description on failure
        static std::optional<std::string> to_number(
                const glz::generic::object_t& args, std::string_view key, double& out) {
            auto it = args.find(key);
            if (it == args.end()) {
                out = 0.0;
                return std::nullopt;
            }

            const auto& value = it->second;
            if (value.is_number()) {
                out = value.get<double>();
                return std::nullopt;
            }
            if (value.is_boolean()) {
                out = value.get<bool>() ? 1.0 : 0.0;
                return std::nullopt;
            }
            if (value.is_string()) {
                const auto& raw = value.get<std::string>();
                auto trimmed = utils::trim_view(raw);
                if (trimmed.starts_with('+')) {
                    trimmed.remove_prefix(1);
                }
                if (auto parsed = utils::parse_arithmetic<double>(trimmed)) {
                    out = *parsed;
                    return std::nullopt;
                }
                return "could not convert '{}' to a number"_format(raw);
            }

            auto json = glz::write_json(value);
            return "argument '{}' must be a number, got {}"_format(key, json ? *json : std::string{"?"});
        }

        static tool_call_result hello(const glz::generic::object_t& args) {
            auto name = argument_text(args, "name", "World");
            return text("Hello, {}! Welcome to the MCP Hello Server!"_format(name));
        }

        static tool_call_result echo(const glz::generic::object_t& args) {
            return text("Echo: {}"_format(argument_text(args, "message", "")));
        }

        static tool_call_result get_time(const glz::generic::object_t&) {
            auto now = std::time(nullptr);
            std::tm local{};
            ::localtime_r(&now, &local);
            char buffer[32]{};
            std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &local);
            return text("Current time: {}"_format(buffer));
        }

        static tool_call_result add_numbers(const glz::generic::object_t& args) {
            double a = 0.0;
            double b = 0.0;
            auto error = to_number(args, "a", a);
            if (!error) {
                error = to_number(args, "b", b);
            }
            if (error) {
                return text("Error: Invalid numbers provided - {}"_format(*error), true);
            }

            auto sum = a + b;
            return text("{} + {} = {}"_format(utils::format_float(a), utils::format_float(b), utils::format_float(sum)));
        }

    }  // namespace detail

    void register_builtin_tools(tool_registry& registry) {
        registry.add(
                tool_entry{
                        .name = "hello",
                        .description = "Say hello to someone",
                        .input_schema = detail::hello_schema,
                        .handler = detail::hello});
        registry.add(
                tool_entry{
                        .name = "echo",
                        .description = "Echo back the provided message",
                        .input_schema = detail::echo_schema,
                        .handler = detail::echo});
        registry.add(
                tool_entry{
                        .name = "get_time",
                        .description = "Get the current time",
                        .input_schema = detail::get_time_schema,
                        .handler = detail::get_time});
        registry.add(
                tool_entry{
                        .name = "add_numbers",
                        .description = "Add two numbers together",
                        .input_schema = detail::add_numbers_schema,
                        .handler = detail::add_numbers});
    }

}  // namespace conduit::server
