#include "conduit/invocation.hpp"

#include "conduit/format.hpp"

#include <cmath>

using namespace conduit::literals;

namespace conduit {

    namespace detail {

        static std::optional<double> coerce_number(const glz::generic& value) {
            if (value.is_number()) {
                return value.get<double>();
            }
            if (value.is_string()) {
                auto text = utils::trim_view(value.get<std::string>());
                if (text.starts_with('+')) {
                    text.remove_prefix(1);
                }
                if (!text.empty()) {
                    return utils::parse_arithmetic<double>(text);
                }
            }
            return std::nullopt;
        }

        static std::optional<bool> coerce_boolean(const glz::generic& value) {
            if (value.is_boolean()) {
                return value.get<bool>();
            }
            if (value.is_string()) {
                auto text = utils::trim_view(value.get<std::string>());
                if (utils::str_case_eq(text, "true"sv) || text == "1"sv) {
                    return true;
                }
                if (utils::str_case_eq(text, "false"sv) || text == "0"sv) {
                    return false;
                }
            }
            return std::nullopt;
        }

        static std::string describe_value(const glz::generic& value) {
            auto json = glz::write_json(value);
            return json ? *json : std::string{"<unprintable>"};
        }

    }  // namespace detail

    std::optional<std::string> tool_result::primary_text() const {
        if (content.empty()) {
            return std::nullopt;
        }
        return content.front().text;
    }

    std::string tool_result::joined_text(std::string_view separator) const {
        std::vector<std::string> texts{};
        texts.reserve(content.size());
        for (const auto& block : content) {
            texts.push_back(block.text);
        }
        return utils::join_with_separator(texts, separator);
    }

    invocation_engine::invocation_engine(correlator& rpc, const tool_catalog& catalog)
            : rpc_{rpc}, catalog_{catalog} {}

    glz::generic::object_t invocation_engine::prepare_arguments(
            const tool& target, const glz::generic::object_t& arguments) {
        for (const auto& required : target.required_arguments()) {
            if (!arguments.contains(required)) {
                throw session_error{
                        error_kind::missing_argument,
                        "tool '{}' requires argument '{}'"_format(target.name, required)};
            }
        }

        glz::generic::object_t prepared = arguments;
        for (auto& [param, value] : prepared) {
            auto type = target.declared_type(param);
            if (!type) {
                continue;
            }

            if (*type == "number"sv || *type == "integer"sv) {
                auto number = detail::coerce_number(value);
                if (!number) {
                    throw session_error{
                            error_kind::invalid_argument,
                            "argument '{}' of tool '{}' must be a {}, got {}"_format(
                                    param, target.name, *type, detail::describe_value(value))};
                }
                if (*type == "integer"sv && std::trunc(*number) != *number) {
                    throw session_error{
                            error_kind::invalid_argument,
                            "argument '{}' of tool '{}' must be an integer, got {}"_format(
                                    param, target.name, detail::describe_value(value))};
                }
                value = *number;
            }
            else if (*type == "boolean"sv) {
                auto flag = detail::coerce_boolean(value);
                if (!flag) {
                    throw session_error{
                            error_kind::invalid_argument,
                            "argument '{}' of tool '{}' must be a boolean, got {}"_format(
                                    param, target.name, detail::describe_value(value))};
                }
                value = *flag;
            }
        }
        return prepared;
    }

    tool_result invocation_engine::invoke(std::string_view name, const glz::generic::object_t& arguments) {
        auto target = catalog_.lookup(name);
        if (!target) {
            throw session_error{error_kind::unknown_tool, "no tool named '{}' in the catalog"_format(name)};
        }

        tool_call_params params{.name = target->name, .arguments = prepare_arguments(*target, arguments)};
        auto resp = rpc_.send(methods::tools_call, to_raw_json(params));
        if (resp.error) {
            throw session_error{error_kind::remote_tool_error, resp.error->message, resp.error->code};
        }

        auto payload = read_payload<tool_call_result>(*resp.result, "tools/call");
        if (payload.content.empty()) {
            debug_log("tool ", target->name, " returned no content");
        }
        return tool_result{.content = std::move(payload.content), .is_error = payload.isError};
    }

}  // namespace conduit
