#include "conduit/server.hpp"

#include "conduit/format.hpp"

#include <glaze/ext/jsonrpc.hpp>
#include <glaze/glaze.hpp>

#include <algorithm>
#include <istream>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>

using namespace conduit::literals;
using namespace std::string_view_literals;

namespace conduit::server {

    namespace detail {

        struct tool_definition {
            std::string name{};
            std::string description{};
            glz::raw_json inputSchema{};
            struct glaze {
                using T = tool_definition;
                static constexpr auto value = glz::object(&T::name, &T::description, "inputSchema", &T::inputSchema);
            };
        };

        struct tools_list_result {
            std::vector<tool_definition> tools{};
            struct glaze {
                using T = tools_list_result;
                static constexpr auto value = glz::object(&T::tools);
            };
        };

        struct call_request {
            std::optional<std::string> name{};
            std::optional<glz::generic> arguments{};
            struct glaze {
                using T = call_request;
                static constexpr auto value = glz::object(&T::name, &T::arguments);
            };
        };

        // ── Response helpers ────────────────────────────────────────────

        template <typename T>
        static std::string make_response(const glz::rpc::id_t& id, T&& result) {
            glz::rpc::response_t<std::decay_t<T>> resp{};
            resp.id = id;
            resp.result = std::forward<T>(result);
            std::string json{};
            (void)glz::write_json(resp, json);
            return json;
        }

        static std::string make_error_response(
                const glz::rpc::id_t& id, glz::rpc::error_e code, const std::string& message) {
            glz::rpc::response_t<glz::raw_json> resp{};
            resp.id = id;
            resp.error = glz::rpc::error{code, std::nullopt, message};
            std::string json{};
            (void)glz::write_json(resp, json);
            return json;
        }

        static std::vector<std::string> required_from_schema(const std::string& schema_text, std::string_view tool) {
            glz::generic schema{};
            if (auto ec = glz::read_json(schema, schema_text)) {
                throw std::invalid_argument(
                        "tool '{}' has an invalid input schema: {}"_format(tool, glz::format_error(ec, schema_text)));
            }
            if (!schema.is_object()) {
                throw std::invalid_argument("tool '{}' input schema is not an object"_format(tool));
            }

            std::vector<std::string> required{};
            const auto& obj = schema.get<glz::generic::object_t>();
            if (auto it = obj.find("required"); it != obj.end() && it->second.is_array()) {
                for (const auto& item : it->second.get<glz::generic::array_t>()) {
                    if (item.is_string()) {
                        required.push_back(item.get<std::string>());
                    }
                }
            }
            return required;
        }

        static tool_call_result text_result(std::string text, bool is_error = false) {
            tool_call_result result{};
            result.content.push_back(content_block{.text = std::move(text)});
            result.isError = is_error;
            return result;
        }

        // ── Handlers ────────────────────────────────────────────────────

        static std::string handle_initialize(
                const glz::rpc::id_t& id, std::string_view raw_params, const server_config& cfg) {
            initialize_params params{};
            std::string params_json{raw_params.empty() ? "{}"sv : raw_params};
            auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(params, params_json);
            if (ec) {
                return make_error_response(id, glz::rpc::error_e::invalid_params, "Failed to parse initialize params");
            }

            const auto& supported = cfg.supported_protocol_versions;
            if (std::ranges::find(supported, params.protocolVersion) == supported.end()) {
                return make_error_response(
                        id,
                        glz::rpc::error_e::invalid_params,
                        "Unsupported protocol version: '{}' (supported: {})"_format(
                                params.protocolVersion, utils::join_with_separator(supported, ", "sv)));
            }

            log_message(
                    log_level::info,
                    "initialize from ",
                    params.clientInfo.name.empty() ? "<anonymous>"sv : std::string_view{params.clientInfo.name},
                    " (protocol ",
                    params.protocolVersion,
                    ")");

            initialize_result result{};
            result.protocolVersion = params.protocolVersion;
            result.capabilities = server_capabilities{};
            result.serverInfo = server_info{.name = cfg.server_name, .version = cfg.server_version};

            return make_response(id, std::move(result));
        }

        static std::string handle_tools_list(const glz::rpc::id_t& id, const tool_registry& registry) {
            tools_list_result result{};
            for (const auto& entry : registry.entries()) {
                result.tools.push_back(
                        tool_definition{
                                .name = entry.name,
                                .description = entry.description,
                                .inputSchema = glz::raw_json{entry.input_schema},
                        });
            }
            return make_response(id, std::move(result));
        }

        static std::string handle_tools_call(
                const glz::rpc::id_t& id, std::string_view raw_params, const tool_registry& registry) {
            call_request params{};
            std::string params_json{raw_params};
            auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(params, params_json);
            if (ec) {
                return make_error_response(id, glz::rpc::error_e::invalid_params, "Failed to parse tool call params");
            }
            if (!params.name || params.name->empty()) {
                return make_error_response(id, glz::rpc::error_e::invalid_params, "tools/call requires a tool name");
            }

            glz::generic::object_t arguments{};
            if (params.arguments && !params.arguments->is_null()) {
                if (!params.arguments->is_object()) {
                    return make_error_response(
                            id, glz::rpc::error_e::invalid_params, "tools/call arguments must be an object");
                }
                arguments = params.arguments->get<glz::generic::object_t>();
            }

            const auto* entry = registry.find(*params.name);
            if (!entry) {
                log_message(log_level::info, "call to unknown tool: ", *params.name);
                return make_response(id, text_result("Unknown tool: {}"_format(*params.name), true));
            }

            for (const auto& required : registry.required_arguments(*entry)) {
                if (!arguments.contains(required)) {
                    return make_error_response(
                            id,
                            glz::rpc::error_e::invalid_params,
                            "Missing required argument '{}' for tool '{}'"_format(required, entry->name));
                }
            }

            auto args_json = glz::write_json(arguments);
            log_message(
                    log_level::info,
                    "Tool called: ",
                    entry->name,
                    " with arguments: ",
                    args_json ? std::string_view{*args_json} : "{}"sv);

            try {
                return make_response(id, entry->handler(arguments));
            } catch (const std::exception& e) {
                log_message(log_level::error, "tool ", entry->name, " failed: ", e.what());
                return make_response(id, text_result("Error: {}"_format(e.what()), true));
            }
        }

    }  // namespace detail

    // ── Registry ────────────────────────────────────────────────────

    void tool_registry::add(tool_entry entry) {
        if (entry.name.empty() || !entry.handler) {
            throw std::invalid_argument("tool entries need a name and a handler");
        }
        if (index_.contains(entry.name)) {
            throw std::invalid_argument("tool already registered: {}"_format(entry.name));
        }
        auto required = detail::required_from_schema(entry.input_schema, entry.name);
        index_.emplace(entry.name, entries_.size());
        required_.push_back(std::move(required));
        entries_.push_back(std::move(entry));
    }

    const tool_entry* tool_registry::find(std::string_view name) const {
        auto it = index_.find(std::string{name});
        if (it == index_.end()) {
            return nullptr;
        }
        return &entries_[it->second];
    }

    const std::vector<std::string>& tool_registry::required_arguments(const tool_entry& entry) const {
        auto index = static_cast<std::size_t>(&entry - entries_.data());
        return required_.at(index);
    }

    // ── Dispatcher ──────────────────────────────────────────────────

    dispatcher::dispatcher(const tool_registry& registry, server_config cfg)
            : registry_{registry}, cfg_{std::move(cfg)} {}

    std::optional<std::string> dispatcher::handle(std::string_view line) {
        std::string buffer{line};
        glz::rpc::generic_request_t request{};
        auto ec = glz::read_json(request, buffer);
        if (ec) {
            log_message(log_level::warn, "unparsable request: ", glz::format_error(ec, buffer));
            return detail::make_error_response({}, glz::rpc::error_e::parse_error, "JSON parse error");
        }

        if (request.method == methods::initialized) {
            initialized_ = true;
            debug_log("client completed the handshake");
            return std::nullopt;
        }
        // notifications never get a reply, whatever the method
        if (std::holds_alternative<glz::generic::null_t>(request.id)) {
            debug_log("ignoring notification ", request.method);
            return std::nullopt;
        }

        if (request.method == methods::initialize) {
            return detail::handle_initialize(request.id, request.params.str, cfg_);
        }
        if (request.method == methods::tools_list) {
            return detail::handle_tools_list(request.id, registry_);
        }
        if (request.method == methods::tools_call) {
            return detail::handle_tools_call(request.id, request.params.str, registry_);
        }
        return detail::make_error_response(
                request.id,
                glz::rpc::error_e::method_not_found,
                "Unknown method: {}"_format(std::string{request.method}));
    }

    // ── Server loop ─────────────────────────────────────────────────

    int run(const tool_registry& registry, const server_config& cfg, std::istream& in, std::ostream& out) {
        dispatcher handler{registry, cfg};
        log_message(
                log_level::info,
                "starting ",
                cfg.server_name,
                " ",
                cfg.server_version,
                " with ",
                registry.entries().size(),
                " tools");

        std::string line{};
        while (std::getline(in, line)) {
            if (utils::trim_view(line).empty()) {
                continue;
            }
            if (auto reply = handler.handle(line)) {
                out << *reply << '\n';
                out.flush();
                if (!out) {
                    log_message(log_level::error, "output stream closed; stopping");
                    return 1;
                }
            }
        }

        log_message(log_level::info, "input closed; shutting down");
        return 0;
    }

}  // namespace conduit::server
