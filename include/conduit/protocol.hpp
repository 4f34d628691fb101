#pragma once

#include "format.hpp"

#include <glaze/glaze.hpp>

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace conduit {

    using namespace std::string_view_literals;

    inline constexpr auto jsonrpc_version = "2.0"sv;

    namespace methods {
        inline constexpr auto initialize = "initialize"sv;
        inline constexpr auto initialized = "notifications/initialized"sv;
        inline constexpr auto tools_list = "tools/list"sv;
        inline constexpr auto tools_call = "tools/call"sv;
    }  // namespace methods

    enum class error_kind : uint8_t {
        spawn_failure,
        transport_failure,
        malformed_response,
        protocol_violation,
        out_of_order,
        unknown_tool,
        missing_argument,
        invalid_argument,
        remote_tool_error,
    };

    inline constexpr std::string_view to_string(error_kind kind) {
        switch (kind) {
            case error_kind::spawn_failure:
                return "spawn failure"sv;
            case error_kind::transport_failure:
                return "transport failure"sv;
            case error_kind::malformed_response:
                return "malformed response"sv;
            case error_kind::protocol_violation:
                return "protocol violation"sv;
            case error_kind::out_of_order:
                return "out of order"sv;
            case error_kind::unknown_tool:
                return "unknown tool"sv;
            case error_kind::missing_argument:
                return "missing argument"sv;
            case error_kind::invalid_argument:
                return "invalid argument"sv;
            case error_kind::remote_tool_error:
                return "remote tool error"sv;
        }
        return "transport failure"sv;
    }

    // Failures that leave the session unusable; the rest are recoverable by the caller
    inline constexpr bool is_fatal(error_kind kind) {
        return kind == error_kind::spawn_failure || kind == error_kind::transport_failure ||
               kind == error_kind::malformed_response || kind == error_kind::protocol_violation;
    }

    class session_error : public std::runtime_error {
      public:
        static constexpr bool to_string_formattable = true;

        session_error(error_kind kind, const std::string& message, std::optional<int64_t> remote_code = std::nullopt)
                : std::runtime_error{message}, kind_{kind}, remote_code_{remote_code} {}

        error_kind kind() const { return kind_; }
        std::optional<int64_t> remote_code() const { return remote_code_; }

        std::string to_string() const { return std::format("{}: {}", conduit::to_string(kind_), what()); }

      private:
        error_kind kind_;
        std::optional<int64_t> remote_code_;
    };

    // ── Wire types ──────────────────────────────────────────────────

    struct client_info {
        std::string name{};
        std::string version{};
        struct glaze {
            using T = client_info;
            static constexpr auto value = glz::object(&T::name, &T::version);
        };
    };

    struct initialize_params {
        std::string protocolVersion{};
        glz::generic capabilities = glz::generic::object_t{};
        client_info clientInfo{};
        struct glaze {
            using T = initialize_params;
            static constexpr auto value = glz::object(
                    "protocolVersion", &T::protocolVersion, "capabilities", &T::capabilities, "clientInfo", &T::clientInfo);
        };
    };

    struct server_info {
        std::string name{};
        std::string version{};
        struct glaze {
            using T = server_info;
            static constexpr auto value = glz::object(&T::name, &T::version);
        };
    };

    struct tools_capability {
        bool listChanged{false};
        struct glaze {
            using T = tools_capability;
            static constexpr auto value = glz::object("listChanged", &T::listChanged);
        };
    };

    struct server_capabilities {
        tools_capability tools{};
        struct glaze {
            using T = server_capabilities;
            static constexpr auto value = glz::object(&T::tools);
        };
    };

    struct initialize_result {
        std::string protocolVersion{};
        server_capabilities capabilities{};
        server_info serverInfo{};
        struct glaze {
            using T = initialize_result;
            static constexpr auto value = glz::object(
                    "protocolVersion",
                    &T::protocolVersion,
                    "capabilities",
                    &T::capabilities,
                    "serverInfo",
                    &T::serverInfo);
        };
    };

    struct content_block {
        std::string type{"text"};
        std::string text{};
        struct glaze {
            using T = content_block;
            static constexpr auto value = glz::object(&T::type, &T::text);
        };
    };

    struct tool_call_params {
        std::string name{};
        glz::generic arguments = glz::generic::object_t{};
        struct glaze {
            using T = tool_call_params;
            static constexpr auto value = glz::object(&T::name, &T::arguments);
        };
    };

    struct tool_call_result {
        std::vector<content_block> content{};
        bool isError{false};
        struct glaze {
            using T = tool_call_result;
            static constexpr auto value = glz::object(&T::content, "isError", &T::isError);
        };
    };

    struct wire_error {
        int64_t code{};
        std::string message{};
        std::optional<glz::raw_json> data{};
        struct glaze {
            using T = wire_error;
            static constexpr auto value = glz::object(&T::code, &T::message, &T::data);
        };
    };

    // ── Messages ────────────────────────────────────────────────────

    struct request_message {
        glz::generic id{};
        std::string method{};
        std::optional<glz::raw_json> params{};
    };

    struct notification_message {
        std::string method{};
        std::optional<glz::raw_json> params{};
    };

    struct response_message {
        glz::generic id{};
        std::optional<glz::raw_json> result{};
        std::optional<wire_error> error{};

        bool has_id(int64_t expected) const;
    };

    using message = std::variant<request_message, notification_message, response_message>;

    // Classifies one inbound line; throws session_error(malformed_response) when the
    // line is not a JSON-RPC 2.0 object of one of the three shapes.
    message parse_message(std::string_view line);

    std::string serialize_request(int64_t id, std::string_view method, const std::optional<glz::raw_json>& params);
    std::string serialize_notification(std::string_view method, const std::optional<glz::raw_json>& params);

    // Renders a request/response id for diagnostics ("7", "\"abc\"", "null")
    std::string describe_id(const glz::generic& id);

    template <typename T>
    glz::raw_json to_raw_json(const T& value) {
        std::string json{};
        if (auto ec = glz::write_json(value, json)) {
            throw std::runtime_error("failed to serialize json payload");
        }
        return glz::raw_json{std::move(json)};
    }

    template <typename T>
    T read_payload(const glz::raw_json& raw, std::string_view what) {
        T value{};
        auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(value, raw.str);
        if (ec) {
            throw session_error{
                    error_kind::malformed_response,
                    std::format("unexpected {} payload: {}", what, glz::format_error(ec, raw.str))};
        }
        return value;
    }

}  // namespace conduit
