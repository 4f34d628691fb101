#include "conduit/protocol.hpp"

#include <glaze/glaze.hpp>

#include <string>
#include <string_view>

using namespace conduit::literals;

namespace conduit {

    namespace detail {

        // Superset of the three message shapes; classification happens after the read
        struct inbound_envelope {
            std::optional<std::string> jsonrpc{};
            std::optional<glz::generic> id{};
            std::optional<std::string> method{};
            std::optional<glz::raw_json> params{};
            std::optional<glz::raw_json> result{};
            std::optional<wire_error> error{};
            struct glaze {
                using T = inbound_envelope;
                static constexpr auto value = glz::object(
                        "jsonrpc",
                        &T::jsonrpc,
                        "id",
                        &T::id,
                        "method",
                        &T::method,
                        "params",
                        &T::params,
                        "result",
                        &T::result,
                        "error",
                        &T::error);
            };
        };

        struct outbound_request {
            std::string_view jsonrpc{jsonrpc_version};
            int64_t id{};
            std::string_view method{};
            std::optional<glz::raw_json> params{};
            struct glaze {
                using T = outbound_request;
                static constexpr auto value =
                        glz::object("jsonrpc", &T::jsonrpc, "id", &T::id, "method", &T::method, "params", &T::params);
            };
        };

        struct outbound_notification {
            std::string_view jsonrpc{jsonrpc_version};
            std::string_view method{};
            std::optional<glz::raw_json> params{};
            struct glaze {
                using T = outbound_notification;
                static constexpr auto value =
                        glz::object("jsonrpc", &T::jsonrpc, "method", &T::method, "params", &T::params);
            };
        };

        static std::string preview(std::string_view line) {
            static constexpr std::size_t max_preview = 120U;
            if (line.size() <= max_preview) {
                return std::string{line};
            }
            return std::string{line.substr(0, max_preview)} + "...";
        }

        // optional<raw_json> reads `"result": null` as absent; look for the key itself
        static bool has_result_key(std::string_view line) {
            glz::generic value{};
            std::string buffer{line};
            if (glz::read_json(value, buffer) || !value.is_object()) {
                return false;
            }
            return value.get<glz::generic::object_t>().contains("result");
        }

        [[noreturn]] static void malformed(std::string_view reason, std::string_view line) {
            throw session_error{error_kind::malformed_response, "{} in line: {}"_format(reason, preview(line))};
        }

    }  // namespace detail

    bool response_message::has_id(int64_t expected) const {
        return id.is_number() && id.get<double>() == static_cast<double>(expected);
    }

    message parse_message(std::string_view line) {
        detail::inbound_envelope env{};
        std::string buffer{line};
        auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(env, buffer);
        if (ec) {
            detail::malformed("invalid json ({})"_format(glz::format_error(ec, buffer)), line);
        }

        if (!env.jsonrpc || *env.jsonrpc != jsonrpc_version) {
            detail::malformed("missing or unsupported jsonrpc version", line);
        }

        if (env.method) {
            if (env.result || env.error) {
                detail::malformed("message carries both a method and a result/error", line);
            }
            if (env.id) {
                return request_message{.id = std::move(*env.id), .method = std::move(*env.method), .params = std::move(env.params)};
            }
            return notification_message{.method = std::move(*env.method), .params = std::move(env.params)};
        }

        if (env.result && env.error) {
            detail::malformed("response carries both result and error", line);
        }
        if (!env.result && !env.error) {
            if (!detail::has_result_key(line)) {
                detail::malformed("message has neither a method nor a result/error", line);
            }
            env.result = glz::raw_json{"null"};
        }
        // error replies to unparsable requests legitimately carry "id": null
        if (!env.id && !env.error) {
            detail::malformed("response without id", line);
        }

        response_message resp{};
        if (env.id) {
            resp.id = std::move(*env.id);
        }
        resp.result = std::move(env.result);
        resp.error = std::move(env.error);
        return resp;
    }

    std::string serialize_request(int64_t id, std::string_view method, const std::optional<glz::raw_json>& params) {
        detail::outbound_request req{.id = id, .method = method, .params = params};
        std::string json{};
        if (auto ec = glz::write_json(req, json)) {
            throw std::runtime_error("failed to serialize request: {}"_format(method));
        }
        return json;
    }

    std::string serialize_notification(std::string_view method, const std::optional<glz::raw_json>& params) {
        detail::outbound_notification note{.method = method, .params = params};
        std::string json{};
        if (auto ec = glz::write_json(note, json)) {
            throw std::runtime_error("failed to serialize notification: {}"_format(method));
        }
        return json;
    }

    std::string describe_id(const glz::generic& id) {
        auto json = glz::write_json(id);
        if (!json) {
            return "null";
        }
        return *json;
    }

}  // namespace conduit
