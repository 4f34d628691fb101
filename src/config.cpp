#include "conduit/config.hpp"

#include "conduit/format.hpp"

#include <glaze/glaze.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>

using namespace conduit::literals;

namespace conduit {

    namespace detail {

        struct persisted_config {
            int schema_version{1};
            std::optional<std::vector<std::string>> server_command{};
            std::optional<std::string> working_directory{};
            std::optional<int> settle_ms{};
            std::optional<int> grace_ms{};
            std::optional<int> response_timeout_ms{};
            std::optional<std::string> protocol_version{};
            std::optional<std::string> client_name{};
            std::optional<std::string> client_version{};
            std::optional<std::string> output{};
            std::optional<std::string> log_level{};
        };

    }  // namespace detail

}  // namespace conduit

namespace glz {

    template <>
    struct meta<conduit::detail::persisted_config> {
        using T = conduit::detail::persisted_config;
        static constexpr auto value =
                object("schema_version",
                       &T::schema_version,
                       "server_command",
                       &T::server_command,
                       "working_directory",
                       &T::working_directory,
                       "settle_ms",
                       &T::settle_ms,
                       "grace_ms",
                       &T::grace_ms,
                       "response_timeout_ms",
                       &T::response_timeout_ms,
                       "protocol_version",
                       &T::protocol_version,
                       "client_name",
                       &T::client_name,
                       "client_version",
                       &T::client_version,
                       "output",
                       &T::output,
                       "log_level",
                       &T::log_level);
    };

}  // namespace glz

namespace conduit {

    void load_config_file(const std::filesystem::path& path, startup_config& cfg) {
        std::ifstream in{path};
        if (!in) {
            throw std::runtime_error("failed to open config file: {}"_format(path.string()));
        }
        std::ostringstream ss{};
        ss << in.rdbuf();
        auto text = ss.str();

        detail::persisted_config data{};
        if (auto ec = glz::read_json(data, text)) {
            throw std::runtime_error(
                    "failed to parse config file {}: {}"_format(path.string(), glz::format_error(ec, text)));
        }
        if (data.schema_version != 1) {
            throw std::runtime_error("unsupported config schema_version: {}"_format(data.schema_version));
        }

        auto& session = cfg.session;
        if (data.server_command) {
            session.server_command = std::move(*data.server_command);
        }
        if (data.working_directory) {
            session.working_directory = std::filesystem::path{*data.working_directory};
        }
        if (data.settle_ms) {
            session.settle_ms = *data.settle_ms;
        }
        if (data.grace_ms) {
            session.grace_ms = *data.grace_ms;
        }
        if (data.response_timeout_ms) {
            session.response_timeout_ms = *data.response_timeout_ms;
        }
        if (data.protocol_version) {
            session.protocol_version = std::move(*data.protocol_version);
        }
        if (data.client_name) {
            session.client_name = std::move(*data.client_name);
        }
        if (data.client_version) {
            session.client_version = std::move(*data.client_version);
        }
        if (data.output && !try_parse_output_mode(*data.output, cfg.output)) {
            throw std::runtime_error("invalid output in config file: " + *data.output);
        }
        if (data.log_level && !try_parse_log_level(*data.log_level, cfg.log_threshold)) {
            throw std::runtime_error("invalid log_level in config file: " + *data.log_level);
        }
        if (session.settle_ms < 0 || session.grace_ms < 0 || session.response_timeout_ms < 0) {
            throw std::runtime_error("config timeouts must be non-negative");
        }
        cfg.config_file = path;
    }

}  // namespace conduit
