#pragma once

#include "utils.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace conduit {

    using namespace std::string_view_literals;

    /*
     * Conduit Startup Config Options
     *
     * Session (client side)
     * - server_command: argv of the tool server child; empty means "<self> serve".
     * - working_directory: Directory the child is started in (inherited when unset).
     * - settle_ms: Delay after spawn before the liveness check.
     * - grace_ms: How long terminate waits after SIGTERM before SIGKILL.
     * - response_timeout_ms: Max wait for one response line; 0 waits forever.
     * - protocol_version: Version offered in the initialize request.
     * - client_name/client_version: clientInfo sent during the handshake.
     *
     * Server
     * - server_name/server_version: serverInfo returned from initialize.
     * - supported_protocol_versions: Versions initialize accepts.
     *
     * Output and logging
     * - output: Result rendering for list/call ("text" or "json").
     * - log_threshold: Minimum level written to stderr.
     * - config_file: Optional JSON file layered under command-line options.
     */

    enum class output_mode { text, json };

    inline constexpr std::string_view default_protocol_version = "2024-11-05"sv;

    inline constexpr std::string_view to_string(output_mode mode) {
        switch (mode) {
            case output_mode::text:
                return "text"sv;
            case output_mode::json:
                return "json"sv;
        }
        return "text"sv;
    }

    inline constexpr bool try_parse_output_mode(std::string_view text, output_mode& out) {
        if (utils::str_case_eq(text, "text"sv)) {
            out = output_mode::text;
            return true;
        }
        if (utils::str_case_eq(text, "json"sv)) {
            out = output_mode::json;
            return true;
        }
        return false;
    }

    inline constexpr bool try_parse_log_level(std::string_view text, log_level& out) {
        if (utils::str_case_eq(text, "debug"sv)) {
            out = log_level::debug;
            return true;
        }
        if (utils::str_case_eq(text, "info"sv)) {
            out = log_level::info;
            return true;
        }
        if (utils::str_case_eq(text, "warn"sv) || utils::str_case_eq(text, "warning"sv)) {
            out = log_level::warn;
            return true;
        }
        if (utils::str_case_eq(text, "error"sv)) {
            out = log_level::error;
            return true;
        }
        if (utils::str_case_eq(text, "off"sv) || utils::str_case_eq(text, "none"sv)) {
            out = log_level::off;
            return true;
        }
        return false;
    }

    struct session_config {
        std::vector<std::string> server_command{};
        std::optional<std::filesystem::path> working_directory{};

        int settle_ms{500};
        int grace_ms{5'000};
        int response_timeout_ms{30'000};

        std::string protocol_version{default_protocol_version};
        std::string client_name{"conduit-client"};
        std::string client_version{"1.0.0"};
    };

    struct server_config {
        std::string server_name{"conduit-hello-server"};
        std::string server_version{"0.1.0"};
        std::vector<std::string> supported_protocol_versions{"2024-11-05", "2025-03-26", "2025-06-18"};
    };

    struct startup_config {
        session_config session{};
        server_config server{};

        output_mode output{output_mode::text};
        log_level log_threshold{log_level::warn};
        std::optional<std::filesystem::path> config_file{};
    };

    // Layers the JSON file at `path` onto `cfg.session`; throws std::runtime_error
    // when the file cannot be read or parsed.
    void load_config_file(const std::filesystem::path& path, startup_config& cfg);

}  // namespace conduit
