#pragma once

#include "session.hpp"

#include <filesystem>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace conduit::cli {

    // `key=value` words into an argument object of string values. Throws
    // std::invalid_argument for a word without '=' or with an empty key.
    glz::generic::object_t parse_assignments(const std::vector<std::string>& pairs);

    std::filesystem::path resolve_self_exe();

    // Session settings with an empty server command replaced by `<self> serve`
    session_config effective_session_config(const startup_config& cfg);

    void render_tools(const std::vector<tool>& tools, output_mode mode, std::ostream& os);
    void render_tool_info(const tool& target, output_mode mode, std::ostream& os);
    void render_result(const tool_result& result, output_mode mode, std::ostream& os);

    // One-shot commands: spawn, handshake, discover, act, clean up.
    // Return the process exit code; failures are reported on `err`.
    int run_list(const startup_config& cfg, std::ostream& out, std::ostream& err);
    int run_info(const startup_config& cfg, std::string_view tool_name, std::ostream& out, std::ostream& err);
    int run_call(
            const startup_config& cfg,
            std::string_view tool_name,
            const std::vector<std::string>& pairs,
            std::ostream& out,
            std::ostream& err);

    int run_shell(const startup_config& cfg);

}  // namespace conduit::cli
