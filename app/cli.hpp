#pragma once

#include "conduit.hpp"

#include <optional>
#include <string>
#include <vector>

namespace conduit::cli {

    enum class command_kind { serve, list, info, call, shell };

    struct command_request {
        command_kind kind{command_kind::shell};
        std::string tool{};
        std::vector<std::string> arguments{};
    };

    // Fills `cfg` and `cmd`; a value means exit immediately with that code
    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg, command_request& cmd);
    int execute(const command_request& cmd, const startup_config& cfg);

}  // namespace conduit::cli
