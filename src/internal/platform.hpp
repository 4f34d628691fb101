#pragma once

#include <string_view>

namespace conduit::internal::platform {
    using namespace std::string_view_literals;

    inline constexpr bool is_linux = CONDUIT_PLATFORM_LINUX != 0;
    inline constexpr bool is_macos = CONDUIT_PLATFORM_MACOS != 0;

    inline constexpr auto executable_name = "conduit"sv;
    inline constexpr auto serve_subcommand = "serve"sv;

}  // namespace conduit::internal::platform
