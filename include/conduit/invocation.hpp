#pragma once

#include "catalog.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace conduit {

    struct tool_result {
        std::vector<content_block> content{};
        bool is_error{false};

        // First block's text; nullopt is the empty-result condition
        std::optional<std::string> primary_text() const;
        std::string joined_text(std::string_view separator = "\n") const;
    };

    class invocation_engine {
      public:
        invocation_engine(correlator& rpc, const tool_catalog& catalog);

        // Local checks run before any wire traffic: unknown_tool, missing_argument,
        // invalid_argument. A JSON-RPC error reply becomes remote_tool_error.
        tool_result invoke(std::string_view name, const glz::generic::object_t& arguments);

        // Checks required arguments and coerces textual values of declared
        // number/integer/boolean parameters. Advisory; the server has the final word.
        static glz::generic::object_t prepare_arguments(const tool& target, const glz::generic::object_t& arguments);

      private:
        correlator& rpc_;
        const tool_catalog& catalog_;
    };

}  // namespace conduit
