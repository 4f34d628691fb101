#pragma once

#include "config.hpp"
#include "protocol.hpp"

#include <functional>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace conduit::server {

    // Leaf tool: argument mapping in, content blocks out. Must not throw for bad
    // input; problems are reported as text with isError set.
    using tool_handler = std::function<tool_call_result(const glz::generic::object_t&)>;

    struct tool_entry {
        std::string name{};
        std::string description{};
        std::string input_schema{};
        tool_handler handler{};
    };

    class tool_registry {
      public:
        // Throws std::invalid_argument for duplicate names or a schema that is not a JSON object
        void add(tool_entry entry);
        const tool_entry* find(std::string_view name) const;
        const std::vector<tool_entry>& entries() const { return entries_; }

        // `required` list of the entry's schema, parsed once by add()
        const std::vector<std::string>& required_arguments(const tool_entry& entry) const;

      private:
        std::vector<tool_entry> entries_{};
        std::vector<std::vector<std::string>> required_{};
        std::unordered_map<std::string, std::size_t> index_{};
    };

    // hello, echo, get_time, add_numbers
    void register_builtin_tools(tool_registry& registry);

    class dispatcher {
      public:
        dispatcher(const tool_registry& registry, server_config cfg);

        // Handles one inbound line; nullopt for notifications, which never get a reply
        std::optional<std::string> handle(std::string_view line);

        bool initialized() const { return initialized_; }

      private:
        const tool_registry& registry_;
        server_config cfg_;
        bool initialized_{false};
    };

    // Reads requests from `in` until EOF, writing each reply as one line to `out`
    int run(const tool_registry& registry, const server_config& cfg, std::istream& in, std::ostream& out);

}  // namespace conduit::server
