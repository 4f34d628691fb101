#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace conduit::cli {

    // isocline-backed prompt for the interactive shell: shell commands complete
    // at the start of a line, tool names after `info`/`call`.
    class line_editor {
      public:
        line_editor();

        line_editor(const line_editor&) = delete;
        line_editor& operator=(const line_editor&) = delete;

        std::optional<std::string> read_line(std::string_view prompt);
        void record_history(std::string_view line);

        void set_tool_names(std::vector<std::string> names);
        const std::vector<std::string>& tool_names() const { return tool_names_; }

      private:
        std::vector<std::string> tool_names_{};
    };

}  // namespace conduit::cli
