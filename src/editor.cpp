#include "editor.hpp"

extern "C" {
#include <isocline.h>
}

#include <string_view>

namespace conduit::cli { namespace detail {

    using namespace std::string_view_literals;

    static const char* command_completions[] = {"list", "info", "call", "help", "quit", "exit", nullptr};

    static constexpr std::string_view trim_left(std::string_view value) {
        auto start = value.find_first_not_of(" \t\r\n");
        if (start == std::string_view::npos) {
            return {};
        }
        return value.substr(start);
    }

    static constexpr std::string_view first_token(std::string_view value) {
        auto end = value.find_first_of(" \t\r\n");
        if (end == std::string_view::npos) {
            return value;
        }
        return value.substr(0, end);
    }

    static void complete_commands(ic_completion_env_t* cenv, const char* prefix) {
        (void)ic_add_completions(cenv, prefix, command_completions);
    }

    static void complete_tool_names(ic_completion_env_t* cenv, const char* prefix) {
        const auto* editor = static_cast<const line_editor*>(ic_completion_arg(cenv));
        if (editor == nullptr) {
            return;
        }
        std::string_view typed{prefix};
        for (const auto& name : editor->tool_names()) {
            if (std::string_view{name}.starts_with(typed)) {
                if (!ic_add_completion(cenv, name.c_str())) {
                    return;
                }
            }
        }
    }

    static void complete_shell(ic_completion_env_t* cenv, const char* prefix) {
        if (prefix == nullptr) {
            return;
        }

        auto trimmed = trim_left(std::string_view{prefix});
        auto command = first_token(trimmed);
        auto has_args = command.size() < trimmed.size();
        if (!has_args) {
            ic_complete_word(cenv, prefix, complete_commands, nullptr);
            return;
        }

        // only the tool name position completes; key=value pairs are free-form
        auto rest = trim_left(trimmed.substr(command.size()));
        if (first_token(rest).size() < rest.size()) {
            return;
        }
        if (command == "info"sv || command == "call"sv) {
            ic_complete_word(cenv, prefix, complete_tool_names, nullptr);
        }
    }

}}  // namespace conduit::cli::detail

namespace conduit::cli {

    line_editor::line_editor() {
        ic_enable_multiline(false);
        ic_enable_history_duplicates(false);
        ic_set_prompt_marker("", "");
        ic_set_history(nullptr, 200);
        ic_set_default_completer(detail::complete_shell, this);
    }

    std::optional<std::string> line_editor::read_line(std::string_view prompt) {
        auto prompt_text = std::string(prompt);
        auto* raw = ic_readline(prompt_text.c_str());
        if (raw == nullptr) {
            return std::nullopt;
        }

        std::string line{raw};
        ic_free(raw);
        return line;
    }

    void line_editor::record_history(std::string_view line) {
        auto entry = std::string(line);
        ic_history_add(entry.c_str());
    }

    void line_editor::set_tool_names(std::vector<std::string> names) {
        tool_names_ = std::move(names);
    }

}  // namespace conduit::cli
