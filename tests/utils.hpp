#pragma once

#include "conduit.hpp"

#include <catch2/catch_test_macros.hpp>
#include <glaze/glaze.hpp>

extern "C" {
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
}

#include <chrono>
#include <deque>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace conduit::test {

    using namespace std::string_view_literals;

    // Transport double: read_line replays `script`, write_line records into `writes`
    struct spy_transport final : transport {
        std::deque<std::string> script{};
        std::vector<std::string> writes{};
        std::optional<launch_options> launched{};
        std::string stderr_text{};

        bool fail_start{false};
        bool fail_writes{false};
        bool started{false};
        bool terminated{false};
        int terminate_calls{0};

        void start(const launch_options& opts) override {
            if (fail_start) {
                throw session_error{error_kind::spawn_failure, "spy refused to start"};
            }
            launched = opts;
            started = true;
        }

        void write_line(std::string_view text) override {
            if (fail_writes || terminated) {
                throw session_error{error_kind::transport_failure, "broken pipe: server closed its input"};
            }
            writes.emplace_back(text);
        }

        std::optional<std::string> read_line() override {
            if (script.empty()) {
                return std::nullopt;
            }
            auto line = std::move(script.front());
            script.pop_front();
            return line;
        }

        void terminate(std::chrono::milliseconds) override {
            ++terminate_calls;
            terminated = true;
        }

        bool running() override { return started && !terminated; }

        std::string diagnostics() override { return stderr_text; }
    };

    inline std::string result_line(int64_t id, std::string_view result_json) {
        return R"({"jsonrpc":"2.0","id":)" + std::to_string(id) + R"(,"result":)" + std::string{result_json} + "}";
    }

    inline std::string error_line(int64_t id, int code, std::string_view message) {
        return R"({"jsonrpc":"2.0","id":)" + std::to_string(id) + R"(,"error":{"code":)" + std::to_string(code) +
               R"(,"message":")" + std::string{message} + R"("}})";
    }

    inline std::string text_result_json(std::string_view text, bool is_error = false) {
        return R"({"content":[{"type":"text","text":")" + std::string{text} + R"("}],"isError":)" +
               (is_error ? "true" : "false") + "}";
    }

    inline constexpr auto initialize_result_json =
            R"({"protocolVersion":"2024-11-05","capabilities":{"tools":{"listChanged":false}},"serverInfo":{"name":"spy-server","version":"9.9.9"}})";

    inline constexpr auto listing_json = R"({"tools":[
        {"name":"hello","description":"Say hello to someone","inputSchema":{"type":"object","properties":{"name":{"type":"string","description":"The name of the person to greet"}},"required":["name"]}},
        {"name":"add_numbers","description":"Add two numbers together","inputSchema":{"type":"object","properties":{"b":{"type":"number","description":"Second number"},"a":{"type":"number","description":"First number"}},"required":["a","b"]}},
        {"name":"toggle","description":"Flip a switch","inputSchema":{"type":"object","properties":{"on":{"type":"boolean"},"times":{"type":"integer"}}}}
    ]})";

    inline glz::generic parse_json(std::string_view text) {
        glz::generic value{};
        std::string buffer{text};
        auto ec = glz::read_json(value, buffer);
        INFO("json: " << text);
        REQUIRE_FALSE(ec);
        return value;
    }

    inline const glz::generic::object_t& as_object(const glz::generic& value) {
        REQUIRE(value.is_object());
        return value.get<glz::generic::object_t>();
    }

    inline const glz::generic& field(const glz::generic& value, std::string_view key) {
        const auto& obj = as_object(value);
        auto it = obj.find(key);
        INFO("missing key: " << key);
        REQUIRE(it != obj.end());
        return it->second;
    }

    inline bool has_field(const glz::generic& value, std::string_view key) {
        return as_object(value).contains(key);
    }

    // Session over a spy with the handshake and discovery replies already queued
    struct scripted_session {
        spy_transport* spy{};
        std::unique_ptr<session> client{};

        explicit scripted_session(session_config cfg = {}) {
            auto channel = std::make_unique<spy_transport>();
            spy = channel.get();
            client = std::make_unique<session>(std::move(cfg), std::move(channel));
        }

        void make_ready() {
            spy->script.push_back(result_line(1, initialize_result_json));
            spy->script.push_back(result_line(2, listing_json));
            client->start();
            client->initialize();
            client->discover_tools();
            REQUIRE(client->state() == session_state::ready);
        }
    };

    namespace detail {
        namespace fs = std::filesystem;

        struct temp_dir {
            fs::path path{};

            explicit temp_dir(std::string_view prefix) {
                auto now = std::chrono::system_clock::now().time_since_epoch().count();
                std::ostringstream dir_name{};
                dir_name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now;
                path = fs::temp_directory_path() / dir_name.str();
                fs::create_directories(path);
            }

            ~temp_dir() {
                std::error_code ec{};
                fs::remove_all(path, ec);
            }

            temp_dir(const temp_dir&) = delete;
            temp_dir& operator=(const temp_dir&) = delete;
        };

        inline void write_file(const fs::path& p, std::string_view content) {
            std::ofstream out{p};
            REQUIRE(out.good());
            out << content;
        }
    }  // namespace detail

}  // namespace conduit::test
