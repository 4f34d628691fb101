#pragma once

#include "protocol.hpp"

#include <sys/types.h>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace conduit {

    struct launch_options {
        std::vector<std::string> command{};
        std::optional<std::filesystem::path> working_directory{};
        std::chrono::milliseconds settle{500};
        // 0 blocks until a line or end-of-stream arrives
        std::chrono::milliseconds read_timeout{0};
    };

    /*
     * Line-oriented channel to a tool server child.
     *
     * - start: spawns the child; throws session_error(spawn_failure).
     * - write_line: writes `text` plus exactly one '\n'; throws session_error(transport_failure).
     * - read_line: next line without its terminator, or nullopt at end-of-stream.
     * - terminate: graceful stop escalating to SIGKILL; idempotent and never throws.
     * - diagnostics: stderr text collected so far.
     */
    class transport {
      public:
        virtual ~transport() = default;

        virtual void start(const launch_options& opts) = 0;
        virtual void write_line(std::string_view text) = 0;
        virtual std::optional<std::string> read_line() = 0;
        virtual void terminate(std::chrono::milliseconds grace) = 0;
        virtual bool running() = 0;
        virtual std::string diagnostics() = 0;
    };

    class process_transport final : public transport {
      public:
        process_transport() = default;
        ~process_transport() override;

        process_transport(const process_transport&) = delete;
        process_transport& operator=(const process_transport&) = delete;

        void start(const launch_options& opts) override;
        void write_line(std::string_view text) override;
        std::optional<std::string> read_line() override;
        void terminate(std::chrono::milliseconds grace) override;
        bool running() override;
        std::string diagnostics() override;

        pid_t pid() const { return pid_; }
        std::optional<int> exit_status() const { return exit_status_; }

      private:
        static constexpr std::size_t max_diagnostics_bytes = 64U * 1024U;

        pid_t pid_{-1};
        int stdin_fd_{-1};
        int stdout_fd_{-1};
        int stderr_fd_{-1};
        std::chrono::milliseconds read_timeout_{0};

        std::string read_buf_{};
        std::string stderr_buf_{};
        std::optional<int> exit_status_{};
        bool stdout_eof_{false};

        bool reap(bool block);
        void drain_stderr();
        void append_diagnostics(const char* data, std::size_t size);
        void close_fds();
    };

}  // namespace conduit
