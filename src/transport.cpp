#include "conduit/transport.hpp"

#include "conduit/format.hpp"

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>

using namespace conduit::literals;

namespace conduit {

    namespace detail {

        // Written by the child through a close-on-exec pipe when it never reaches exec
        struct exec_status {
            int stage{};
            int error{};
        };

        static constexpr int stage_chdir = 1;
        static constexpr int stage_exec = 2;

        static void close_fd(int& fd) {
            if (fd >= 0) {
                ::close(fd);
            }
            fd = -1;
        }

        static void close_pair(int (&fds)[2]) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }

        static bool set_flag(int fd, int get_cmd, int set_cmd, int flag) {
            int flags = ::fcntl(fd, get_cmd);
            return flags >= 0 && ::fcntl(fd, set_cmd, flags | flag) == 0;
        }

        static int decode_status(int status) {
            if (WIFEXITED(status)) {
                return WEXITSTATUS(status);
            }
            if (WIFSIGNALED(status)) {
                return 128 + WTERMSIG(status);
            }
            return 1;
        }

        static std::string describe_command(const std::vector<std::string>& command) {
            return utils::join_with_separator(command, " "sv);
        }

        static std::string errno_text(int err) {
            return std::string{std::strerror(err)};
        }

    }  // namespace detail

    process_transport::~process_transport() {
        terminate(std::chrono::milliseconds{0});
    }

    void process_transport::start(const launch_options& opts) {
        if (pid_ > 0 || stdin_fd_ >= 0) {
            throw session_error{error_kind::spawn_failure, "transport already started"};
        }
        if (opts.command.empty()) {
            throw session_error{error_kind::spawn_failure, "empty server command"};
        }

        ::signal(SIGPIPE, SIG_IGN);

        int in_pipe[2]{-1, -1};
        int out_pipe[2]{-1, -1};
        int err_pipe[2]{-1, -1};
        int status_pipe[2]{-1, -1};
        if (::pipe(in_pipe) != 0 || ::pipe(out_pipe) != 0 || ::pipe(err_pipe) != 0 || ::pipe(status_pipe) != 0) {
            auto err = errno;
            detail::close_pair(in_pipe);
            detail::close_pair(out_pipe);
            detail::close_pair(err_pipe);
            detail::close_pair(status_pipe);
            throw session_error{error_kind::spawn_failure, "pipe() failed: {}"_format(detail::errno_text(err))};
        }
        detail::set_flag(status_pipe[1], F_GETFD, F_SETFD, FD_CLOEXEC);
        detail::set_flag(in_pipe[1], F_GETFD, F_SETFD, FD_CLOEXEC);
        detail::set_flag(out_pipe[0], F_GETFD, F_SETFD, FD_CLOEXEC);
        detail::set_flag(err_pipe[0], F_GETFD, F_SETFD, FD_CLOEXEC);

        // argv is built before fork; the child only calls async-signal-safe functions
        std::vector<char*> argv{};
        argv.reserve(opts.command.size() + 1);
        for (const auto& arg : opts.command) {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.push_back(nullptr);
        std::string cwd = opts.working_directory ? opts.working_directory->string() : std::string{};

        auto pid = ::fork();
        if (pid < 0) {
            auto err = errno;
            detail::close_pair(in_pipe);
            detail::close_pair(out_pipe);
            detail::close_pair(err_pipe);
            detail::close_pair(status_pipe);
            throw session_error{error_kind::spawn_failure, "fork() failed: {}"_format(detail::errno_text(err))};
        }

        if (pid == 0) {
            ::close(in_pipe[1]);
            ::close(out_pipe[0]);
            ::close(err_pipe[0]);
            ::close(status_pipe[0]);
            ::dup2(in_pipe[0], STDIN_FILENO);
            ::dup2(out_pipe[1], STDOUT_FILENO);
            ::dup2(err_pipe[1], STDERR_FILENO);
            ::close(in_pipe[0]);
            ::close(out_pipe[1]);
            ::close(err_pipe[1]);

            detail::exec_status failure{};
            if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
                failure = {.stage = detail::stage_chdir, .error = errno};
            }
            else {
                ::execvp(argv[0], argv.data());
                failure = {.stage = detail::stage_exec, .error = errno};
            }
            (void)!::write(status_pipe[1], &failure, sizeof(failure));
            _exit(127);
        }

        // parent
        ::close(in_pipe[0]);
        ::close(out_pipe[1]);
        ::close(err_pipe[1]);
        ::close(status_pipe[1]);

        pid_ = pid;
        stdin_fd_ = in_pipe[1];
        stdout_fd_ = out_pipe[0];
        stderr_fd_ = err_pipe[0];
        stdout_eof_ = false;
        exit_status_.reset();
        read_buf_.clear();
        stderr_buf_.clear();
        read_timeout_ = opts.read_timeout;
        detail::set_flag(stderr_fd_, F_GETFL, F_SETFL, O_NONBLOCK);

        // EOF here means exec succeeded and closed the status pipe
        detail::exec_status failure{};
        ssize_t n = 0;
        do {
            n = ::read(status_pipe[0], &failure, sizeof(failure));
        } while (n < 0 && errno == EINTR);
        ::close(status_pipe[0]);

        auto command_text = detail::describe_command(opts.command);
        if (n == static_cast<ssize_t>(sizeof(failure))) {
            reap(true);
            close_fds();
            if (failure.stage == detail::stage_chdir) {
                throw session_error{
                        error_kind::spawn_failure,
                        "cannot enter working directory {}: {}"_format(cwd, detail::errno_text(failure.error))};
            }
            throw session_error{
                    error_kind::spawn_failure,
                    "cannot execute {}: {}"_format(command_text, detail::errno_text(failure.error))};
        }

        debug_log("spawned server pid=", pid_, " command=", command_text);

        if (opts.settle.count() > 0) {
            std::this_thread::sleep_for(opts.settle);
        }

        if (reap(false)) {
            drain_stderr();
            auto status = exit_status_.value_or(1);
            auto diag = stderr_buf_;
            close_fds();
            throw session_error{
                    error_kind::spawn_failure,
                    "server exited during startup with status {}{}"_format(
                            status, diag.empty() ? std::string{} : ": " + std::string{utils::trim_view(diag)})};
        }
    }

    void process_transport::write_line(std::string_view text) {
        if (stdin_fd_ < 0) {
            throw session_error{error_kind::transport_failure, "transport is not open for writing"};
        }
        if (!running()) {
            throw session_error{
                    error_kind::transport_failure,
                    "server process has exited with status {}"_format(exit_status_.value_or(-1))};
        }

        std::string msg{text};
        msg.push_back('\n');

        std::size_t offset = 0;
        while (offset < msg.size()) {
            auto written = ::write(stdin_fd_, msg.data() + offset, msg.size() - offset);
            if (written < 0) {
                if (errno == EINTR) {
                    continue;
                }
                auto err = errno;
                throw session_error{
                        error_kind::transport_failure,
                        err == EPIPE ? std::string{"broken pipe: server closed its input"}
                                     : "write failed: {}"_format(detail::errno_text(err))};
            }
            offset += static_cast<std::size_t>(written);
        }
    }

    std::optional<std::string> process_transport::read_line() {
        auto deadline = std::chrono::steady_clock::now() + read_timeout_;

        for (;;) {
            auto pos = read_buf_.find('\n');
            if (pos != std::string::npos) {
                auto line = read_buf_.substr(0, pos);
                read_buf_.erase(0, pos + 1);
                if (!line.empty() && line.back() == '\r') {
                    line.pop_back();
                }
                return line;
            }

            if (stdout_eof_ || stdout_fd_ < 0) {
                return std::nullopt;
            }

            int timeout = -1;
            if (read_timeout_.count() > 0) {
                auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                                         deadline - std::chrono::steady_clock::now())
                                         .count();
                if (remaining <= 0) {
                    throw session_error{
                            error_kind::transport_failure,
                            "timed out after {}ms waiting for server output"_format(read_timeout_.count())};
                }
                timeout = static_cast<int>(remaining);
            }

            pollfd fds[2]{};
            fds[0] = {.fd = stdout_fd_, .events = POLLIN, .revents = 0};
            fds[1] = {.fd = stderr_fd_, .events = POLLIN, .revents = 0};
            nfds_t nfds = stderr_fd_ >= 0 ? 2 : 1;

            int ret = ::poll(fds, nfds, timeout);
            if (ret < 0) {
                if (errno == EINTR) {
                    continue;
                }
                throw session_error{error_kind::transport_failure, "poll failed: {}"_format(detail::errno_text(errno))};
            }
            if (ret == 0) {
                continue;
            }

            if (nfds == 2 && (fds[1].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
                drain_stderr();
            }

            if ((fds[0].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
                char chunk[4096]{};
                auto n = ::read(stdout_fd_, chunk, sizeof(chunk));
                if (n > 0) {
                    read_buf_.append(chunk, static_cast<size_t>(n));
                }
                else if (n == 0) {
                    stdout_eof_ = true;
                }
                else if (errno != EINTR && errno != EAGAIN) {
                    throw session_error{
                            error_kind::transport_failure, "read failed: {}"_format(detail::errno_text(errno))};
                }
            }
        }
    }

    void process_transport::terminate(std::chrono::milliseconds grace) {
        detail::close_fd(stdin_fd_);

        if (pid_ > 0 && !reap(false)) {
            ::kill(pid_, SIGTERM);

            auto deadline = std::chrono::steady_clock::now() + grace;
            while (pid_ > 0 && std::chrono::steady_clock::now() < deadline) {
                drain_stderr();
                if (reap(false)) {
                    break;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds{10});
            }

            if (pid_ > 0) {
                if (grace.count() > 0) {
                    log_message(
                            log_level::warn, "server pid ", pid_, " ignored SIGTERM for ", grace.count(), "ms; killing");
                }
                ::kill(pid_, SIGKILL);
                reap(true);
            }
        }

        drain_stderr();
        close_fds();
    }

    bool process_transport::running() {
        return pid_ > 0 && !reap(false);
    }

    std::string process_transport::diagnostics() {
        drain_stderr();
        return stderr_buf_;
    }

    bool process_transport::reap(bool block) {
        if (pid_ <= 0) {
            return true;
        }

        int status = 0;
        pid_t r = 0;
        do {
            r = ::waitpid(pid_, &status, block ? 0 : WNOHANG);
        } while (r < 0 && errno == EINTR);

        if (r == 0) {
            return false;
        }
        exit_status_ = r == pid_ ? detail::decode_status(status) : -1;
        debug_log("server pid=", pid_, " exited with status ", *exit_status_);
        pid_ = -1;
        return true;
    }

    void process_transport::drain_stderr() {
        if (stderr_fd_ < 0) {
            return;
        }
        char chunk[4096]{};
        for (;;) {
            auto n = ::read(stderr_fd_, chunk, sizeof(chunk));
            if (n > 0) {
                append_diagnostics(chunk, static_cast<std::size_t>(n));
                continue;
            }
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n == 0 || errno != EAGAIN) {
                detail::close_fd(stderr_fd_);
            }
            return;
        }
    }

    void process_transport::append_diagnostics(const char* data, std::size_t size) {
        stderr_buf_.append(data, size);
        if (stderr_buf_.size() > max_diagnostics_bytes) {
            stderr_buf_.erase(0, stderr_buf_.size() - max_diagnostics_bytes);
        }
    }

    void process_transport::close_fds() {
        detail::close_fd(stdin_fd_);
        detail::close_fd(stdout_fd_);
        detail::close_fd(stderr_fd_);
    }

}  // namespace conduit
