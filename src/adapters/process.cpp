#include "process.hpp"
#include <cerrno>
#include <cstring>
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace gtxfer::adapters::process {

namespace {

class LineSplitter {
public:
    explicit LineSplitter(const LineCallback& on_line) : on_line_(on_line) {}

    void feed(const char* data, std::size_t size) {
        for (std::size_t i = 0; i < size; ++i) {
            const char c = data[i];
            if (c == '\n' || c == '\r') {
                flush();
            } else {
                pending_.push_back(c);
            }
        }
    }

    void flush() {
        if (!pending_.empty() && on_line_) {
            on_line_(pending_);
        }
        pending_.clear();
    }

private:
    const LineCallback& on_line_;
    std::string pending_;
};

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

auto wait_child(pid_t pid) -> int {
    int status = 0;
    while (::waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) return -1;
    }
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

} // namespace

auto run(const std::vector<std::string>& argv,
         const LineCallback& on_line,
         std::optional<std::chrono::milliseconds> timeout)
    -> infra::Result<int>
{
    if (argv.empty()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument, "Empty command"));
    }

    int out_pipe[2]{-1, -1};
    int status_pipe[2]{-1, -1};
    if (::pipe2(out_pipe, O_CLOEXEC) != 0) {
        return std::unexpected(infra::make_error(infra::ErrorCode::SpawnFailed,
            fmt::format("pipe() failed: {}", std::strerror(errno))));
    }
    if (::pipe2(status_pipe, O_CLOEXEC) != 0) {
        const int err = errno;
        close_fd(out_pipe[0]); close_fd(out_pipe[1]);
        return std::unexpected(infra::make_error(infra::ErrorCode::SpawnFailed,
            fmt::format("pipe() failed: {}", std::strerror(err))));
    }

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        cargv.push_back(const_cast<char*>(arg.c_str()));
    }
    cargv.push_back(nullptr);

    spdlog::debug("Running: {}", format_command(argv));

    const pid_t pid = ::fork();
    if (pid == -1) {
        const int err = errno;
        close_fd(out_pipe[0]); close_fd(out_pipe[1]);
        close_fd(status_pipe[0]); close_fd(status_pipe[1]);
        return std::unexpected(infra::make_error(infra::ErrorCode::SpawnFailed,
            fmt::format("fork() failed: {}", std::strerror(err))));
    }

    if (pid == 0) {
        // Дочерний процесс: только async-signal-safe вызовы до exec
        const int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(out_pipe[1], STDERR_FILENO);
        ::execvp(cargv[0], cargv.data());

        const int err = errno;
        (void)!::write(status_pipe[1], &err, sizeof(err));
        ::_exit(127);
    }

    close_fd(out_pipe[1]);
    close_fd(status_pipe[1]);

    // status_pipe закрывается при успешном exec (O_CLOEXEC), иначе в нём errno
    int child_errno = 0;
    ssize_t n = 0;
    do {
        n = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n == -1 && errno == EINTR);
    close_fd(status_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        close_fd(out_pipe[0]);
        (void)wait_child(pid);
        return std::unexpected(infra::make_error(infra::ErrorCode::SpawnFailed,
            fmt::format("Cannot execute '{}': {}", argv.front(), std::strerror(child_errno))));
    }

    using clock = std::chrono::steady_clock;
    std::optional<clock::time_point> deadline;
    if (timeout) {
        deadline = clock::now() + *timeout;
    }

    LineSplitter splitter(on_line);
    bool timed_out = false;
    char buf[4096];

    for (;;) {
        int wait_ms = -1;
        if (deadline) {
            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - clock::now());
            if (remaining.count() <= 0) {
                timed_out = true;
                break;
            }
            wait_ms = static_cast<int>(remaining.count());
        }

        pollfd pfd{out_pipe[0], POLLIN, 0};
        const int rc = ::poll(&pfd, 1, wait_ms);
        if (rc < 0) {
            if (errno == EINTR) continue;
            spdlog::warn("poll() failed: {}", std::strerror(errno));
            break;
        }
        if (rc == 0) continue; // проверим дедлайн

        const ssize_t got = ::read(out_pipe[0], buf, sizeof(buf));
        if (got > 0) {
            splitter.feed(buf, static_cast<std::size_t>(got));
        } else if (got == 0) {
            break; // EOF
        } else if (errno != EINTR && errno != EAGAIN) {
            spdlog::warn("read() failed: {}", std::strerror(errno));
            break;
        }
    }

    splitter.flush();
    close_fd(out_pipe[0]);

    if (timed_out) {
        ::kill(pid, SIGKILL);
        (void)wait_child(pid);
        return std::unexpected(infra::make_error(infra::ErrorCode::Timeout,
            fmt::format("'{}' timed out after {} ms", argv.front(), timeout->count())));
    }

    const int exit_code = wait_child(pid);
    if (exit_code < 0) {
        return std::unexpected(infra::make_error(infra::ErrorCode::SpawnFailed,
            fmt::format("waitpid() failed for '{}'", argv.front())));
    }
    return exit_code;
}

auto format_command(const std::vector<std::string>& argv) -> std::string {
    std::string out;
    for (const auto& arg : argv) {
        if (!out.empty()) out += ' ';
        if (arg.find_first_of(" \t\"") != std::string::npos) {
            out += fmt::format("\"{}\"", arg);
        } else {
            out += arg;
        }
    }
    return out;
}

} // namespace gtxfer::adapters::process
