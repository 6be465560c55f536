#include "subprocess/subprocess.hpp"

#include "common/error_types.hpp"
#include "common/linux.hpp"
#include "logging.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <libassert/assert.hpp>
#include <range/v3/algorithm/transform.hpp>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <memory>
#include <mutex>
#include <string_view>
#include <thread>
#include <tuple>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sched.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

namespace assessgrader {

namespace {

constexpr std::chrono::milliseconds POLL_SLICE{20};
constexpr std::size_t READ_CHUNK = 64 * 1024;
constexpr std::size_t WRITE_CHUNK = 16 * 1024;

/// Only async-signal-safe calls are allowed between fork and exec, so failures are reported raw
[[noreturn]] void child_fail(const char* what) {
    const int err = errno;
    std::ignore = ::write(STDERR_FILENO, what, std::strlen(what));
    std::ignore = ::write(STDERR_FILENO, ": ", 2);
    const char* msg = ::strerrordesc_np(err);
    if (msg != nullptr) {
        std::ignore = ::write(STDERR_FILENO, msg, std::strlen(msg));
    }
    std::ignore = ::write(STDERR_FILENO, "\n", 1);
    ::_exit(127);
}

void set_limit(int resource, const std::optional<rlim_t>& limit, const char* what) {
    if (!limit) {
        return;
    }

    struct ::rlimit lim{.rlim_cur = *limit, .rlim_max = *limit};
    if (::setrlimit(resource, &lim) == -1) {
        child_fail(what);
    }
}

void ignore_sigpipe_once() {
    // Writing to a child that already exited must surface as EPIPE instead of killing the server
    static std::once_flag flag;
    std::call_once(flag, [] { std::ignore = std::signal(SIGPIPE, SIG_IGN); });
}

bool is_would_block(const std::error_code& err) {
    return err == std::errc::resource_unavailable_try_again || err == std::errc::operation_would_block;
}

} // namespace

Subprocess::Subprocess(std::string exec, std::vector<std::string> args, SubprocessLimits limits,
                       std::vector<std::string> envp)
    : exec_{std::move(exec)}
    , args_{std::move(args)}
    , limits_{limits}
    , envp_{std::move(envp)} {}

Subprocess::~Subprocess() {
    // if child_pid_ == 0, then initialization failed, or the object was moved from
    if (child_pid_ == 0) {
        return;
    }

    if (!reaped_) {
        std::ignore = kill();
    }

    std::ignore = close_fd(stdin_fd_);
    std::ignore = close_fd(stdout_fd_);
    std::ignore = close_fd(stderr_fd_);
}

Subprocess::Subprocess(Subprocess&& other) noexcept
    : exec_{std::move(other.exec_)}
    , args_{std::move(other.args_)}
    , limits_{other.limits_}
    , envp_{std::move(other.envp_)}
    , child_pid_{std::exchange(other.child_pid_, 0)}
    , reaped_{other.reaped_}
    , stdin_fd_{std::exchange(other.stdin_fd_, -1)}
    , stdout_fd_{std::exchange(other.stdout_fd_, -1)}
    , stderr_fd_{std::exchange(other.stderr_fd_, -1)} {}

Subprocess& Subprocess::operator=(Subprocess&& rhs) noexcept {
    if (this == &rhs) {
        return *this;
    }

    std::destroy_at(this);
    std::construct_at(this, std::move(rhs));

    return *this;
}

std::vector<std::string> Subprocess::default_environment() {
    return {"PATH=/usr/local/bin:/usr/bin:/bin", "HOME=/tmp", "LANG=C.UTF-8"};
}

Result<void> Subprocess::start() {
    ASSERT(child_pid_ == 0, "Subprocess started twice");

    ignore_sigpipe_once();

    auto stdin_pipe = TRYE(linux::pipe2(O_CLOEXEC), SyscallFailure);
    auto stdout_pipe = TRYE(linux::pipe2(O_CLOEXEC), SyscallFailure);
    auto stderr_pipe = TRYE(linux::pipe2(O_CLOEXEC), SyscallFailure);

    stdin_fd_ = stdin_pipe.write_fd;
    stdout_fd_ = stdout_pipe.read_fd;
    stderr_fd_ = stderr_pipe.read_fd;
    child_stdin_fd_ = stdin_pipe.read_fd;
    child_stdout_fd_ = stdout_pipe.write_fd;
    child_stderr_fd_ = stderr_pipe.write_fd;

    // Nothing may allocate in the child, so argv and envp are laid out up front
    // NOLINTBEGIN(cppcoreguidelines-pro-type-const-cast)
    auto to_cstr = [](const std::string& str) { return const_cast<char*>(str.c_str()); };

    std::vector<char*> argv(args_.size() + 2, nullptr);
    argv.front() = const_cast<char*>(exec_.c_str());
    ranges::transform(args_, argv.begin() + 1, to_cstr);

    std::vector<char*> envp(envp_.size() + 1, nullptr);
    ranges::transform(envp_, envp.begin(), to_cstr);
    // NOLINTEND(cppcoreguidelines-pro-type-const-cast)

    linux::Fork fork_res = TRYE(linux::fork(), SyscallFailure);

    if (fork_res.which == linux::Fork::Child) {
        exec_child(argv, envp);
    }

    child_pid_ = fork_res.pid;
    reaped_ = false;

    // Also set from the parent so a kill issued before the child gets there still reaches the group
    std::ignore = ::setpgid(child_pid_, child_pid_);

    LOG_DEBUG("Started '{}' {} as pid {}", exec_, args_, child_pid_);

    return init_parent();
}

void Subprocess::exec_child(const std::vector<char*>& argv, const std::vector<char*>& envp) const {
    // Own process group, so a kill takes out anything the candidate's code forked
    if (::setpgid(0, 0) == -1) {
        child_fail("setpgid");
    }

    if (::dup2(child_stdin_fd_, STDIN_FILENO) == -1 || ::dup2(child_stdout_fd_, STDOUT_FILENO) == -1 ||
        ::dup2(child_stderr_fd_, STDERR_FILENO) == -1) {
        child_fail("dup2");
    }

    std::ignore = ::signal(SIGPIPE, SIG_DFL);

    // The server blocks SIGINT/SIGTERM in all threads; the mask survives exec
    sigset_t no_signals;
    ::sigemptyset(&no_signals);
    ::sigprocmask(SIG_SETMASK, &no_signals, nullptr);

    if (limits_.isolate_network && ::unshare(CLONE_NEWUSER | CLONE_NEWNET) == -1) {
        child_fail("unshare");
    }

    set_limit(RLIMIT_AS, limits_.address_space_bytes, "setrlimit(RLIMIT_AS)");
    set_limit(RLIMIT_CPU, limits_.cpu_seconds, "setrlimit(RLIMIT_CPU)");
    set_limit(RLIMIT_NOFILE, limits_.max_open_files, "setrlimit(RLIMIT_NOFILE)");

    ::execvpe(argv.front(), argv.data(), envp.data());

    child_fail("execvpe");
}

Result<void> Subprocess::init_parent() {
    TRY(close_fd(child_stdin_fd_));
    TRY(close_fd(child_stdout_fd_));
    TRY(close_fd(child_stderr_fd_));

    for (int fd : {stdin_fd_, stdout_fd_, stderr_fd_}) {
        int pre_flags = TRYE(linux::fcntl(fd, F_GETFL), SyscallFailure);
        TRYE(linux::fcntl(fd, F_SETFL, pre_flags | O_NONBLOCK), SyscallFailure); // NOLINT
    }

    return {};
}

Result<RunResult> Subprocess::run(std::string_view stdin_text, std::chrono::milliseconds timeout,
                                  std::stop_token stop) {
    using std::chrono::steady_clock;

    if (child_pid_ == 0) {
        TRY(start());
    }

    const auto start_time = steady_clock::now();
    const auto deadline = start_time + timeout;

    std::string_view pending_stdin = stdin_text;
    if (pending_stdin.empty()) {
        TRY(close_fd(stdin_fd_));
    }

    RunResult result;

    while (true) {
        if (stop.stop_requested()) {
            TRY(kill());
            result.kind = RunResult::Kind::Cancelled;
            break;
        }

        const auto now = steady_clock::now();
        if (now >= deadline) {
            TRY(kill());
            result.kind = RunResult::Kind::TimedOut;
            break;
        }

        const auto slice = std::min(POLL_SLICE, std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now));

        std::vector<pollfd> fds;
        for (int fd : {stdout_fd_, stderr_fd_}) {
            if (fd != -1) {
                fds.push_back(pollfd{.fd = fd, .events = POLLIN, .revents = 0});
            }
        }
        if (stdin_fd_ != -1) {
            fds.push_back(pollfd{.fd = stdin_fd_, .events = POLLOUT, .revents = 0});
        }

        if (fds.empty()) {
            std::this_thread::sleep_for(slice);
        } else if (auto poll_res = linux::poll(fds, static_cast<int>(slice.count()));
                   !poll_res && poll_res.error() != std::errc::interrupted) {
            return ErrorKind::SyscallFailure;
        }

        for (const auto& entry : fds) {
            if (entry.revents == 0) {
                continue;
            }

            if (entry.fd == stdout_fd_) {
                TRY(drain(stdout_fd_, result.stdout_text, result.output_truncated));
            } else if (entry.fd == stderr_fd_) {
                TRY(drain(stderr_fd_, result.stderr_text, result.output_truncated));
            } else if (entry.fd == stdin_fd_) {
                TRY(feed_stdin(pending_stdin));
            }
        }

        auto status = TRY(try_reap());

        if (status) {
            // Pick up anything written between the last poll and exit
            TRY(drain(stdout_fd_, result.stdout_text, result.output_truncated));
            TRY(drain(stderr_fd_, result.stderr_text, result.output_truncated));

            if (WIFEXITED(*status)) {
                result.kind = RunResult::Kind::Exited;
                result.code = WEXITSTATUS(*status);
            } else {
                result.kind = RunResult::Kind::Signalled;
                result.code = WTERMSIG(*status);
            }
            break;
        }
    }

    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(steady_clock::now() - start_time);

    LOG_DEBUG("pid {} finished: {} ({}) after {}ms", child_pid_, result.kind, result.code, result.elapsed.count());

    return result;
}

Result<void> Subprocess::kill() {
    if (child_pid_ == 0 || reaped_) {
        return {};
    }

    // Negative pid -> the whole process group
    if (auto res = linux::kill(-child_pid_, SIGKILL); !res && res.error() != std::errc::no_such_process) {
        return ErrorKind::SyscallFailure;
    }

    TRYE(linux::waitpid(child_pid_), SyscallFailure);
    reaped_ = true;

    return {};
}

bool Subprocess::is_alive() const {
    return child_pid_ != 0 && !reaped_ && linux::kill(child_pid_, 0) != std::make_error_code(std::errc::no_such_process);
}

Result<void> Subprocess::close_fd(int& fd) {
    if (fd == -1) {
        return {};
    }

    const int to_close = std::exchange(fd, -1);
    TRYE(linux::close(to_close), SyscallFailure);

    return {};
}

Result<void> Subprocess::drain(int& fd, std::string& into, bool& truncated) {
    while (fd != -1) {
        auto chunk = linux::read(fd, READ_CHUNK);

        if (!chunk) {
            if (is_would_block(chunk.error())) {
                return {};
            }
            if (chunk.error() == std::errc::interrupted) {
                continue;
            }
            return ErrorKind::SyscallFailure;
        }

        // EOF
        if (chunk->empty()) {
            TRY(close_fd(fd));
            return {};
        }

        const std::size_t room = MAX_CAPTURE_BYTES - std::min(MAX_CAPTURE_BYTES, into.size());
        if (chunk->size() > room) {
            truncated = true;
        }
        into.append(*chunk, 0, std::min(room, chunk->size()));
    }

    return {};
}

Result<void> Subprocess::feed_stdin(std::string_view& pending) {
    if (stdin_fd_ == -1) {
        return {};
    }

    auto written = linux::write(stdin_fd_, pending.substr(0, WRITE_CHUNK));

    if (!written) {
        if (is_would_block(written.error()) || written.error() == std::errc::interrupted) {
            return {};
        }
        // The child closed its stdin (or exited); whatever it did not read is dropped
        if (written.error() == std::errc::broken_pipe) {
            pending = {};
            return close_fd(stdin_fd_);
        }
        return ErrorKind::SyscallFailure;
    }

    pending.remove_prefix(static_cast<std::size_t>(*written));

    if (pending.empty()) {
        TRY(close_fd(stdin_fd_));
    }

    return {};
}

Result<std::optional<int>> Subprocess::try_reap() {
    auto wait_res = TRYE(linux::waitpid(child_pid_, WNOHANG), SyscallFailure);

    if (wait_res.pid == 0) {
        return std::optional<int>{};
    }

    reaped_ = true;

    return std::optional<int>{wait_res.status};
}

} // namespace assessgrader
