#pragma once

#include "common/class_traits.hpp"
#include "common/error_types.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

#include <sys/resource.h>
#include <sys/types.h>

namespace assessgrader {

struct RunResult
{
    enum class Kind { Exited, Signalled, TimedOut, Cancelled };

    Kind kind = Kind::Exited;
    /// Exit code for ``Exited``, signal number for ``Signalled``
    int code = 0;

    std::string stdout_text;
    std::string stderr_text;
    bool output_truncated = false;

    std::chrono::milliseconds elapsed{0};
};

struct SubprocessLimits
{
    std::optional<rlim_t> address_space_bytes;
    std::optional<rlim_t> cpu_seconds;
    std::optional<rlim_t> max_open_files;
    /// Run the child in fresh user + network namespaces, so it has no network access
    bool isolate_network = false;
};

class Subprocess : NonCopyable
{
public:
    /// Output beyond this many bytes (per stream) is discarded
    static constexpr std::size_t MAX_CAPTURE_BYTES = std::size_t{1} << 20;

    /// ``exec`` is searched in PATH if it contains no slash.
    /// The child gets ``envp`` as its whole environment.
    Subprocess(std::string exec, std::vector<std::string> args, SubprocessLimits limits = {},
               std::vector<std::string> envp = default_environment());
    ~Subprocess();
    Subprocess(Subprocess&&) noexcept;
    Subprocess& operator=(Subprocess&&) noexcept;

    /// Forks and execs the child
    Result<void> start();

    /// Feeds ``stdin_text`` to the child, then collects stdout and stderr until it exits.
    /// The child is killed when ``timeout`` elapses or ``stop`` is requested.
    /// Starts the child first if that has not happened yet.
    Result<RunResult> run(std::string_view stdin_text, std::chrono::milliseconds timeout,
                          std::stop_token stop = {});

    /// Kill the child's whole process group with SIGKILL and reap it
    Result<void> kill();

    bool is_alive() const;

    pid_t get_pid() const { return child_pid_; }

    static std::vector<std::string> default_environment();

private:
    [[noreturn]] void exec_child(const std::vector<char*>& argv, const std::vector<char*>& envp) const;
    Result<void> init_parent();

    Result<void> close_fd(int& fd);
    Result<void> drain(int& fd, std::string& into, bool& truncated);
    Result<void> feed_stdin(std::string_view& pending);
    Result<std::optional<int>> try_reap();

    std::string exec_;
    std::vector<std::string> args_;
    SubprocessLimits limits_;
    std::vector<std::string> envp_;

    pid_t child_pid_{};
    bool reaped_ = false;

    /// Parent ends only; -1 once closed
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;

    /// Child ends, open only between fork and init_parent
    int child_stdin_fd_ = -1;
    int child_stdout_fd_ = -1;
    int child_stderr_fd_ = -1;
};

} // namespace assessgrader

FMT_SERIALIZE_ENUM(::assessgrader::RunResult::Kind, Exited, Signalled, TimedOut, Cancelled);
