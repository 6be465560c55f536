#pragma once

#include <assessgrader/common/expected.hpp>
#include <assessgrader/logging.hpp>

#include <fmt/format.h>
#include <libassert/assert.hpp>

#include <cerrno>
#include <cstddef>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/random.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace assessgrader::linux {

inline std::error_code make_error_code(int err = errno) {
    return {err, std::generic_category()};
}

/// writes to a file descriptor. See write(2)
/// returns the number of bytes written; logs failure at debug level
inline Expected<ssize_t> write(int fd, std::string_view data) {
    ssize_t res = ::write(fd, data.data(), data.size());

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("write failed: '{}'", err.message());
        return err;
    }

    return res;
}

/// reads at most ``count`` bytes from a file descriptor. See read(2)
/// An empty result means EOF
inline Expected<std::string> read(int fd, std::size_t count) {
    std::string buffer(count, '\0');

    ssize_t res = ::read(fd, buffer.data(), count);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("read failed: '{}'", err.message());
        return err;
    }

    DEBUG_ASSERT(res >= 0, "read result is negative and != -1");
    buffer.resize(static_cast<std::size_t>(res));

    return buffer;
}

/// closes a file descriptor. See close(2)
inline Expected<> close(int fd) {
    int res = ::close(fd);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("close failed: '{}'", err.message());
        return err;
    }

    return {};
}

/// see kill(2)
inline Expected<> kill(pid_t pid, int sig) {
    int res = ::kill(pid, sig);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("kill failed: '{}'", err.message());
        return err;
    }

    return {};
}

struct Fork
{
    enum { Parent, Child } which;

    pid_t pid; // Only valid if which == Parent
};

/// see fork(2)
inline Expected<Fork> fork() {
    pid_t res = ::fork();

    if (res == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("fork failed: '{}'", err.message());
        return err;
    }

    if (res == 0) {
        return Fork{.which = Fork::Child, .pid = 0};
    }

    return Fork{.which = Fork::Parent, .pid = res};
}

/// see fcntl(2)
inline Expected<int> fcntl(int fd, int cmd, std::optional<int> arg = std::nullopt) {
    int res{};

    if (arg) {
        // NOLINTNEXTLINE(*vararg)
        res = ::fcntl(fd, cmd, arg.value());
    } else {
        // NOLINTNEXTLINE(*vararg)
        res = ::fcntl(fd, cmd);
    }

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("fcntl failed: '{}'", err.message());

        return err;
    }

    return Expected<int>{res};
}

/// see poll(2). Returns the number of ready descriptors; 0 on timeout
inline Expected<int> poll(std::vector<pollfd>& fds, int timeout_ms) {
    int res = ::poll(fds.data(), fds.size(), timeout_ms);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("poll failed: '{}'", err.message());

        return err;
    }

    return res;
}

struct WaitResult
{
    /// 0 if the child has not changed state (only with WNOHANG)
    pid_t pid;
    int status;
};

/// see waitpid(2). Retries on EINTR
inline Expected<WaitResult> waitpid(pid_t pid, int options = 0) {
    int status = 0;
    pid_t res{};

    do {
        res = ::waitpid(pid, &status, options);
    } while (res == -1 && errno == EINTR);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("waitpid failed: '{}'", err.message());

        return err;
    }

    return WaitResult{.pid = res, .status = status};
}

struct Pipe
{
    int read_fd;
    int write_fd;
};

// Ensure that fds are packed so that pipe works properly
static_assert(offsetof(Pipe, read_fd) + sizeof(Pipe::read_fd) == offsetof(Pipe, write_fd));

/// see pipe2(2)
inline Expected<Pipe> pipe2(int flags = 0) {
    Pipe pipe{};

    int res = ::pipe2(&pipe.read_fd, flags);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("pipe failed: '{}'", err.message());

        return err;
    }

    return pipe;
}

/// see mkdtemp(3). ``path_template`` must end in "XXXXXX"; returns the created directory
inline Expected<std::string> mkdtemp(std::string path_template) {
    char* res = ::mkdtemp(path_template.data());

    if (res == nullptr) {
        auto err = make_error_code(errno);

        LOG_DEBUG("mkdtemp failed: '{}'", err.message());

        return err;
    }

    return path_template;
}

/// Fills ``count`` bytes from the kernel's CSPRNG. See getrandom(2)
inline Expected<std::string> getrandom(std::size_t count) {
    std::string buffer(count, '\0');
    std::size_t filled = 0;

    while (filled < count) {
        ssize_t res = ::getrandom(buffer.data() + filled, count - filled, 0);

        if (res == -1) {
            if (errno == EINTR) {
                continue;
            }

            auto err = make_error_code(errno);

            LOG_DEBUG("getrandom failed: '{}'", err.message());

            return err;
        }

        filled += static_cast<std::size_t>(res);
    }

    return buffer;
}

} // namespace assessgrader::linux
