#pragma once

#include <grader/common/expected.hpp>
#include <grader/logging.hpp>

#include <fmt/format.h>

#include <array>
#include <cerrno>
#include <csignal>
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <string.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

// Thin wrappers around the syscalls used by the sandbox. Every wrapper reports failure through
// ``Expected`` and logs it at debug level.
//
// None of these may be used in a freshly forked child of a multi-threaded process, as logging
// allocates and locks.
namespace grader::linux {

inline std::error_code make_error_code(int err = errno) {
    return {err, std::generic_category()};
}

/// writes to a file descriptor. See write(2)
/// returns the number of bytes written
inline Expected<std::size_t> write(int fd, std::string_view data) {
    ssize_t res = ::write(fd, data.data(), data.size());

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("write failed: '{}'", err.message());
        return err;
    }

    return static_cast<std::size_t>(res);
}

/// reads from a file descriptor into ``buffer``. See read(2)
/// returns the number of bytes read; 0 means end of file
inline Expected<std::size_t> read(int fd, std::span<char> buffer) {
    ssize_t res = ::read(fd, buffer.data(), buffer.size());

    if (res == -1) {
        auto err = make_error_code(errno);

        // Would-block is a normal condition for the non-blocking pipes we read from
        if (err != std::errc::resource_unavailable_try_again && err != std::errc::interrupted) {
            LOG_DEBUG("read failed: '{}'", err.message());
        }
        return err;
    }

    return static_cast<std::size_t>(res);
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

        LOG_DEBUG("kill(pid={}, sig={}) failed: '{}'", pid, sig, err.message());
        return err;
    }

    return {};
}

struct Fork
{
    enum { Parent, Child } which;

    pid_t pid; // Only valid if which == Parent

    bool operator==(const Fork& rhs) const = default;
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

    return res;
}

/// Adds O_NONBLOCK to the status flags of ``fd``
inline Expected<> set_nonblocking(int fd) {
    auto flags = fcntl(fd, F_GETFL);
    if (!flags) {
        return flags.error();
    }

    auto res = fcntl(fd, F_SETFL, flags.value() | O_NONBLOCK); // NOLINT(hicpp-signed-bitwise)
    if (!res) {
        return res.error();
    }

    return {};
}

struct Pipe
{
    int read_fd = -1;
    int write_fd = -1;
};

/// see pipe2(2)
inline Expected<Pipe> pipe2(int flags = 0) {
    std::array<int, 2> fds{};

    int res = ::pipe2(fds.data(), flags);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("pipe2 failed: '{}'", err.message());

        return err;
    }

    return Pipe{.read_fd = fds[0], .write_fd = fds[1]};
}

/// see waitpid(2)
/// returns the raw wait status, or std::nullopt if ``WNOHANG`` was given and the child has not changed state
inline Expected<std::optional<int>> waitpid(pid_t pid, int options = 0) {
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

    if (res == 0) {
        return std::optional<int>{};
    }

    return std::optional<int>{status};
}

/// see waitid(2)
/// returns whether ``pid`` has exited, without reaping it (``WNOWAIT``). Never blocks.
inline Expected<bool> waitid_exited(pid_t pid) {
    siginfo_t info{};
    int res{};

    do {
        res = ::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT);
    } while (res == -1 && errno == EINTR);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("waitid failed: '{}'", err.message());

        return err;
    }

    // si_pid stays 0 while the child is still running
    return info.si_pid != 0;
}

/// see setpgid(2)
inline Expected<> setpgid(pid_t pid, pid_t pgid) {
    int res = ::setpgid(pid, pgid);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("setpgid failed: '{}'", err.message());

        return err;
    }

    return {};
}

/// see poll(2)
/// returns the number of ready descriptors; 0 on timeout. EINTR is reported as 0 ready descriptors.
inline Expected<int> poll(std::span<pollfd> fds, int timeout_ms) {
    int res = ::poll(fds.data(), fds.size(), timeout_ms);

    if (res == -1) {
        if (errno == EINTR) {
            return 0;
        }

        auto err = make_error_code(errno);

        LOG_DEBUG("poll failed: '{}'", err.message());

        return err;
    }

    return res;
}

/// Value type to behave as a linux signal
class Signal
{
public:
    // NOLINTNEXTLINE(google-explicit-constructor)
    Signal(int signal_num)
        : signal_num_{signal_num} {};

    // NOLINTNEXTLINE(google-explicit-constructor)
    operator int() const { return signal_num_; }

    /// Abbreviated name, e.g. "SIGKILL"
    std::string to_string() const {
        const char* abbrev = sigabbrev_np(signal_num_);

        if (abbrev == nullptr) {
            return fmt::format("SIG{}", signal_num_);
        }

        return fmt::format("SIG{}", abbrev);
    }

    friend std::string format_as(const Signal& from) { return from.to_string(); }

private:
    int signal_num_;
};

using SignalHandlerT = void (*)(int);

/// see signal(2)
inline Expected<SignalHandlerT> signal(Signal sig, SignalHandlerT handler) {
    SignalHandlerT prev_handler = ::signal(sig, handler);

    if (prev_handler == SIG_ERR) {
        auto err = make_error_code();

        LOG_DEBUG("signal failed: '{}'", err.message());

        return err;
    }

    return prev_handler;
}

} // namespace grader::linux
