#include "sandbox/sandboxed_process.hpp"

#include "sandbox/utf8.hpp"

#include <grader/common/error_types.hpp>
#include <grader/common/expected.hpp>
#include <grader/common/linux.hpp>
#include <grader/logging.hpp>
#include <grader/sandbox/execute.hpp>

#include <fmt/ranges.h>
#include <fmt/std.h>
#include <gsl/util>
#include <libassert/assert.hpp>

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstring>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace grader {

namespace {

constexpr std::size_t READ_CHUNK_SIZE = 4096;
/// Upper bound on chunks read from one stream per poll round, so one chatty stream can't starve the others
constexpr int MAX_CHUNKS_PER_ROUND = 16;
constexpr std::chrono::milliseconds POLL_SLICE{25};
/// How long output is still collected once the child has exited
constexpr std::chrono::milliseconds DRAIN_GRACE{500};

/// Writing to a pipe whose reader is gone must fail with EPIPE instead of killing the grader
void ignore_sigpipe() {
    static std::once_flag once;

    std::call_once(once, [] {
        if (auto res = linux::signal(SIGPIPE, SIG_IGN); !res) {
            LOG_WARN("Could not ignore SIGPIPE: {}", res.error().message());
        }
    });
}

void close_fd(int& fd) {
    if (fd == -1) {
        return;
    }

    std::ignore = linux::close(fd);
    fd = -1;
}

void close_pipe(linux::Pipe& pipe) {
    close_fd(pipe.read_fd);
    close_fd(pipe.write_fd);
}

} // namespace

SandboxedProcess::SandboxedProcess(std::string executable, std::vector<std::string> arguments,
                                   ExecuteOptions options)
    : executable_{std::move(executable)}
    , arguments_{std::move(arguments)}
    , options_{std::move(options)}
    , stdout_{.pipe = {}, .data = {}, .limit = options_.standard_output_limit,
              .overflow_reason = ExecutionReason::StandardOutputExceeded}
    , stderr_{.pipe = {}, .data = {}, .limit = options_.standard_error_limit,
              .overflow_reason = ExecutionReason::StandardErrorExceeded} {}

SandboxedProcess::~SandboxedProcess() {
    if (child_pid_ != 0 && !reaped_) {
        force_kill(ExecutionReason::TimedOut);
        std::ignore = linux::waitpid(child_pid_);
    }

    close_all();
}

Expected<> SandboxedProcess::start() {
    ASSERT(child_pid_ == 0, "A sandboxed process may only be started once");

    ignore_sigpipe();

    std::vector<std::string> argv;
    argv.reserve(arguments_.size() + 1);
    argv.push_back(executable_);
    argv.insert(argv.end(), arguments_.begin(), arguments_.end());

    return spawn(std::move(argv));
}

Expected<> SandboxedProcess::spawn(std::vector<std::string> argv) {
    // Everything the child needs is prepared before forking; the child may only make raw syscalls
    std::vector<char*> argv_ptrs;
    argv_ptrs.reserve(argv.size() + 1);
    for (std::string& arg : argv) {
        argv_ptrs.push_back(arg.data());
    }
    argv_ptrs.push_back(nullptr);

    stdin_pipe_ = TRY(linux::pipe2(O_CLOEXEC));
    stdout_.pipe = TRY(linux::pipe2(O_CLOEXEC));
    stderr_.pipe = TRY(linux::pipe2(O_CLOEXEC));
    // Closed by a successful exec, so the parent reads EOF. Otherwise it receives errno.
    exec_error_pipe_ = TRY(linux::pipe2(O_CLOEXEC));

    linux::Fork fork_res = TRY(linux::fork());

    if (fork_res.which == linux::Fork::Child) {
        exec_child(argv_ptrs);
    }

    child_pid_ = fork_res.pid;

    // Also done by the child; whichever runs first wins. Fails harmlessly if the child already exec'd.
    std::ignore = linux::setpgid(child_pid_, child_pid_);

    // Close the ends used by the child
    close_fd(stdin_pipe_.read_fd);
    close_fd(stdout_.pipe.write_fd);
    close_fd(stderr_.pipe.write_fd);
    close_fd(exec_error_pipe_.write_fd);

    std::array<char, sizeof(int)> errno_buf{};
    std::size_t errno_bytes = 0;

    while (errno_bytes < errno_buf.size()) {
        auto res = linux::read(exec_error_pipe_.read_fd, std::span{errno_buf}.subspan(errno_bytes));

        if (!res && res.error() == std::errc::interrupted) {
            continue;
        }
        if (!res || res.value() == 0) {
            break;
        }
        errno_bytes += res.value();
    }
    close_fd(exec_error_pipe_.read_fd);

    if (errno_bytes == errno_buf.size()) {
        int child_errno{};
        std::memcpy(&child_errno, errno_buf.data(), sizeof(child_errno));

        LOG_DEBUG("Could not exec {:?}: {}", executable_, get_err_msg(child_errno));

        std::ignore = linux::waitpid(child_pid_);
        reaped_ = true;

        return linux::make_error_code(child_errno);
    }

    LOG_DEBUG("Spawned {:?} {} as pid {}", executable_, arguments_, child_pid_);

    TRY(linux::set_nonblocking(stdout_.pipe.read_fd));
    TRY(linux::set_nonblocking(stderr_.pipe.read_fd));

    if (options_.standard_input) {
        // The trailing newline releases programs blocked on reading a line
        stdin_data_ = *options_.standard_input + "\n";
        TRY(linux::set_nonblocking(stdin_pipe_.write_fd));
    } else {
        close_fd(stdin_pipe_.write_fd);
    }

    return {};
}

void SandboxedProcess::exec_child(std::vector<char*>& argv) const {
    // Only async-signal-safe calls from here on. No logging, no allocation.
    auto report_and_exit = [this] {
        int err = errno;
        std::ignore = ::write(exec_error_pipe_.write_fd, &err, sizeof(err));
        ::_exit(127);
    };

    ::setpgid(0, 0);
    ::signal(SIGPIPE, SIG_DFL);

    if (::dup2(stdin_pipe_.read_fd, STDIN_FILENO) == -1 || ::dup2(stdout_.pipe.write_fd, STDOUT_FILENO) == -1 ||
        ::dup2(stderr_.pipe.write_fd, STDERR_FILENO) == -1) {
        report_and_exit();
    }

    ::execvp(argv.front(), argv.data());

    report_and_exit();
    __builtin_unreachable();
}

Expected<ExecutionResult> SandboxedProcess::supervise() {
    using std::chrono::steady_clock;

    ASSERT(child_pid_ != 0 && !reaped_, "supervise() requires a running child");

    std::optional<steady_clock::time_point> deadline;
    if (options_.timeout) {
        deadline = steady_clock::now() + *options_.timeout;
    }

    // The child is left unreaped, so its pid (and with it the process group id) can't be reused yet
    while (!TRY(linux::waitid_exited(child_pid_))) {
        auto slice = POLL_SLICE;
        if (deadline && !kill_sent_) {
            const auto now = steady_clock::now();
            if (now >= *deadline) {
                LOG_DEBUG("pid {} ran past its {} deadline", child_pid_, *options_.timeout);
                force_kill(ExecutionReason::TimedOut);
            } else {
                slice = std::min(slice, std::chrono::ceil<std::chrono::milliseconds>(*deadline - now));
            }
        }

        TRY(poll_once(slice, true));
    }

    // Anything the child left running in the background goes down with the group
    std::ignore = linux::kill(-child_pid_, SIGKILL);

    TRY(drain());

    const std::optional<int> wait_status = TRY(linux::waitpid(child_pid_));
    reaped_ = true;
    close_all();

    ASSERT(wait_status.has_value());
    return decode(*wait_status);
}

Expected<> SandboxedProcess::poll_once(std::chrono::milliseconds slice, bool feed_input) {
    std::vector<pollfd> fds;
    if (stdout_.pipe.read_fd != -1) {
        fds.push_back({.fd = stdout_.pipe.read_fd, .events = POLLIN, .revents = 0});
    }
    if (stderr_.pipe.read_fd != -1) {
        fds.push_back({.fd = stderr_.pipe.read_fd, .events = POLLIN, .revents = 0});
    }
    if (feed_input && stdin_pipe_.write_fd != -1) {
        fds.push_back({.fd = stdin_pipe_.write_fd, .events = POLLOUT, .revents = 0});
    }

    TRY(linux::poll(fds, gsl::narrow_cast<int>(slice.count())));

    for (const pollfd& entry : fds) {
        if (entry.revents == 0) {
            continue;
        }

        if (entry.fd == stdout_.pipe.read_fd) {
            read_available(stdout_);
        } else if (entry.fd == stderr_.pipe.read_fd) {
            read_available(stderr_);
        } else if (entry.fd == stdin_pipe_.write_fd) {
            feed_stdin();
        }
    }

    return {};
}

Expected<> SandboxedProcess::drain() {
    using std::chrono::steady_clock;

    close_fd(stdin_pipe_.write_fd);

    // Only a process that left the group can still hold the pipes open by now
    const auto give_up = steady_clock::now() + DRAIN_GRACE;

    while (stdout_.pipe.read_fd != -1 || stderr_.pipe.read_fd != -1) {
        const auto now = steady_clock::now();
        if (now >= give_up) {
            LOG_DEBUG("Output pipes of pid {} still open after {}; not waiting any longer", child_pid_, DRAIN_GRACE);
            break;
        }

        TRY(poll_once(std::min(POLL_SLICE, std::chrono::ceil<std::chrono::milliseconds>(give_up - now)), false));
    }

    return {};
}

void SandboxedProcess::read_available(Capture& capture) {
    std::array<char, READ_CHUNK_SIZE> chunk{};

    for (int i = 0; i < MAX_CHUNKS_PER_ROUND && capture.pipe.read_fd != -1; ++i) {
        auto res = linux::read(capture.pipe.read_fd, chunk);

        if (!res) {
            if (res.error() == std::errc::interrupted) {
                continue;
            }
            if (res.error() != std::errc::resource_unavailable_try_again) {
                close_fd(capture.pipe.read_fd);
            }
            return;
        }

        if (res.value() == 0) {
            close_fd(capture.pipe.read_fd);
            return;
        }

        append_bounded(capture, {chunk.data(), res.value()});
    }
}

void SandboxedProcess::append_bounded(Capture& capture, std::string_view chunk) {
    if (capture.truncated) {
        return;
    }

    const std::size_t room = capture.limit - capture.data.size();

    if (chunk.size() <= room) {
        capture.data.append(chunk);
        return;
    }

    capture.data.append(chunk.substr(0, room));
    capture.data.resize(utf8::complete_prefix_length(capture.data));
    capture.truncated = true;

    LOG_DEBUG("pid {} exceeded its output limit of {} bytes ({})", child_pid_, capture.limit,
              capture.overflow_reason);

    force_kill(capture.overflow_reason);
}

void SandboxedProcess::feed_stdin() {
    while (stdin_written_ < stdin_data_.size()) {
        auto res = linux::write(stdin_pipe_.write_fd, std::string_view{stdin_data_}.substr(stdin_written_));

        if (!res) {
            if (res.error() == std::errc::resource_unavailable_try_again) {
                return;
            }
            if (res.error() == std::errc::interrupted) {
                continue;
            }
            // Most likely EPIPE: the child won't read any more
            LOG_TRACE("Giving up on stdin of pid {}: {}", child_pid_, res.error().message());
            break;
        }

        stdin_written_ += res.value();
    }

    close_fd(stdin_pipe_.write_fd);
}

void SandboxedProcess::force_kill(ExecutionReason reason) {
    if (!kill_reason_) {
        kill_reason_ = reason;
    }

    if (kill_sent_ || child_pid_ == 0) {
        return;
    }

    kill_sent_ = true;

    // The whole group, so that anything the child spawned goes down with it
    if (!linux::kill(-child_pid_, SIGKILL) && !reaped_) {
        std::ignore = linux::kill(child_pid_, SIGKILL);
    }

    LOG_DEBUG("Sent SIGKILL to pid {} ({})", child_pid_, reason);
}

void SandboxedProcess::close_all() {
    close_pipe(stdin_pipe_);
    close_pipe(exec_error_pipe_);
    close_pipe(stdout_.pipe);
    close_pipe(stderr_.pipe);
}

ExecutionResult SandboxedProcess::decode(int wait_status) {
    ExecutionResult result;

    if (kill_reason_) {
        // The group was killed. The child may still have exited on its own before the overflow was read,
        // which is not a graceful exit either.
        result.termination_signal = linux::Signal{SIGKILL}.to_string();
    } else if (WIFEXITED(wait_status)) {
        result.exit_code = WEXITSTATUS(wait_status);
    } else if (WIFSIGNALED(wait_status)) {
        result.termination_signal = linux::Signal{WTERMSIG(wait_status)}.to_string();
    }

    result.standard_output = std::move(stdout_.data);
    result.standard_error = std::move(stderr_.data);
    result.reason = kill_reason_.value_or(ExecutionReason::Success);

    LOG_DEBUG("pid {} finished: exit_code={}, signal={}, reason={}", child_pid_, result.exit_code,
              result.termination_signal, result.reason);

    return result;
}

} // namespace grader
