#pragma once

#include <grader/common/class_traits.hpp>
#include <grader/common/expected.hpp>
#include <grader/common/linux.hpp>
#include <grader/sandbox/execute.hpp>

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>

namespace grader {

/// A child process with piped stdio, supervised until it exits or is killed.
///
/// The child gets its own process group, so that a forced kill also reaches anything it spawned.
/// Once the child exits, the group is killed as well. Nothing it started outlives the execution.
class SandboxedProcess : NonMovable
{
public:
    SandboxedProcess(std::string executable, std::vector<std::string> arguments, ExecuteOptions options);

    /// Kills and reaps the child if it is still around
    ~SandboxedProcess();

    /// Fork and exec. Fails if the executable could not be run.
    Expected<> start();

    /// Feed stdin and collect output until the child is reaped
    Expected<ExecutionResult> supervise();

private:
    /// One captured output stream
    struct Capture
    {
        linux::Pipe pipe;
        std::string data;
        std::size_t limit;
        ExecutionReason overflow_reason;
        bool truncated = false;
    };

    Expected<> spawn(std::vector<std::string> argv);
    [[noreturn]] void exec_child(std::vector<char*>& argv) const;

    /// Read whatever is available right now. Returns at end of file or when the pipe would block.
    void read_available(Capture& capture);
    void append_bounded(Capture& capture, std::string_view chunk);

    void feed_stdin();

    /// Wait up to ``slice`` for pipe activity and service it
    Expected<> poll_once(std::chrono::milliseconds slice, bool feed_input);
    /// Collect output still buffered after the child exited, until end of file or a short grace period
    Expected<> drain();

    /// SIGKILL the whole process group. The first reason recorded wins.
    void force_kill(ExecutionReason reason);

    void close_all();

    ExecutionResult decode(int wait_status);

    std::string executable_;
    std::vector<std::string> arguments_;
    ExecuteOptions options_;

    pid_t child_pid_ = 0;
    bool reaped_ = false;
    bool kill_sent_ = false;
    std::optional<ExecutionReason> kill_reason_;

    linux::Pipe stdin_pipe_;
    linux::Pipe exec_error_pipe_;
    std::string stdin_data_;
    std::size_t stdin_written_ = 0;

    Capture stdout_;
    Capture stderr_;
};

} // namespace grader
