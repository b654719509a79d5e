#include "catch2_custom.hpp"

#include "sandbox/utf8.hpp"

#include <grader/sandbox/execute.hpp>

#include <chrono>
#include <fstream>
#include <future>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include <sys/types.h>

using namespace grader;
using namespace std::chrono_literals;

namespace {

/// True once ``pid`` no longer exists or is only a zombie waiting for its new parent
bool is_gone(pid_t pid) {
    std::ifstream stat{fmt::format("/proc/{}/stat", pid)};
    if (!stat) {
        return true;
    }

    std::string line;
    std::getline(stat, line);

    // The state follows the parenthesized command name
    const auto state_pos = line.rfind(')');
    return state_pos == std::string::npos || state_pos + 2 >= line.size() || line[state_pos + 2] == 'Z' ||
           line[state_pos + 2] == 'X';
}

} // namespace

TEST_CASE("Echo exits cleanly") {
    auto res = execute("echo", {"5"});

    REQUIRE(res);
    REQUIRE(res->exit_code == 0);
    REQUIRE_FALSE(res->termination_signal.has_value());
    REQUIRE(res->standard_output == "5\n");
    REQUIRE(res->standard_error.empty());
    REQUIRE(res->reason == ExecutionReason::Success);
}

TEST_CASE("Exit codes and stderr are captured") {
    auto res = execute("sh", {"-c", "echo out; echo err >&2; exit 3"});

    REQUIRE(res);
    REQUIRE(res->exit_code == 3);
    REQUIRE(res->standard_output == "out\n");
    REQUIRE(res->standard_error == "err\n");
    // A non-zero exit is not a sandbox failure
    REQUIRE(res->reason == ExecutionReason::Success);
}

TEST_CASE("Standard input is written with a trailing newline") {
    SECTION("Line based programs") {
        auto res = execute("sh", {"-c", "read line; echo \"got $line\""}, {.standard_input = "hello"});

        REQUIRE(res);
        REQUIRE(res->standard_output == "got hello\n");
    }

    SECTION("Reading until end of file") {
        auto res = execute("cat", {}, {.standard_input = "first\nsecond"});

        REQUIRE(res);
        REQUIRE(res->standard_output == "first\nsecond\n");
    }

    SECTION("Without input, stdin is closed") {
        auto res = execute("cat", {}, {.timeout = 2s});

        REQUIRE(res);
        REQUIRE(res->exit_code == 0);
        REQUIRE(res->standard_output.empty());
        REQUIRE(res->reason == ExecutionReason::Success);
    }
}

TEST_CASE("Output over the limit kills the program") {
    constexpr std::size_t LIMIT = 1024;

    SECTION("Standard output") {
        auto res = execute("sh", {"-c", "while true; do echo aaaaaaaaaaaaaaaa; done"},
                           {.standard_output_limit = LIMIT, .timeout = 10s});

        REQUIRE(res);
        REQUIRE(res->reason == ExecutionReason::StandardOutputExceeded);
        REQUIRE(res->standard_output.size() <= LIMIT);
        REQUIRE_FALSE(res->exit_code.has_value());
        REQUIRE(res->termination_signal == "SIGKILL");
    }

    SECTION("Standard error") {
        auto res = execute("sh", {"-c", "while true; do echo bbbbbbbbbbbbbbbb >&2; done"},
                           {.standard_error_limit = LIMIT, .timeout = 10s});

        REQUIRE(res);
        REQUIRE(res->reason == ExecutionReason::StandardErrorExceeded);
        REQUIRE(res->standard_error.size() <= LIMIT);
        REQUIRE(res->termination_signal == "SIGKILL");
    }

    SECTION("Output exactly at the limit is fine") {
        auto res = execute("printf", {"abcd"}, {.standard_output_limit = 4});

        REQUIRE(res);
        REQUIRE(res->reason == ExecutionReason::Success);
        REQUIRE(res->standard_output == "abcd");
    }
}

TEST_CASE("Output over the limit from a program that exits at once") {
    // Whether the overflow is read before or after the exit, the result is the same
    for (int i = 0; i < 20; ++i) {
        auto res = execute("sh", {"-c", "printf aaaaaaaaaaaaaaaaaaaa"}, {.standard_output_limit = 5});

        REQUIRE(res);
        REQUIRE(res->reason == ExecutionReason::StandardOutputExceeded);
        REQUIRE(res->standard_output == "aaaaa");
        REQUIRE_FALSE(res->exit_code.has_value());
        REQUIRE(res->termination_signal == "SIGKILL");
    }
}

TEST_CASE("Background jobs don't outlive the program") {
    const auto start = std::chrono::steady_clock::now();

    auto res = execute("sh", {"-c", "sleep 30 & echo $!"}, {.timeout = 10s});

    REQUIRE(res);
    REQUIRE(res->reason == ExecutionReason::Success);
    REQUIRE(res->exit_code == 0);
    REQUIRE(std::chrono::steady_clock::now() - start < 5s);

    const pid_t background_pid = std::stoi(res->standard_output);

    // SIGKILL has been sent; give the kernel a moment to tear the process down
    bool gone = is_gone(background_pid);
    for (int i = 0; i < 100 && !gone; ++i) {
        std::this_thread::sleep_for(20ms);
        gone = is_gone(background_pid);
    }

    REQUIRE(gone);
}

TEST_CASE("Programs running past the timeout are killed") {
    const auto start = std::chrono::steady_clock::now();

    SECTION("Plain sleep") {
        auto res = execute("sleep", {"10"}, {.timeout = 100ms});

        REQUIRE(res);
        REQUIRE(res->reason == ExecutionReason::TimedOut);
        REQUIRE(res->termination_signal == "SIGKILL");
    }

    SECTION("Ignoring SIGTERM makes no difference") {
        auto res = execute("sh", {"-c", "trap '' TERM; sleep 10"}, {.timeout = 100ms});

        REQUIRE(res);
        REQUIRE(res->reason == ExecutionReason::TimedOut);
        REQUIRE_FALSE(res->exit_code.has_value());
    }

    REQUIRE(std::chrono::steady_clock::now() - start < 5s);
}

TEST_CASE("Output produced before a timeout is kept") {
    auto res = execute("sh", {"-c", "echo partial; sleep 10"}, {.timeout = 200ms});

    REQUIRE(res);
    REQUIRE(res->reason == ExecutionReason::TimedOut);
    REQUIRE(res->standard_output == "partial\n");
}

TEST_CASE("Programs that can't be run are errors") {
    auto res = execute("this-program-does-not-exist-anywhere", {});

    REQUIRE(res.has_error());
    REQUIRE(res.error() == std::errc::no_such_file_or_directory);
}

TEST_CASE("Concurrent executions are independent") {
    std::vector<std::future<Expected<ExecutionResult>>> futures;

    for (int i = 0; i < 4; ++i) {
        futures.push_back(execute_async("sh", {"-c", "read n; echo $((n * 2))"}, {.standard_input = std::to_string(i)}));
    }

    for (int i = 0; i < 4; ++i) {
        auto res = futures[static_cast<std::size_t>(i)].get();

        REQUIRE(res);
        REQUIRE(res->standard_output == std::to_string(i * 2) + "\n");
    }
}

TEST_CASE("Truncation never splits a UTF-8 sequence") {
    REQUIRE(utf8::complete_prefix_length("") == 0);
    REQUIRE(utf8::complete_prefix_length("plain") == 5);
    // "é" is 2 bytes
    REQUIRE(utf8::complete_prefix_length("caf\xC3\xA9") == 5);
    REQUIRE(utf8::complete_prefix_length("caf\xC3") == 3);
    // "€" is 3 bytes
    REQUIRE(utf8::complete_prefix_length("\xE2\x82\xAC") == 3);
    REQUIRE(utf8::complete_prefix_length("\xE2\x82") == 0);

    SECTION("From a real program") {
        // 3 bytes per character, so a limit of 4 can only hold one complete character
        auto res = execute("printf", {"\xE2\x82\xAC\xE2\x82\xAC\xE2\x82\xAC"}, {.standard_output_limit = 4});

        REQUIRE(res);
        REQUIRE(res->reason == ExecutionReason::StandardOutputExceeded);
        REQUIRE(res->standard_output == "\xE2\x82\xAC");
        REQUIRE_FALSE(res->exit_code.has_value());
    }
}
