#pragma once

#include <grader/core/hook.hpp>
#include <grader/core/suite.hpp>
#include <grader/core/test.hpp>
#include <grader/exceptions.hpp>
#include <grader/runner/stats.hpp>

#include <string_view>

namespace grader {

enum class EventKind {
    RunBegin,      ///< stats: totals known before anything runs
    SuiteBegin,    ///< suite
    SuiteEnd,      ///< suite
    TestBegin,     ///< test
    TestRetry,     ///< test, failure of the attempt that will be retried
    TestEnd,       ///< test in its final state, failure if failed, hook if a before-each hook failed it
    HookFailed,    ///< hook, failure, test if it is an each-hook
    RunnableError, ///< a non-fatal problem (e.g. multiple completion) attributed to a test or hook
    RunEnd,        ///< final stats
};

constexpr std::string_view format_as(EventKind kind) {
    switch (kind) {
    case EventKind::RunBegin:
        return "runBegin";
    case EventKind::SuiteBegin:
        return "suiteBegin";
    case EventKind::SuiteEnd:
        return "suiteEnd";
    case EventKind::TestBegin:
        return "testBegin";
    case EventKind::TestRetry:
        return "testRetry";
    case EventKind::TestEnd:
        return "testEnd";
    case EventKind::HookFailed:
        return "hookFailed";
    case EventKind::RunnableError:
        return "runnableError";
    case EventKind::RunEnd:
        return "runEnd";
    }

    return "<unknown>";
}

/// A lifecycle event. Pointers are only valid for the duration of the dispatch; fields that
/// do not apply to ``kind`` are null.
struct Event
{
    EventKind kind;

    const Suite* suite = nullptr;
    const Test* test = nullptr;
    const Hook* hook = nullptr;
    const Failure* failure = nullptr;
    const Stats* stats = nullptr;
};

} // namespace grader
