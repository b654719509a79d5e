#pragma once

#include <grader/core/runnable.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace grader {

enum class HookPhase { BeforeAll, AfterAll, BeforeEach, AfterEach };

constexpr std::string_view format_as(HookPhase phase) {
    switch (phase) {
    case HookPhase::BeforeAll:
        return "before all";
    case HookPhase::AfterAll:
        return "after all";
    case HookPhase::BeforeEach:
        return "before each";
    case HookPhase::AfterEach:
        return "after each";
    }

    return "<unknown>";
}

/// Setup or teardown body bound to a phase of the suite that declared it.
/// Titled like ``"before each" hook: name``.
class Hook : public Runnable
{
public:
    Hook(HookPhase phase, Body body, Suite& suite, const std::optional<std::string>& name = std::nullopt);

    RunnableType get_type() const override { return RunnableType::Hook; }

    HookPhase get_phase() const { return phase_; }

private:
    HookPhase phase_;
};

} // namespace grader
