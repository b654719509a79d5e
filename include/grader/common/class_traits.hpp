#pragma once

#include <type_traits>

namespace grader {

/// Inherit from this to make a type move-only.
class NonCopyable
{
public:
    NonCopyable() = default;
    ~NonCopyable() = default;

    NonCopyable(const NonCopyable&) = delete;
    NonCopyable& operator=(const NonCopyable&) = delete;

    NonCopyable(NonCopyable&&) = default;
    NonCopyable& operator=(NonCopyable&&) = default;
};

/// Inherit from this to pin a type in memory (neither copyable nor movable).
/// Used for tree nodes and anything that hands out stable references to itself.
class NonMovable
{
public:
    NonMovable() = default;
    ~NonMovable() = default;

    NonMovable(const NonMovable&) = delete;
    NonMovable& operator=(const NonMovable&) = delete;

    NonMovable(NonMovable&&) = delete;
    NonMovable& operator=(NonMovable&&) = delete;
};

static_assert(!std::is_copy_constructible_v<NonCopyable> && std::is_move_constructible_v<NonCopyable>);
static_assert(!std::is_copy_constructible_v<NonMovable> && !std::is_move_constructible_v<NonMovable>);

} // namespace grader
