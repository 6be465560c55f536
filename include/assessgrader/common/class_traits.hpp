#pragma once

#include <type_traits>

namespace assessgrader {

/// Movable, but not copyable. Inherit from this to annotate a class as such.
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

/// Neither movable nor copyable. Used for anything owning a mutex or a thread.
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

} // namespace assessgrader
