#pragma once

#include <assessgrader/common/expected.hpp>
#include <assessgrader/logging.hpp>

#include <array>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <ctime>
#include <functional>
#include <string>
#include <system_error>

namespace assessgrader {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/// Source of "now". Everything time dependent takes one of these so tests can drive the clock by hand
using ClockFn = std::function<TimePoint()>;

inline ClockFn system_clock_fn() {
    return [] { return Clock::now(); };
}

__attribute__((format(strftime, 2, 0))) // help the compiler check `format` for validity
inline Expected<std::string>
to_utc_string(TimePoint time_point, const char* format = "%Y-%m-%dT%H:%M:%SZ") {
    std::time_t time = Clock::to_time_t(time_point);

    std::tm tm_buf{};

    if (gmtime_r(&time, &tm_buf) != &tm_buf) {
        auto err = errno;
        LOG_WARN("gmtime_r failed to convert to UTC: {}", get_err_msg(err));
        return std::error_code{err, std::generic_category()};
    }

    constexpr std::size_t BUF_SZ = 128;
    std::array<char, BUF_SZ> buf{};

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wformat-nonliteral"
    if (std::size_t num_chars = std::strftime(buf.data(), buf.size(), format, &tm_buf)) {
        return std::string{buf.data(), num_chars};
    }
#pragma GCC diagnostic pop

    LOG_WARN("strftime failed to format time point");
    return std::make_error_code(std::errc::value_too_large);
}

/// Whole seconds elapsed between two points, never negative
inline long long seconds_between(TimePoint from, TimePoint to) {
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(to - from).count();
    return secs < 0 ? 0 : secs;
}

} // namespace assessgrader
