// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef timing_hpp
#define timing_hpp

#include <chrono>
#include <ostream>
#include <utility>

namespace polyscan { namespace utils {

struct TimeInterval
{
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    TimePoint start, end;
};

inline TimeInterval::TimePoint now() noexcept
{
    return TimeInterval::Clock::now();
}

template <typename T>
auto duration(const TimeInterval& interval)
{
    return std::chrono::duration_cast<T>(interval.end - interval.start);
}

// Calls f and records how long it took in interval.
template <typename F>
auto time_call(F&& f, TimeInterval& interval)
{
    interval.start = now();
    auto result = std::forward<F>(f)();
    interval.end = now();
    return result;
}

// e.g. 250ms, 4.2s, 3m 7s, 2h 15m
inline std::ostream& operator<<(std::ostream& os, const TimeInterval& interval)
{
    const auto ms = duration<std::chrono::milliseconds>(interval).count();
    if (ms < 1000) {
        os << ms << "ms";
        return os;
    }
    if (ms < 60000) {
        os << ms / 1000 << '.' << (ms % 1000) / 100 << 's';
        return os;
    }
    const auto secs = ms / 1000;
    const auto mins = secs / 60;
    if (mins < 60) {
        os << mins << 'm';
        if (secs % 60 > 0) os << ' ' << secs % 60 << 's';
        return os;
    }
    os << mins / 60 << 'h';
    if (mins % 60 > 0) os << ' ' << mins % 60 << 'm';
    return os;
}

} // namespace utils
} // namespace polyscan

#endif
