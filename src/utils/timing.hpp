// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef timing_hpp
#define timing_hpp

#include <chrono>
#include <ostream>

namespace varcanon { namespace utils {

struct TimeInterval
{
    using Clock     = std::chrono::system_clock;
    using TimePoint = Clock::time_point;
    
    TimePoint start, end;
};

// Prints the two largest units, e.g. 950ms, 42s, 3m 12s or 2h 5m
inline std::ostream& operator<<(std::ostream& os, const TimeInterval& interval)
{
    using namespace std::chrono;
    const auto elapsed = interval.end - interval.start;
    const auto millis = duration_cast<milliseconds>(elapsed).count();
    if (millis < 1000) return os << millis << "ms";
    const auto total_secs = duration_cast<seconds>(elapsed).count();
    if (total_secs < 60) return os << total_secs << 's';
    const auto total_mins = total_secs / 60;
    long long major {total_mins}, minor {total_secs % 60};
    char major_unit {'m'}, minor_unit {'s'};
    if (total_mins >= 60) {
        major = total_mins / 60;
        minor = total_mins % 60;
        major_unit = 'h';
        minor_unit = 'm';
    }
    os << major << major_unit;
    if (minor > 0) os << ' ' << minor << minor_unit;
    return os;
}

} // namespace utils
} // namespace varcanon

#endif
