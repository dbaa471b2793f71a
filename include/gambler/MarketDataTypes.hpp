#pragma once
#include <string>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace gambler {

using TimePoint = std::chrono::time_point<std::chrono::system_clock>;

// ---- Price bar for a single instrument ----

struct Bar {
    std::string symbol;
    TimePoint   ts{};
    double      open{0.0};
    double      high{0.0};
    double      low{0.0};
    double      close{0.0};
    double      volume{0.0};
};

inline long long to_epoch_ms(const TimePoint& tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

inline TimePoint from_epoch_ms(long long ms) {
    return TimePoint(std::chrono::milliseconds(ms));
}

// "2000-01-03", used as the prefix of strategy log lines
inline std::string format_date(const TimePoint& tp) {
    auto time_t_val = std::chrono::system_clock::to_time_t(tp);
    std::ostringstream oss;
    oss << std::put_time(std::gmtime(&time_t_val), "%Y-%m-%d");
    return oss.str();
}

// "2000-01-03T00:00:00Z"
inline std::string format_iso8601(const TimePoint& tp) {
    auto time_t_val = std::chrono::system_clock::to_time_t(tp);
    std::ostringstream oss;
    oss << std::put_time(std::gmtime(&time_t_val), "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

}
