#include "metrics/types.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace urbanmetrics {
namespace metrics {

std::string toString(Confidence confidence) {
    switch (confidence) {
        case Confidence::HIGH:
            return "high";
        case Confidence::MEDIUM:
            return "medium";
        case Confidence::LOW:
        default:
            return "low";
    }
}

std::string toString(InsightType type) {
    switch (type) {
        case InsightType::POSITIVE:
            return "positive";
        case InsightType::CAUTION:
            return "caution";
        case InsightType::NEUTRAL:
        default:
            return "neutral";
    }
}

std::string currentTimestampISO8601() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm utc_time{};
#if defined(_WIN32)
    gmtime_s(&utc_time, &seconds);
#else
    gmtime_r(&seconds, &utc_time);
#endif

    std::ostringstream oss;
    oss << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return oss.str();
}

} // namespace metrics
} // namespace urbanmetrics
