#pragma once

#include <prompter/core/types.h>
#include <chrono>
#include <optional>
#include <string>

namespace prompter::core {

/**
 * @brief Utility for converting session timestamps to and from ISO 8601 text
 */
class TimeParser {
public:
    /**
     * @brief Parse an ISO 8601 date/time string (always interpreted as UTC)
     *
     * Supported forms:
     * - "2024-01-01T10:20:30Z", "2024-01-01T10:20:30.123Z"
     * - "2024-01-01T10:20:30+02:00" (offset applied)
     * - "2024-01-01"
     *
     * @param isoStr ISO 8601 formatted string
     * @return Parsed time point or nullopt if invalid format
     */
    static std::optional<TimePoint> parseISO8601(const std::string& isoStr);

    /**
     * @brief Format a time_point as "YYYY-MM-DDTHH:MM:SS.mmmZ"
     */
    static std::string formatISO8601(const TimePoint& tp);

    /**
     * @brief Truncate a time point to millisecond precision so that it survives
     * a format/parse round trip unchanged
     */
    static TimePoint toMillis(const TimePoint& tp);
};

} // namespace prompter::core
