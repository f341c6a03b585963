#include <prompter/core/time_parser.h>

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace prompter::core {

namespace {

std::optional<int> parseDigits(const std::string& s, size_t pos, size_t count) {
    if (pos + count > s.size()) {
        return std::nullopt;
    }
    int value = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) {
            return std::nullopt;
        }
        value = value * 10 + (s[i] - '0');
    }
    return value;
}

} // namespace

std::optional<TimePoint> TimeParser::parseISO8601(const std::string& isoStr) {
    std::tm tm = {};
    std::istringstream ss(isoStr);

    // Full form first (YYYY-MM-DDTHH:MM:SS)
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (!ss.fail()) {
        std::string rest;
        std::getline(ss, rest);

        auto tp = std::chrono::system_clock::from_time_t(::timegm(&tm));

        size_t pos = 0;
        if (pos < rest.size() && rest[pos] == '.') {
            ++pos;
            size_t digits = 0;
            int millis = 0;
            while (pos < rest.size() && std::isdigit(static_cast<unsigned char>(rest[pos]))) {
                // Anything finer than milliseconds is dropped
                if (digits < 3) {
                    millis = millis * 10 + (rest[pos] - '0');
                }
                ++digits;
                ++pos;
            }
            if (digits == 0) {
                return std::nullopt;
            }
            for (size_t d = digits; d < 3; ++d) {
                millis *= 10;
            }
            tp += std::chrono::milliseconds(millis);
        }

        if (pos == rest.size() || (rest[pos] == 'Z' && pos + 1 == rest.size())) {
            return tp;
        }

        if (rest[pos] == '+' || rest[pos] == '-') {
            // Offsets like +02:00 or -0500
            int sign = (rest[pos] == '+') ? 1 : -1;
            auto hours = parseDigits(rest, pos + 1, 2);
            if (!hours) {
                return std::nullopt;
            }
            size_t minutePos = pos + 3;
            if (minutePos < rest.size() && rest[minutePos] == ':') {
                ++minutePos;
            }
            int minutes = 0;
            if (minutePos < rest.size()) {
                auto m = parseDigits(rest, minutePos, 2);
                if (!m) {
                    return std::nullopt;
                }
                minutes = *m;
            }
            auto offset = std::chrono::hours(*hours) + std::chrono::minutes(minutes);
            return tp - (sign * offset);
        }
        return std::nullopt;
    }

    // Date-only form (YYYY-MM-DD)
    ss.clear();
    ss.str(isoStr);
    tm = {};
    ss >> std::get_time(&tm, "%Y-%m-%d");
    if (!ss.fail()) {
        std::string rest;
        std::getline(ss, rest);
        if (!rest.empty()) {
            return std::nullopt;
        }
        tm.tm_hour = 0;
        tm.tm_min = 0;
        tm.tm_sec = 0;
        return std::chrono::system_clock::from_time_t(::timegm(&tm));
    }

    return std::nullopt;
}

std::string TimeParser::formatISO8601(const TimePoint& tp) {
    auto ms = std::chrono::floor<std::chrono::milliseconds>(tp);
    auto secs = std::chrono::floor<std::chrono::seconds>(ms);
    auto fraction = (ms - secs).count();

    auto time_t = std::chrono::system_clock::to_time_t(secs);
    std::tm tm{};
    ::gmtime_r(&time_t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
        << fraction << 'Z';
    return oss.str();
}

TimePoint TimeParser::toMillis(const TimePoint& tp) {
    return std::chrono::time_point_cast<TimePoint::duration>(
        std::chrono::floor<std::chrono::milliseconds>(tp));
}

} // namespace prompter::core
