#include "core/types/Timestamp.hpp"

#include <cctype>
#include <cstdint>
#include <cstdio>
#include <ctime>

namespace signfleet::core {

std::string formatTimestamp(const std::chrono::system_clock::time_point& tp) {
    using namespace std::chrono;

    auto sinceEpoch = duration_cast<nanoseconds>(tp.time_since_epoch());
    auto secs = duration_cast<seconds>(sinceEpoch);
    auto nanos = sinceEpoch - secs;
    if (nanos.count() < 0) {
        secs -= seconds(1);
        nanos += seconds(1);
    }

    std::time_t time = static_cast<std::time_t>(secs.count());
    std::tm tm{};
    gmtime_r(&time, &tm);

    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%09lldZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec,
                  static_cast<long long>(nanos.count()));
    return buffer;
}

std::optional<std::chrono::system_clock::time_point> parseTimestamp(const std::string& text) {
    using namespace std::chrono;

    std::tm tm{};
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &tm.tm_year, &tm.tm_mon,
                    &tm.tm_mday, &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &consumed) != 6) {
        return std::nullopt;
    }
    tm.tm_year -= 1900;
    tm.tm_mon -= 1;

    size_t pos = static_cast<size_t>(consumed);
    int64_t nanos = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 9) {
                nanos = nanos * 10 + (text[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        for (; digits < 9; ++digits) {
            nanos *= 10;
        }
    }

    int64_t offsetSeconds = 0;
    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        int hours = 0;
        int minutes = 0;
        if (std::sscanf(text.c_str() + pos + 1, "%2d:%2d", &hours, &minutes) != 2) {
            return std::nullopt;
        }
        offsetSeconds = (hours * 3600 + minutes * 60) * (text[pos] == '+' ? 1 : -1);
    } else if (pos >= text.size() || (text[pos] != 'Z' && text[pos] != 'z')) {
        return std::nullopt;
    }

    auto secs = static_cast<int64_t>(timegm(&tm)) - offsetSeconds;
    return system_clock::time_point(
        duration_cast<system_clock::duration>(seconds(secs) + nanoseconds(nanos)));
}

} // namespace signfleet::core
