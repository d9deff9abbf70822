#include "common/TimeUtils.h"

#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>

namespace replaylab {
namespace utils {

namespace {
constexpr long long MS_PER_DAY = 86400000LL;
// Epoch values below this are treated as seconds (year 5138 in seconds)
constexpr long long SECONDS_EPOCH_LIMIT = 100000000000LL;

// Days since 1970-01-01 for a proleptic Gregorian date
long long daysFromCivil(long long y, unsigned m, unsigned d) {
    y -= m <= 2 ? 1 : 0;
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long long>(doe) - 719468;
}

void civilFromDays(long long z, long long& y, unsigned& m, unsigned& d) {
    z += 719468;
    const long long era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    y = static_cast<long long>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y += (m <= 2) ? 1 : 0;
}

bool readDigits(const std::string& s, size_t& pos, size_t count, int& out) {
    if (pos + count > s.size()) return false;
    int value = 0;
    for (size_t i = 0; i < count; ++i) {
        const char c = s[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        value = value * 10 + (c - '0');
    }
    pos += count;
    out = value;
    return true;
}

bool expectChar(const std::string& s, size_t& pos, char c) {
    if (pos < s.size() && s[pos] == c) {
        ++pos;
        return true;
    }
    return false;
}
} // namespace

std::string TimeUtils::toIso8601(TimestampMs ts_ms) {
    long long days = ts_ms / MS_PER_DAY;
    long long rem = ts_ms % MS_PER_DAY;
    if (rem < 0) {
        rem += MS_PER_DAY;
        --days;
    }

    long long y = 0;
    unsigned m = 0;
    unsigned d = 0;
    civilFromDays(days, y, m, d);

    const long long hh = rem / 3600000;
    const long long mm = (rem / 60000) % 60;
    const long long ss = (rem / 1000) % 60;
    const long long ms = rem % 1000;

    char buffer[40];
    std::snprintf(buffer, sizeof(buffer), "%04lld-%02u-%02uT%02lld:%02lld:%02lld.%03lldZ",
                  y, m, d, hh, mm, ss, ms);
    return std::string(buffer);
}

std::optional<TimestampMs> TimeUtils::parseIso8601(const std::string& text) {
    size_t pos = 0;
    int year = 0, month = 0, day = 0;
    if (!readDigits(text, pos, 4, year) || !expectChar(text, pos, '-') ||
        !readDigits(text, pos, 2, month) || !expectChar(text, pos, '-') ||
        !readDigits(text, pos, 2, day)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31) {
        return std::nullopt;
    }

    int hour = 0, minute = 0, second = 0, millis = 0;
    if (pos < text.size() && (text[pos] == 'T' || text[pos] == ' ')) {
        ++pos;
        if (!readDigits(text, pos, 2, hour) || !expectChar(text, pos, ':') ||
            !readDigits(text, pos, 2, minute)) {
            return std::nullopt;
        }
        if (expectChar(text, pos, ':')) {
            if (!readDigits(text, pos, 2, second)) return std::nullopt;
            if (expectChar(text, pos, '.')) {
                int scale = 100;
                bool any = false;
                while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
                    millis += (text[pos] - '0') * scale;
                    scale /= 10;
                    ++pos;
                    any = true;
                }
                if (!any) return std::nullopt;
            }
        }
    }
    if (hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    long long offset_minutes = 0;
    if (pos < text.size()) {
        if (text[pos] == 'Z' || text[pos] == 'z') {
            ++pos;
        } else if (text[pos] == '+' || text[pos] == '-') {
            const int sign = (text[pos] == '-') ? -1 : 1;
            ++pos;
            int oh = 0, om = 0;
            if (!readDigits(text, pos, 2, oh)) return std::nullopt;
            expectChar(text, pos, ':');
            if (pos < text.size() && !readDigits(text, pos, 2, om)) return std::nullopt;
            offset_minutes = sign * (oh * 60 + om);
        }
    }
    if (pos != text.size()) {
        return std::nullopt;
    }

    const long long days = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    long long ts = days * MS_PER_DAY +
                   (static_cast<long long>(hour) * 3600 + minute * 60 + second) * 1000LL + millis;
    ts -= offset_minutes * 60000LL;
    return ts;
}

std::optional<TimestampMs> TimeUtils::parseTimestamp(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }

    bool numeric = true;
    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (!(std::isdigit(static_cast<unsigned char>(c)) || (i == 0 && c == '-'))) {
            numeric = false;
            break;
        }
    }
    if (numeric) {
        try {
            return toMsTimestamp(std::stoll(text));
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return parseIso8601(text);
}

TimestampMs TimeUtils::toMsTimestamp(long long ts) {
    if (ts > -SECONDS_EPOCH_LIMIT && ts < SECONDS_EPOCH_LIMIT) {
        return ts * 1000LL;
    }
    return ts;
}

TimestampMs TimeUtils::nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

std::string TimeUtils::nowCompactUtc() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t secs = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&secs, &tm);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y%m%d_%H%M%S", &tm);
    return std::string(buffer);
}

} // namespace utils
} // namespace replaylab
