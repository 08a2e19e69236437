#include "core/DateTime.hpp"
#include "core/StringUtil.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <vector>

namespace corkboard {
namespace core {

namespace {

struct CivilTime {
    int year = 0;
    int month = 0;
    int day = 0;
    int hour = 0;
    int minute = 0;
    int second = 0;
    int offsetSeconds = 0; // local = UTC + offset
};

bool isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int daysInMonth(int year, int month) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && isLeapYear(year)) {
        return 29;
    }
    return days[month - 1];
}

// Days since 1970-01-01 for a proleptic Gregorian date
int64_t daysFromCivil(int year, int month, int day) {
    year -= month <= 2 ? 1 : 0;
    const int64_t era = (year >= 0 ? year : year - 399) / 400;
    const int64_t yoe = year - era * 400;
    const int64_t doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

std::optional<Timestamp> toTimestamp(const CivilTime& t) {
    if (t.month < 1 || t.month > 12) return std::nullopt;
    if (t.day < 1 || t.day > daysInMonth(t.year, t.month)) return std::nullopt;
    if (t.hour < 0 || t.hour > 23) return std::nullopt;
    if (t.minute < 0 || t.minute > 59) return std::nullopt;
    // 60 allows a leap second, folded into the next minute
    if (t.second < 0 || t.second > 60) return std::nullopt;

    int64_t seconds = daysFromCivil(t.year, t.month, t.day) * 86400
        + t.hour * 3600 + t.minute * 60 + t.second
        - t.offsetSeconds;
    return fromEpochSeconds(seconds);
}

std::string toUpper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

bool allDigits(const std::string& text) {
    return !text.empty() && std::all_of(text.begin(), text.end(),
                                        [](unsigned char c) { return std::isdigit(c) != 0; });
}

// Reads exactly `count` digits starting at `pos`
bool readDigits(const std::string& text, size_t pos, size_t count, int& out) {
    if (pos + count > text.size()) {
        return false;
    }
    int value = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return false;
        }
        value = value * 10 + (text[i] - '0');
    }
    out = value;
    return true;
}

// Three-letter abbreviation or the full English name, any case
int monthFromName(const std::string& name) {
    static const char* months[] = {"JANUARY", "FEBRUARY", "MARCH", "APRIL", "MAY", "JUNE",
                                   "JULY", "AUGUST", "SEPTEMBER", "OCTOBER", "NOVEMBER", "DECEMBER"};
    std::string upper = toUpper(name);
    for (int i = 0; i < 12; ++i) {
        std::string full = months[i];
        if (upper == full || upper == full.substr(0, 3)) {
            return i + 1;
        }
    }
    return 0;
}

// Replaces (possibly nested) parenthesized comments with a space.
// Returns nullopt when the parentheses do not balance.
std::optional<std::string> stripComments(const std::string& text) {
    std::string stripped;
    int depth = 0;
    for (char c : text) {
        if (c == '(') {
            if (depth++ == 0) {
                stripped += ' ';
            }
        } else if (c == ')') {
            if (depth == 0) {
                return std::nullopt;
            }
            --depth;
        } else if (depth == 0) {
            stripped += c;
        }
    }
    if (depth != 0) {
        return std::nullopt;
    }
    return stripped;
}

std::optional<int> rfc2822ZoneOffset(const std::string& zone) {
    if (zone.empty()) {
        return 0;
    }
    if ((zone[0] == '+' || zone[0] == '-') && zone.size() == 5 && allDigits(zone.substr(1))) {
        int hours = std::stoi(zone.substr(1, 2));
        int minutes = std::stoi(zone.substr(3, 2));
        if (minutes > 59) {
            return std::nullopt;
        }
        int offset = hours * 3600 + minutes * 60;
        return zone[0] == '-' ? -offset : offset;
    }

    std::string upper = toUpper(zone);
    if (upper == "GMT" || upper == "UT" || upper == "UTC" || upper == "Z") return 0;
    if (upper == "EST") return -5 * 3600;
    if (upper == "EDT") return -4 * 3600;
    if (upper == "CST") return -6 * 3600;
    if (upper == "CDT") return -5 * 3600;
    if (upper == "MST") return -7 * 3600;
    if (upper == "MDT") return -6 * 3600;
    if (upper == "PST") return -8 * 3600;
    if (upper == "PDT") return -7 * 3600;
    return std::nullopt;
}

} // namespace

int64_t toEpochSeconds(const Timestamp& timestamp) {
    return std::chrono::duration_cast<std::chrono::seconds>(timestamp.time_since_epoch()).count();
}

Timestamp fromEpochSeconds(int64_t seconds) {
    return Timestamp(std::chrono::seconds(seconds));
}

std::optional<Timestamp> parseRfc2822(const std::string& text) {
    auto uncommented = stripComments(text);
    if (!uncommented) {
        return std::nullopt;
    }
    std::string s = trim(*uncommented);

    // Optional day-of-week
    auto comma = s.find(',');
    if (comma != std::string::npos) {
        s = s.substr(comma + 1);
    }

    std::istringstream in(s);
    std::vector<std::string> tokens;
    std::string token;
    while (in >> token) {
        tokens.push_back(token);
    }
    if (tokens.size() < 4 || tokens.size() > 5) {
        return std::nullopt;
    }

    CivilTime t;
    if (!allDigits(tokens[0]) || tokens[0].size() > 2) return std::nullopt;
    t.day = std::stoi(tokens[0]);

    t.month = monthFromName(tokens[1]);
    if (t.month == 0) return std::nullopt;

    if (!allDigits(tokens[2]) || tokens[2].size() > 4) return std::nullopt;
    t.year = std::stoi(tokens[2]);
    if (tokens[2].size() == 2) {
        t.year += t.year < 50 ? 2000 : 1900;
    } else if (tokens[2].size() == 3) {
        t.year += 1900;
    }

    const std::string& clock = tokens[3];
    if (!readDigits(clock, 0, 2, t.hour) || clock.size() < 5 || clock[2] != ':' ||
        !readDigits(clock, 3, 2, t.minute)) {
        return std::nullopt;
    }
    if (clock.size() == 8) {
        if (clock[5] != ':' || !readDigits(clock, 6, 2, t.second)) return std::nullopt;
    } else if (clock.size() != 5) {
        return std::nullopt;
    }

    auto offset = rfc2822ZoneOffset(tokens.size() == 5 ? tokens[4] : "");
    if (!offset) return std::nullopt;
    t.offsetSeconds = *offset;

    return toTimestamp(t);
}

std::optional<Timestamp> parseRfc3339(const std::string& text) {
    std::string s = trim(text);
    CivilTime t;

    // YYYY-MM-DDTHH:MM:SS
    if (s.size() < 20) return std::nullopt;
    if (!readDigits(s, 0, 4, t.year) || s[4] != '-' ||
        !readDigits(s, 5, 2, t.month) || s[7] != '-' ||
        !readDigits(s, 8, 2, t.day)) {
        return std::nullopt;
    }
    char separator = s[10];
    if (separator != 'T' && separator != 't' && separator != ' ') return std::nullopt;
    if (!readDigits(s, 11, 2, t.hour) || s[13] != ':' ||
        !readDigits(s, 14, 2, t.minute) || s[16] != ':' ||
        !readDigits(s, 17, 2, t.second)) {
        return std::nullopt;
    }

    size_t pos = 19;
    if (s[pos] == '.') {
        ++pos;
        size_t digits = pos;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
            ++pos;
        }
        if (pos == digits) return std::nullopt;
    }
    if (pos >= s.size()) return std::nullopt;

    std::string zone = s.substr(pos);
    if (zone == "Z" || zone == "z") {
        t.offsetSeconds = 0;
    } else if ((zone[0] == '+' || zone[0] == '-') && zone.size() == 6 && zone[3] == ':') {
        int hours = 0;
        int minutes = 0;
        if (!readDigits(zone, 1, 2, hours) || !readDigits(zone, 4, 2, minutes) ||
            hours > 23 || minutes > 59) {
            return std::nullopt;
        }
        int offset = hours * 3600 + minutes * 60;
        t.offsetSeconds = zone[0] == '-' ? -offset : offset;
    } else {
        return std::nullopt;
    }

    return toTimestamp(t);
}

std::string formatTimestamp(const Timestamp& timestamp) {
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm utc{};
    gmtime_r(&time, &utc);

    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%d %H:%M");
    return out.str();
}

} // namespace core
} // namespace corkboard
