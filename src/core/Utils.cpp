#include "podengine/core/Utils.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cstdio>
#include <sstream>
#include <vector>

namespace podengine {
namespace core {
namespace utils {

namespace {

bool isContinuationByte(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

bool parseNumber(const std::string& text, std::int64_t& out) {
    if (text.empty()) {
        return false;
    }
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto result = std::from_chars(begin, end, out);
    return result.ec == std::errc() && result.ptr == end;
}

// Days since 1970-01-01 for a proleptic Gregorian date.
std::int64_t daysFromCivil(std::int64_t y, unsigned m, unsigned d) {
    y -= m <= 2 ? 1 : 0;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

struct CivilTime {
    std::int64_t year;
    unsigned month;
    unsigned day;
    unsigned hour;
    unsigned minute;
    unsigned second;
};

CivilTime civilFromUnix(std::int64_t seconds) {
    std::int64_t days = seconds / 86400;
    std::int64_t rem = seconds % 86400;
    if (rem < 0) {
        rem += 86400;
        --days;
    }

    days += 719468;
    const std::int64_t era = (days >= 0 ? days : days - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(days - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;

    CivilTime civil{};
    civil.day = doy - (153 * mp + 2) / 5 + 1;
    civil.month = mp < 10 ? mp + 3 : mp - 9;
    civil.year = static_cast<std::int64_t>(yoe) + era * 400 + (civil.month <= 2 ? 1 : 0);
    civil.hour = static_cast<unsigned>(rem / 3600);
    civil.minute = static_cast<unsigned>((rem % 3600) / 60);
    civil.second = static_cast<unsigned>(rem % 60);
    return civil;
}

std::optional<unsigned> monthFromName(const std::string& name) {
    static const std::array<const char*, 12> months = {
        "jan", "feb", "mar", "apr", "may", "jun",
        "jul", "aug", "sep", "oct", "nov", "dec"};
    if (name.size() < 3) {
        return std::nullopt;
    }
    const std::string prefix = toLower(name.substr(0, 3));
    for (std::size_t i = 0; i < months.size(); ++i) {
        if (prefix == months[i]) {
            return static_cast<unsigned>(i + 1);
        }
    }
    return std::nullopt;
}

// Offset east of UTC in seconds; unknown zones count as UTC.
std::int64_t zoneOffset(const std::string& zone) {
    if (zone.size() == 5 && (zone[0] == '+' || zone[0] == '-')) {
        std::int64_t hhmm = 0;
        if (parseNumber(zone.substr(1), hhmm)) {
            const std::int64_t offset = (hhmm / 100) * 3600 + (hhmm % 100) * 60;
            return zone[0] == '-' ? -offset : offset;
        }
        return 0;
    }
    const std::string upper = [&zone] {
        std::string s = zone;
        std::transform(s.begin(), s.end(), s.begin(), ::toupper);
        return s;
    }();
    if (upper == "EDT") return -4 * 3600;
    if (upper == "EST" || upper == "CDT") return -5 * 3600;
    if (upper == "CST" || upper == "MDT") return -6 * 3600;
    if (upper == "MST" || upper == "PDT") return -7 * 3600;
    if (upper == "PST") return -8 * 3600;
    return 0;
}

} // namespace

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\n\r");
    return value.substr(first, last - first + 1);
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), ::tolower);
    return value;
}

std::size_t utf8Length(const std::string& value) {
    std::size_t count = 0;
    for (unsigned char c : value) {
        if (!isContinuationByte(c)) {
            ++count;
        }
    }
    return count;
}

std::string utf8Substr(const std::string& value, std::size_t start, std::size_t length) {
    std::size_t index = 0;
    std::size_t byteStart = value.size();
    std::size_t byteEnd = value.size();
    for (std::size_t i = 0; i < value.size(); ++i) {
        if (isContinuationByte(static_cast<unsigned char>(value[i]))) {
            continue;
        }
        if (index == start) {
            byteStart = i;
        }
        if (index == start + length) {
            byteEnd = i;
            break;
        }
        ++index;
    }
    if (byteStart >= byteEnd) {
        return "";
    }
    return value.substr(byteStart, byteEnd - byteStart);
}

std::string formatDuration(std::optional<std::int64_t> seconds) {
    if (!seconds || *seconds < 0) {
        return "--:--:--";
    }
    const std::int64_t hours = *seconds / 3600;
    const std::int64_t minutes = (*seconds % 3600) / 60;
    const std::int64_t secs = *seconds % 60;
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%02lld:%02lld:%02lld",
                  static_cast<long long>(hours), static_cast<long long>(minutes),
                  static_cast<long long>(secs));
    return buffer;
}

std::optional<TimePoint> parseRfc2822(const std::string& value) {
    std::string text = value;
    std::replace(text.begin(), text.end(), ',', ' ');

    std::vector<std::string> tokens;
    std::istringstream in(text);
    std::string token;
    while (in >> token) {
        tokens.push_back(token);
    }
    if (!tokens.empty() && !std::isdigit(static_cast<unsigned char>(tokens[0][0]))) {
        tokens.erase(tokens.begin()); // weekday
    }
    if (tokens.size() < 4) {
        return std::nullopt;
    }

    std::int64_t day = 0;
    std::int64_t year = 0;
    if (!parseNumber(tokens[0], day) || !parseNumber(tokens[2], year)) {
        return std::nullopt;
    }
    auto month = monthFromName(tokens[1]);
    if (!month || day < 1 || day > 31) {
        return std::nullopt;
    }
    if (tokens[2].size() <= 2) {
        year += year < 50 ? 2000 : 1900;
    }

    std::vector<std::int64_t> clock;
    std::istringstream timeIn(tokens[3]);
    std::string part;
    while (std::getline(timeIn, part, ':')) {
        std::int64_t number = 0;
        if (!parseNumber(part, number)) {
            return std::nullopt;
        }
        clock.push_back(number);
    }
    if (clock.size() < 2 || clock.size() > 3) {
        return std::nullopt;
    }
    const std::int64_t hour = clock[0];
    const std::int64_t minute = clock[1];
    const std::int64_t second = clock.size() == 3 ? clock[2] : 0;
    if (hour > 23 || minute > 59 || second > 60 || hour < 0 || minute < 0 || second < 0) {
        return std::nullopt;
    }

    const std::int64_t offset = tokens.size() > 4 ? zoneOffset(tokens[4]) : 0;
    const std::int64_t seconds = daysFromCivil(year, *month, static_cast<unsigned>(day)) * 86400 +
                                 hour * 3600 + minute * 60 + second - offset;
    return fromUnixSeconds(seconds);
}

std::optional<std::int64_t> parseRfc3339(const std::string& value) {
    const std::string text = trim(value);
    if (text.size() < 19 || text[4] != '-' || text[7] != '-' || text[13] != ':' ||
        text[16] != ':') {
        return std::nullopt;
    }
    if (text[10] != 'T' && text[10] != 't' && text[10] != ' ') {
        return std::nullopt;
    }

    std::int64_t year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (!parseNumber(text.substr(0, 4), year) || !parseNumber(text.substr(5, 2), month) ||
        !parseNumber(text.substr(8, 2), day) || !parseNumber(text.substr(11, 2), hour) ||
        !parseNumber(text.substr(14, 2), minute) || !parseNumber(text.substr(17, 2), second)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 ||
        second > 60) {
        return std::nullopt;
    }

    std::size_t pos = 19;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            ++pos;
        }
    }

    std::int64_t offset = 0;
    if (pos < text.size()) {
        const char sign = text[pos];
        if (sign == 'Z' || sign == 'z') {
            offset = 0;
        } else if (sign == '+' || sign == '-') {
            std::string zone = text.substr(pos + 1);
            zone.erase(std::remove(zone.begin(), zone.end(), ':'), zone.end());
            std::int64_t hhmm = 0;
            if (zone.size() != 4 || !parseNumber(zone, hhmm)) {
                return std::nullopt;
            }
            offset = (hhmm / 100) * 3600 + (hhmm % 100) * 60;
            if (sign == '-') {
                offset = -offset;
            }
        } else {
            return std::nullopt;
        }
    }

    return daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day)) * 86400 +
           hour * 3600 + minute * 60 + second - offset;
}

std::string formatRfc3339(std::int64_t unixSeconds) {
    const CivilTime t = civilFromUnix(unixSeconds);
    char buffer[40];
    std::snprintf(buffer, sizeof(buffer), "%04lld-%02u-%02uT%02u:%02u:%02uZ",
                  static_cast<long long>(t.year), t.month, t.day, t.hour, t.minute, t.second);
    return buffer;
}

std::string pubdateSuffix(TimePoint pubdate) {
    const CivilTime t = civilFromUnix(toUnixSeconds(pubdate));
    char buffer[40];
    std::snprintf(buffer, sizeof(buffer), "_%04lld%02u%02u_%02u%02u%02u",
                  static_cast<long long>(t.year), t.month, t.day, t.hour, t.minute, t.second);
    return buffer;
}

std::int64_t toUnixSeconds(TimePoint time) {
    return std::chrono::duration_cast<std::chrono::seconds>(time.time_since_epoch()).count();
}

TimePoint fromUnixSeconds(std::int64_t seconds) {
    return TimePoint{std::chrono::seconds{seconds}};
}

std::int64_t currentTimeMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

std::int64_t currentTimeSeconds() {
    return toUnixSeconds(std::chrono::system_clock::now());
}

std::string sanitizeFilename(const std::string& name, std::size_t maxBytes) {
    static const std::string reserved = "<>:\"/\\|?*";

    std::string cleaned;
    cleaned.reserve(name.size());
    for (char ch : name) {
        const auto c = static_cast<unsigned char>(ch);
        if (c < 0x20 || c == 0x7f || reserved.find(ch) != std::string::npos) {
            continue;
        }
        cleaned.push_back(ch);
    }

    // CON, PRN, AUX, NUL, COM1-9, LPT1-9, with or without an extension.
    while (!cleaned.empty() && (cleaned.back() == '.' || cleaned.back() == ' ')) {
        cleaned.pop_back();
    }
    const std::string stem = toLower(cleaned.substr(0, cleaned.find('.')));
    const bool reservedName =
        stem == "con" || stem == "prn" || stem == "aux" || stem == "nul" ||
        (stem.size() == 4 && (stem.compare(0, 3, "com") == 0 || stem.compare(0, 3, "lpt") == 0) &&
         stem[3] >= '1' && stem[3] <= '9');
    if (reservedName) {
        cleaned.insert(cleaned.begin(), '_');
    }

    if (cleaned.size() > maxBytes) {
        std::size_t cut = maxBytes;
        while (cut > 0 && isContinuationByte(static_cast<unsigned char>(cleaned[cut]))) {
            --cut;
        }
        cleaned.resize(cut);
        while (!cleaned.empty() && (cleaned.back() == '.' || cleaned.back() == ' ')) {
            cleaned.pop_back();
        }
    }

    if (cleaned.empty()) {
        return "untitled";
    }
    return cleaned;
}

} // namespace utils
} // namespace core
} // namespace podengine
