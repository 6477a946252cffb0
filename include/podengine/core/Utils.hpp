#pragma once

#include "podengine/core/Types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace podengine {
namespace core {
namespace utils {

std::string trim(const std::string& value);
std::string toLower(std::string value);

// UTF-8 aware helpers; positions and lengths count code points.
std::size_t utf8Length(const std::string& value);
std::string utf8Substr(const std::string& value, std::size_t start, std::size_t length);

// "HH:MM:SS", or "--:--:--" when the duration is unknown.
std::string formatDuration(std::optional<std::int64_t> seconds);

// Parses RSS dates ("Wed, 02 Oct 2002 13:00:00 GMT"). Accepts a missing
// weekday, missing seconds, two-digit years, full month names, numeric
// offsets and the common North American zone names.
std::optional<TimePoint> parseRfc2822(const std::string& value);

// Parses "2024-01-05T10:20:30Z" / "...+02:00", fractional seconds ignored.
std::optional<std::int64_t> parseRfc3339(const std::string& value);
std::string formatRfc3339(std::int64_t unixSeconds);

// "_YYYYMMDD_HHMMSS" in UTC, appended to download file names.
std::string pubdateSuffix(TimePoint pubdate);

std::int64_t toUnixSeconds(TimePoint time);
TimePoint fromUnixSeconds(std::int64_t seconds);

constexpr std::size_t kMaxFileNameBytes = 255;

std::int64_t currentTimeMs();
std::int64_t currentTimeSeconds();

// Windows-safe file name: reserved and control characters removed,
// trailing dots and spaces trimmed, reserved device names avoided and the
// result truncated to maxBytes on a code point boundary.
std::string sanitizeFilename(const std::string& name, std::size_t maxBytes = kMaxFileNameBytes);

} // namespace utils
} // namespace core
} // namespace podengine
