#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>

namespace podengine {
namespace core {

// Reads the real duration of a downloaded audio file.
class MediaProbe {
public:
    virtual ~MediaProbe() = default;

    // Seconds, or empty when the container cannot be read.
    virtual std::optional<std::int64_t> durationSeconds(const std::filesystem::path& file) = 0;
};

} // namespace core
} // namespace podengine
