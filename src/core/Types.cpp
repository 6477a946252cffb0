#include "podengine/core/Types.hpp"
#include "podengine/core/Utils.hpp"

#include <numeric>

namespace podengine {
namespace core {

namespace {

std::size_t saturatingSub(std::size_t a, std::size_t b) {
    return a > b ? a - b : 0;
}

// Title on the left, meta right-aligned so the row is `width` columns.
std::string withMeta(const std::string& title, const std::string& meta, std::size_t width) {
    const std::size_t metaWidth = saturatingSub(width, utils::utf8Length(title) + 3);
    const std::size_t pad = saturatingSub(metaWidth, utils::utf8Length(meta));
    return " " + title + " " + std::string(pad, ' ') + meta + " ";
}

} // namespace

std::string Episode::displayTitle(std::size_t width) const {
    std::string out;
    out += played ? "✔" : " ";
    out += path ? "↓" : " ";
    out += " " + utils::utf8Substr(title, 0, saturatingSub(width, 3));

    if (width > kEpisodeDurationLength) {
        const std::string meta = "[" + utils::formatDuration(duration) + "]";
        const std::string fitted =
            utils::utf8Substr(out, 0, saturatingSub(width, utils::utf8Length(meta) + 3));
        return withMeta(fitted, meta, width);
    }
    return " " + utils::utf8Substr(out, 0, saturatingSub(width, 2)) + " ";
}

std::size_t Podcast::numUnplayed() const {
    auto unplayed = episodes->map([](const Episode& ep) { return ep.played ? 0 : 1; }, false);
    return std::accumulate(unplayed.begin(), unplayed.end(), std::size_t{0});
}

std::string Podcast::displayTitle(std::size_t width) const {
    if (width > kPodcastUnplayedTotalsLength) {
        const std::string meta = "(" + std::to_string(numUnplayed()) + "/" +
                                 std::to_string(episodes->size(false)) + ")";
        const std::string fitted =
            utils::utf8Substr(title, 0, saturatingSub(width, utils::utf8Length(meta) + 3));
        return withMeta(fitted, meta, width);
    }
    return " " + utils::utf8Substr(title, 0, saturatingSub(width, 2)) + " ";
}

std::string NewEpisode::displayTitle(std::size_t width) const {
    const std::size_t used = utils::utf8Length(title) + utils::utf8Length(podTitle) + 9;
    const std::string padding(saturatingSub(width, used), ' ');
    const std::string full =
        std::string(" [") + (selected ? "✓" : " ") + "] " + title + " (" + podTitle + ")" +
        padding + " ";
    return utils::utf8Substr(full, 0, width);
}

} // namespace core
} // namespace podengine
