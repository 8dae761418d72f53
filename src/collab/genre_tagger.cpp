/**
 * Spotiflow - Genre Tagger Implementation
 */

#include "genre_tagger.h"
#include "../core/utils.h"

namespace spotiflow {

std::vector<std::string> StoreTagSource::fetch_tags(
    const std::string& track_name,
    const std::string& artist_name
) {
    return store_.get_tags_for(track_name, artist_name);
}

const std::vector<std::string>& GenreTagger::vocabulary() {
    static const std::vector<std::string> genres = {
        "electronic", "jazz", "hip hop", "pop", "rock",
        "alternative rock", "metal", "indie"
    };
    return genres;
}

std::optional<std::string> GenreTagger::lookup_genre(
    const std::string& track_name,
    const std::string& artist_name
) {
    return match_genre(source_.fetch_tags(track_name, artist_name));
}

std::optional<std::string> GenreTagger::match_genre(const std::vector<std::string>& tags) {
    for (const auto& tag : tags) {
        std::string lowered = utils::to_lower(utils::trim(tag));
        if (lowered.empty()) continue;

        for (const auto& genre : vocabulary()) {
            if (utils::contains(genre, lowered) || utils::contains(lowered, genre)) {
                return genre;
            }
        }
    }
    return std::nullopt;
}

} // namespace spotiflow
