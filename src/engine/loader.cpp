/**
 * Spotiflow - Playlist Loader Implementation
 */

#include "loader.h"
#include <cstdio>
#include <exception>

namespace spotiflow {

Result<PlaylistModel> PlaylistLoader::load(const std::vector<TrackInfo>& tracks) {
    stats_ = LoadStats();
    PlaylistModel model;

    for (const auto& track : tracks) {
        if (model.contains(track.id)) {
            stats_.duplicates++;
            if (verbose_) {
                std::fprintf(stderr, "[Loader] skipping repeated track %s\n", track.id.c_str());
            }
            continue;
        }

        auto features = fetch(track);
        if (!features) {
            stats_.missing_features++;
            if (verbose_) {
                std::fprintf(stderr, "[Loader] no features for %s (%s - %s)\n",
                    track.id.c_str(), track.artist.c_str(), track.name.c_str());
            }
        }

        auto inserted = model.insert(track, std::move(features));
        if (inserted.failed()) {
            return inserted.failure();
        }
        stats_.loaded++;
    }

    if (verbose_) {
        std::fprintf(stderr, "[Loader] loaded=%d missing_features=%d duplicates=%d source_errors=%d\n",
            stats_.loaded, stats_.missing_features, stats_.duplicates, stats_.source_errors);
    }

    return model;
}

std::optional<FeatureVector> PlaylistLoader::fetch(const TrackInfo& track) {
    try {
        return source_.fetch_features(track.id);
    } catch (const std::exception& e) {
        stats_.source_errors++;
        if (verbose_) {
            std::fprintf(stderr, "[Loader] feature lookup failed for %s: %s\n",
                track.id.c_str(), e.what());
        }
        return std::nullopt;
    }
}

} // namespace spotiflow
