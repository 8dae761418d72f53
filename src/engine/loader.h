/**
 * Spotiflow - Playlist Loader
 */

#ifndef SPOTIFLOW_LOADER_H
#define SPOTIFLOW_LOADER_H

#include "spotiflow/types.h"
#include "../collab/feature_source.h"
#include "../matcher/playlist_model.h"
#include <vector>

namespace spotiflow {

struct LoadStats {
    int loaded = 0;             // Tracks inserted into the model
    int missing_features = 0;   // Inserted without features
    int duplicates = 0;         // Repeated ids skipped
    int source_errors = 0;      // Feature lookups that threw
};

/**
 * Builds a PlaylistModel from retrieved playlist entries.
 *
 * Features are fetched once per distinct id, in playlist order. A repeated id
 * keeps its first position. A feature lookup that throws is logged and the
 * track is inserted without features.
 */
class PlaylistLoader {
public:
    explicit PlaylistLoader(FeatureSource& source, bool verbose = false)
        : source_(source), verbose_(verbose) {}

    Result<PlaylistModel> load(const std::vector<TrackInfo>& tracks);

    const LoadStats& stats() const { return stats_; }

private:
    std::optional<FeatureVector> fetch(const TrackInfo& track);

    FeatureSource& source_;
    bool verbose_;
    LoadStats stats_;
};

} // namespace spotiflow

#endif // SPOTIFLOW_LOADER_H
