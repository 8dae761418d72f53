/**
 * Spotiflow - Feature Source Implementation
 */

#include "feature_source.h"

namespace spotiflow {

std::optional<FeatureVector> StoreFeatureSource::fetch_features(const std::string& track_id) {
    auto record = store_.get_track(track_id);
    if (!record) {
        return std::nullopt;
    }
    return record->features;
}

} // namespace spotiflow
