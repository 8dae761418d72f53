/**
 * Spotiflow - Feature Source
 */

#ifndef SPOTIFLOW_FEATURE_SOURCE_H
#define SPOTIFLOW_FEATURE_SOURCE_H

#include "spotiflow/types.h"
#include "../core/store.h"
#include <optional>
#include <string>

namespace spotiflow {

/**
 * Supplies feature vectors by track id.
 *
 * std::nullopt means no features are available. Implementations may throw
 * std::exception on transport failures; PlaylistLoader treats that as absent.
 */
class FeatureSource {
public:
    virtual ~FeatureSource() = default;

    virtual std::optional<FeatureVector> fetch_features(const std::string& track_id) = 0;
};

/**
 * Reads features from the tracks table.
 */
class StoreFeatureSource : public FeatureSource {
public:
    explicit StoreFeatureSource(Store& store) : store_(store) {}

    std::optional<FeatureVector> fetch_features(const std::string& track_id) override;

private:
    Store& store_;
};

} // namespace spotiflow

#endif // SPOTIFLOW_FEATURE_SOURCE_H
