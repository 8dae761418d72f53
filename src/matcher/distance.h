/**
 * Spotiflow - Distance Metric
 */

#ifndef SPOTIFLOW_DISTANCE_H
#define SPOTIFLOW_DISTANCE_H

#include "spotiflow/types.h"
#include <string>
#include <utility>
#include <vector>

namespace spotiflow {

/**
 * Euclidean distance between feature vectors (lower = more similar).
 */
class DistanceMetric {
public:
    /**
     * Calculate the L2 distance between two feature vectors.
     * Fails with ErrorCode::InvalidDimension unless both vectors have
     * kFeatureDimensions finite components.
     */
    Result<float> distance(const FeatureVector& a, const FeatureVector& b) const;

    /**
     * Rank candidate tracks by distance to a target vector.
     * Candidates without features are skipped.
     * @param target Target vector
     * @param candidates Tracks to compare
     * @param count Maximum number of results
     * @return (track id, distance) pairs sorted by ascending distance
     */
    Result<std::vector<std::pair<std::string, float>>> find_nearest(
        const FeatureVector& target,
        const std::vector<TrackRecord>& candidates,
        int count = 10
    ) const;
};

} // namespace spotiflow

#endif // SPOTIFLOW_DISTANCE_H
