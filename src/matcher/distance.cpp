/**
 * Spotiflow - Distance Metric Implementation
 */

#include "distance.h"
#include "../core/utils.h"
#include <algorithm>
#include <cmath>

namespace spotiflow {

namespace {

bool all_finite(const FeatureVector& v) {
    return std::all_of(v.values.begin(), v.values.end(),
        [](float x) { return std::isfinite(x); });
}

} // namespace

Result<float> DistanceMetric::distance(const FeatureVector& a, const FeatureVector& b) const {
    if (!a.is_valid() || !b.is_valid() || a.size() != b.size()) {
        return ResultError{ErrorCode::InvalidDimension,
            "Feature vectors must have " + std::to_string(kFeatureDimensions) +
            " components (got " + std::to_string(a.size()) + " and " +
            std::to_string(b.size()) + ")"};
    }
    if (!all_finite(a) || !all_finite(b)) {
        return ResultError{ErrorCode::InvalidDimension,
            "Feature vectors must not contain NaN or infinite components"};
    }

    float d = utils::euclidean_distance(a.values, b.values);
    if (!std::isfinite(d)) {
        return ResultError{ErrorCode::InvalidDimension, "Feature distance overflows"};
    }
    return d;
}

Result<std::vector<std::pair<std::string, float>>> DistanceMetric::find_nearest(
    const FeatureVector& target,
    const std::vector<TrackRecord>& candidates,
    int count
) const {
    std::vector<std::pair<std::string, float>> results;
    results.reserve(candidates.size());

    for (const auto& candidate : candidates) {
        if (!candidate.features) continue;

        auto d = distance(target, *candidate.features);
        if (d.failed()) {
            ResultError err = d.failure();
            err.track_ids.push_back(candidate.info.id);
            return err;
        }
        results.emplace_back(candidate.info.id, d.value());
    }

    // Stable so that equidistant candidates keep their input order
    std::stable_sort(results.begin(), results.end(),
        [](const auto& a, const auto& b) { return a.second < b.second; });

    if (count >= 0 && results.size() > static_cast<size_t>(count)) {
        results.resize(count);
    }

    return results;
}

} // namespace spotiflow
