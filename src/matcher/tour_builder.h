/**
 * Spotiflow - Greedy Tour Builder
 */

#ifndef SPOTIFLOW_TOUR_BUILDER_H
#define SPOTIFLOW_TOUR_BUILDER_H

#include "spotiflow/types.h"
#include "distance.h"
#include "playlist_model.h"
#include <string>
#include <vector>

namespace spotiflow {

/**
 * Orders a playlist so that consecutive tracks are close in feature space,
 * using a nearest-neighbour walk.
 *
 * The walk starts at TourOptions::seed_id, or at the first inserted track.
 * From the current track it appends the nearest remaining track; on an exact
 * tie the candidate inserted earliest wins, so a fixed model and seed always
 * produce the same tour. O(n^2) distance evaluations.
 *
 * Tracks without features cannot be ranked. With
 * MissingFeaturePolicy::AppendAtEnd they are appended after the walk in
 * insertion order; with MissingFeaturePolicy::Reject the build fails with
 * ErrorCode::MissingFeatures listing them.
 */
class GreedyTourBuilder {
public:
    GreedyTourBuilder() = default;

    /**
     * Build a tour over every track of the model.
     *
     * An empty model yields an empty tour. An explicit seed must be in the
     * model (ErrorCode::UnknownTrack) and must have features
     * (ErrorCode::MissingFeatures). When the default seed has no features
     * the walk starts at the earliest inserted track that has some.
     */
    Result<Tour> build(const PlaylistModel& model, const TourOptions& options = TourOptions()) const;

private:
    DistanceMetric metric_;

    Result<std::string> select_start(
        const PlaylistModel& model,
        const TourOptions& options,
        const std::vector<std::string>& ranked
    ) const;
};

} // namespace spotiflow

#endif // SPOTIFLOW_TOUR_BUILDER_H
