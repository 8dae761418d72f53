/**
 * Spotiflow - Greedy Tour Builder Implementation
 */

#include "tour_builder.h"
#include "../core/utils.h"

namespace spotiflow {

Result<Tour> GreedyTourBuilder::build(const PlaylistModel& model, const TourOptions& options) const {
    Tour tour;

    if (model.empty()) {
        if (options.seed_id) {
            return ResultError{ErrorCode::UnknownTrack,
                "Seed track not in playlist: " + *options.seed_id, {*options.seed_id}};
        }
        return tour;
    }

    // Split into rankable tracks and tracks without features, both in insertion order
    std::vector<std::string> ranked;
    std::vector<std::string> missing;
    for (const auto& id : model.ordered_ids()) {
        if (model.find(id)->has_features()) {
            ranked.push_back(id);
        } else {
            missing.push_back(id);
        }
    }

    if (!missing.empty() && options.missing_features == MissingFeaturePolicy::Reject) {
        return ResultError{ErrorCode::MissingFeatures,
            "No features for " + std::to_string(missing.size()) + " track(s): " +
            utils::join(missing, ", "), missing};
    }

    if (ranked.empty() && !options.seed_id) {
        tour.track_ids = missing;
        tour.missing_feature_ids = missing;
        return tour;
    }

    auto start = select_start(model, options, ranked);
    if (start.failed()) {
        return start.failure();
    }

    std::string current = start.value();

    std::vector<std::string> remaining;
    remaining.reserve(ranked.size());
    for (const auto& id : ranked) {
        if (id != current) {
            remaining.push_back(id);
        }
    }

    tour.track_ids.reserve(model.size());
    tour.track_ids.push_back(current);

    while (!remaining.empty()) {
        const FeatureVector& from = *model.find(current)->features;

        size_t best = 0;
        float best_distance = 0.0f;

        for (size_t i = 0; i < remaining.size(); ++i) {
            auto d = metric_.distance(from, *model.find(remaining[i])->features);
            if (d.failed()) {
                return ResultError{ErrorCode::InvalidDimension,
                    current + " -> " + remaining[i] + ": " + d.error(),
                    {current, remaining[i]}};
            }

            // Strict comparison keeps the earliest candidate on ties
            if (i == 0 || d.value() < best_distance) {
                best = i;
                best_distance = d.value();
            }
        }

        current = remaining[best];
        remaining.erase(remaining.begin() + static_cast<std::ptrdiff_t>(best));

        tour.track_ids.push_back(current);
        tour.total_distance += best_distance;
        tour.iterations++;
    }

    tour.track_ids.insert(tour.track_ids.end(), missing.begin(), missing.end());
    tour.missing_feature_ids = std::move(missing);

    return tour;
}

Result<std::string> GreedyTourBuilder::select_start(
    const PlaylistModel& model,
    const TourOptions& options,
    const std::vector<std::string>& ranked
) const {
    if (options.seed_id) {
        const std::string& seed = *options.seed_id;
        const TrackRecord* record = model.find(seed);
        if (!record) {
            return ResultError{ErrorCode::UnknownTrack,
                "Seed track not in playlist: " + seed, {seed}};
        }
        if (!record->has_features()) {
            return ResultError{ErrorCode::MissingFeatures,
                "Seed track has no features: " + seed, {seed}};
        }
        return seed;
    }

    auto first = model.first_inserted();
    if (first.failed()) {
        return first;
    }
    if (model.find(first.value())->has_features()) {
        return first;
    }

    // Default seed cannot be ranked; walk from the earliest track that can
    return ranked.front();
}

} // namespace spotiflow
