/**
 * Spotiflow - Playlist Model Implementation
 */

#include "playlist_model.h"

namespace spotiflow {

Result<size_t> PlaylistModel::insert(const TrackInfo& info, std::optional<FeatureVector> features) {
    if (tracks_.count(info.id) > 0) {
        return ResultError{ErrorCode::DuplicateTrack,
            "Track already in playlist: " + info.id, {info.id}};
    }

    size_t index = order_.size();
    order_.push_back(info.id);
    tracks_.emplace(info.id, TrackRecord{info, std::move(features)});
    return index;
}

Result<TrackRecord> PlaylistModel::get(const std::string& id) const {
    const TrackRecord* record = find(id);
    if (!record) {
        return ResultError{ErrorCode::UnknownTrack, "Unknown track: " + id, {id}};
    }
    return *record;
}

const TrackRecord* PlaylistModel::find(const std::string& id) const {
    auto it = tracks_.find(id);
    return it != tracks_.end() ? &it->second : nullptr;
}

Result<std::string> PlaylistModel::first_inserted() const {
    if (order_.empty()) {
        return ResultError{ErrorCode::EmptyPlaylist, "Playlist has no tracks"};
    }
    return order_.front();
}

std::unordered_set<std::string> PlaylistModel::ids() const {
    return std::unordered_set<std::string>(order_.begin(), order_.end());
}

std::vector<std::string> PlaylistModel::ids_missing_features() const {
    std::vector<std::string> missing;
    for (const auto& id : order_) {
        if (!tracks_.at(id).has_features()) {
            missing.push_back(id);
        }
    }
    return missing;
}

bool is_complete_tour(const PlaylistModel& model, const Tour& tour) {
    if (tour.size() != model.size()) return false;

    std::unordered_set<std::string> seen;
    for (const auto& id : tour.track_ids) {
        if (!model.contains(id) || !seen.insert(id).second) {
            return false;
        }
    }
    return true;
}

} // namespace spotiflow
