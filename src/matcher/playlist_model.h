/**
 * Spotiflow - Playlist Model
 */

#ifndef SPOTIFLOW_PLAYLIST_MODEL_H
#define SPOTIFLOW_PLAYLIST_MODEL_H

#include "spotiflow/types.h"
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace spotiflow {

/**
 * Track id -> (metadata, features) for one playlist.
 *
 * Insertion order is kept in a separate append-only list. The first inserted
 * id is the default tour seed, so callers that need reproducible tours must
 * insert in a fixed order.
 */
class PlaylistModel {
public:
    PlaylistModel() = default;

    /**
     * Add a track. Fails with ErrorCode::DuplicateTrack if the id is present.
     * @return Insertion index of the track
     */
    Result<size_t> insert(const TrackInfo& info, std::optional<FeatureVector> features);

    /**
     * Look up a track. Fails with ErrorCode::UnknownTrack.
     */
    Result<TrackRecord> get(const std::string& id) const;

    /**
     * Non-failing lookup, nullptr if the id is unknown.
     */
    const TrackRecord* find(const std::string& id) const;

    bool contains(const std::string& id) const { return tracks_.count(id) > 0; }

    /**
     * Earliest inserted id. Fails with ErrorCode::EmptyPlaylist.
     */
    Result<std::string> first_inserted() const;

    /**
     * All track ids.
     */
    std::unordered_set<std::string> ids() const;

    /**
     * Track ids in insertion order.
     */
    const std::vector<std::string>& ordered_ids() const { return order_; }

    /**
     * Ids of tracks without features, in insertion order.
     */
    std::vector<std::string> ids_missing_features() const;

    size_t size() const { return order_.size(); }
    bool empty() const { return order_.empty(); }

private:
    std::vector<std::string> order_;
    std::unordered_map<std::string, TrackRecord> tracks_;
};

/**
 * Check that a tour lists every track of the model exactly once.
 */
bool is_complete_tour(const PlaylistModel& model, const Tour& tour);

} // namespace spotiflow

#endif // SPOTIFLOW_PLAYLIST_MODEL_H
