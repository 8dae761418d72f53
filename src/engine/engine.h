/**
 * Spotiflow - Main Engine Class
 */

#ifndef SPOTIFLOW_ENGINE_H
#define SPOTIFLOW_ENGINE_H

#include "spotiflow/types.h"
#include "loader.h"
#include "../core/store.h"
#include "../collab/feature_source.h"
#include "../collab/playlist_sink.h"
#include "../collab/genre_tagger.h"
#include "../matcher/distance.h"
#include "../matcher/playlist_model.h"
#include "../matcher/tour_builder.h"
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace spotiflow {

/**
 * Main Spotiflow Engine class.
 * Coordinates the store, the feature/playlist collaborators and tour building:
 * playlist -> PlaylistModel -> Tour -> new playlist.
 */
class Engine {
public:
    explicit Engine(const EngineConfig& config);
    ~Engine();

    // Non-copyable
    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    /**
     * Check if engine initialized successfully.
     */
    bool is_valid() const;

    /**
     * Get last error message.
     */
    const std::string& error() const { return last_error_; }

    const EngineConfig& config() const { return config_; }

    /* ========================================================================
     * Library Management
     * ======================================================================== */

    Result<bool> import_track(const TrackInfo& track, const std::optional<FeatureVector>& features);

    Result<bool> import_tags(const std::string& track_id, const std::vector<std::string>& tags);

    int track_count() const;

    std::optional<TrackRecord> get_track(const std::string& id);

    std::vector<TrackRecord> search_tracks(const std::string& pattern);

    /* ========================================================================
     * Playlists
     * ======================================================================== */

    /**
     * Get playlists of an owner, all playlists if owner is empty.
     */
    std::vector<PlaylistInfo> get_playlists(const std::string& owner);

    std::optional<PlaylistInfo> get_playlist(int64_t id);

    std::vector<TrackInfo> get_playlist_tracks(int64_t id);

    /**
     * Create a playlist through the playlist sink.
     * @return ID of the new playlist
     */
    Result<std::string> create_playlist(
        const std::string& owner,
        const std::string& name,
        const std::vector<std::string>& track_ids
    );

    /* ========================================================================
     * Ordering
     * ======================================================================== */

    /**
     * Load a stored playlist with the features of its tracks.
     */
    Result<PlaylistModel> load_playlist(int64_t playlist_id);

    /**
     * Build the similarity-ordered tour of a stored playlist.
     */
    Result<Tour> order_playlist(int64_t playlist_id, const TourOptions& options = TourOptions());

    /**
     * Nearest tracks to track_id within a playlist, closest first.
     */
    Result<std::vector<std::pair<std::string, float>>> find_similar(
        int64_t playlist_id,
        const std::string& track_id,
        int count = 5
    );

    /**
     * Store a tour as a new playlist.
     */
    Result<std::string> save_tour(const std::string& owner, const std::string& name, const Tour& tour);

    /**
     * Order a playlist and save the result as "<name><name_suffix>".
     * The owner is EngineConfig::owner_id, or the source playlist's owner
     * when that is empty.
     * @return ID of the new playlist
     */
    Result<std::string> improve_playlist(int64_t playlist_id, const TourOptions& options = TourOptions());

    /**
     * Genre of a track from its recorded tags.
     */
    std::optional<std::string> lookup_genre(const std::string& track_id);

    /**
     * Statistics of the most recent playlist load.
     */
    const LoadStats& last_load_stats() const { return load_stats_; }

private:
    ResultError record_error(ResultError error);

    EngineConfig config_;

    std::unique_ptr<Store> store_;
    std::unique_ptr<StoreFeatureSource> feature_source_;
    std::unique_ptr<StorePlaylistSink> playlist_sink_;
    std::unique_ptr<StoreTagSource> tag_source_;
    std::unique_ptr<GenreTagger> genre_tagger_;

    GreedyTourBuilder tour_builder_;
    DistanceMetric metric_;
    LoadStats load_stats_;

    std::string last_error_;
};

} // namespace spotiflow

#endif // SPOTIFLOW_ENGINE_H
