/**
 * Spotiflow - Database Store
 */

#ifndef SPOTIFLOW_STORE_H
#define SPOTIFLOW_STORE_H

#include "spotiflow/types.h"
#include <sqlite3.h>
#include <string>
#include <vector>
#include <optional>

namespace spotiflow {

/**
 * SQLite-based storage for tracks, their features and playlists.
 */
class Store {
public:
    explicit Store(const std::string& db_path);
    ~Store();

    // Non-copyable
    Store(const Store&) = delete;
    Store& operator=(const Store&) = delete;

    // Move constructible
    Store(Store&&) noexcept;
    Store& operator=(Store&&) noexcept;

    bool is_open() const { return db_ != nullptr; }
    const std::string& error() const { return last_error_; }

    /* ========================================================================
     * Track Operations
     * ======================================================================== */

    /**
     * Insert or update a track. std::nullopt features are stored as NULL.
     */
    Result<bool> upsert_track(const TrackInfo& track, const std::optional<FeatureVector>& features);

    /**
     * Get track by ID.
     */
    std::optional<TrackRecord> get_track(const std::string& id);

    /**
     * Search tracks by name or artist pattern (SQL LIKE).
     */
    std::vector<TrackRecord> search_tracks(const std::string& pattern);

    /**
     * Get track count.
     */
    int get_track_count();

    /* ========================================================================
     * Playlist Operations
     * ======================================================================== */

    /**
     * Create an empty playlist.
     * @return ID of the new playlist
     */
    Result<int64_t> create_playlist(const std::string& owner, const std::string& name, bool is_public);

    /**
     * Append tracks after the current last position, in one transaction.
     * @return Number of tracks appended
     */
    Result<int> append_playlist_tracks(int64_t playlist_id, const std::vector<std::string>& track_ids);

    /**
     * Get playlists of an owner, all playlists if owner is empty.
     */
    std::vector<PlaylistInfo> get_playlists(const std::string& owner);

    /**
     * Get playlist by ID.
     */
    std::optional<PlaylistInfo> get_playlist(int64_t id);

    /**
     * Get playlists of an owner with an exact name, newest last.
     */
    std::vector<PlaylistInfo> find_playlists_by_name(const std::string& owner, const std::string& name);

    /**
     * Get the tracks of a playlist in position order. Entries whose track is
     * not in the tracks table carry only their id.
     */
    std::vector<TrackInfo> get_playlist_tracks(int64_t playlist_id);

    /**
     * Delete a playlist and its entries.
     */
    bool delete_playlist(int64_t id);

    /* ========================================================================
     * Tags
     * ======================================================================== */

    /**
     * Replace the free-text tags of a track. Order is kept as rank.
     */
    Result<bool> set_track_tags(const std::string& track_id, const std::vector<std::string>& tags);

    /**
     * Tags of the tracks matching name and artist (case-insensitive), by rank.
     */
    std::vector<std::string> get_tags_for(const std::string& name, const std::string& artist);

private:
    void init_schema();

    bool exec(const char* sql);

    // Row readers for the column order of the SELECTs in store.cpp
    TrackRecord read_track_row(sqlite3_stmt* stmt);
    PlaylistInfo read_playlist_row(sqlite3_stmt* stmt);

    // Serialization helpers for feature vectors
    std::vector<uint8_t> serialize_floats(const std::vector<float>& data);
    std::vector<float> deserialize_floats(const void* data, int size);

    sqlite3* db_ = nullptr;
    std::string last_error_;
};

} // namespace spotiflow

#endif // SPOTIFLOW_STORE_H
