/**
 * Spotiflow - Playlist Sink
 */

#ifndef SPOTIFLOW_PLAYLIST_SINK_H
#define SPOTIFLOW_PLAYLIST_SINK_H

#include "spotiflow/types.h"
#include "../core/store.h"
#include <string>
#include <vector>

namespace spotiflow {

/**
 * Creates a playlist and fills it with an ordered list of track ids.
 * Splitting large lists into backend-sized batches is up to the sink.
 */
class PlaylistSink {
public:
    virtual ~PlaylistSink() = default;

    /**
     * @return ID of the created playlist
     */
    virtual Result<std::string> create_and_populate(
        const std::string& owner_id,
        const std::string& name,
        const std::vector<std::string>& track_ids
    ) = 0;
};

/**
 * Writes playlists to the local store, at most batch_size tracks per append.
 */
class StorePlaylistSink : public PlaylistSink {
public:
    StorePlaylistSink(Store& store, size_t batch_size = 100, bool is_public = true)
        : store_(store), batch_size_(batch_size), is_public_(is_public) {}

    Result<std::string> create_and_populate(
        const std::string& owner_id,
        const std::string& name,
        const std::vector<std::string>& track_ids
    ) override;

    size_t batch_size() const { return batch_size_; }

    // Number of append calls made by the last create_and_populate()
    int last_batch_count() const { return last_batch_count_; }

private:
    Store& store_;
    size_t batch_size_;
    bool is_public_;
    int last_batch_count_ = 0;
};

} // namespace spotiflow

#endif // SPOTIFLOW_PLAYLIST_SINK_H
