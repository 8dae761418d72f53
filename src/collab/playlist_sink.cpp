/**
 * Spotiflow - Playlist Sink Implementation
 */

#include "playlist_sink.h"
#include <algorithm>

namespace spotiflow {

Result<std::string> StorePlaylistSink::create_and_populate(
    const std::string& owner_id,
    const std::string& name,
    const std::vector<std::string>& track_ids
) {
    last_batch_count_ = 0;

    auto created = store_.create_playlist(owner_id, name, is_public_);
    if (created.failed()) {
        return created.failure();
    }
    int64_t playlist_id = created.value();

    size_t step = batch_size_ > 0 ? batch_size_ : std::max<size_t>(track_ids.size(), 1);

    for (size_t begin = 0; begin < track_ids.size(); begin += step) {
        size_t end = std::min(begin + step, track_ids.size());
        std::vector<std::string> batch(track_ids.begin() + begin, track_ids.begin() + end);

        auto appended = store_.append_playlist_tracks(playlist_id, batch);
        if (appended.failed()) {
            // Do not leave a half-filled playlist behind
            ResultError err = appended.failure();
            if (!store_.delete_playlist(playlist_id)) {
                err.message += " (playlist " + std::to_string(playlist_id) + " left partially filled)";
            }
            return err;
        }
        last_batch_count_++;
    }

    return std::to_string(playlist_id);
}

} // namespace spotiflow
