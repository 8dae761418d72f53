/**
 * Spotiflow - Main Engine Implementation
 */

#include "engine.h"
#include <cstdio>

namespace spotiflow {

Engine::Engine(const EngineConfig& config)
    : config_(config)
    , store_(std::make_unique<Store>(config.db_path)) {

    if (!store_->is_open()) {
        last_error_ = "Failed to open database: " + store_->error();
        return;
    }

    feature_source_ = std::make_unique<StoreFeatureSource>(*store_);
    playlist_sink_ = std::make_unique<StorePlaylistSink>(*store_, config_.batch_size, config_.public_playlist);
    tag_source_ = std::make_unique<StoreTagSource>(*store_);
    genre_tagger_ = std::make_unique<GenreTagger>(*tag_source_);
}

Engine::~Engine() = default;

bool Engine::is_valid() const {
    return store_ && store_->is_open();
}

ResultError Engine::record_error(ResultError error) {
    last_error_ = error.message;
    return error;
}

/* ============================================================================
 * Library Management
 * ============================================================================ */

Result<bool> Engine::import_track(const TrackInfo& track, const std::optional<FeatureVector>& features) {
    if (!is_valid()) {
        return record_error({ErrorCode::StoreError, "Engine not initialized"});
    }

    auto result = store_->upsert_track(track, features);
    if (result.failed()) {
        return record_error(result.failure());
    }
    return true;
}

Result<bool> Engine::import_tags(const std::string& track_id, const std::vector<std::string>& tags) {
    if (!is_valid()) {
        return record_error({ErrorCode::StoreError, "Engine not initialized"});
    }

    auto result = store_->set_track_tags(track_id, tags);
    if (result.failed()) {
        return record_error(result.failure());
    }
    return true;
}

int Engine::track_count() const {
    return is_valid() ? store_->get_track_count() : 0;
}

std::optional<TrackRecord> Engine::get_track(const std::string& id) {
    return is_valid() ? store_->get_track(id) : std::nullopt;
}

std::vector<TrackRecord> Engine::search_tracks(const std::string& pattern) {
    return is_valid() ? store_->search_tracks(pattern) : std::vector<TrackRecord>{};
}

/* ============================================================================
 * Playlists
 * ============================================================================ */

std::vector<PlaylistInfo> Engine::get_playlists(const std::string& owner) {
    return is_valid() ? store_->get_playlists(owner) : std::vector<PlaylistInfo>{};
}

std::optional<PlaylistInfo> Engine::get_playlist(int64_t id) {
    return is_valid() ? store_->get_playlist(id) : std::nullopt;
}

std::vector<TrackInfo> Engine::get_playlist_tracks(int64_t id) {
    return is_valid() ? store_->get_playlist_tracks(id) : std::vector<TrackInfo>{};
}

Result<std::string> Engine::create_playlist(
    const std::string& owner,
    const std::string& name,
    const std::vector<std::string>& track_ids
) {
    if (!is_valid()) {
        return record_error({ErrorCode::StoreError, "Engine not initialized"});
    }

    auto created = playlist_sink_->create_and_populate(owner, name, track_ids);
    if (created.failed()) {
        return record_error(created.failure());
    }

    if (config_.verbose) {
        std::fprintf(stderr, "[Engine] created playlist %s '%s' with %zu tracks in %d batch(es)\n",
            created.value().c_str(), name.c_str(), track_ids.size(),
            playlist_sink_->last_batch_count());
    }
    return created;
}

/* ============================================================================
 * Ordering
 * ============================================================================ */

Result<PlaylistModel> Engine::load_playlist(int64_t playlist_id) {
    if (!is_valid()) {
        return record_error({ErrorCode::StoreError, "Engine not initialized"});
    }

    if (!store_->get_playlist(playlist_id)) {
        return record_error({ErrorCode::StoreError,
            "Playlist not found: " + std::to_string(playlist_id)});
    }

    PlaylistLoader loader(*feature_source_, config_.verbose);
    auto model = loader.load(store_->get_playlist_tracks(playlist_id));
    load_stats_ = loader.stats();

    if (model.failed()) {
        return record_error(model.failure());
    }
    return model;
}

Result<Tour> Engine::order_playlist(int64_t playlist_id, const TourOptions& options) {
    auto model = load_playlist(playlist_id);
    if (model.failed()) {
        return model.failure();
    }

    auto tour = tour_builder_.build(model.value(), options);
    if (tour.failed()) {
        return record_error(tour.failure());
    }

    if (!is_complete_tour(model.value(), tour.value())) {
        return record_error({ErrorCode::Generic,
            "Tour is not a permutation of playlist " + std::to_string(playlist_id)});
    }

    if (config_.verbose) {
        std::fprintf(stderr, "[Engine] ordered %zu tracks (%zu without features), total distance %.3f\n",
            tour.value().size(), tour.value().missing_feature_ids.size(),
            static_cast<double>(tour.value().total_distance));
    }
    return tour;
}

Result<std::vector<std::pair<std::string, float>>> Engine::find_similar(
    int64_t playlist_id,
    const std::string& track_id,
    int count
) {
    auto model = load_playlist(playlist_id);
    if (model.failed()) {
        return model.failure();
    }

    auto target = model.value().get(track_id);
    if (target.failed()) {
        return record_error(target.failure());
    }
    if (!target.value().features) {
        return record_error({ErrorCode::MissingFeatures,
            "Track has no features: " + track_id, {track_id}});
    }

    std::vector<TrackRecord> candidates;
    candidates.reserve(model.value().size());
    for (const auto& id : model.value().ordered_ids()) {
        if (id != track_id) {
            candidates.push_back(*model.value().find(id));
        }
    }

    auto nearest = metric_.find_nearest(*target.value().features, candidates, count);
    if (nearest.failed()) {
        return record_error(nearest.failure());
    }
    return nearest;
}

Result<std::string> Engine::save_tour(const std::string& owner, const std::string& name, const Tour& tour) {
    if (tour.empty()) {
        return record_error({ErrorCode::EmptyPlaylist, "Nothing to save: tour is empty"});
    }
    return create_playlist(owner, name, tour.track_ids);
}

Result<std::string> Engine::improve_playlist(int64_t playlist_id, const TourOptions& options) {
    if (!is_valid()) {
        return record_error({ErrorCode::StoreError, "Engine not initialized"});
    }

    auto source = store_->get_playlist(playlist_id);
    if (!source) {
        return record_error({ErrorCode::StoreError,
            "Playlist not found: " + std::to_string(playlist_id)});
    }

    auto tour = order_playlist(playlist_id, options);
    if (tour.failed()) {
        return tour.failure();
    }

    const std::string& owner = config_.owner_id.empty() ? source->owner : config_.owner_id;
    return save_tour(owner, source->name + config_.name_suffix, tour.value());
}

std::optional<std::string> Engine::lookup_genre(const std::string& track_id) {
    if (!is_valid()) return std::nullopt;

    auto track = store_->get_track(track_id);
    if (!track) return std::nullopt;

    return genre_tagger_->lookup_genre(track->info.name, track->info.artist);
}

} // namespace spotiflow
