/**
 * Spotiflow - C API Implementation
 */

#include "spotiflow/spotiflow.h"
#include "../engine/engine.h"
#include <cstdlib>
#include <cstring>

using namespace spotiflow;

/* ============================================================================
 * Internal Structures
 * ============================================================================ */

struct SpotiflowEngine {
    std::unique_ptr<Engine> engine;
    std::string last_error;
    SpotiflowError last_code = SPOTIFLOW_OK;
};

struct TourHandleImpl {
    Tour tour;
};

namespace {

SpotiflowError to_c_error(ErrorCode code) {
    switch (code) {
        case ErrorCode::EmptyPlaylist:    return SPOTIFLOW_ERROR_EMPTY_PLAYLIST;
        case ErrorCode::DuplicateTrack:   return SPOTIFLOW_ERROR_DUPLICATE_TRACK;
        case ErrorCode::UnknownTrack:     return SPOTIFLOW_ERROR_UNKNOWN_TRACK;
        case ErrorCode::InvalidDimension: return SPOTIFLOW_ERROR_INVALID_DIMENSION;
        case ErrorCode::MissingFeatures:  return SPOTIFLOW_ERROR_MISSING_FEATURES;
        case ErrorCode::StoreError:       return SPOTIFLOW_ERROR_DATABASE_ERROR;
        case ErrorCode::Generic:          return SPOTIFLOW_ERROR_INTERNAL;
    }
    return SPOTIFLOW_ERROR_INTERNAL;
}

SpotiflowError fail(SpotiflowEngine* engine, const ResultError& error) {
    engine->last_error = error.message;
    engine->last_code = to_c_error(error.code);
    return engine->last_code;
}

SpotiflowError reject(SpotiflowEngine* engine, const std::string& message) {
    engine->last_error = message;
    engine->last_code = SPOTIFLOW_ERROR_INVALID_ARGUMENT;
    return engine->last_code;
}

SpotiflowError succeed(SpotiflowEngine* engine) {
    engine->last_code = SPOTIFLOW_OK;
    return SPOTIFLOW_OK;
}

TourOptions to_tour_options(const SpotiflowTourOptions* options) {
    TourOptions cpp_options;
    if (options) {
        if (options->seed_track_id && options->seed_track_id[0] != '\0') {
            cpp_options.seed_id = std::string(options->seed_track_id);
        }
        cpp_options.missing_features = options->missing_policy == SPOTIFLOW_MISSING_REJECT
            ? MissingFeaturePolicy::Reject
            : MissingFeaturePolicy::AppendAtEnd;
    }
    return cpp_options;
}

int64_t parse_playlist_id(const std::string& id) {
    return static_cast<int64_t>(std::strtoll(id.c_str(), nullptr, 10));
}

char** copy_strings(const std::vector<std::string>& strings) {
    char** out = new char*[strings.size()];
    for (size_t i = 0; i < strings.size(); ++i) {
        out[i] = strdup(strings[i].c_str());
    }
    return out;
}

} // namespace

/* ============================================================================
 * Engine Lifecycle
 * ============================================================================ */

SpotiflowEngine* spotiflow_create(const char* db_path) {
    if (!db_path) return nullptr;

    SpotiflowConfig config = {};
    config.db_path = db_path;
    config.public_playlist = 1;
    config.batch_size = 100;
    return spotiflow_create_with_config(&config);
}

SpotiflowEngine* spotiflow_create_with_config(const SpotiflowConfig* config) {
    if (!config || !config->db_path) return nullptr;

    EngineConfig cpp_config;
    cpp_config.db_path = config->db_path;
    if (config->owner_id) cpp_config.owner_id = config->owner_id;
    if (config->name_suffix) cpp_config.name_suffix = config->name_suffix;
    cpp_config.public_playlist = config->public_playlist != 0;
    cpp_config.batch_size = config->batch_size > 0 ? static_cast<size_t>(config->batch_size) : 0;
    cpp_config.verbose = config->verbose != 0;

    auto handle = new SpotiflowEngine();
    handle->engine = std::make_unique<Engine>(cpp_config);

    if (!handle->engine->is_valid()) {
        delete handle;
        return nullptr;
    }

    return handle;
}

void spotiflow_destroy(SpotiflowEngine* engine) {
    delete engine;
}

const char* spotiflow_get_error(SpotiflowEngine* engine) {
    if (!engine) return "Invalid engine";
    return engine->last_error.c_str();
}

SpotiflowError spotiflow_get_last_error_code(SpotiflowEngine* engine) {
    if (!engine) return SPOTIFLOW_ERROR_INVALID_ARGUMENT;
    return engine->last_code;
}

/* ============================================================================
 * Library
 * ============================================================================ */

SpotiflowError spotiflow_import_track(
    SpotiflowEngine* engine,
    const SpotiflowTrackInfo* track,
    const SpotiflowFeatures* features
) {
    if (!engine || !engine->engine) return SPOTIFLOW_ERROR_INVALID_ARGUMENT;
    if (!track || !track->id) return reject(engine, "Track id is required");

    TrackInfo info;
    info.id = track->id;
    info.name = track->name ? track->name : "";
    info.artist = track->artist ? track->artist : "";

    std::optional<FeatureVector> vector;
    if (features) {
        AudioFeatures f;
        f.danceability = features->danceability;
        f.energy = features->energy;
        f.instrumentalness = features->instrumentalness;
        f.loudness = features->loudness;
        f.speechiness = features->speechiness;
        f.tempo = features->tempo;
        f.valence = features->valence;
        vector = FeatureVector::from_audio_features(f);
    }

    auto result = engine->engine->import_track(info, vector);
    if (result.failed()) {
        return fail(engine, result.failure());
    }
    return succeed(engine);
}

SpotiflowError spotiflow_import_tags(
    SpotiflowEngine* engine,
    const char* track_id,
    const char** tags,
    int count
) {
    if (!engine || !engine->engine) return SPOTIFLOW_ERROR_INVALID_ARGUMENT;
    if (!track_id || count < 0 || (count > 0 && !tags)) {
        return reject(engine, "Track id and tag list are required");
    }

    std::vector<std::string> cpp_tags;
    for (int i = 0; i < count; ++i) {
        if (tags[i]) cpp_tags.emplace_back(tags[i]);
    }

    auto result = engine->engine->import_tags(track_id, cpp_tags);
    if (result.failed()) {
        return fail(engine, result.failure());
    }
    return succeed(engine);
}

int spotiflow_get_track_count(SpotiflowEngine* engine) {
    if (!engine || !engine->engine) return 0;
    return engine->engine->track_count();
}

SpotiflowError spotiflow_get_track_info(
    SpotiflowEngine* engine,
    const char* track_id,
    SpotiflowTrackInfo* info
) {
    if (!engine || !engine->engine) return SPOTIFLOW_ERROR_INVALID_ARGUMENT;
    if (!track_id || !info) return reject(engine, "Track id and output are required");

    auto track = engine->engine->get_track(track_id);
    if (!track) {
        return fail(engine, {ErrorCode::UnknownTrack,
            std::string("Unknown track: ") + track_id, {track_id}});
    }

    info->id = strdup(track->info.id.c_str());
    info->name = strdup(track->info.name.c_str());
    info->artist = strdup(track->info.artist.c_str());

    return succeed(engine);
}

void spotiflow_track_info_free(SpotiflowTrackInfo* info) {
    if (!info) return;
    free(const_cast<char*>(info->id));
    free(const_cast<char*>(info->name));
    free(const_cast<char*>(info->artist));
    info->id = info->name = info->artist = nullptr;
}

char* spotiflow_lookup_genre(SpotiflowEngine* engine, const char* track_id) {
    if (!engine || !engine->engine || !track_id) return nullptr;

    auto genre = engine->engine->lookup_genre(track_id);
    return genre ? strdup(genre->c_str()) : nullptr;
}

/* ============================================================================
 * Playlists
 * ============================================================================ */

SpotiflowError spotiflow_create_playlist(
    SpotiflowEngine* engine,
    const char* owner,
    const char* name,
    const char** track_ids,
    int count,
    int64_t* out_playlist_id
) {
    if (!engine || !engine->engine) return SPOTIFLOW_ERROR_INVALID_ARGUMENT;
    if (!owner || !name || count < 0 || (count > 0 && !track_ids)) {
        return reject(engine, "Owner, name and track list are required");
    }

    std::vector<std::string> ids;
    ids.reserve(count);
    for (int i = 0; i < count; ++i) {
        if (!track_ids[i]) return reject(engine, "Track id " + std::to_string(i) + " is NULL");
        ids.emplace_back(track_ids[i]);
    }

    auto created = engine->engine->create_playlist(owner, name, ids);
    if (created.failed()) {
        return fail(engine, created.failure());
    }

    if (out_playlist_id) *out_playlist_id = parse_playlist_id(created.value());
    return succeed(engine);
}

SpotiflowError spotiflow_list_playlists(
    SpotiflowEngine* engine,
    const char* owner,
    SpotiflowPlaylistInfo** out_playlists,
    int* out_count
) {
    if (!engine || !engine->engine) return SPOTIFLOW_ERROR_INVALID_ARGUMENT;
    if (!out_playlists || !out_count) return reject(engine, "Output pointers are required");

    auto playlists = engine->engine->get_playlists(owner ? owner : "");

    *out_count = static_cast<int>(playlists.size());
    *out_playlists = new SpotiflowPlaylistInfo[playlists.size()];

    for (size_t i = 0; i < playlists.size(); ++i) {
        SpotiflowPlaylistInfo& info = (*out_playlists)[i];
        info.id = playlists[i].id;
        info.owner = strdup(playlists[i].owner.c_str());
        info.name = strdup(playlists[i].name.c_str());
        info.is_public = playlists[i].is_public ? 1 : 0;
        info.track_count = playlists[i].track_count;
    }

    return succeed(engine);
}

void spotiflow_playlists_free(SpotiflowPlaylistInfo* playlists, int count) {
    if (!playlists) return;
    for (int i = 0; i < count; ++i) {
        free(const_cast<char*>(playlists[i].owner));
        free(const_cast<char*>(playlists[i].name));
    }
    delete[] playlists;
}

SpotiflowError spotiflow_get_playlist_tracks(
    SpotiflowEngine* engine,
    int64_t playlist_id,
    char*** out_track_ids,
    int* out_count
) {
    if (!engine || !engine->engine) return SPOTIFLOW_ERROR_INVALID_ARGUMENT;
    if (!out_track_ids || !out_count) return reject(engine, "Output pointers are required");

    if (!engine->engine->get_playlist(playlist_id)) {
        return fail(engine, {ErrorCode::StoreError,
            "Playlist not found: " + std::to_string(playlist_id)});
    }

    std::vector<std::string> ids;
    for (const auto& track : engine->engine->get_playlist_tracks(playlist_id)) {
        ids.push_back(track.id);
    }

    *out_count = static_cast<int>(ids.size());
    *out_track_ids = copy_strings(ids);
    return succeed(engine);
}

void spotiflow_strings_free(char** strings, int count) {
    if (!strings) return;
    for (int i = 0; i < count; ++i) {
        free(strings[i]);
    }
    delete[] strings;
}

/* ============================================================================
 * Ordering
 * ============================================================================ */

TourHandle spotiflow_order_playlist(
    SpotiflowEngine* engine,
    int64_t playlist_id,
    const SpotiflowTourOptions* options
) {
    if (!engine || !engine->engine) return nullptr;

    auto tour = engine->engine->order_playlist(playlist_id, to_tour_options(options));
    if (tour.failed()) {
        fail(engine, tour.failure());
        return nullptr;
    }

    succeed(engine);
    auto handle = new TourHandleImpl();
    handle->tour = std::move(tour.value());
    return handle;
}

int spotiflow_tour_get_count(TourHandle tour) {
    if (!tour) return 0;
    return static_cast<int>(tour->tour.size());
}

const char* spotiflow_tour_get_track(TourHandle tour, int index) {
    if (!tour || index < 0 || static_cast<size_t>(index) >= tour->tour.size()) return nullptr;
    return tour->tour.track_ids[index].c_str();
}

int spotiflow_tour_get_missing_count(TourHandle tour) {
    if (!tour) return 0;
    return static_cast<int>(tour->tour.missing_feature_ids.size());
}

float spotiflow_tour_get_distance(TourHandle tour) {
    if (!tour) return 0.0f;
    return tour->tour.total_distance;
}

SpotiflowError spotiflow_tour_save(
    SpotiflowEngine* engine,
    TourHandle tour,
    const char* owner,
    const char* name,
    int64_t* out_playlist_id
) {
    if (!engine || !engine->engine) return SPOTIFLOW_ERROR_INVALID_ARGUMENT;
    if (!tour || !owner || !name) return reject(engine, "Tour, owner and name are required");

    auto saved = engine->engine->save_tour(owner, name, tour->tour);
    if (saved.failed()) {
        return fail(engine, saved.failure());
    }

    if (out_playlist_id) *out_playlist_id = parse_playlist_id(saved.value());
    return succeed(engine);
}

void spotiflow_tour_free(TourHandle tour) {
    delete tour;
}

SpotiflowError spotiflow_improve_playlist(
    SpotiflowEngine* engine,
    int64_t playlist_id,
    const SpotiflowTourOptions* options,
    int64_t* out_playlist_id
) {
    if (!engine || !engine->engine) return SPOTIFLOW_ERROR_INVALID_ARGUMENT;

    auto created = engine->engine->improve_playlist(playlist_id, to_tour_options(options));
    if (created.failed()) {
        return fail(engine, created.failure());
    }

    if (out_playlist_id) *out_playlist_id = parse_playlist_id(created.value());
    return succeed(engine);
}

SpotiflowError spotiflow_find_similar(
    SpotiflowEngine* engine,
    int64_t playlist_id,
    const char* track_id,
    int max_count,
    char*** out_track_ids,
    float** out_distances,
    int* out_count
) {
    if (!engine || !engine->engine) return SPOTIFLOW_ERROR_INVALID_ARGUMENT;
    if (!track_id || !out_track_ids || !out_distances || !out_count) {
        return reject(engine, "Track id and output pointers are required");
    }

    auto nearest = engine->engine->find_similar(playlist_id, track_id, max_count);
    if (nearest.failed()) {
        return fail(engine, nearest.failure());
    }

    const auto& pairs = nearest.value();
    std::vector<std::string> ids;
    ids.reserve(pairs.size());

    *out_distances = static_cast<float*>(malloc(sizeof(float) * (pairs.empty() ? 1 : pairs.size())));
    for (size_t i = 0; i < pairs.size(); ++i) {
        ids.push_back(pairs[i].first);
        (*out_distances)[i] = pairs[i].second;
    }

    *out_count = static_cast<int>(pairs.size());
    *out_track_ids = copy_strings(ids);
    return succeed(engine);
}
