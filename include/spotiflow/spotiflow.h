/**
 * Spotiflow - Public C API
 *
 * Reorders playlists so that consecutive tracks are acoustically similar,
 * and stores the result as a new playlist.
 */

#ifndef SPOTIFLOW_H
#define SPOTIFLOW_H

#ifdef __cplusplus
extern "C" {
#endif

#include <stdint.h>
#include <stddef.h>

/* ============================================================================
 * Types
 * ============================================================================ */

#define SPOTIFLOW_FEATURE_DIMENSIONS 7

typedef struct SpotiflowEngine SpotiflowEngine;
typedef struct TourHandleImpl* TourHandle;

typedef enum {
    SPOTIFLOW_OK = 0,
    SPOTIFLOW_ERROR_INVALID_ARGUMENT = -1,
    SPOTIFLOW_ERROR_EMPTY_PLAYLIST = -2,
    SPOTIFLOW_ERROR_DUPLICATE_TRACK = -3,
    SPOTIFLOW_ERROR_UNKNOWN_TRACK = -4,
    SPOTIFLOW_ERROR_INVALID_DIMENSION = -5,
    SPOTIFLOW_ERROR_MISSING_FEATURES = -6,
    SPOTIFLOW_ERROR_DATABASE_ERROR = -7,
    SPOTIFLOW_ERROR_INTERNAL = -8,
} SpotiflowError;

typedef enum {
    SPOTIFLOW_MISSING_APPEND = 0,   /* Append tracks without features at the end */
    SPOTIFLOW_MISSING_REJECT = 1,   /* Fail with SPOTIFLOW_ERROR_MISSING_FEATURES */
} SpotiflowMissingPolicy;

/* Track information */
typedef struct {
    const char* id;
    const char* name;
    const char* artist;
} SpotiflowTrackInfo;

/*
 * Audio features, one field per axis. Passed as a pointer; NULL means the
 * track has no features.
 */
typedef struct {
    float danceability;
    float energy;
    float instrumentalness;
    float loudness;
    float speechiness;
    float tempo;
    float valence;
} SpotiflowFeatures;

/* Playlist information */
typedef struct {
    int64_t id;
    const char* owner;
    const char* name;
    int is_public;
    int track_count;
} SpotiflowPlaylistInfo;

/* Engine configuration */
typedef struct {
    const char* db_path;        /* SQLite database path (required) */
    const char* owner_id;       /* Owner of created playlists, NULL = source owner */
    const char* name_suffix;    /* Appended to improved playlist names, NULL = " - Improved" */
    int public_playlist;        /* Create public playlists */
    int batch_size;             /* Max tracks per append (0 = no limit) */
    int verbose;                /* Diagnostics on stderr */
} SpotiflowConfig;

/* Tour options */
typedef struct {
    const char* seed_track_id;  /* NULL = first track of the playlist */
    SpotiflowMissingPolicy missing_policy;
} SpotiflowTourOptions;

/* ============================================================================
 * Engine Lifecycle
 * ============================================================================ */

/**
 * Create a new engine with default configuration.
 *
 * @param db_path Path to SQLite database file (will be created if not exists)
 * @return Engine instance, or NULL on failure
 */
SpotiflowEngine* spotiflow_create(const char* db_path);

/**
 * Create a new engine from a configuration.
 *
 * @return Engine instance, or NULL on failure
 */
SpotiflowEngine* spotiflow_create_with_config(const SpotiflowConfig* config);

/**
 * Destroy an engine instance and free all resources.
 */
void spotiflow_destroy(SpotiflowEngine* engine);

/**
 * Get the last error message.
 */
const char* spotiflow_get_error(SpotiflowEngine* engine);

/* ============================================================================
 * Library
 * ============================================================================ */

/**
 * Insert or update a track.
 *
 * @param features Track features, or NULL if none are available
 */
SpotiflowError spotiflow_import_track(
    SpotiflowEngine* engine,
    const SpotiflowTrackInfo* track,
    const SpotiflowFeatures* features
);

/**
 * Replace the free-text tags of a track (used for genre lookup).
 */
SpotiflowError spotiflow_import_tags(
    SpotiflowEngine* engine,
    const char* track_id,
    const char** tags,
    int count
);

/**
 * Get number of tracks in the library.
 */
int spotiflow_get_track_count(SpotiflowEngine* engine);

/**
 * Get track information by ID.
 * Release the strings with spotiflow_track_info_free().
 */
SpotiflowError spotiflow_get_track_info(
    SpotiflowEngine* engine,
    const char* track_id,
    SpotiflowTrackInfo* info
);

void spotiflow_track_info_free(SpotiflowTrackInfo* info);

/**
 * Genre of a track from its tags.
 *
 * @return Newly allocated label (release with free()), or NULL if unknown
 */
char* spotiflow_lookup_genre(SpotiflowEngine* engine, const char* track_id);

/* ============================================================================
 * Playlists
 * ============================================================================ */

/**
 * Create a playlist from an ordered list of track IDs.
 *
 * @param out_playlist_id Receives the new playlist ID
 */
SpotiflowError spotiflow_create_playlist(
    SpotiflowEngine* engine,
    const char* owner,
    const char* name,
    const char** track_ids,
    int count,
    int64_t* out_playlist_id
);

/**
 * List playlists of an owner (NULL or "" = all playlists).
 * Release the array with spotiflow_playlists_free().
 */
SpotiflowError spotiflow_list_playlists(
    SpotiflowEngine* engine,
    const char* owner,
    SpotiflowPlaylistInfo** out_playlists,
    int* out_count
);

void spotiflow_playlists_free(SpotiflowPlaylistInfo* playlists, int count);

/**
 * Get the track IDs of a playlist in order.
 * Release with spotiflow_strings_free().
 */
SpotiflowError spotiflow_get_playlist_tracks(
    SpotiflowEngine* engine,
    int64_t playlist_id,
    char*** out_track_ids,
    int* out_count
);

void spotiflow_strings_free(char** strings, int count);

/* ============================================================================
 * Ordering
 * ============================================================================ */

/**
 * Order a playlist so that consecutive tracks are close in feature space.
 *
 * @param options Tour options, or NULL for defaults
 * @return Tour handle, or NULL on failure (see spotiflow_get_error and
 *         spotiflow_get_last_error_code)
 */
TourHandle spotiflow_order_playlist(
    SpotiflowEngine* engine,
    int64_t playlist_id,
    const SpotiflowTourOptions* options
);

/**
 * Status of the last call on this engine, SPOTIFLOW_OK after a success.
 * Argument errors are recorded too, with a message in spotiflow_get_error.
 */
SpotiflowError spotiflow_get_last_error_code(SpotiflowEngine* engine);

int spotiflow_tour_get_count(TourHandle tour);

/**
 * Track ID at a tour position, NULL if out of range.
 * The string is owned by the tour.
 */
const char* spotiflow_tour_get_track(TourHandle tour, int index);

/**
 * Number of trailing tracks that were appended for lack of features.
 */
int spotiflow_tour_get_missing_count(TourHandle tour);

/**
 * Sum of distances between consecutive ranked tracks.
 */
float spotiflow_tour_get_distance(TourHandle tour);

/**
 * Store a tour as a new playlist.
 */
SpotiflowError spotiflow_tour_save(
    SpotiflowEngine* engine,
    TourHandle tour,
    const char* owner,
    const char* name,
    int64_t* out_playlist_id
);

void spotiflow_tour_free(TourHandle tour);

/**
 * Order a playlist and store it as "<name> - Improved" (or the configured
 * suffix).
 */
SpotiflowError spotiflow_improve_playlist(
    SpotiflowEngine* engine,
    int64_t playlist_id,
    const SpotiflowTourOptions* options,
    int64_t* out_playlist_id
);

/**
 * Nearest tracks to a track within a playlist, closest first.
 * Release IDs with spotiflow_strings_free() and distances with free().
 */
SpotiflowError spotiflow_find_similar(
    SpotiflowEngine* engine,
    int64_t playlist_id,
    const char* track_id,
    int max_count,
    char*** out_track_ids,
    float** out_distances,
    int* out_count
);

#ifdef __cplusplus
}
#endif

#endif /* SPOTIFLOW_H */
