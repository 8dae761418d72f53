/**
 * Spotiflow - Internal Types
 */

#ifndef SPOTIFLOW_TYPES_H
#define SPOTIFLOW_TYPES_H

#include <string>
#include <vector>
#include <optional>
#include <variant>
#include <cstddef>
#include <type_traits>
#include <cstdint>

namespace spotiflow {

/* ============================================================================
 * Result Type
 * ============================================================================ */

enum class ErrorCode {
    Generic,
    EmptyPlaylist,
    DuplicateTrack,
    UnknownTrack,
    InvalidDimension,
    MissingFeatures,
    StoreError
};

// Error wrapper type to avoid variant<T, T> when T = std::string
struct ResultError {
    ErrorCode code = ErrorCode::Generic;
    std::string message;
    std::vector<std::string> track_ids;     // Offending tracks, if any

    ResultError() = default;
    ResultError(std::string m) : message(std::move(m)) {}
    ResultError(const char* m) : message(m) {}
    ResultError(ErrorCode c, std::string m, std::vector<std::string> ids = {})
        : code(c), message(std::move(m)), track_ids(std::move(ids)) {}
};

template<typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(ResultError error) : data_(std::move(error)) {}
    Result(const char* error) : data_(ResultError{error}) {}

    // Only enable this constructor when T is not std::string to avoid ambiguity
    template<typename U = T, typename = std::enable_if_t<!std::is_same_v<U, std::string>>>
    Result(std::string error) : data_(ResultError{std::move(error)}) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    bool failed() const { return !ok(); }

    T& value() { return std::get<T>(data_); }
    const T& value() const { return std::get<T>(data_); }

    const ResultError& failure() const { return std::get<ResultError>(data_); }
    const std::string& error() const { return failure().message; }
    ErrorCode error_code() const { return failure().code; }

    T value_or(T default_value) const {
        return ok() ? value() : default_value;
    }

private:
    std::variant<T, ResultError> data_;
};

/* ============================================================================
 * Track Features
 * ============================================================================ */

constexpr size_t kFeatureDimensions = 7;

// Fixed axis positions shared by every FeatureVector.
enum class FeatureAxis : size_t {
    Danceability = 0,
    Energy,
    Instrumentalness,
    Loudness,
    Speechiness,
    Tempo,
    Valence
};

inline const char* feature_axis_name(FeatureAxis axis) {
    switch (axis) {
        case FeatureAxis::Danceability:     return "danceability";
        case FeatureAxis::Energy:           return "energy";
        case FeatureAxis::Instrumentalness: return "instrumentalness";
        case FeatureAxis::Loudness:         return "loudness";
        case FeatureAxis::Speechiness:      return "speechiness";
        case FeatureAxis::Tempo:            return "tempo";
        case FeatureAxis::Valence:          return "valence";
    }
    return "unknown";
}

/**
 * Audio features as delivered by the music service, one named field per axis.
 */
struct AudioFeatures {
    float danceability = 0.0f;          // 0.0 - 1.0
    float energy = 0.0f;                // 0.0 - 1.0
    float instrumentalness = 0.0f;      // 0.0 - 1.0
    float loudness = 0.0f;              // dB, typically -60 - 0
    float speechiness = 0.0f;           // 0.0 - 1.0
    float tempo = 0.0f;                 // BPM
    float valence = 0.0f;               // 0.0 - 1.0
};

/**
 * Acoustic descriptor of a track, projected into the FeatureAxis order.
 *
 * A vector whose length is not kFeatureDimensions is representable so that
 * malformed input can be reported instead of being padded or truncated.
 */
struct FeatureVector {
    std::vector<float> values;

    FeatureVector() = default;
    explicit FeatureVector(std::vector<float> v) : values(std::move(v)) {}

    static FeatureVector from_audio_features(const AudioFeatures& f) {
        return FeatureVector({
            f.danceability, f.energy, f.instrumentalness, f.loudness,
            f.speechiness, f.tempo, f.valence
        });
    }

    size_t size() const { return values.size(); }
    bool is_valid() const { return values.size() == kFeatureDimensions; }

    float at(FeatureAxis axis) const { return values.at(static_cast<size_t>(axis)); }

    bool operator==(const FeatureVector& other) const { return values == other.values; }
    bool operator!=(const FeatureVector& other) const { return !(*this == other); }
};

/* ============================================================================
 * Track Info
 * ============================================================================ */

struct TrackInfo {
    std::string id;                     // Opaque service id, unique within a playlist
    std::string name;
    std::string artist;                 // Primary artist
};

/**
 * A track together with its features. std::nullopt means no descriptor could
 * be obtained, which is distinct from a zero vector.
 */
struct TrackRecord {
    TrackInfo info;
    std::optional<FeatureVector> features;

    bool has_features() const { return features.has_value(); }
};

/* ============================================================================
 * Playlist Types
 * ============================================================================ */

struct PlaylistInfo {
    int64_t id = 0;
    std::string owner;
    std::string name;
    bool is_public = true;
    int track_count = 0;
    int64_t created_at = 0;             // Unix timestamp
};

/**
 * Ordered permutation of a playlist's track ids.
 */
struct Tour {
    std::vector<std::string> track_ids;
    std::vector<std::string> missing_feature_ids;   // Appended after the ranked tracks
    float total_distance = 0.0f;        // Sum of successor distances
    size_t iterations = 0;              // Nearest-neighbour selections performed

    size_t size() const { return track_ids.size(); }
    bool empty() const { return track_ids.empty(); }
};

/* ============================================================================
 * Tour Options
 * ============================================================================ */

enum class MissingFeaturePolicy {
    AppendAtEnd,    // Exclude from the competition, append in insertion order
    Reject          // Fail with ErrorCode::MissingFeatures
};

struct TourOptions {
    std::optional<std::string> seed_id;     // Defaults to the first inserted track
    MissingFeaturePolicy missing_features = MissingFeaturePolicy::AppendAtEnd;
};

/* ============================================================================
 * Engine Configuration
 * ============================================================================ */

struct EngineConfig {
    std::string db_path = "spotiflow.db";
    std::string owner_id;               // Owner of created playlists
    std::string name_suffix = " - Improved";
    bool public_playlist = true;
    size_t batch_size = 100;            // Max tracks per sink call (0 = no limit)
    bool verbose = false;
};

} // namespace spotiflow

#endif // SPOTIFLOW_TYPES_H
