/**
 * Spotiflow - Database Store Implementation
 */

#include "store.h"
#include "utils.h"
#include <cstring>

namespace spotiflow {

namespace {

const char* kTrackColumns = "id, name, artist, features";

const char* kPlaylistColumns =
    "p.id, p.owner, p.name, p.is_public, p.created_at, "
    "(SELECT COUNT(*) FROM playlist_tracks t WHERE t.playlist_id = p.id)";

std::string column_text(sqlite3_stmt* stmt, int col) {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? text : "";
}

} // namespace

Store::Store(const std::string& db_path) {
    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        last_error_ = sqlite3_errmsg(db_);
        sqlite3_close(db_);
        db_ = nullptr;
        return;
    }

    // Enable WAL mode for better concurrency
    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);

    init_schema();
}

Store::~Store() {
    if (db_) {
        sqlite3_close(db_);
    }
}

Store::Store(Store&& other) noexcept
    : db_(other.db_), last_error_(std::move(other.last_error_)) {
    other.db_ = nullptr;
}

Store& Store::operator=(Store&& other) noexcept {
    if (this != &other) {
        if (db_) sqlite3_close(db_);
        db_ = other.db_;
        last_error_ = std::move(other.last_error_);
        other.db_ = nullptr;
    }
    return *this;
}

void Store::init_schema() {
    const char* schema = R"(
        CREATE TABLE IF NOT EXISTS tracks (
            id TEXT PRIMARY KEY,
            name TEXT NOT NULL,
            artist TEXT,
            features BLOB
        );

        CREATE TABLE IF NOT EXISTS playlists (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            owner TEXT NOT NULL,
            name TEXT NOT NULL,
            is_public INTEGER DEFAULT 1,
            created_at INTEGER DEFAULT 0
        );

        CREATE TABLE IF NOT EXISTS playlist_tracks (
            playlist_id INTEGER NOT NULL,
            position INTEGER NOT NULL,
            track_id TEXT NOT NULL,
            PRIMARY KEY (playlist_id, position)
        );

        CREATE TABLE IF NOT EXISTS track_tags (
            track_id TEXT NOT NULL,
            tag TEXT NOT NULL,
            rank INTEGER NOT NULL
        );

        CREATE INDEX IF NOT EXISTS idx_playlists_owner ON playlists(owner);
        CREATE INDEX IF NOT EXISTS idx_track_tags_track ON track_tags(track_id);
    )";

    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, schema, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        last_error_ = err_msg ? err_msg : "Failed to create schema";
        sqlite3_free(err_msg);
    }
}

bool Store::exec(const char* sql) {
    char* err_msg = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err_msg) != SQLITE_OK) {
        last_error_ = err_msg ? err_msg : sqlite3_errmsg(db_);
        sqlite3_free(err_msg);
        return false;
    }
    return true;
}

std::vector<uint8_t> Store::serialize_floats(const std::vector<float>& data) {
    std::vector<uint8_t> result(data.size() * sizeof(float));
    if (!data.empty()) {
        std::memcpy(result.data(), data.data(), result.size());
    }
    return result;
}

std::vector<float> Store::deserialize_floats(const void* data, int size) {
    if (!data || size <= 0) return {};

    size_t count = size / sizeof(float);
    std::vector<float> result(count);
    std::memcpy(result.data(), data, count * sizeof(float));
    return result;
}

TrackRecord Store::read_track_row(sqlite3_stmt* stmt) {
    TrackRecord record;
    record.info.id = column_text(stmt, 0);
    record.info.name = column_text(stmt, 1);
    record.info.artist = column_text(stmt, 2);

    // NULL marks absent features; a zero-length blob is a (malformed) empty vector
    if (sqlite3_column_type(stmt, 3) != SQLITE_NULL) {
        record.features = FeatureVector(
            deserialize_floats(sqlite3_column_blob(stmt, 3), sqlite3_column_bytes(stmt, 3)));
    }
    return record;
}

PlaylistInfo Store::read_playlist_row(sqlite3_stmt* stmt) {
    PlaylistInfo info;
    info.id = sqlite3_column_int64(stmt, 0);
    info.owner = column_text(stmt, 1);
    info.name = column_text(stmt, 2);
    info.is_public = sqlite3_column_int(stmt, 3) != 0;
    info.created_at = sqlite3_column_int64(stmt, 4);
    info.track_count = sqlite3_column_int(stmt, 5);
    return info;
}

/* ============================================================================
 * Tracks
 * ============================================================================ */

Result<bool> Store::upsert_track(const TrackInfo& track, const std::optional<FeatureVector>& features) {
    if (!db_) return "Database not open";

    if (track.id.empty()) {
        return ResultError{ErrorCode::StoreError, "Track id must not be empty"};
    }

    const char* sql = R"(
        INSERT INTO tracks (id, name, artist, features)
        VALUES (?, ?, ?, ?)
        ON CONFLICT(id) DO UPDATE SET
            name = excluded.name,
            artist = excluded.artist,
            features = excluded.features
    )";

    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return ResultError{ErrorCode::StoreError,
            std::string("Prepare failed: ") + sqlite3_errmsg(db_)};
    }

    sqlite3_bind_text(stmt, 1, track.id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, track.name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, track.artist.c_str(), -1, SQLITE_TRANSIENT);

    std::vector<uint8_t> feature_data;
    if (!features) {
        sqlite3_bind_null(stmt, 4);
    } else if (features->values.empty()) {
        sqlite3_bind_zeroblob(stmt, 4, 0);
    } else {
        feature_data = serialize_floats(features->values);
        sqlite3_bind_blob(stmt, 4, feature_data.data(),
                          static_cast<int>(feature_data.size()), SQLITE_TRANSIENT);
    }

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return ResultError{ErrorCode::StoreError,
            std::string("Insert failed: ") + sqlite3_errmsg(db_), {track.id}};
    }

    return true;
}

std::optional<TrackRecord> Store::get_track(const std::string& id) {
    if (!db_) return std::nullopt;

    std::string sql = std::string("SELECT ") + kTrackColumns + " FROM tracks WHERE id = ?";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        last_error_ = sqlite3_errmsg(db_);
        return std::nullopt;
    }

    sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);

    std::optional<TrackRecord> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = read_track_row(stmt);
    }

    sqlite3_finalize(stmt);
    return result;
}

std::vector<TrackRecord> Store::search_tracks(const std::string& pattern) {
    std::vector<TrackRecord> tracks;
    if (!db_) return tracks;

    std::string sql = std::string("SELECT ") + kTrackColumns +
        " FROM tracks WHERE name LIKE ?1 OR artist LIKE ?1 ORDER BY rowid";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        last_error_ = sqlite3_errmsg(db_);
        return tracks;
    }

    sqlite3_bind_text(stmt, 1, pattern.c_str(), -1, SQLITE_TRANSIENT);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        tracks.push_back(read_track_row(stmt));
    }

    sqlite3_finalize(stmt);
    return tracks;
}

int Store::get_track_count() {
    if (!db_) return 0;

    const char* sql = "SELECT COUNT(*) FROM tracks";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }

    int count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int(stmt, 0);
    }

    sqlite3_finalize(stmt);
    return count;
}

/* ============================================================================
 * Playlists
 * ============================================================================ */

Result<int64_t> Store::create_playlist(const std::string& owner, const std::string& name, bool is_public) {
    if (!db_) return "Database not open";

    const char* sql = "INSERT INTO playlists (owner, name, is_public, created_at) VALUES (?, ?, ?, ?)";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return ResultError{ErrorCode::StoreError,
            std::string("Prepare failed: ") + sqlite3_errmsg(db_)};
    }

    sqlite3_bind_text(stmt, 1, owner.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 3, is_public ? 1 : 0);
    sqlite3_bind_int64(stmt, 4, utils::current_timestamp());

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return ResultError{ErrorCode::StoreError,
            std::string("Insert failed: ") + sqlite3_errmsg(db_)};
    }

    return static_cast<int64_t>(sqlite3_last_insert_rowid(db_));
}

Result<int> Store::append_playlist_tracks(int64_t playlist_id, const std::vector<std::string>& track_ids) {
    if (!db_) return "Database not open";

    if (!get_playlist(playlist_id)) {
        return ResultError{ErrorCode::StoreError,
            "Playlist not found: " + std::to_string(playlist_id)};
    }

    if (!exec("BEGIN TRANSACTION;")) {
        return ResultError{ErrorCode::StoreError, "Begin failed: " + last_error_};
    }

    int64_t next_position = 0;
    sqlite3_stmt* stmt;

    const char* max_sql = "SELECT COALESCE(MAX(position) + 1, 0) FROM playlist_tracks WHERE playlist_id = ?";
    if (sqlite3_prepare_v2(db_, max_sql, -1, &stmt, nullptr) == SQLITE_OK) {
        sqlite3_bind_int64(stmt, 1, playlist_id);
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            next_position = sqlite3_column_int64(stmt, 0);
        }
        sqlite3_finalize(stmt);
    }

    const char* sql = "INSERT INTO playlist_tracks (playlist_id, position, track_id) VALUES (?, ?, ?)";
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::string message = std::string("Prepare failed: ") + sqlite3_errmsg(db_);
        exec("ROLLBACK;");
        return ResultError{ErrorCode::StoreError, message};
    }

    int appended = 0;
    for (const auto& track_id : track_ids) {
        sqlite3_reset(stmt);
        sqlite3_bind_int64(stmt, 1, playlist_id);
        sqlite3_bind_int64(stmt, 2, next_position++);
        sqlite3_bind_text(stmt, 3, track_id.c_str(), -1, SQLITE_TRANSIENT);

        if (sqlite3_step(stmt) != SQLITE_DONE) {
            std::string message = std::string("Insert failed: ") + sqlite3_errmsg(db_);
            sqlite3_finalize(stmt);
            exec("ROLLBACK;");
            return ResultError{ErrorCode::StoreError, message, {track_id}};
        }
        appended++;
    }

    sqlite3_finalize(stmt);

    if (!exec("COMMIT;")) {
        std::string message = "Commit failed: " + last_error_;
        exec("ROLLBACK;");
        return ResultError{ErrorCode::StoreError, message};
    }

    return appended;
}

std::vector<PlaylistInfo> Store::get_playlists(const std::string& owner) {
    std::vector<PlaylistInfo> playlists;
    if (!db_) return playlists;

    std::string sql = std::string("SELECT ") + kPlaylistColumns + " FROM playlists p";
    if (!owner.empty()) {
        sql += " WHERE p.owner = ?";
    }
    sql += " ORDER BY p.id";

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        last_error_ = sqlite3_errmsg(db_);
        return playlists;
    }

    if (!owner.empty()) {
        sqlite3_bind_text(stmt, 1, owner.c_str(), -1, SQLITE_TRANSIENT);
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        playlists.push_back(read_playlist_row(stmt));
    }

    sqlite3_finalize(stmt);
    return playlists;
}

std::optional<PlaylistInfo> Store::get_playlist(int64_t id) {
    if (!db_) return std::nullopt;

    std::string sql = std::string("SELECT ") + kPlaylistColumns + " FROM playlists p WHERE p.id = ?";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        last_error_ = sqlite3_errmsg(db_);
        return std::nullopt;
    }

    sqlite3_bind_int64(stmt, 1, id);

    std::optional<PlaylistInfo> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = read_playlist_row(stmt);
    }

    sqlite3_finalize(stmt);
    return result;
}

std::vector<PlaylistInfo> Store::find_playlists_by_name(const std::string& owner, const std::string& name) {
    std::vector<PlaylistInfo> playlists;
    if (!db_) return playlists;

    std::string sql = std::string("SELECT ") + kPlaylistColumns +
        " FROM playlists p WHERE p.owner = ? AND p.name = ? ORDER BY p.id";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        last_error_ = sqlite3_errmsg(db_);
        return playlists;
    }

    sqlite3_bind_text(stmt, 1, owner.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, name.c_str(), -1, SQLITE_TRANSIENT);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        playlists.push_back(read_playlist_row(stmt));
    }

    sqlite3_finalize(stmt);
    return playlists;
}

std::vector<TrackInfo> Store::get_playlist_tracks(int64_t playlist_id) {
    std::vector<TrackInfo> tracks;
    if (!db_) return tracks;

    const char* sql = R"(
        SELECT pt.track_id, t.name, t.artist
        FROM playlist_tracks pt
        LEFT JOIN tracks t ON t.id = pt.track_id
        WHERE pt.playlist_id = ?
        ORDER BY pt.position
    )";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        last_error_ = sqlite3_errmsg(db_);
        return tracks;
    }

    sqlite3_bind_int64(stmt, 1, playlist_id);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        TrackInfo track;
        track.id = column_text(stmt, 0);
        track.name = column_text(stmt, 1);
        track.artist = column_text(stmt, 2);
        tracks.push_back(track);
    }

    sqlite3_finalize(stmt);
    return tracks;
}

bool Store::delete_playlist(int64_t id) {
    if (!db_) return false;

    const char* sqls[] = {
        "DELETE FROM playlist_tracks WHERE playlist_id = ?",
        "DELETE FROM playlists WHERE id = ?"
    };

    for (const char* sql : sqls) {
        sqlite3_stmt* stmt;
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            last_error_ = sqlite3_errmsg(db_);
            return false;
        }

        sqlite3_bind_int64(stmt, 1, id);
        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);

        if (rc != SQLITE_DONE) {
            last_error_ = sqlite3_errmsg(db_);
            return false;
        }
    }

    return sqlite3_changes(db_) > 0;
}

/* ============================================================================
 * Tags
 * ============================================================================ */

Result<bool> Store::set_track_tags(const std::string& track_id, const std::vector<std::string>& tags) {
    if (!db_) return "Database not open";

    if (!exec("BEGIN TRANSACTION;")) {
        return ResultError{ErrorCode::StoreError, "Begin failed: " + last_error_};
    }

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, "DELETE FROM track_tags WHERE track_id = ?", -1, &stmt, nullptr) != SQLITE_OK) {
        std::string message = std::string("Prepare failed: ") + sqlite3_errmsg(db_);
        exec("ROLLBACK;");
        return ResultError{ErrorCode::StoreError, message};
    }
    sqlite3_bind_text(stmt, 1, track_id.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        std::string message = std::string("Delete failed: ") + sqlite3_errmsg(db_);
        exec("ROLLBACK;");
        return ResultError{ErrorCode::StoreError, message, {track_id}};
    }

    const char* sql = "INSERT INTO track_tags (track_id, tag, rank) VALUES (?, ?, ?)";
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::string message = std::string("Prepare failed: ") + sqlite3_errmsg(db_);
        exec("ROLLBACK;");
        return ResultError{ErrorCode::StoreError, message};
    }

    for (size_t i = 0; i < tags.size(); ++i) {
        sqlite3_reset(stmt);
        sqlite3_bind_text(stmt, 1, track_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, tags[i].c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int(stmt, 3, static_cast<int>(i));

        if (sqlite3_step(stmt) != SQLITE_DONE) {
            std::string message = std::string("Insert failed: ") + sqlite3_errmsg(db_);
            sqlite3_finalize(stmt);
            exec("ROLLBACK;");
            return ResultError{ErrorCode::StoreError, message, {track_id}};
        }
    }

    sqlite3_finalize(stmt);

    if (!exec("COMMIT;")) {
        std::string message = "Commit failed: " + last_error_;
        exec("ROLLBACK;");
        return ResultError{ErrorCode::StoreError, message};
    }

    return true;
}

std::vector<std::string> Store::get_tags_for(const std::string& name, const std::string& artist) {
    std::vector<std::string> tags;
    if (!db_) return tags;

    const char* sql = R"(
        SELECT tt.tag
        FROM track_tags tt
        JOIN tracks t ON t.id = tt.track_id
        WHERE lower(t.name) = lower(?) AND lower(t.artist) = lower(?)
        ORDER BY t.rowid, tt.rank
    )";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        last_error_ = sqlite3_errmsg(db_);
        return tags;
    }

    sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, artist.c_str(), -1, SQLITE_TRANSIENT);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        tags.push_back(column_text(stmt, 0));
    }

    sqlite3_finalize(stmt);
    return tags;
}

} // namespace spotiflow
