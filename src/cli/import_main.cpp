/**
 * Spotiflow CLI - Playlist Import
 *
 * Loads tracks, their audio features and tags from a tab-separated file and
 * stores them as a playlist.
 *
 * Usage: spotiflow-import [options] -o <owner> -n <name> <tracks.tsv>
 */

#include "spotiflow/spotiflow.h"
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace {

constexpr int kFeatureColumn = 3;
constexpr int kTagColumn = kFeatureColumn + SPOTIFLOW_FEATURE_DIMENSIONS;

void print_usage(const char* program) {
    std::string default_db = "spotiflow.db";
#ifdef SPOTIFLOW_DEFAULT_DB_PATH
    default_db = SPOTIFLOW_DEFAULT_DB_PATH;
#endif

    std::cerr << "Usage: " << program << " [options] -o <owner> -n <name> <tracks.tsv>\n"
              << "\nOptions:\n"
              << "  -d, --database <path>  Database file path (default: " << default_db << ")\n"
              << "  -o, --owner <id>       Owner of the imported playlist (required)\n"
              << "  -n, --name <name>      Name of the imported playlist (required)\n"
              << "  -h, --help             Show this help\n"
              << "\nColumns (tab-separated, '#' starts a comment line):\n"
              << "  id  name  artist  danceability  energy  instrumentalness  loudness\n"
              << "  speechiness  tempo  valence  [tags separated by ';']\n"
              << "Leave the feature columns empty or '-' for tracks without features.\n";
}

std::vector<std::string> split_columns(const std::string& line, char delimiter) {
    std::vector<std::string> columns;
    std::string current;
    for (char c : line) {
        if (c == delimiter) {
            columns.push_back(current);
            current.clear();
        } else if (c != '\r') {
            current += c;
        }
    }
    columns.push_back(current);
    return columns;
}

bool is_blank(const std::string& s) {
    return s.empty() || s == "-";
}

// Parses the 7 feature columns; false if they are absent or malformed (nan, inf included)
bool parse_features(const std::vector<std::string>& columns, SpotiflowFeatures* out, bool* malformed) {
    *malformed = false;

    if (columns.size() < static_cast<size_t>(kTagColumn)) {
        *malformed = columns.size() > static_cast<size_t>(kFeatureColumn);
        return false;
    }

    bool all_blank = true;
    for (int i = kFeatureColumn; i < kTagColumn; ++i) {
        if (!is_blank(columns[i])) all_blank = false;
    }
    if (all_blank) return false;

    float values[SPOTIFLOW_FEATURE_DIMENSIONS];
    for (int i = 0; i < SPOTIFLOW_FEATURE_DIMENSIONS; ++i) {
        const std::string& text = columns[kFeatureColumn + i];
        char* end = nullptr;
        values[i] = std::strtof(text.c_str(), &end);
        if (is_blank(text) || end == text.c_str() || *end != '\0' || !std::isfinite(values[i])) {
            *malformed = true;
            return false;
        }
    }

    out->danceability = values[0];
    out->energy = values[1];
    out->instrumentalness = values[2];
    out->loudness = values[3];
    out->speechiness = values[4];
    out->tempo = values[5];
    out->valence = values[6];
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
#ifdef SPOTIFLOW_DEFAULT_DB_PATH
    std::string db_path = SPOTIFLOW_DEFAULT_DB_PATH;
#else
    std::string db_path = "spotiflow.db";
#endif
    std::string owner;
    std::string name;
    std::string input_path;

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (strcmp(argv[i], "-d") == 0 || strcmp(argv[i], "--database") == 0) {
            if (i + 1 < argc) {
                db_path = argv[++i];
            } else {
                std::cerr << "Error: -d requires a path argument\n";
                return 1;
            }
        } else if (strcmp(argv[i], "-o") == 0 || strcmp(argv[i], "--owner") == 0) {
            if (i + 1 < argc) {
                owner = argv[++i];
            } else {
                std::cerr << "Error: -o requires an owner argument\n";
                return 1;
            }
        } else if (strcmp(argv[i], "-n") == 0 || strcmp(argv[i], "--name") == 0) {
            if (i + 1 < argc) {
                name = argv[++i];
            } else {
                std::cerr << "Error: -n requires a name argument\n";
                return 1;
            }
        } else if (argv[i][0] != '-') {
            input_path = argv[i];
        } else {
            std::cerr << "Error: Unknown option " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (input_path.empty() || owner.empty() || name.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    std::ifstream input(input_path);
    if (!input) {
        std::cerr << "Error: Cannot open " << input_path << "\n";
        return 1;
    }

    SpotiflowEngine* engine = spotiflow_create(db_path.c_str());
    if (!engine) {
        std::cerr << "Error: Failed to create engine. Database: " << db_path << "\n";
        return 1;
    }

    std::vector<std::string> track_ids;
    int without_features = 0;
    int line_number = 0;
    std::string line;

    while (std::getline(input, line)) {
        line_number++;
        if (line.empty() || line[0] == '#' || line == "\r") continue;

        auto columns = split_columns(line, '\t');
        if (columns.size() < 3 || columns[0].empty()) {
            std::cerr << "Warning: line " << line_number << ": expected id, name and artist, skipped\n";
            continue;
        }

        SpotiflowFeatures features = {};
        bool malformed = false;
        bool has_features = parse_features(columns, &features, &malformed);
        if (malformed) {
            std::cerr << "Warning: line " << line_number << ": malformed features, track "
                      << columns[0] << " imported without features\n";
        }
        if (!has_features) without_features++;

        SpotiflowTrackInfo track = {columns[0].c_str(), columns[1].c_str(), columns[2].c_str()};
        if (spotiflow_import_track(engine, &track, has_features ? &features : nullptr) != SPOTIFLOW_OK) {
            std::cerr << "Error: line " << line_number << ": " << spotiflow_get_error(engine) << "\n";
            spotiflow_destroy(engine);
            return 1;
        }

        if (columns.size() > static_cast<size_t>(kTagColumn) && !columns[kTagColumn].empty()) {
            auto tags = split_columns(columns[kTagColumn], ';');
            std::vector<const char*> tag_ptrs;
            for (const auto& tag : tags) {
                if (!tag.empty()) tag_ptrs.push_back(tag.c_str());
            }
            if (spotiflow_import_tags(engine, columns[0].c_str(), tag_ptrs.data(),
                                      static_cast<int>(tag_ptrs.size())) != SPOTIFLOW_OK) {
                std::cerr << "Warning: line " << line_number << ": tags not stored: "
                          << spotiflow_get_error(engine) << "\n";
            }
        }

        track_ids.push_back(columns[0]);
    }

    std::vector<const char*> id_ptrs;
    id_ptrs.reserve(track_ids.size());
    for (const auto& id : track_ids) {
        id_ptrs.push_back(id.c_str());
    }

    int64_t playlist_id = 0;
    if (spotiflow_create_playlist(engine, owner.c_str(), name.c_str(), id_ptrs.data(),
                                  static_cast<int>(id_ptrs.size()), &playlist_id) != SPOTIFLOW_OK) {
        std::cerr << "Error: " << spotiflow_get_error(engine) << "\n";
        spotiflow_destroy(engine);
        return 1;
    }

    std::cout << "Imported " << track_ids.size() << " tracks (" << without_features
              << " without features) into playlist [" << playlist_id << "] " << name << "\n";

    spotiflow_destroy(engine);
    return 0;
}
