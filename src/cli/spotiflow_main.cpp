/**
 * Spotiflow CLI - Playlist Improver
 *
 * Reorders a playlist so that consecutive tracks sound alike and saves the
 * result as "<playlist> - Improved".
 *
 * Usage: spotiflow [options] --user <id>
 */

#include "spotiflow/spotiflow.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>

namespace {

void print_usage(const char* program) {
    std::string default_db = "spotiflow.db";
#ifdef SPOTIFLOW_DEFAULT_DB_PATH
    default_db = SPOTIFLOW_DEFAULT_DB_PATH;
#endif

    std::cerr << "Usage: " << program << " [options] --user <id>\n"
              << "\nOptions:\n"
              << "  -d, --database <path>  Database file path (default: " << default_db << ")\n"
              << "  -u, --user <id>        User owning the new playlist (required)\n"
              << "  -p, --playlist <id>    Playlist to reorder (default: pick interactively)\n"
              << "  -s, --seed <track_id>  Track to start from (default: first track)\n"
              << "  -n, --name <name>      Name of the new playlist (default: '<name> - Improved')\n"
              << "  -b, --batch <n>        Max tracks per append call (default: 100)\n"
              << "      --strict           Fail if any track has no features\n"
              << "      --private          Create a private playlist\n"
              << "      --genres           Show the genre of each track\n"
              << "      --similar <id>     List the tracks closest to <id> and exit\n"
              << "  -y, --yes              Do not ask for confirmation\n"
              << "  -v, --verbose          Print diagnostics\n"
              << "  -h, --help             Show this help\n";
}

struct PlaylistChoice {
    int64_t id = -1;
    std::string name;
    std::string owner;
};

// Prompts for one of the user's playlists; id stays -1 on an invalid choice
PlaylistChoice pick_playlist(SpotiflowEngine* engine, const std::string& user) {
    PlaylistChoice choice;

    SpotiflowPlaylistInfo* playlists = nullptr;
    int count = 0;
    if (spotiflow_list_playlists(engine, user.c_str(), &playlists, &count) != SPOTIFLOW_OK) {
        std::cerr << "Error: " << spotiflow_get_error(engine) << "\n";
        return choice;
    }

    if (count == 0) {
        std::cerr << "Error: No playlists found for " << user << "\n";
        spotiflow_playlists_free(playlists, count);
        return choice;
    }

    std::cout << "Pick a playlist: \n";
    for (int i = 0; i < count; ++i) {
        std::cout << (i + 1) << " " << playlists[i].name << "\n";
    }

    std::string line;
    std::getline(std::cin, line);
    int picked = std::atoi(line.c_str());

    if (picked < 1 || picked > count) {
        std::cout << "That is not a valid choice. Please try again.\n";
    } else {
        const SpotiflowPlaylistInfo& info = playlists[picked - 1];
        choice.id = info.id;
        choice.name = info.name;
        choice.owner = info.owner;
    }

    spotiflow_playlists_free(playlists, count);
    return choice;
}

PlaylistChoice find_playlist(SpotiflowEngine* engine, int64_t playlist_id) {
    PlaylistChoice choice;

    SpotiflowPlaylistInfo* playlists = nullptr;
    int count = 0;
    if (spotiflow_list_playlists(engine, nullptr, &playlists, &count) != SPOTIFLOW_OK) {
        return choice;
    }

    for (int i = 0; i < count; ++i) {
        if (playlists[i].id == playlist_id) {
            choice.id = playlists[i].id;
            choice.name = playlists[i].name;
            choice.owner = playlists[i].owner;
            break;
        }
    }

    spotiflow_playlists_free(playlists, count);
    return choice;
}

void print_track(SpotiflowEngine* engine, int position, const char* track_id, bool show_genre) {
    std::cout << "  " << position << ". [" << track_id << "] ";

    SpotiflowTrackInfo info;
    if (spotiflow_get_track_info(engine, track_id, &info) == SPOTIFLOW_OK) {
        std::cout << info.artist << " - " << info.name;
        spotiflow_track_info_free(&info);
    }

    if (show_genre) {
        char* genre = spotiflow_lookup_genre(engine, track_id);
        if (genre) {
            std::cout << " (" << genre << ")";
            free(genre);
        }
    }
    std::cout << "\n";
}

int list_similar(SpotiflowEngine* engine, int64_t playlist_id, const std::string& track_id) {
    char** ids = nullptr;
    float* distances = nullptr;
    int count = 0;

    if (spotiflow_find_similar(engine, playlist_id, track_id.c_str(), 5,
                               &ids, &distances, &count) != SPOTIFLOW_OK) {
        std::cerr << "Error: " << spotiflow_get_error(engine) << "\n";
        return 1;
    }

    std::cout << "Closest to " << track_id << ":\n\n";
    for (int i = 0; i < count; ++i) {
        print_track(engine, i + 1, ids[i], false);
        std::cout << "       distance: " << distances[i] << "\n";
    }

    spotiflow_strings_free(ids, count);
    free(distances);
    return 0;
}

bool confirm(const std::string& name, bool is_public) {
    std::cout << "Creating new " << (is_public ? "public" : "private") << " playlist '"
              << name << "', continue? (y/n)  " << std::flush;

    std::string answer;
    std::getline(std::cin, answer);
    std::transform(answer.begin(), answer.end(), answer.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    return answer != "n" && answer != "no";
}

} // namespace

int main(int argc, char* argv[]) {
    SpotiflowConfig config = {};
#ifdef SPOTIFLOW_DEFAULT_DB_PATH
    std::string db_path = SPOTIFLOW_DEFAULT_DB_PATH;
#else
    std::string db_path = "spotiflow.db";
#endif
    std::string user;
    std::string seed;
    std::string new_name;
    std::string similar_to;
    int64_t playlist_id = -1;
    int batch_size = 100;
    bool strict = false;
    bool is_public = true;
    bool show_genres = false;
    bool assume_yes = false;
    bool verbose = false;

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        const bool has_value = i + 1 < argc;

        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if ((strcmp(argv[i], "-d") == 0 || strcmp(argv[i], "--database") == 0) && has_value) {
            db_path = argv[++i];
        } else if ((strcmp(argv[i], "-u") == 0 || strcmp(argv[i], "--user") == 0) && has_value) {
            user = argv[++i];
        } else if ((strcmp(argv[i], "-p") == 0 || strcmp(argv[i], "--playlist") == 0) && has_value) {
            playlist_id = std::strtoll(argv[++i], nullptr, 10);
        } else if ((strcmp(argv[i], "-s") == 0 || strcmp(argv[i], "--seed") == 0) && has_value) {
            seed = argv[++i];
        } else if ((strcmp(argv[i], "-n") == 0 || strcmp(argv[i], "--name") == 0) && has_value) {
            new_name = argv[++i];
        } else if ((strcmp(argv[i], "-b") == 0 || strcmp(argv[i], "--batch") == 0) && has_value) {
            batch_size = std::atoi(argv[++i]);
        } else if (strcmp(argv[i], "--similar") == 0 && has_value) {
            similar_to = argv[++i];
        } else if (strcmp(argv[i], "--strict") == 0) {
            strict = true;
        } else if (strcmp(argv[i], "--private") == 0) {
            is_public = false;
        } else if (strcmp(argv[i], "--genres") == 0) {
            show_genres = true;
        } else if (strcmp(argv[i], "-y") == 0 || strcmp(argv[i], "--yes") == 0) {
            assume_yes = true;
        } else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--verbose") == 0) {
            verbose = true;
        } else {
            std::cerr << "Error: Unknown or incomplete option " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (user.empty()) {
        std::cerr << "Error: No user specified\n";
        print_usage(argv[0]);
        return 1;
    }

    config.db_path = db_path.c_str();
    config.owner_id = user.c_str();
    config.public_playlist = is_public ? 1 : 0;
    config.batch_size = batch_size;
    config.verbose = verbose ? 1 : 0;

    SpotiflowEngine* engine = spotiflow_create_with_config(&config);
    if (!engine) {
        std::cerr << "Error: Failed to create engine. Database: " << db_path << "\n";
        return 1;
    }

    PlaylistChoice playlist = playlist_id >= 0
        ? find_playlist(engine, playlist_id)
        : pick_playlist(engine, user);

    if (playlist.id < 0) {
        if (playlist_id >= 0) {
            std::cerr << "Error: Playlist not found: " << playlist_id << "\n";
        }
        spotiflow_destroy(engine);
        return 1;
    }

    if (!similar_to.empty()) {
        int rc = list_similar(engine, playlist.id, similar_to);
        spotiflow_destroy(engine);
        return rc;
    }

    std::cout << "Gathering features...\n";

    SpotiflowTourOptions options = {};
    options.seed_track_id = seed.empty() ? nullptr : seed.c_str();
    options.missing_policy = strict ? SPOTIFLOW_MISSING_REJECT : SPOTIFLOW_MISSING_APPEND;

    TourHandle tour = spotiflow_order_playlist(engine, playlist.id, &options);
    if (!tour) {
        std::cerr << "Error: " << spotiflow_get_error(engine) << "\n";
        spotiflow_destroy(engine);
        return 1;
    }

    std::cout << "Done\n\n";

    int count = spotiflow_tour_get_count(tour);
    int missing = spotiflow_tour_get_missing_count(tour);

    std::cout << "New order for '" << playlist.name << "' (" << count << " tracks";
    if (missing > 0) {
        std::cout << ", last " << missing << " without features";
    }
    std::cout << "):\n\n";

    for (int i = 0; i < count; ++i) {
        print_track(engine, i + 1, spotiflow_tour_get_track(tour, i), show_genres);
    }
    std::cout << "\nTotal distance: " << spotiflow_tour_get_distance(tour) << "\n\n";

    if (count == 0) {
        std::cout << "Playlist is empty, nothing to create.\n";
        spotiflow_tour_free(tour);
        spotiflow_destroy(engine);
        return 0;
    }

    if (new_name.empty()) {
        new_name = playlist.name + " - Improved";
    }

    int rc = 0;
    if (assume_yes || confirm(new_name, is_public)) {
        int64_t created_id = 0;
        if (spotiflow_tour_save(engine, tour, user.c_str(), new_name.c_str(), &created_id) == SPOTIFLOW_OK) {
            std::cout << new_name << " created! [" << created_id << "]\n\n";
        } else {
            std::cerr << "Error: " << spotiflow_get_error(engine) << "\n";
            rc = 1;
        }
    }

    std::cout << "Thanks for using Spotiflow!\n";

    spotiflow_tour_free(tour);
    spotiflow_destroy(engine);
    return rc;
}
