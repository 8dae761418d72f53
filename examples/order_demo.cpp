/**
 * Spotiflow - Ordering Example
 *
 * Builds a small in-memory library, reorders it and prints both orders.
 */

#include "spotiflow/spotiflow.h"
#include <iostream>
#include <string>

struct DemoTrack {
    const char* id;
    const char* name;
    const char* artist;
    SpotiflowFeatures features;
    bool has_features;
};

int main() {
    std::cout << "Spotiflow - Ordering Example\n";
    std::cout << "============================\n\n";

    SpotiflowEngine* engine = spotiflow_create(":memory:");
    if (!engine) {
        std::cerr << "Error: Failed to create engine\n";
        return 1;
    }

    const DemoTrack tracks[] = {
        {"t1", "Slow Morning",  "Quiet Band",    {0.30f, 0.20f, 0.70f, -14.0f, 0.04f,  78.0f, 0.30f}, true},
        {"t2", "Club Anthem",   "DJ Loud",       {0.85f, 0.90f, 0.10f,  -4.0f, 0.06f, 126.0f, 0.80f}, true},
        {"t3", "Late Night",    "Quiet Band",    {0.35f, 0.25f, 0.65f, -13.0f, 0.05f,  80.0f, 0.25f}, true},
        {"t4", "Voice Memo",    "Unknown",       {}, false},
        {"t5", "Peak Time",     "DJ Loud",       {0.80f, 0.95f, 0.05f,  -3.5f, 0.07f, 128.0f, 0.75f}, true},
        {"t6", "Sunday Stroll", "Acoustic Duo",  {0.55f, 0.45f, 0.30f,  -9.0f, 0.05f, 100.0f, 0.60f}, true},
    };

    const char* ids[6];
    int count = 0;
    for (const auto& t : tracks) {
        SpotiflowTrackInfo info = {t.id, t.name, t.artist};
        if (spotiflow_import_track(engine, &info, t.has_features ? &t.features : nullptr) != SPOTIFLOW_OK) {
            std::cerr << "Error: " << spotiflow_get_error(engine) << "\n";
            spotiflow_destroy(engine);
            return 1;
        }
        ids[count++] = t.id;
    }

    int64_t playlist_id = 0;
    if (spotiflow_create_playlist(engine, "demo", "Mixed Bag", ids, count, &playlist_id) != SPOTIFLOW_OK) {
        std::cerr << "Error: " << spotiflow_get_error(engine) << "\n";
        spotiflow_destroy(engine);
        return 1;
    }

    std::cout << "Original order:\n";
    for (const auto& t : tracks) {
        std::cout << "  " << t.id << "  " << t.artist << " - " << t.name << "\n";
    }

    TourHandle tour = spotiflow_order_playlist(engine, playlist_id, nullptr);
    if (!tour) {
        std::cerr << "Error: " << spotiflow_get_error(engine) << "\n";
        spotiflow_destroy(engine);
        return 1;
    }

    std::cout << "\nSimilarity order:\n";
    for (int i = 0; i < spotiflow_tour_get_count(tour); ++i) {
        std::cout << "  " << spotiflow_tour_get_track(tour, i) << "\n";
    }
    std::cout << "\nTotal distance: " << spotiflow_tour_get_distance(tour) << "\n";
    std::cout << "Tracks without features: " << spotiflow_tour_get_missing_count(tour) << "\n";

    spotiflow_tour_free(tour);
    spotiflow_destroy(engine);
    return 0;
}
