/**
 * Spotiflow - Matcher Tests
 * Tests for DistanceMetric, PlaylistModel and GreedyTourBuilder
 */

#include "spotiflow/types.h"
#include "../src/matcher/distance.h"
#include "../src/matcher/playlist_model.h"
#include "../src/matcher/tour_builder.h"

#include <algorithm>
#include <iostream>
#include <limits>
#include <cmath>
#include <random>
#include <stdexcept>
#include <unordered_set>

using namespace spotiflow;

/* ============================================================================
 * Test Utilities
 * ============================================================================ */

#define TEST(name) void test_##name()
#define RUN_TEST(name) do { \
    std::cout << "Test: " #name "... "; \
    try { \
        test_##name(); \
        std::cout << "PASSED\n"; \
    } catch (const std::exception& e) { \
        std::cout << "FAILED: " << e.what() << "\n"; \
        failed_tests++; \
    } \
} while(0)

static int failed_tests = 0;

void assert_near(float actual, float expected, float tolerance, const char* msg = "") {
    if (std::abs(actual - expected) > tolerance) {
        throw std::runtime_error(std::string(msg) +
            " Expected: " + std::to_string(expected) +
            ", Actual: " + std::to_string(actual));
    }
}

void assert_true(bool condition, const char* msg = "") {
    if (!condition) {
        throw std::runtime_error(std::string("Assertion failed: ") + msg);
    }
}

void assert_order(const Tour& tour, const std::vector<std::string>& expected, const char* msg = "") {
    if (tour.track_ids != expected) {
        std::string got;
        for (const auto& id : tour.track_ids) got += id + " ";
        throw std::runtime_error(std::string(msg) + " Got: " + got);
    }
}

/* ============================================================================
 * Test Data Helpers
 * ============================================================================ */

// Feature vector with the given leading components, remaining axes zero
FeatureVector make_vector(std::initializer_list<float> leading) {
    std::vector<float> values(leading);
    values.resize(kFeatureDimensions, 0.0f);
    return FeatureVector(values);
}

TrackInfo make_info(const std::string& id) {
    TrackInfo info;
    info.id = id;
    info.name = "Track " + id;
    info.artist = "Artist " + id;
    return info;
}

void add(PlaylistModel& model, const std::string& id, std::optional<FeatureVector> features) {
    auto inserted = model.insert(make_info(id), std::move(features));
    assert_true(inserted.ok(), "insert should succeed");
}

// Model with n tracks and deterministic pseudo-random features
PlaylistModel make_random_model(int n, uint32_t seed) {
    std::mt19937 rng(seed);
    std::uniform_real_distribution<float> unit(0.0f, 1.0f);
    std::uniform_real_distribution<float> loudness(-30.0f, 0.0f);
    std::uniform_real_distribution<float> tempo(60.0f, 180.0f);

    PlaylistModel model;
    for (int i = 0; i < n; ++i) {
        AudioFeatures f;
        f.danceability = unit(rng);
        f.energy = unit(rng);
        f.instrumentalness = unit(rng);
        f.loudness = loudness(rng);
        f.speechiness = unit(rng);
        f.tempo = tempo(rng);
        f.valence = unit(rng);
        add(model, "track_" + std::to_string(i), FeatureVector::from_audio_features(f));
    }
    return model;
}

/* ============================================================================
 * DistanceMetric Tests
 * ============================================================================ */

TEST(distance_known_value) {
    DistanceMetric metric;
    auto d = metric.distance(make_vector({0.0f, 0.0f}), make_vector({3.0f, 4.0f}));
    assert_true(d.ok(), "Distance should succeed");
    assert_near(d.value(), 5.0f, 1e-5f, "3-4-5 triangle");
}

TEST(distance_reflexive_zero) {
    DistanceMetric metric;
    FeatureVector a = make_vector({0.4f, 0.7f, 0.1f, -8.0f, 0.05f, 121.0f, 0.6f});
    auto d = metric.distance(a, a);
    assert_true(d.ok(), "Distance should succeed");
    assert_true(d.value() == 0.0f, "Distance to self should be exactly 0");
}

TEST(distance_symmetric) {
    DistanceMetric metric;
    PlaylistModel model = make_random_model(12, 7);
    const auto& ids = model.ordered_ids();

    for (const auto& i : ids) {
        for (const auto& j : ids) {
            const FeatureVector& a = *model.find(i)->features;
            const FeatureVector& b = *model.find(j)->features;
            auto ab = metric.distance(a, b);
            auto ba = metric.distance(b, a);
            assert_true(ab.ok() && ba.ok(), "Distance should succeed");
            assert_true(ab.value() == ba.value(), "Distance should be symmetric");
            assert_true(ab.value() >= 0.0f, "Distance should be non-negative");
        }
    }
}

TEST(distance_uses_every_axis) {
    DistanceMetric metric;
    FeatureVector zero = make_vector({});

    for (size_t axis = 0; axis < kFeatureDimensions; ++axis) {
        std::vector<float> values(kFeatureDimensions, 0.0f);
        values[axis] = 2.0f;
        auto d = metric.distance(zero, FeatureVector(values));
        assert_true(d.ok(), "Distance should succeed");
        assert_near(d.value(), 2.0f, 1e-6f, "Each axis should contribute");
    }
}

TEST(distance_invalid_dimension) {
    DistanceMetric metric;
    FeatureVector good = make_vector({1.0f});
    FeatureVector short_vec(std::vector<float>{1.0f, 2.0f, 3.0f});
    FeatureVector long_vec(std::vector<float>(8, 1.0f));
    FeatureVector empty_vec;

    auto d1 = metric.distance(good, short_vec);
    assert_true(d1.failed(), "Short vector should fail");
    assert_true(d1.error_code() == ErrorCode::InvalidDimension, "Error should be InvalidDimension");

    auto d2 = metric.distance(long_vec, good);
    assert_true(d2.failed() && d2.error_code() == ErrorCode::InvalidDimension, "Long vector should fail");

    auto d3 = metric.distance(long_vec, long_vec);
    assert_true(d3.failed(), "Equal but wrong lengths should still fail");

    auto d4 = metric.distance(empty_vec, empty_vec);
    assert_true(d4.failed() && d4.error_code() == ErrorCode::InvalidDimension, "Empty vectors should fail");
}

TEST(distance_rejects_non_finite) {
    DistanceMetric metric;
    const float nan = std::numeric_limits<float>::quiet_NaN();
    const float inf = std::numeric_limits<float>::infinity();
    FeatureVector good = make_vector({1.0f});

    auto d1 = metric.distance(good, make_vector({nan}));
    assert_true(d1.failed(), "NaN component should fail");
    assert_true(d1.error_code() == ErrorCode::InvalidDimension, "Error should be InvalidDimension");

    auto d2 = metric.distance(make_vector({0.0f, inf}), good);
    assert_true(d2.failed() && d2.error_code() == ErrorCode::InvalidDimension, "Infinite component should fail");

    auto d3 = metric.distance(make_vector({0.0f, 0.0f, -inf}), make_vector({0.0f, 0.0f, -inf}));
    assert_true(d3.failed(), "Equal infinite vectors should still fail");

    auto d4 = metric.distance(make_vector({3.0e38f}), make_vector({-3.0e38f}));
    assert_true(d4.failed() && d4.error_code() == ErrorCode::InvalidDimension, "Overflowing distance should fail");
}

TEST(distance_from_audio_features_order) {
    AudioFeatures f;
    f.danceability = 1.0f;
    f.energy = 2.0f;
    f.instrumentalness = 3.0f;
    f.loudness = 4.0f;
    f.speechiness = 5.0f;
    f.tempo = 6.0f;
    f.valence = 7.0f;

    FeatureVector v = FeatureVector::from_audio_features(f);
    assert_true(v.is_valid(), "Projected vector should have 7 components");
    assert_true(v.at(FeatureAxis::Danceability) == 1.0f, "Danceability first");
    assert_true(v.at(FeatureAxis::Instrumentalness) == 3.0f, "Instrumentalness third");
    assert_true(v.at(FeatureAxis::Tempo) == 6.0f, "Tempo sixth");
    assert_true(v.at(FeatureAxis::Valence) == 7.0f, "Valence last");
    assert_true(std::string(feature_axis_name(FeatureAxis::Speechiness)) == "speechiness", "Axis name");
}

TEST(distance_find_nearest_sorted) {
    DistanceMetric metric;

    std::vector<TrackRecord> candidates = {
        {make_info("far"), make_vector({9.0f})},
        {make_info("none"), std::nullopt},
        {make_info("near"), make_vector({1.0f})},
        {make_info("mid_a"), make_vector({4.0f})},
        {make_info("mid_b"), make_vector({-4.0f})},
    };

    auto nearest = metric.find_nearest(make_vector({}), candidates, 3);
    assert_true(nearest.ok(), "find_nearest should succeed");

    const auto& results = nearest.value();
    assert_true(results.size() == 3, "Should be limited to 3 results");
    assert_true(results[0].first == "near", "Nearest first");
    assert_true(results[1].first == "mid_a", "Equal distances keep input order");
    assert_true(results[2].first == "mid_b", "Equal distances keep input order");
    assert_near(results[1].second, 4.0f, 1e-6f, "Distance reported");
}

TEST(distance_find_nearest_reports_bad_track) {
    DistanceMetric metric;

    std::vector<TrackRecord> candidates = {
        {make_info("ok"), make_vector({1.0f})},
        {make_info("bad"), FeatureVector(std::vector<float>{1.0f})},
    };

    auto nearest = metric.find_nearest(make_vector({}), candidates);
    assert_true(nearest.failed(), "Malformed candidate should fail");
    assert_true(nearest.error_code() == ErrorCode::InvalidDimension, "InvalidDimension expected");
    assert_true(nearest.failure().track_ids == std::vector<std::string>{"bad"}, "Offending track named");
}

/* ============================================================================
 * PlaylistModel Tests
 * ============================================================================ */

TEST(model_insert_and_get) {
    PlaylistModel model;
    auto first = model.insert(make_info("a"), make_vector({1.0f}));
    auto second = model.insert(make_info("b"), std::nullopt);

    assert_true(first.ok() && first.value() == 0, "First insertion index is 0");
    assert_true(second.ok() && second.value() == 1, "Second insertion index is 1");
    assert_true(model.size() == 2, "Model should hold 2 tracks");

    auto a = model.get("a");
    assert_true(a.ok(), "Known track should be found");
    assert_true(a.value().info.name == "Track a", "Metadata kept");
    assert_true(a.value().features && *a.value().features == make_vector({1.0f}), "Features kept");

    auto b = model.get("b");
    assert_true(b.ok() && !b.value().has_features(), "Absent features stay absent");
}

TEST(model_absent_is_not_zero) {
    PlaylistModel model;
    add(model, "zero", make_vector({}));
    add(model, "absent", std::nullopt);

    assert_true(model.find("zero")->has_features(), "Zero vector is a real descriptor");
    assert_true(!model.find("absent")->has_features(), "Absent is not coerced to zero");

    auto missing = model.ids_missing_features();
    assert_true(missing.size() == 1 && missing[0] == "absent", "Only the absent track is missing");
}

TEST(model_duplicate_track) {
    PlaylistModel model;
    add(model, "a", make_vector({1.0f}));

    auto again = model.insert(make_info("a"), make_vector({2.0f}));
    assert_true(again.failed(), "Duplicate insert should fail");
    assert_true(again.error_code() == ErrorCode::DuplicateTrack, "Error should be DuplicateTrack");
    assert_true(again.failure().track_ids == std::vector<std::string>{"a"}, "Offending id reported");

    assert_true(model.size() == 1, "Model unchanged");
    assert_true(*model.find("a")->features == make_vector({1.0f}), "Original features kept");
}

TEST(model_unknown_track) {
    PlaylistModel model;
    add(model, "a", make_vector({}));

    auto missing = model.get("zzz");
    assert_true(missing.failed(), "Unknown id should fail");
    assert_true(missing.error_code() == ErrorCode::UnknownTrack, "Error should be UnknownTrack");
    assert_true(model.find("zzz") == nullptr, "find() returns nullptr");
    assert_true(!model.contains("zzz"), "contains() is false");
}

TEST(model_first_inserted) {
    PlaylistModel empty;
    auto none = empty.first_inserted();
    assert_true(none.failed(), "Empty model has no first track");
    assert_true(none.error_code() == ErrorCode::EmptyPlaylist, "Error should be EmptyPlaylist");

    PlaylistModel model;
    add(model, "m", make_vector({}));
    add(model, "a", make_vector({}));
    add(model, "z", make_vector({}));

    auto first = model.first_inserted();
    assert_true(first.ok() && first.value() == "m", "Insertion order, not key order");
    assert_true(model.ordered_ids() == std::vector<std::string>({"m", "a", "z"}), "Order kept");
}

TEST(model_ids) {
    PlaylistModel model;
    add(model, "x", make_vector({}));
    add(model, "y", std::nullopt);

    auto ids = model.ids();
    assert_true(ids.size() == 2, "Two ids");
    assert_true(ids.count("x") == 1 && ids.count("y") == 1, "All ids present");
}

TEST(model_complete_tour_check) {
    PlaylistModel model;
    add(model, "a", make_vector({}));
    add(model, "b", make_vector({}));
    add(model, "c", make_vector({}));

    Tour good;
    good.track_ids = {"c", "a", "b"};
    assert_true(is_complete_tour(model, good), "Permutation is complete");

    Tour duplicate;
    duplicate.track_ids = {"a", "a", "b"};
    assert_true(!is_complete_tour(model, duplicate), "Duplicates rejected");

    Tour short_tour;
    short_tour.track_ids = {"a", "b"};
    assert_true(!is_complete_tour(model, short_tour), "Omissions rejected");

    Tour foreign;
    foreign.track_ids = {"a", "b", "q"};
    assert_true(!is_complete_tour(model, foreign), "Unknown ids rejected");
}

/* ============================================================================
 * GreedyTourBuilder Tests
 * ============================================================================ */

TEST(tour_nearest_neighbour_scenario) {
    PlaylistModel model;
    add(model, "A", make_vector({0.0f}));
    add(model, "B", make_vector({1.0f}));
    add(model, "C", make_vector({5.0f}));

    GreedyTourBuilder builder;
    auto tour = builder.build(model);

    assert_true(tour.ok(), "Build should succeed");
    assert_order(tour.value(), {"A", "B", "C"}, "A -> B (1) beats A -> C (5)");
    assert_near(tour.value().total_distance, 5.0f, 1e-5f, "1 + 4");
    assert_true(tour.value().iterations == 2, "n - 1 iterations");
}

TEST(tour_greedy_not_insertion_order) {
    PlaylistModel model;
    add(model, "start", make_vector({0.0f}));
    add(model, "far", make_vector({10.0f}));
    add(model, "near", make_vector({1.0f}));
    add(model, "middle", make_vector({4.0f}));

    GreedyTourBuilder builder;
    auto tour = builder.build(model);

    assert_true(tour.ok(), "Build should succeed");
    assert_order(tour.value(), {"start", "near", "middle", "far"}, "Walks to nearest each step");
}

TEST(tour_is_permutation) {
    GreedyTourBuilder builder;

    for (int n : {1, 2, 3, 10, 57}) {
        PlaylistModel model = make_random_model(n, static_cast<uint32_t>(100 + n));
        auto tour = builder.build(model);

        assert_true(tour.ok(), "Build should succeed");
        assert_true(tour.value().size() == static_cast<size_t>(n), "Same length as model");
        assert_true(is_complete_tour(model, tour.value()), "Every id exactly once");
        assert_true(tour.value().iterations == static_cast<size_t>(n - 1), "n - 1 iterations");
    }
}

TEST(tour_deterministic) {
    PlaylistModel model = make_random_model(40, 1234);
    GreedyTourBuilder builder1;
    GreedyTourBuilder builder2;

    auto t1 = builder1.build(model);
    auto t2 = builder2.build(model);
    auto t3 = builder1.build(model);

    assert_true(t1.ok() && t2.ok() && t3.ok(), "Builds should succeed");
    assert_true(t1.value().track_ids == t2.value().track_ids, "Same input, same tour");
    assert_true(t1.value().track_ids == t3.value().track_ids, "Repeat runs are identical");
}

TEST(tour_tie_break_insertion_order) {
    GreedyTourBuilder builder;

    PlaylistModel bc;
    add(bc, "A", make_vector({0.0f}));
    add(bc, "B", make_vector({1.0f, 1.0f}));
    add(bc, "C", make_vector({1.0f, 1.0f}));

    auto t1 = builder.build(bc);
    assert_true(t1.ok(), "Build should succeed");
    assert_order(t1.value(), {"A", "B", "C"}, "B inserted first wins the tie");

    PlaylistModel cb;
    add(cb, "A", make_vector({0.0f}));
    add(cb, "C", make_vector({1.0f, 1.0f}));
    add(cb, "B", make_vector({1.0f, 1.0f}));

    auto t2 = builder.build(cb);
    assert_true(t2.ok(), "Build should succeed");
    assert_order(t2.value(), {"A", "C", "B"}, "C inserted first wins the tie");
}

TEST(tour_tie_break_mirror_candidates) {
    // Equidistant but different vectors
    PlaylistModel model;
    add(model, "A", make_vector({0.0f}));
    add(model, "left", make_vector({-2.0f}));
    add(model, "right", make_vector({2.0f}));

    GreedyTourBuilder builder;
    auto tour = builder.build(model);
    assert_true(tour.ok(), "Build should succeed");
    assert_order(tour.value(), {"A", "left", "right"}, "Earliest candidate wins");
}

TEST(tour_single_track) {
    PlaylistModel model;
    add(model, "only", make_vector({0.3f}));

    GreedyTourBuilder builder;
    auto tour = builder.build(model);

    assert_true(tour.ok(), "Build should succeed");
    assert_order(tour.value(), {"only"}, "Single track tour");
    assert_true(tour.value().iterations == 0, "No iterations for one track");
    assert_true(tour.value().total_distance == 0.0f, "No distance travelled");
}

TEST(tour_empty_model) {
    PlaylistModel model;
    GreedyTourBuilder builder;

    auto tour = builder.build(model);
    assert_true(tour.ok(), "Empty model is a no-op");
    assert_true(tour.value().empty(), "Empty tour");
    assert_true(tour.value().iterations == 0, "No iterations");

    TourOptions options;
    options.seed_id = "x";
    auto seeded = builder.build(model, options);
    assert_true(seeded.failed(), "Seed cannot be in an empty model");
    assert_true(seeded.error_code() == ErrorCode::UnknownTrack, "UnknownTrack expected");
}

TEST(tour_missing_features_appended) {
    PlaylistModel model;
    add(model, "A", make_vector({0.0f}));
    add(model, "D", std::nullopt);
    add(model, "B", make_vector({1.0f}));
    add(model, "C", make_vector({5.0f}));

    GreedyTourBuilder builder;
    auto tour = builder.build(model);

    assert_true(tour.ok(), "AppendAtEnd must not fail");
    assert_order(tour.value(), {"A", "B", "C", "D"}, "Absent track goes last");
    assert_true(tour.value().missing_feature_ids == std::vector<std::string>{"D"}, "D reported");
    assert_true(tour.value().iterations == 2, "Only ranked tracks are walked");
    assert_true(is_complete_tour(model, tour.value()), "Still a permutation");
}

TEST(tour_missing_features_keep_insertion_order) {
    PlaylistModel model;
    add(model, "x2", std::nullopt);
    add(model, "A", make_vector({0.0f}));
    add(model, "x1", std::nullopt);
    add(model, "B", make_vector({1.0f}));
    add(model, "x3", std::nullopt);

    GreedyTourBuilder builder;
    auto tour = builder.build(model);

    assert_true(tour.ok(), "Build should succeed");
    assert_order(tour.value(), {"A", "B", "x2", "x1", "x3"},
        "Default seed without features: walk from first ranked, absent in insertion order");
}

TEST(tour_all_missing_features) {
    PlaylistModel model;
    add(model, "p", std::nullopt);
    add(model, "q", std::nullopt);

    GreedyTourBuilder builder;
    auto tour = builder.build(model);

    assert_true(tour.ok(), "Build should succeed");
    assert_order(tour.value(), {"p", "q"}, "Insertion order");
    assert_true(tour.value().iterations == 0, "Nothing to rank");
}

TEST(tour_missing_features_rejected) {
    PlaylistModel model;
    add(model, "A", make_vector({0.0f}));
    add(model, "D", std::nullopt);
    add(model, "B", make_vector({1.0f}));
    add(model, "E", std::nullopt);

    TourOptions options;
    options.missing_features = MissingFeaturePolicy::Reject;

    GreedyTourBuilder builder;
    auto tour = builder.build(model, options);

    assert_true(tour.failed(), "Reject policy should fail");
    assert_true(tour.error_code() == ErrorCode::MissingFeatures, "MissingFeatures expected");
    assert_true(tour.failure().track_ids == std::vector<std::string>({"D", "E"}), "All offending ids named");
    assert_true(tour.error().find("D") != std::string::npos, "Message names the tracks");
}

TEST(tour_reject_policy_without_missing) {
    PlaylistModel model;
    add(model, "A", make_vector({0.0f}));
    add(model, "B", make_vector({1.0f}));

    TourOptions options;
    options.missing_features = MissingFeaturePolicy::Reject;

    GreedyTourBuilder builder;
    auto tour = builder.build(model, options);
    assert_true(tour.ok(), "Nothing to reject");
    assert_order(tour.value(), {"A", "B"});
}

TEST(tour_explicit_seed) {
    PlaylistModel model;
    add(model, "A", make_vector({0.0f}));
    add(model, "B", make_vector({1.0f}));
    add(model, "C", make_vector({5.0f}));

    TourOptions options;
    options.seed_id = "C";

    GreedyTourBuilder builder;
    auto tour = builder.build(model, options);

    assert_true(tour.ok(), "Build should succeed");
    assert_order(tour.value(), {"C", "B", "A"}, "Walk starts at the requested seed");
}

TEST(tour_seed_errors) {
    PlaylistModel model;
    add(model, "A", make_vector({0.0f}));
    add(model, "D", std::nullopt);

    GreedyTourBuilder builder;

    TourOptions unknown;
    unknown.seed_id = "nope";
    auto t1 = builder.build(model, unknown);
    assert_true(t1.failed() && t1.error_code() == ErrorCode::UnknownTrack, "Unknown seed rejected");
    assert_true(t1.failure().track_ids == std::vector<std::string>{"nope"}, "Seed named");

    TourOptions absent;
    absent.seed_id = "D";
    auto t2 = builder.build(model, absent);
    assert_true(t2.failed() && t2.error_code() == ErrorCode::MissingFeatures, "Seed without features rejected");
    assert_true(t2.failure().track_ids == std::vector<std::string>{"D"}, "Seed named");
}

TEST(tour_invalid_dimension_propagated) {
    PlaylistModel model;
    add(model, "A", make_vector({0.0f}));
    add(model, "bad", FeatureVector(std::vector<float>{1.0f, 2.0f}));

    GreedyTourBuilder builder;
    auto tour = builder.build(model);

    assert_true(tour.failed(), "Malformed vector should fail");
    assert_true(tour.error_code() == ErrorCode::InvalidDimension, "InvalidDimension expected");

    const auto& ids = tour.failure().track_ids;
    assert_true(std::find(ids.begin(), ids.end(), "bad") != ids.end(), "Malformed track named");
}

TEST(tour_non_finite_features_rejected) {
    // NaN-featured track scanned first must not win the comparison
    PlaylistModel model;
    add(model, "A", make_vector({0.0f}));
    add(model, "B", make_vector({std::numeric_limits<float>::quiet_NaN()}));
    add(model, "C", make_vector({1.0f}));

    GreedyTourBuilder builder;
    auto tour = builder.build(model);

    assert_true(tour.failed(), "NaN features should fail the build");
    assert_true(tour.error_code() == ErrorCode::InvalidDimension, "InvalidDimension expected");

    const auto& ids = tour.failure().track_ids;
    assert_true(std::find(ids.begin(), ids.end(), "B") != ids.end(), "NaN track named");
}

TEST(tour_local_steps_are_minimal) {
    PlaylistModel model = make_random_model(30, 99);
    GreedyTourBuilder builder;
    DistanceMetric metric;

    auto tour = builder.build(model);
    assert_true(tour.ok(), "Build should succeed");

    const auto& order = tour.value().track_ids;
    std::unordered_set<std::string> visited;
    for (size_t i = 0; i + 1 < order.size(); ++i) {
        visited.insert(order[i]);
        const FeatureVector& current = *model.find(order[i])->features;
        float chosen = metric.distance(current, *model.find(order[i + 1])->features).value();

        for (const auto& id : model.ordered_ids()) {
            if (visited.count(id)) continue;
            float d = metric.distance(current, *model.find(id)->features).value();
            assert_true(chosen <= d, "Each step picks the nearest unvisited track");
        }
    }
}

/* ============================================================================
 * Main
 * ============================================================================ */

int main() {
    std::cout << "======================================\n";
    std::cout << "Spotiflow - Matcher Tests\n";
    std::cout << "======================================\n\n";

    std::cout << "--- DistanceMetric ---\n";
    RUN_TEST(distance_known_value);
    RUN_TEST(distance_reflexive_zero);
    RUN_TEST(distance_symmetric);
    RUN_TEST(distance_uses_every_axis);
    RUN_TEST(distance_invalid_dimension);
    RUN_TEST(distance_rejects_non_finite);
    RUN_TEST(distance_from_audio_features_order);
    RUN_TEST(distance_find_nearest_sorted);
    RUN_TEST(distance_find_nearest_reports_bad_track);

    std::cout << "\n--- PlaylistModel ---\n";
    RUN_TEST(model_insert_and_get);
    RUN_TEST(model_absent_is_not_zero);
    RUN_TEST(model_duplicate_track);
    RUN_TEST(model_unknown_track);
    RUN_TEST(model_first_inserted);
    RUN_TEST(model_ids);
    RUN_TEST(model_complete_tour_check);

    std::cout << "\n--- GreedyTourBuilder ---\n";
    RUN_TEST(tour_nearest_neighbour_scenario);
    RUN_TEST(tour_greedy_not_insertion_order);
    RUN_TEST(tour_is_permutation);
    RUN_TEST(tour_deterministic);
    RUN_TEST(tour_tie_break_insertion_order);
    RUN_TEST(tour_tie_break_mirror_candidates);
    RUN_TEST(tour_single_track);
    RUN_TEST(tour_empty_model);
    RUN_TEST(tour_missing_features_appended);
    RUN_TEST(tour_missing_features_keep_insertion_order);
    RUN_TEST(tour_all_missing_features);
    RUN_TEST(tour_missing_features_rejected);
    RUN_TEST(tour_reject_policy_without_missing);
    RUN_TEST(tour_explicit_seed);
    RUN_TEST(tour_seed_errors);
    RUN_TEST(tour_invalid_dimension_propagated);
    RUN_TEST(tour_non_finite_features_rejected);
    RUN_TEST(tour_local_steps_are_minimal);

    std::cout << "\n======================================\n";
    if (failed_tests == 0) {
        std::cout << "All tests passed!\n";
        return 0;
    } else {
        std::cout << failed_tests << " test(s) failed.\n";
        return 1;
    }
}
