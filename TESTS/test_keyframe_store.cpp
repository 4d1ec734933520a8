#include "doctest/doctest.h"

#include <stdexcept>

#include <nlohmann/json.hpp>

#include "keyframes/keyframe_store.hpp"

using captionist::Keyframe;
using captionist::KeyframeStore;
using captionist::ResolvedKeyframe;

namespace {
Keyframe make_keyframe(int index, std::optional<SDL_Point> position, std::optional<int> size) {
    Keyframe kf;
    kf.frame_index = index;
    kf.position = position;
    kf.size = size;
    return kf;
}
}

TEST_CASE("empty store resolves to the default placement") {
    KeyframeStore store;
    const ResolvedKeyframe resolved = store.interpolate(7);
    CHECK(resolved.position.x == 20);
    CHECK(resolved.position.y == 20);
    CHECK(resolved.size == 50);
}

TEST_CASE("single keyframe extrapolates flat in both directions") {
    KeyframeStore store;
    store.insert_or_merge(make_keyframe(5, SDL_Point{100, 50}, std::nullopt));

    for (int frame : {0, 5, 9, 40}) {
        const ResolvedKeyframe resolved = store.interpolate(frame);
        CHECK(resolved.position.x == 100);
        CHECK(resolved.position.y == 50);
        CHECK(resolved.size == 50);
    }
}

TEST_CASE("values between keyframes are linearly interpolated") {
    KeyframeStore store;
    store.insert_or_merge(make_keyframe(0, SDL_Point{0, 0}, 10));
    store.insert_or_merge(make_keyframe(10, SDL_Point{100, 200}, 30));

    const ResolvedKeyframe mid = store.interpolate(5);
    CHECK(mid.position.x == 50);
    CHECK(mid.position.y == 100);
    CHECK(mid.size == 20);

    const ResolvedKeyframe early = store.interpolate(3);
    CHECK(early.position.x == 30);
    CHECK(early.position.y == 60);
    CHECK(early.size == 16);

    const ResolvedKeyframe after = store.interpolate(15);
    CHECK(after.position.x == 100);
    CHECK(after.position.y == 200);
    CHECK(after.size == 30);
}

TEST_CASE("interpolated values round to the nearest integer") {
    KeyframeStore store;
    store.insert_or_merge(make_keyframe(0, SDL_Point{0, 0}, std::nullopt));
    store.insert_or_merge(make_keyframe(3, SDL_Point{10, -10}, std::nullopt));

    CHECK(store.interpolate(1).position.x == 3);
    CHECK(store.interpolate(2).position.x == 7);
    CHECK(store.interpolate(1).position.y == -3);
    CHECK(store.interpolate(2).position.y == -7);
}

TEST_CASE("position and size resolve independently") {
    KeyframeStore store;
    store.insert_or_merge(make_keyframe(0, SDL_Point{0, 0}, std::nullopt));
    store.insert_or_merge(make_keyframe(10, std::nullopt, 40));
    store.insert_or_merge(make_keyframe(20, SDL_Point{20, 40}, std::nullopt));

    const ResolvedKeyframe resolved = store.interpolate(5);
    CHECK(resolved.position.x == 5);
    CHECK(resolved.position.y == 10);
    CHECK(resolved.size == 40);
}

TEST_CASE("an explicit keyframe returns its stored values") {
    KeyframeStore store;
    store.insert_or_merge(make_keyframe(0, SDL_Point{0, 0}, 10));
    store.insert_or_merge(make_keyframe(4, SDL_Point{77, 13}, 61));
    store.insert_or_merge(make_keyframe(8, SDL_Point{0, 0}, 10));

    const ResolvedKeyframe resolved = store.interpolate(4);
    CHECK(resolved.position.x == 77);
    CHECK(resolved.position.y == 13);
    CHECK(resolved.size == 61);
}

TEST_CASE("inserting at an occupied index merges present fields") {
    KeyframeStore store;
    store.insert_or_merge(make_keyframe(4, SDL_Point{1, 2}, std::nullopt));
    store.insert_or_merge(make_keyframe(4, std::nullopt, 30));

    REQUIRE(store.size() == 1);
    auto kf = store.get(4);
    REQUIRE(kf.has_value());
    REQUIRE(kf->position.has_value());
    CHECK(kf->position->x == 1);
    CHECK(kf->position->y == 2);
    CHECK(kf->size == 30);

    store.insert_or_merge(make_keyframe(4, SDL_Point{5, 5}, std::nullopt));
    kf = store.get(4);
    REQUIRE(kf.has_value());
    CHECK(kf->position->x == 5);
    CHECK(kf->size == 30);
}

TEST_CASE("keyframes stay sorted and unique by frame index") {
    KeyframeStore store;
    for (int index : {9, 2, 5, 2, 0}) {
        store.insert_or_merge(make_keyframe(index, std::nullopt, index + 1));
    }
    CHECK(store.frame_indices() == std::vector<int>{0, 2, 5, 9});
}

TEST_CASE("get and remove report missing keyframes without side effects") {
    KeyframeStore store;
    store.insert_or_merge(make_keyframe(3, SDL_Point{1, 1}, 12));

    CHECK_FALSE(store.get(4).has_value());
    CHECK_FALSE(store.contains(4));
    store.remove(4);
    CHECK(store.size() == 1);

    store.remove(3);
    CHECK(store.empty());
}

TEST_CASE("interpolate_keyframe freezes the resolved state") {
    KeyframeStore store;
    store.insert_or_merge(make_keyframe(0, SDL_Point{0, 0}, 10));
    store.insert_or_merge(make_keyframe(10, SDL_Point{100, 100}, 20));

    const Keyframe frozen = store.interpolate_keyframe(5);
    CHECK(frozen.frame_index == 5);
    REQUIRE(frozen.position.has_value());
    CHECK(frozen.position->x == 50);
    CHECK(frozen.size == 15);

    store.insert_or_merge(frozen);
    store.remove(10);
    CHECK(store.interpolate(8).position.x == 50);
}

TEST_CASE("keyframe JSON round trip preserves partial fields") {
    KeyframeStore store;
    store.insert_or_merge(make_keyframe(0, SDL_Point{10, 20}, std::nullopt));
    store.insert_or_merge(make_keyframe(6, std::nullopt, 44));

    const nlohmann::json json = store.to_json();
    REQUIRE(json.is_array());
    REQUIRE(json.size() == 2);
    CHECK(json[0]["frame_index"] == 0);
    CHECK(json[0]["size"].is_null());
    CHECK(json[1]["position"].is_null());

    const KeyframeStore restored = KeyframeStore::from_json(json);
    CHECK(restored == store);
}

TEST_CASE("keyframe JSON accepts legacy keys") {
    const nlohmann::json legacy = nlohmann::json::parse(R"([{"frame_ind": 3, "position": [1, 2], "text_size": 12}])");
    const KeyframeStore store = KeyframeStore::from_json(legacy);
    auto kf = store.get(3);
    REQUIRE(kf.has_value());
    CHECK(kf->position->x == 1);
    CHECK(kf->position->y == 2);
    CHECK(kf->size == 12);
}

TEST_CASE("malformed keyframe JSON is rejected") {
    CHECK_THROWS_AS(KeyframeStore::from_json(nlohmann::json::object()), std::runtime_error);
    CHECK_THROWS_AS(KeyframeStore::from_json(nlohmann::json::parse(R"([{"position": [1, 2]}])")), std::runtime_error);
    CHECK_THROWS_AS(KeyframeStore::from_json(nlohmann::json::parse(R"([{"frame_index": 1, "position": [1]}])")), std::runtime_error);
}
