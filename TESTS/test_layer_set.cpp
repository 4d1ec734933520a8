#include "doctest/doctest.h"

#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "composition/layer_set.hpp"
#include "sequence/sequence.hpp"
#include "stubs/fake_text_service.hpp"

using captionist::ContentByLayer;
using captionist::Frame;
using captionist::Keyframe;
using captionist::LayerSet;
using captionist::Sequence;

namespace {
Sequence black_sequence(int count) {
    return Sequence::repeat(Frame::blank(120, 80, SDL_Color{0, 0, 0, 255}, 100), count);
}

void place(LayerSet& layers, const std::string& id, int x, int y, int size) {
    Keyframe kf;
    kf.frame_index = 0;
    kf.position = SDL_Point{x, y};
    kf.size = size;
    layers.layer(id)->keyframes().insert_or_merge(kf);
}
}

TEST_CASE("a layer set starts with one default layer") {
    LayerSet layers;
    REQUIRE(layers.size() == 1);
    CHECK(layers.ids() == std::vector<std::string>{"Text 1"});
    CHECK(layers.content("Text 1") == std::string("Text 1"));
}

TEST_CASE("add_layer generates distinct sequential ids") {
    LayerSet layers;
    CHECK(layers.add_layer() == "Text 2");
    CHECK(layers.add_layer() == "Text 3");

    REQUIRE(layers.remove_layer("Text 1"));
    CHECK(layers.add_layer() == "Text 4");
    CHECK(layers.ids() == std::vector<std::string>{"Text 2", "Text 3", "Text 4"});
    CHECK(layers.content("Text 4") == std::string("Text 4"));
}

TEST_CASE("the last layer cannot be removed") {
    LayerSet layers;
    CHECK_FALSE(layers.remove_layer("Text 1"));
    CHECK(layers.size() == 1);
    CHECK_FALSE(layers.remove_layer("missing"));
}

TEST_CASE("content can only be set for existing layers") {
    LayerSet layers;
    CHECK(layers.set_content("Text 1", "hello"));
    CHECK(layers.content("Text 1") == std::string("hello"));
    CHECK_FALSE(layers.set_content("Text 9", "nope"));
    CHECK_FALSE(layers.content("Text 9").has_value());
}

TEST_CASE("render_all stamps every frame in place") {
    FakeTextService service;
    LayerSet layers;
    place(layers, "Text 1", 60, 40, 10);
    Sequence sequence = black_sequence(3);

    ContentByLayer contents{{"Text 1", "abcd"}};
    layers.render_all(sequence, contents, service);

    CHECK(service.draw_calls == 3);
    for (const Frame& frame : sequence) {
        const SDL_Color c = frame.pixel(60, 40);
        CHECK(c.r == 255);
        CHECK(c.g == 255);
        CHECK(c.b == 255);
    }
}

TEST_CASE("layers without content are skipped") {
    FakeTextService service;
    LayerSet layers;
    layers.add_layer();
    Sequence sequence = black_sequence(2);

    ContentByLayer contents{{"Text 2", "x"}};
    layers.render_all(sequence, contents, service);
    CHECK(service.draw_calls == 2);
}

TEST_CASE("render_active_first fires the hook once, right after the active frame") {
    FakeTextService service;
    LayerSet layers;
    Sequence sequence = black_sequence(10);

    int hook_calls = 0;
    int hook_index = -1;
    int draws_at_hook = -1;
    layers.render_active_first(sequence, layers.contents(), 4, service, [&](int index) {
        ++hook_calls;
        hook_index = index;
        draws_at_hook = service.draw_calls;
    });

    CHECK(hook_calls == 1);
    CHECK(hook_index == 4);
    CHECK(draws_at_hook == 1);
    CHECK(service.draw_calls == 10);
}

TEST_CASE("render_active_first clamps an out-of-range active index") {
    FakeTextService service;
    LayerSet layers;
    Sequence sequence = black_sequence(5);

    int hook_index = -1;
    layers.render_active_first(sequence, layers.contents(), 99, service, [&](int index) { hook_index = index; });
    CHECK(hook_index == 4);
}

TEST_CASE("layers_at lists the layers under a point, topmost first") {
    FakeTextService service;
    LayerSet layers;
    layers.add_layer();
    place(layers, "Text 1", 50, 50, 10);
    place(layers, "Text 2", 55, 50, 10);

    CHECK(layers.layers_at(SDL_Point{52, 50}, 0, service) == std::vector<std::string>{"Text 2", "Text 1"});
    CHECK(layers.layers_at(SDL_Point{200, 200}, 0, service).empty());
}

TEST_CASE("layer set JSON round trip preserves order and regenerates content") {
    LayerSet layers;
    layers.add_layer();
    layers.add_layer();
    REQUIRE(layers.remove_layer("Text 2"));
    REQUIRE(layers.set_content("Text 1", "top text"));
    REQUIRE(layers.layer("Text 3")->set_stroke_width(5));
    place(layers, "Text 3", 10, 10, 12);

    const nlohmann::json document = layers.to_json();
    const LayerSet restored = LayerSet::from_json(document);

    CHECK(restored.ids() == std::vector<std::string>{"Text 1", "Text 3"});
    CHECK(restored.content("Text 1") == std::string("Text 1"));
    CHECK(restored.layer("Text 3")->stroke_width() == 5);
    CHECK(restored.layer("Text 3")->keyframes() == layers.layer("Text 3")->keyframes());
    CHECK(restored.to_json() == document);
}

TEST_CASE("layer set JSON must hold at least one uniquely named layer") {
    CHECK_THROWS_AS(LayerSet::from_json(nlohmann::json::array()), std::runtime_error);
    CHECK_THROWS_AS(LayerSet::from_json(nlohmann::json::object()), std::runtime_error);
    CHECK_THROWS_AS(LayerSet::from_json(nlohmann::json::parse(R"([{"id": "A"}, {"id": "A"}])")), std::runtime_error);
}
