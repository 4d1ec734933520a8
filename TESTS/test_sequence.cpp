#include "doctest/doctest.h"

#include <stdexcept>
#include <vector>

#include "sequence/sequence.hpp"

using captionist::Frame;
using captionist::Sequence;

namespace {
Sequence striped_sequence(int count, int width = 16, int height = 12) {
    std::vector<Frame> frames;
    for (int i = 0; i < count; ++i) {
        const Uint8 shade = static_cast<Uint8>(20 * i);
        frames.push_back(Frame::blank(width, height, SDL_Color{shade, 0, 255, 255}, 40 + 10 * i));
    }
    return Sequence(std::move(frames));
}
}

TEST_CASE("slicing and concatenating reproduces the original sequence") {
    const Sequence original = striped_sequence(5);
    for (int cut = 0; cut <= 5; ++cut) {
        const Sequence joined = original.slice(0, cut) + original.slice(cut, 5);
        CHECK(joined == original);
    }
}

TEST_CASE("slice clamps its range and never mutates the source") {
    const Sequence original = striped_sequence(4);
    CHECK(original.slice(-5, 100) == original);
    CHECK(original.slice(3, 1).empty());
    const Sequence middle = original.slice(1, 3);
    REQUIRE(middle.size() == 2);
    CHECK(middle[0] == original[1]);
    CHECK(middle[1].duration() == original[2].duration());
    CHECK(original.size() == 4);
}

TEST_CASE("concatenating frames of different sizes fails") {
    const Sequence small = striped_sequence(2, 16, 12);
    const Sequence large = striped_sequence(2, 32, 12);
    CHECK_THROWS_AS(Sequence::concat(small, large), std::runtime_error);
    CHECK((Sequence() + small) == small);
}

TEST_CASE("copies do not share pixel buffers") {
    const Sequence original = striped_sequence(2);
    Sequence copy = original.copy();
    REQUIRE(copy == original);

    SDL_FillRect(copy[0].surface(), nullptr, SDL_MapRGB(copy[0].surface()->format, 1, 2, 3));
    CHECK(copy != original);
    const SDL_Color c = original[0].pixel(0, 0);
    CHECK(c.b == 255);
}

TEST_CASE("set replaces the image and the duration") {
    Sequence sequence = striped_sequence(3);
    const Frame replacement = Frame::blank(16, 12, SDL_Color{9, 9, 9, 255}, 777);
    sequence.set(1, replacement);
    CHECK(sequence[1] == replacement);
    CHECK(sequence.at(1).duration() == 777);
    CHECK_THROWS_AS(sequence.at(3), std::out_of_range);
    CHECK_THROWS_AS(sequence.set(-1, replacement), std::out_of_range);
}

TEST_CASE("repeat and append build sequences frame by frame") {
    const Frame frame = Frame::blank(8, 8, SDL_Color{1, 1, 1, 255}, 30);
    Sequence sequence = Sequence::repeat(frame, 3);
    CHECK(sequence.size() == 3);
    CHECK(Sequence::repeat(frame, 0).empty());

    sequence.append(frame);
    CHECK(sequence.size() == 4);
    CHECK_THROWS_AS(sequence.append(Frame::blank(4, 8, SDL_Color{1, 1, 1, 255}, 30)), std::runtime_error);
}
