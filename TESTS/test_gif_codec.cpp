#include "doctest/doctest.h"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>
#include <vector>

#include "sequence/gif_codec.hpp"
#include "sequence/sequence.hpp"
#include "utils/log.hpp"

namespace fs = std::filesystem;
using captionist::Frame;
using captionist::Sequence;

static fs::path test_root() {
#ifdef PROJECT_ROOT
    return fs::path(PROJECT_ROOT) / "TEST_TMP" / "gif_codec";
#else
    return fs::current_path() / "TEST_TMP" / "gif_codec";
#endif
}

namespace {
Frame two_tone_frame(SDL_Color left, SDL_Color right, int duration) {
    Frame frame = Frame::blank(20, 10, left, duration);
    SDL_Rect half{10, 0, 10, 10};
    SDL_FillRect(frame.surface(), &half, SDL_MapRGB(frame.surface()->format, right.r, right.g, right.b));
    return frame;
}

Sequence sample_sequence() {
    Sequence sequence;
    sequence.append(two_tone_frame(SDL_Color{255, 0, 0, 255}, SDL_Color{0, 0, 255, 255}, 100));
    sequence.append(two_tone_frame(SDL_Color{0, 255, 0, 255}, SDL_Color{255, 255, 255, 255}, 250));
    sequence.append(two_tone_frame(SDL_Color{0, 0, 0, 255}, SDL_Color{12, 34, 56, 255}, 40));
    return sequence;
}

std::vector<unsigned char> read_all(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<unsigned char>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

fs::path prepare(const char* name) {
    std::error_code ec;
    fs::create_directories(test_root(), ec);
    const fs::path path = test_root() / name;
    fs::remove(path, ec);
    return path;
}
}

TEST_CASE("looping GIFs keep frames, durations and the loop flag") {
    captionist::log::ScopedLevel quiet_log(captionist::log::Level::Warn);
    const fs::path path = prepare("looping.gif");
    Sequence original = sample_sequence();
    original.save(path, true);

    const Sequence reopened = Sequence::open(path);
    CHECK(reopened.loop());
    REQUIRE(reopened.size() == original.size());
    for (std::size_t i = 0; i < original.size(); ++i) {
        CHECK(reopened[i].duration() == original[i].duration());
        CHECK(reopened[i] == original[i]);
    }

    const std::optional<int> count = captionist::gif_codec::read_loop_count(read_all(path));
    REQUIRE(count.has_value());
    CHECK(*count == 0);
}

TEST_CASE("play-once GIFs carry no loop extension") {
    captionist::log::ScopedLevel quiet_log(captionist::log::Level::Warn);
    const fs::path path = prepare("once.gif");
    sample_sequence().save(path, false);

    CHECK_FALSE(captionist::gif_codec::read_loop_count(read_all(path)).has_value());
    CHECK_FALSE(Sequence::open(path).loop());
}

TEST_CASE("open, save, open is stable") {
    captionist::log::ScopedLevel quiet_log(captionist::log::Level::Warn);
    const fs::path first = prepare("stable_a.gif");
    const fs::path second = prepare("stable_b.gif");
    sample_sequence().save(first, true);

    const Sequence a = Sequence::open(first);
    a.save(second);
    const Sequence b = Sequence::open(second);
    CHECK(b == a);
}

TEST_CASE("durations are stored in centiseconds") {
    captionist::log::ScopedLevel quiet_log(captionist::log::Level::Warn);
    const fs::path path = prepare("rounded.gif");
    Sequence sequence;
    sequence.append(Frame::blank(4, 4, SDL_Color{1, 2, 3, 255}, 33));
    sequence.append(Frame::blank(4, 4, SDL_Color{3, 2, 1, 255}, 47));
    sequence.save(path, true);

    const Sequence reopened = Sequence::open(path);
    REQUIRE(reopened.size() == 2);
    CHECK(reopened[0].duration() == 30);
    CHECK(reopened[1].duration() == 50);
}

TEST_CASE("frames with more than 256 colours are quantised") {
    captionist::log::ScopedLevel quiet_log(captionist::log::Level::Warn);
    const fs::path path = prepare("gradient.gif");
    Frame frame = Frame::blank(64, 64, SDL_Color{0, 0, 0, 255}, 100);
    for (int y = 0; y < 64; ++y) {
        for (int x = 0; x < 64; ++x) {
            SDL_Rect px{x, y, 1, 1};
            SDL_FillRect(frame.surface(), &px, SDL_MapRGB(frame.surface()->format, x * 4, y * 4, 128));
        }
    }
    Sequence sequence;
    sequence.append(frame);
    sequence.save(path, true);

    const Sequence reopened = Sequence::open(path);
    REQUIRE(reopened.size() == 1);
    CHECK(reopened[0].width() == 64);
    CHECK(reopened[0].height() == 64);
    const SDL_Color c = reopened[0].pixel(32, 32);
    CHECK(c.b >= 120);
    CHECK(c.b <= 136);
}

TEST_CASE("missing or corrupt GIFs raise errors") {
    captionist::log::ScopedLevel quiet_log(captionist::log::Level::Error);
    CHECK_THROWS_AS(Sequence::open(test_root() / "does_not_exist.gif"), std::runtime_error);

    const fs::path junk = prepare("junk.gif");
    {
        std::ofstream out(junk, std::ios::binary);
        out << "definitely not a gif";
    }
    CHECK_THROWS_AS(Sequence::open(junk), std::runtime_error);
    CHECK_THROWS_AS(Sequence().save(prepare("empty.gif"), true), std::runtime_error);
}
