#pragma once

#include <SDL.h>

#include <optional>

namespace captionist {

inline constexpr SDL_Point kDefaultPosition{20, 20};
inline constexpr int kDefaultSize = 50;

// Position is the centre of the caption's bounding box.
struct Keyframe {
    int frame_index = 0;
    std::optional<SDL_Point> position;
    std::optional<int> size;

    bool has_position() const { return position.has_value(); }
    bool has_size() const { return size.has_value(); }
};

struct ResolvedKeyframe {
    SDL_Point position = kDefaultPosition;
    int size = kDefaultSize;
};

inline bool same_point(const SDL_Point& a, const SDL_Point& b) {
    return a.x == b.x && a.y == b.y;
}

inline bool operator==(const Keyframe& a, const Keyframe& b) {
    if (a.frame_index != b.frame_index || a.size != b.size || a.has_position() != b.has_position()) {
        return false;
    }
    return !a.has_position() || same_point(*a.position, *b.position);
}

inline bool operator!=(const Keyframe& a, const Keyframe& b) {
    return !(a == b);
}

inline bool operator==(const ResolvedKeyframe& a, const ResolvedKeyframe& b) {
    return same_point(a.position, b.position) && a.size == b.size;
}

}
