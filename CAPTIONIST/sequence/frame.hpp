#pragma once

#include <SDL.h>

#include "sequence/surface_utils.hpp"

namespace captionist {

class Frame {
public:
    Frame(surface_utils::SurfacePtr image, int duration);

    Frame(const Frame& other);
    Frame& operator=(const Frame& other);
    Frame(Frame&&) noexcept = default;
    Frame& operator=(Frame&&) noexcept = default;

    static Frame blank(int width, int height, SDL_Color fill, int duration);
    static Frame from_rgba(const unsigned char* rgba, int width, int height, int duration);

    SDL_Surface* surface() const { return image_.get(); }
    int width() const { return image_->w; }
    int height() const { return image_->h; }
    bool same_size(const Frame& other) const { return width() == other.width() && height() == other.height(); }

    int duration() const { return duration_; }
    void set_duration(int duration) { duration_ = duration; }

    SDL_Color pixel(int x, int y) const;

    bool operator==(const Frame& other) const;
    bool operator!=(const Frame& other) const { return !(*this == other); }

private:
    surface_utils::SurfacePtr image_;
    int duration_ = 0;
};

}
