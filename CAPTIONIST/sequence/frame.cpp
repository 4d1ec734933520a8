#include "sequence/frame.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace captionist {

namespace {

surface_utils::SurfacePtr require_copy(SDL_Surface* source) {
    surface_utils::SurfacePtr copy = surface_utils::duplicate_surface(source);
    if (!copy) {
        throw std::runtime_error(std::string("Frame: failed to copy surface: ") + SDL_GetError());
    }
    return copy;
}

}

Frame::Frame(surface_utils::SurfacePtr image, int duration)
: image_(std::move(image)), duration_(duration) {
    if (!image_) {
        throw std::runtime_error("Frame: image surface is null");
    }
    if (image_->format->format != surface_utils::kFramePixelFormat) {
        image_ = require_copy(image_.get());
    }
}

Frame::Frame(const Frame& other)
: image_(require_copy(other.image_.get())), duration_(other.duration_) {}

Frame& Frame::operator=(const Frame& other) {
    if (this != &other) {
        image_ = require_copy(other.image_.get());
        duration_ = other.duration_;
    }
    return *this;
}

Frame Frame::blank(int width, int height, SDL_Color fill, int duration) {
    surface_utils::SurfacePtr surface = surface_utils::create_frame_surface(width, height);
    if (!surface) {
        throw std::runtime_error(std::string("Frame: failed to allocate surface: ") + SDL_GetError());
    }
    SDL_FillRect(surface.get(), nullptr, SDL_MapRGB(surface->format, fill.r, fill.g, fill.b));
    return Frame(std::move(surface), duration);
}

Frame Frame::from_rgba(const unsigned char* rgba, int width, int height, int duration) {
    surface_utils::SurfacePtr surface = surface_utils::from_rgba_pixels(rgba, width, height);
    if (!surface) {
        throw std::runtime_error("Frame: failed to build surface from RGBA pixels");
    }
    return Frame(std::move(surface), duration);
}

SDL_Color Frame::pixel(int x, int y) const {
    return surface_utils::read_pixel(image_.get(), x, y);
}

bool Frame::operator==(const Frame& other) const {
    return duration_ == other.duration_ && surface_utils::same_pixels(image_.get(), other.image_.get());
}

}
