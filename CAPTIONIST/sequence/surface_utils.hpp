#pragma once

#include <SDL.h>

#include <memory>

namespace captionist::surface_utils {

using SurfacePtr = std::unique_ptr<SDL_Surface, decltype(&SDL_FreeSurface)>;

SurfacePtr make_surface_ptr(SDL_Surface* surface);

// Frames are kept as packed 24-bit RGB.
inline constexpr Uint32 kFramePixelFormat = SDL_PIXELFORMAT_RGB24;

SurfacePtr create_frame_surface(int width, int height);
SurfacePtr duplicate_surface(SDL_Surface* surface);
SurfacePtr from_rgba_pixels(const unsigned char* rgba, int width, int height);

bool same_pixels(SDL_Surface* a, SDL_Surface* b);

SDL_Color read_pixel(SDL_Surface* surface, int x, int y);

}
