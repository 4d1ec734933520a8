#include "sequence/surface_utils.hpp"

#include <cstring>
#include <cstddef>

namespace captionist::surface_utils {

namespace {

class ScopedSurfaceLock {
public:
    explicit ScopedSurfaceLock(SDL_Surface* surface)
    : surface_(surface) {
        if (surface_ && SDL_MUSTLOCK(surface_)) {
            locked_ = SDL_LockSurface(surface_) == 0;
        }
    }
    ~ScopedSurfaceLock() {
        if (locked_) {
            SDL_UnlockSurface(surface_);
        }
    }

    ScopedSurfaceLock(const ScopedSurfaceLock&) = delete;
    ScopedSurfaceLock& operator=(const ScopedSurfaceLock&) = delete;

    bool ok() const { return surface_ && (!SDL_MUSTLOCK(surface_) || locked_); }

private:
    SDL_Surface* surface_ = nullptr;
    bool locked_ = false;
};

}

SurfacePtr make_surface_ptr(SDL_Surface* surface) {
    return SurfacePtr(surface, SDL_FreeSurface);
}

SurfacePtr create_frame_surface(int width, int height) {
    if (width <= 0 || height <= 0) {
        return make_surface_ptr(nullptr);
    }
    return make_surface_ptr(SDL_CreateRGBSurfaceWithFormat(0, width, height, 24, kFramePixelFormat));
}

SurfacePtr duplicate_surface(SDL_Surface* surface) {
    if (!surface) {
        return make_surface_ptr(nullptr);
    }
    SurfacePtr copy = make_surface_ptr(SDL_ConvertSurfaceFormat(surface, kFramePixelFormat, 0));
    if (copy) {
        return copy;
    }
    SurfacePtr fallback = create_frame_surface(surface->w, surface->h);
    if (!fallback) {
        return fallback;
    }
    SDL_Rect rect{0, 0, surface->w, surface->h};
    if (SDL_BlitSurface(surface, &rect, fallback.get(), &rect) != 0) {
        return make_surface_ptr(nullptr);
    }
    return fallback;
}

SurfacePtr from_rgba_pixels(const unsigned char* rgba, int width, int height) {
    if (!rgba) {
        return make_surface_ptr(nullptr);
    }
    SurfacePtr surface = create_frame_surface(width, height);
    if (!surface) {
        return surface;
    }
    ScopedSurfaceLock lock(surface.get());
    if (!lock.ok()) {
        return make_surface_ptr(nullptr);
    }
    auto* dst = static_cast<Uint8*>(surface->pixels);
    for (int y = 0; y < height; ++y) {
        const unsigned char* src_row = rgba + static_cast<std::size_t>(y) * static_cast<std::size_t>(width) * 4;
        Uint8* dst_row = dst + static_cast<std::size_t>(y) * static_cast<std::size_t>(surface->pitch);
        for (int x = 0; x < width; ++x) {
            dst_row[x * 3 + 0] = src_row[x * 4 + 0];
            dst_row[x * 3 + 1] = src_row[x * 4 + 1];
            dst_row[x * 3 + 2] = src_row[x * 4 + 2];
        }
    }
    return surface;
}

bool same_pixels(SDL_Surface* a, SDL_Surface* b) {
    if (a == b) {
        return true;
    }
    if (!a || !b) {
        return false;
    }
    if (a->w != b->w || a->h != b->h || a->format->format != b->format->format) {
        return false;
    }
    ScopedSurfaceLock lock_a(a);
    ScopedSurfaceLock lock_b(b);
    if (!lock_a.ok() || !lock_b.ok()) {
        return false;
    }
    const std::size_t row_bytes = static_cast<std::size_t>(a->w) * a->format->BytesPerPixel;
    const auto* pa = static_cast<const Uint8*>(a->pixels);
    const auto* pb = static_cast<const Uint8*>(b->pixels);
    for (int y = 0; y < a->h; ++y) {
        if (std::memcmp(pa + static_cast<std::size_t>(y) * a->pitch,
                        pb + static_cast<std::size_t>(y) * b->pitch, row_bytes) != 0) {
            return false;
        }
    }
    return true;
}

SDL_Color read_pixel(SDL_Surface* surface, int x, int y) {
    SDL_Color color{0, 0, 0, 0};
    if (!surface || x < 0 || y < 0 || x >= surface->w || y >= surface->h) {
        return color;
    }
    ScopedSurfaceLock lock(surface);
    if (!lock.ok()) {
        return color;
    }
    const int bpp = surface->format->BytesPerPixel;
    const Uint8* p = static_cast<const Uint8*>(surface->pixels) +
                     static_cast<std::size_t>(y) * surface->pitch + static_cast<std::size_t>(x) * bpp;
    Uint32 pixel = 0;
    switch (bpp) {
        case 1: pixel = *p; break;
        case 2: pixel = *reinterpret_cast<const Uint16*>(p); break;
        case 3:
            if (SDL_BYTEORDER == SDL_BIG_ENDIAN) {
                pixel = (static_cast<Uint32>(p[0]) << 16) | (static_cast<Uint32>(p[1]) << 8) | p[2];
            } else {
                pixel = p[0] | (static_cast<Uint32>(p[1]) << 8) | (static_cast<Uint32>(p[2]) << 16);
            }
            break;
        default: pixel = *reinterpret_cast<const Uint32*>(p); break;
    }
    SDL_GetRGBA(pixel, surface->format, &color.r, &color.g, &color.b, &color.a);
    return color;
}

}
