#pragma once

#include <SDL.h>

#include <string>

namespace captionist {

// Measures and rasterises multi-line caption text. Lines are separated by '\n'.
class TextService {
public:
    virtual ~TextService() = default;

    // Size of the whole text block; {0, 0} when the font cannot be used.
    virtual SDL_Point measure(const std::string& font, int size, const std::string& text) const = 0;

    // Draws the block inside box (as returned by measure, positioned by the caller): the
    // stroke pass goes beneath the fill pass and lines are centred horizontally.
    virtual bool draw(SDL_Surface* target,
                      const SDL_Rect& box,
                      const std::string& text,
                      const std::string& font,
                      int size,
                      SDL_Color fill,
                      int stroke_width,
                      SDL_Color stroke_color) const = 0;
};

}
