#pragma once

#include <SDL.h>

#include <algorithm>
#include <atomic>
#include <string>
#include <vector>

#include "text/text_service.hpp"
#include "utils/string_utils.hpp"

// Fixed metrics: every glyph is size/2 wide, every line is size tall. Drawing fills the
// box with the fill colour. measure may be called from several threads.
class FakeTextService : public captionist::TextService {
public:
    SDL_Point measure(const std::string&, int size, const std::string& text) const override {
        ++measure_calls;
        if (text.empty()) {
            return SDL_Point{0, 0};
        }
        const std::vector<std::string> lines = captionist::strings::split_lines(text);
        std::size_t longest = 0;
        for (const std::string& line : lines) {
            longest = std::max(longest, line.size());
        }
        return SDL_Point{static_cast<int>(longest) * (size / 2), static_cast<int>(lines.size()) * size};
    }

    bool draw(SDL_Surface* target,
              const SDL_Rect& box,
              const std::string&,
              const std::string&,
              int,
              SDL_Color fill,
              int,
              SDL_Color) const override {
        ++draw_calls;
        drawn_boxes.push_back(box);
        SDL_Rect dst = box;
        return SDL_FillRect(target, &dst, SDL_MapRGB(target->format, fill.r, fill.g, fill.b)) == 0;
    }

    mutable std::atomic<int> measure_calls{0};
    mutable int draw_calls = 0;
    mutable std::vector<SDL_Rect> drawn_boxes;
};
