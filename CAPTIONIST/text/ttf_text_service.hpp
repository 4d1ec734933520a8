#pragma once

#include <SDL.h>
#include <SDL_ttf.h>

#include <mutex>
#include <string>
#include <unordered_map>

#include "text/text_service.hpp"

namespace captionist {

// SDL_ttf backed text service. Opened fonts are cached per (path, size, outline) and
// closed on destruction, so the service must not outlive TTF_Quit.
class TtfTextService : public TextService {
public:
    TtfTextService() = default;
    ~TtfTextService() override;

    TtfTextService(const TtfTextService&) = delete;
    TtfTextService& operator=(const TtfTextService&) = delete;

    SDL_Point measure(const std::string& font, int size, const std::string& text) const override;

    bool draw(SDL_Surface* target,
              const SDL_Rect& box,
              const std::string& text,
              const std::string& font,
              int size,
              SDL_Color fill,
              int stroke_width,
              SDL_Color stroke_color) const override;

    TTF_Font* get_font(const std::string& reference, int size, int outline = 0) const;

    void clear();

private:
    struct FontKey {
        std::string path;
        int size = 0;
        int outline = 0;

        bool operator==(const FontKey& other) const;
    };

    struct FontKeyHash {
        std::size_t operator()(const FontKey& key) const noexcept;
    };

    TTF_Font* load_font(const std::string& path, int size, int outline) const;

    mutable std::unordered_map<FontKey, TTF_Font*, FontKeyHash> fonts_;
    mutable std::mutex mutex_;
};

}
