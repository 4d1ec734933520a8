#include "ttf_text_service.hpp"

#include <algorithm>
#include <functional>
#include <utility>
#include <vector>

#include "config/settings.hpp"
#include "sequence/surface_utils.hpp"
#include "text/font_paths.hpp"
#include "utils/log.hpp"
#include "utils/string_utils.hpp"

namespace captionist {

namespace {
constexpr SDL_Point kZeroPoint{0, 0};

int line_width(TTF_Font* font, const std::string& line) {
    if (line.empty()) {
        return 0;
    }
    int w = 0;
    int h = 0;
    if (TTF_SizeUTF8(font, line.c_str(), &w, &h) != 0) {
        return 0;
    }
    return w;
}

bool blit_line(SDL_Surface* target, TTF_Font* font, const std::string& line, SDL_Color color, int x, int y) {
    surface_utils::SurfacePtr rendered = surface_utils::make_surface_ptr(TTF_RenderUTF8_Blended(font, line.c_str(), color));
    if (!rendered) {
        log::warn(std::string("[TtfTextService] Failed to render line: ") + TTF_GetError());
        return false;
    }
    SDL_SetSurfaceBlendMode(rendered.get(), SDL_BLENDMODE_BLEND);
    SDL_Rect dst{x, y, rendered->w, rendered->h};
    return SDL_BlitSurface(rendered.get(), nullptr, target, &dst) == 0;
}

}

bool TtfTextService::FontKey::operator==(const FontKey& other) const {
    return size == other.size && outline == other.outline && path == other.path;
}

std::size_t TtfTextService::FontKeyHash::operator()(const FontKey& key) const noexcept {
    std::size_t h1 = std::hash<std::string>{}(key.path);
    std::size_t h2 = std::hash<int>{}(key.size * 131 + key.outline);
    return h1 ^ (h2 + 0x9e3779b9 + (h1 << 6) + (h1 >> 2));
}

TtfTextService::~TtfTextService() {
    clear();
}

TTF_Font* TtfTextService::load_font(const std::string& path, int size, int outline) const {
    if (path.empty() || size <= 0) {
        return nullptr;
    }
    TTF_Font* font = TTF_OpenFont(path.c_str(), size);
    if (!font) {
        return nullptr;
    }
    TTF_SetFontKerning(font, settings::load_bool("text.kerning", true) ? 1 : 0);
    if (outline > 0) {
        TTF_SetFontOutline(font, outline);
    }
    return font;
}

TTF_Font* TtfTextService::get_font(const std::string& reference, int size, int outline) const {
    FontKey key{reference, size, outline};
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = fonts_.find(key);
    if (it != fonts_.end()) {
        return it->second;
    }
    TTF_Font* font = load_font(fonts::resolve_font_path(reference), size, outline);
    if (!font) {
        const std::string fallback = fonts::fallback_sans();
        log::warn("[TtfTextService] Unable to open font '" + reference + "' (" + TTF_GetError() +
                  "); falling back to '" + fallback + "'");
        font = load_font(fallback, size, outline);
    }
    if (!font) {
        return nullptr;
    }
    fonts_.emplace(std::move(key), font);
    return font;
}

SDL_Point TtfTextService::measure(const std::string& font_ref, int size, const std::string& text) const {
    if (text.empty()) {
        return kZeroPoint;
    }
    TTF_Font* font = get_font(font_ref, size);
    if (!font) {
        return kZeroPoint;
    }
    const std::vector<std::string> lines = strings::split_lines(text);
    int width = 0;
    for (const std::string& line : lines) {
        width = std::max(width, line_width(font, line));
    }
    const int skip = TTF_FontLineSkip(font);
    const int height = skip * static_cast<int>(lines.size() - 1) + TTF_FontHeight(font);
    return SDL_Point{width, height};
}

bool TtfTextService::draw(SDL_Surface* target,
                          const SDL_Rect& box,
                          const std::string& text,
                          const std::string& font_ref,
                          int size,
                          SDL_Color fill,
                          int stroke_width,
                          SDL_Color stroke_color) const {
    if (!target || text.empty()) {
        return false;
    }
    TTF_Font* font = get_font(font_ref, size);
    if (!font) {
        return false;
    }
    TTF_Font* outline_font = stroke_width > 0 ? get_font(font_ref, size, stroke_width) : nullptr;

    const std::vector<std::string> lines = strings::split_lines(text);
    const int skip = TTF_FontLineSkip(font);
    bool ok = true;
    for (int i = static_cast<int>(lines.size()) - 1; i >= 0; --i) {
        const std::string& line = lines[static_cast<std::size_t>(i)];
        if (line.empty()) {
            continue;
        }
        const int x = box.x + (box.w - line_width(font, line)) / 2;
        const int y = box.y + i * skip;
        if (outline_font) {
            ok = blit_line(target, outline_font, line, stroke_color, x - stroke_width, y - stroke_width) && ok;
        }
        ok = blit_line(target, font, line, fill, x, y) && ok;
    }
    return ok;
}

void TtfTextService::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& entry : fonts_) {
        if (entry.second) {
            TTF_CloseFont(entry.second);
        }
    }
    fonts_.clear();
}

}
