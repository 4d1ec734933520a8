#include "text_layer.hpp"

#include <functional>
#include <mutex>
#include <stdexcept>
#include <utility>

#include "config/settings.hpp"
#include "sequence/frame.hpp"
#include "sequence/surface_utils.hpp"
#include "utils/color.hpp"
#include "utils/log.hpp"

namespace captionist {

namespace {

std::size_t measure_cache_capacity() {
    const int configured = settings::load_int("text.measure_cache_capacity",
                                              static_cast<int>(kDefaultMeasureCacheCapacity));
    return configured > 0 ? static_cast<std::size_t>(configured) : kDefaultMeasureCacheCapacity;
}

bool fill_background(SDL_Surface* target, const SDL_Rect& rect, SDL_Color color) {
    surface_utils::SurfacePtr overlay = surface_utils::make_surface_ptr(
        SDL_CreateRGBSurfaceWithFormat(0, rect.w, rect.h, 32, SDL_PIXELFORMAT_RGBA32));
    if (!overlay) {
        return false;
    }
    SDL_FillRect(overlay.get(), nullptr, SDL_MapRGBA(overlay->format, color.r, color.g, color.b, color.a));
    SDL_SetSurfaceBlendMode(overlay.get(), SDL_BLENDMODE_BLEND);
    SDL_Rect dst = rect;
    return SDL_BlitSurface(overlay.get(), nullptr, target, &dst) == 0;
}

std::string read_color(const nlohmann::json& record, const char* key, const std::string& fallback) {
    auto it = record.find(key);
    if (it == record.end() || it->is_null()) {
        return fallback;
    }
    std::optional<std::string> parsed = utils::color::from_json(*it);
    if (!parsed) {
        throw std::runtime_error(std::string("Text layer field '") + key + "' is not a valid colour");
    }
    return *parsed;
}

}

bool TextLayer::MeasureKey::operator==(const MeasureKey& other) const {
    return size == other.size && font == other.font && text == other.text;
}

std::size_t TextLayer::MeasureKeyHash::operator()(const MeasureKey& key) const noexcept {
    std::size_t h = std::hash<std::string>{}(key.font);
    h ^= std::hash<int>{}(key.size) + 0x9e3779b9 + (h << 6) + (h >> 2);
    h ^= std::hash<std::string>{}(key.text) + 0x9e3779b9 + (h << 6) + (h >> 2);
    return h;
}

TextLayer::MeasureCache::MeasureCache(const MeasureCache& other)
: entries(1) {
    std::lock_guard<std::mutex> lock(other.mutex);
    entries = other.entries;
}

TextLayer::MeasureCache& TextLayer::MeasureCache::operator=(const MeasureCache& other) {
    if (this != &other) {
        std::scoped_lock lock(mutex, other.mutex);
        entries = other.entries;
    }
    return *this;
}

TextLayer::TextLayer(std::string id)
: id_(std::move(id)), measure_cache_(measure_cache_capacity()) {}

bool TextLayer::set_font(const std::string& font) {
    if (font.empty()) {
        return false;
    }
    font_ = font;
    return true;
}

bool TextLayer::set_text_color(const std::string& color) {
    if (!utils::color::is_valid(color)) {
        return false;
    }
    text_color_ = color;
    return true;
}

bool TextLayer::set_background_color(const std::optional<std::string>& color) {
    if (color && !utils::color::is_valid(*color)) {
        return false;
    }
    background_color_ = color;
    return true;
}

bool TextLayer::set_stroke_width(int width) {
    if (width < 0) {
        return false;
    }
    stroke_width_ = width;
    return true;
}

bool TextLayer::set_stroke_color(const std::string& color) {
    if (!utils::color::is_valid(color)) {
        return false;
    }
    stroke_color_ = color;
    return true;
}

SDL_Point TextLayer::measure(int font_size, const std::string& text, const TextService& service) const {
    MeasureKey key{font_, font_size, text};
    {
        std::lock_guard<std::mutex> lock(measure_cache_.mutex);
        if (auto cached = measure_cache_.entries.get(key)) {
            return *cached;
        }
    }
    const SDL_Point size = service.measure(font_, font_size, text);
    std::lock_guard<std::mutex> lock(measure_cache_.mutex);
    measure_cache_.entries.put(key, size);
    return size;
}

SDL_Rect TextLayer::bounding_box(SDL_Point center, int font_size, const std::string& text, const TextService& service) const {
    const SDL_Point size = measure(font_size, text, service);
    return SDL_Rect{center.x - size.x / 2, center.y - size.y / 2, size.x, size.y};
}

bool TextLayer::contains_point(SDL_Point point, int frame_index, const std::string& text, const TextService& service) const {
    const ResolvedKeyframe state = keyframes_.interpolate(frame_index);
    const SDL_Rect box = bounding_box(state.position, state.size, text, service);
    return SDL_PointInRect(&point, &box) == SDL_TRUE;
}

bool TextLayer::draw(Frame& frame, int frame_index, const std::string& text, const TextService& service) const {
    if (text.empty()) {
        return true;
    }
    const ResolvedKeyframe state = keyframes_.interpolate(frame_index);
    const SDL_Rect box = bounding_box(state.position, state.size, text, service);

    if (background_color_) {
        if (auto background = utils::color::parse(*background_color_)) {
            const int margin = settings::load_int("text.background_margin", kDefaultBackgroundMargin);
            const SDL_Rect padded{box.x - margin, box.y - margin, box.w + 2 * margin, box.h + 2 * margin};
            if (!fill_background(frame.surface(), padded, *background)) {
                log::warn("[TextLayer] Background fill failed for '" + id_ + "': " + SDL_GetError());
            }
        }
    }

    const SDL_Color fill = utils::color::parse(text_color_).value_or(SDL_Color{255, 255, 255, 255});
    const SDL_Color stroke = utils::color::parse(stroke_color_).value_or(SDL_Color{0, 0, 0, 255});
    const bool drawn = service.draw(frame.surface(), box, text, font_, state.size, fill, stroke_width_, stroke);
    if (!drawn) {
        log::warn("[TextLayer] Failed to draw '" + id_ + "' on frame " + std::to_string(frame_index));
    }
    return drawn;
}

nlohmann::json TextLayer::to_json() const {
    nlohmann::json out = nlohmann::json::object();
    out["id"] = id_;
    out["keyframes"] = keyframes_.to_json();
    out["font"] = font_;
    out["text_color"] = text_color_;
    if (background_color_) {
        out["background_color"] = *background_color_;
    } else {
        out["background_color"] = nullptr;
    }
    out["stroke_width"] = stroke_width_;
    out["stroke_color"] = stroke_color_;
    return out;
}

TextLayer TextLayer::from_json(const nlohmann::json& value) {
    if (!value.is_object()) {
        throw std::runtime_error("Text layer record must be a JSON object");
    }
    auto id = value.find("id");
    if (id == value.end() || !id->is_string() || id->get<std::string>().empty()) {
        throw std::runtime_error("Text layer record is missing a string 'id'");
    }
    TextLayer layer(id->get<std::string>());

    auto keyframes = value.find("keyframes");
    if (keyframes != value.end() && !keyframes->is_null()) {
        layer.keyframes_ = KeyframeStore::from_json(*keyframes);
    }

    auto font = value.find("font");
    if (font == value.end()) {
        font = value.find("font_path");
    }
    if (font != value.end() && !font->is_null()) {
        if (!font->is_string() || !layer.set_font(font->get<std::string>())) {
            throw std::runtime_error("Text layer '" + layer.id_ + "' has an invalid font");
        }
    }

    layer.text_color_ = read_color(value, "text_color", kDefaultTextColor);
    layer.stroke_color_ = read_color(value, "stroke_color", kDefaultStrokeColor);
    auto background = value.find("background_color");
    if (background != value.end() && !background->is_null()) {
        layer.background_color_ = read_color(value, "background_color", "");
    }

    auto stroke = value.find("stroke_width");
    if (stroke != value.end() && !stroke->is_null()) {
        if (!stroke->is_number_integer() || !layer.set_stroke_width(stroke->get<int>())) {
            throw std::runtime_error("Text layer '" + layer.id_ + "' has an invalid stroke_width");
        }
    }
    return layer;
}

bool TextLayer::same_style(const TextLayer& other) const {
    return font_ == other.font_ && text_color_ == other.text_color_ &&
           background_color_ == other.background_color_ && stroke_width_ == other.stroke_width_ &&
           stroke_color_ == other.stroke_color_;
}

}
