#pragma once

#include <SDL.h>

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "keyframes/keyframe_store.hpp"
#include "text/text_service.hpp"
#include "utils/lru_cache.hpp"

namespace captionist {

class Frame;

inline constexpr const char* kDefaultFont = "Montserrat-Regular.ttf";
inline constexpr const char* kDefaultTextColor = "#FFF";
inline constexpr const char* kDefaultStrokeColor = "#000";
inline constexpr int kDefaultStrokeWidth = 2;
inline constexpr int kDefaultBackgroundMargin = 10;
inline constexpr std::size_t kDefaultMeasureCacheCapacity = 32;

// One animated caption: keyframed placement plus a text style.
class TextLayer {
public:
    explicit TextLayer(std::string id);

    const std::string& id() const { return id_; }

    KeyframeStore& keyframes() { return keyframes_; }
    const KeyframeStore& keyframes() const { return keyframes_; }

    const std::string& font() const { return font_; }
    const std::string& text_color() const { return text_color_; }
    const std::optional<std::string>& background_color() const { return background_color_; }
    int stroke_width() const { return stroke_width_; }
    const std::string& stroke_color() const { return stroke_color_; }

    // Setters reject invalid values and leave the layer untouched.
    bool set_font(const std::string& font);
    bool set_text_color(const std::string& color);
    bool set_background_color(const std::optional<std::string>& color);
    bool set_stroke_width(int width);
    bool set_stroke_color(const std::string& color);

    SDL_Rect bounding_box(SDL_Point center, int font_size, const std::string& text, const TextService& service) const;
    bool contains_point(SDL_Point point, int frame_index, const std::string& text, const TextService& service) const;

    // Stamps the caption onto frame at the interpolated state for frame_index.
    bool draw(Frame& frame, int frame_index, const std::string& text, const TextService& service) const;

    nlohmann::json to_json() const;
    // Throws std::runtime_error on a malformed record.
    static TextLayer from_json(const nlohmann::json& value);

    bool same_style(const TextLayer& other) const;

private:
    struct MeasureKey {
        std::string font;
        int size = 0;
        std::string text;

        bool operator==(const MeasureKey& other) const;
    };

    struct MeasureKeyHash {
        std::size_t operator()(const MeasureKey& key) const noexcept;
    };

    // Copies take a snapshot of the entries and get a fresh mutex.
    struct MeasureCache {
        explicit MeasureCache(std::size_t capacity) : entries(capacity) {}
        MeasureCache(const MeasureCache& other);
        MeasureCache& operator=(const MeasureCache& other);

        mutable std::mutex mutex;
        utils::LruCache<MeasureKey, SDL_Point, MeasureKeyHash> entries;
    };

    // Safe to call from several threads at once.
    SDL_Point measure(int font_size, const std::string& text, const TextService& service) const;

    std::string id_;
    KeyframeStore keyframes_;
    std::string font_ = kDefaultFont;
    std::string text_color_ = kDefaultTextColor;
    std::optional<std::string> background_color_;
    int stroke_width_ = kDefaultStrokeWidth;
    std::string stroke_color_ = kDefaultStrokeColor;

    mutable MeasureCache measure_cache_;
};

}
