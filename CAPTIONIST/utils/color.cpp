#include "color.hpp"

#include <algorithm>
#include <array>
#include <cstdio>
#include <utility>

#include <nlohmann/json.hpp>

#include "utils/string_utils.hpp"

namespace captionist::utils::color {

namespace {

int clamp_channel_value(int v) {
    return std::max(0, std::min(255, v));
}

std::optional<int> hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
    if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
    return std::nullopt;
}

std::optional<SDL_Color> parse_hex_color_string(std::string_view text) {
    if (text.empty() || text[0] != '#') {
        return std::nullopt;
    }
    const std::string_view digits = text.substr(1);
    const bool short_form = digits.size() == 3 || digits.size() == 4;
    const bool long_form = digits.size() == 6 || digits.size() == 8;
    if (!short_form && !long_form) {
        return std::nullopt;
    }

    const std::size_t width = short_form ? 1 : 2;
    const std::size_t channels = digits.size() / width;
    std::array<int, 4> values{0, 0, 0, 255};
    for (std::size_t i = 0; i < channels; ++i) {
        int value = 0;
        for (std::size_t j = 0; j < width; ++j) {
            auto digit = hex_digit(digits[i * width + j]);
            if (!digit) {
                return std::nullopt;
            }
            value = (value << 4) | *digit;
        }
        if (short_form) {
            value = value * 17;
        }
        values[i] = value;
    }
    return SDL_Color{static_cast<Uint8>(values[0]), static_cast<Uint8>(values[1]),
                     static_cast<Uint8>(values[2]), static_cast<Uint8>(values[3])};
}

std::optional<SDL_Color> parse_named_color(std::string_view text) {
    static const std::array<std::pair<const char*, SDL_Color>, 12> kNamed = {{
        {"white",   SDL_Color{255, 255, 255, 255}},
        {"black",   SDL_Color{0, 0, 0, 255}},
        {"red",     SDL_Color{255, 0, 0, 255}},
        {"green",   SDL_Color{0, 128, 0, 255}},
        {"lime",    SDL_Color{0, 255, 0, 255}},
        {"blue",    SDL_Color{0, 0, 255, 255}},
        {"yellow",  SDL_Color{255, 255, 0, 255}},
        {"cyan",    SDL_Color{0, 255, 255, 255}},
        {"magenta", SDL_Color{255, 0, 255, 255}},
        {"orange",  SDL_Color{255, 165, 0, 255}},
        {"gray",    SDL_Color{128, 128, 128, 255}},
        {"grey",    SDL_Color{128, 128, 128, 255}},
    }};
    const std::string lower = strings::to_lower_copy(std::string(text));
    for (const auto& entry : kNamed) {
        if (lower == entry.first) {
            return entry.second;
        }
    }
    return std::nullopt;
}

}

std::optional<SDL_Color> parse(std::string_view text) {
    const std::string trimmed = strings::trim_copy(text);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    if (trimmed[0] == '#') {
        return parse_hex_color_string(trimmed);
    }
    return parse_named_color(trimmed);
}

bool is_valid(std::string_view text) {
    return parse(text).has_value();
}

std::string to_hex(SDL_Color color) {
    char buffer[10];
    if (color.a == 255) {
        std::snprintf(buffer, sizeof(buffer), "#%02X%02X%02X", color.r, color.g, color.b);
    } else {
        std::snprintf(buffer, sizeof(buffer), "#%02X%02X%02X%02X", color.r, color.g, color.b, color.a);
    }
    return std::string(buffer);
}

std::optional<std::string> from_json(const nlohmann::json& value) {
    if (value.is_string()) {
        std::string text = value.get<std::string>();
        if (!is_valid(text)) {
            return std::nullopt;
        }
        return text;
    }
    if (value.is_array() && (value.size() == 3 || value.size() == 4)) {
        std::array<int, 4> channels{0, 0, 0, 255};
        for (std::size_t i = 0; i < value.size(); ++i) {
            if (!value[i].is_number()) {
                return std::nullopt;
            }
            channels[i] = clamp_channel_value(value[i].get<int>());
        }
        return to_hex(SDL_Color{static_cast<Uint8>(channels[0]), static_cast<Uint8>(channels[1]),
                                static_cast<Uint8>(channels[2]), static_cast<Uint8>(channels[3])});
    }
    return std::nullopt;
}

}
