#pragma once

#include <SDL.h>
#include <nlohmann/json_fwd.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace captionist::utils::color {

std::optional<SDL_Color> parse(std::string_view text);
bool is_valid(std::string_view text);

std::string to_hex(SDL_Color color);

// Accepts a colour string or an [r, g, b(, a)] channel array; anything else yields nullopt.
std::optional<std::string> from_json(const nlohmann::json& value);

}
