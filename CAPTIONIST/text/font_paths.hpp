#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace captionist::fonts {

// Directories searched for bare font file names, configured ones first.
std::vector<std::filesystem::path> search_dirs();

// Returns the first existing candidate; the reference itself when nothing matches.
std::string resolve_font_path(const std::string& reference);

// A system sans-serif face used when the requested font cannot be opened.
std::string fallback_sans();

}
