#include "font_paths.hpp"

#include <initializer_list>
#include <system_error>

#include "config/settings.hpp"

namespace captionist::fonts {

namespace {

bool is_file(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec) && !ec;
}

std::string first_existing(std::initializer_list<const char*> candidates) {
    const char* fallback = nullptr;
    for (const char* path : candidates) {
        if (!path || !*path) continue;
        if (!fallback) fallback = path;
        if (is_file(path)) {
            return std::string(path);
        }
    }
    return fallback ? std::string(fallback) : std::string{};
}

}

std::vector<std::filesystem::path> search_dirs() {
    std::vector<std::filesystem::path> dirs;
    for (const std::string& dir : settings::load_string_list("fonts.search_dirs")) {
        if (!dir.empty()) {
            dirs.emplace_back(dir);
        }
    }
    dirs.emplace_back("fonts");
    dirs.emplace_back("assets/fonts");
#ifdef _WIN32
    dirs.emplace_back("C:/Windows/Fonts");
#else
    dirs.emplace_back("/usr/share/fonts/truetype");
    dirs.emplace_back("/usr/local/share/fonts");
#endif
    return dirs;
}

std::string resolve_font_path(const std::string& reference) {
    if (reference.empty()) {
        return fallback_sans();
    }
    const std::filesystem::path direct(reference);
    if (is_file(direct)) {
        return reference;
    }
    if (direct.is_absolute()) {
        return reference;
    }
    for (const auto& dir : search_dirs()) {
        const std::filesystem::path candidate = dir / direct;
        if (is_file(candidate)) {
            return candidate.string();
        }
        const std::filesystem::path nested = dir / direct.stem() / direct.filename();
        if (is_file(nested)) {
            return nested.string();
        }
    }
    return reference;
}

std::string fallback_sans() {
#ifdef _WIN32
    return first_existing({
        "C:/Windows/Fonts/segoeui.ttf",
        "C:/Windows/Fonts/arial.ttf",
        "C:/Windows/Fonts/verdana.ttf"
    });
#else
    return first_existing({
        "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
        "/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf",
        "/usr/share/fonts/truetype/freefont/FreeSans.ttf"
    });
#endif
}

}
