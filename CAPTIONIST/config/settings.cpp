#include "settings.hpp"

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <mutex>
#include <string>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>

#include "utils/log.hpp"

namespace captionist::settings {

namespace {

std::mutex& settings_mutex() {
    static std::mutex mutex;
    return mutex;
}

nlohmann::json& settings_cache() {
    static nlohmann::json cache = nlohmann::json::object();
    return cache;
}

bool& settings_loaded_flag() {
    static bool loaded = false;
    return loaded;
}

nlohmann::json read_settings_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return nlohmann::json::object();
    }
    std::ifstream in(path);
    if (!in.is_open()) {
        log::warn("[Settings] Unable to open '" + path.string() + "'; using defaults");
        return nlohmann::json::object();
    }
    try {
        nlohmann::json parsed;
        in >> parsed;
        if (!parsed.is_object()) {
            log::warn("[Settings] '" + path.string() + "' is not a JSON object; using defaults");
            return nlohmann::json::object();
        }
        return parsed;
    } catch (const nlohmann::json::parse_error& ex) {
        log::warn("[Settings] Parse error in '" + path.string() + "': " + ex.what());
        return nlohmann::json::object();
    }
}

void ensure_loaded() {
    if (settings_loaded_flag()) {
        return;
    }
    settings_loaded_flag() = true;
    settings_cache() = read_settings_file(settings_path());
}

std::vector<std::string> split_key(std::string_view key) {
    std::vector<std::string> parts;
    std::string current;
    for (char ch : key) {
        if (ch == '.') {
            if (!current.empty()) {
                parts.push_back(current);
                current.clear();
            }
        } else {
            current.push_back(ch);
        }
    }
    if (!current.empty()) {
        parts.push_back(current);
    }
    return parts;
}

const nlohmann::json* find_node(std::string_view key) {
    const auto parts = split_key(key);
    if (parts.empty()) {
        return nullptr;
    }
    const nlohmann::json* node = &settings_cache();
    for (const auto& part : parts) {
        if (!node->is_object()) {
            return nullptr;
        }
        auto it = node->find(part);
        if (it == node->end()) {
            return nullptr;
        }
        node = &(*it);
    }
    return node;
}

}

std::filesystem::path settings_path() {
    if (const char* override_path = std::getenv("CAPTIONIST_SETTINGS")) {
        if (*override_path) {
            return std::filesystem::path(override_path);
        }
    }
    return std::filesystem::path("captionist_settings.json");
}

void load_from(const std::filesystem::path& path) {
    nlohmann::json loaded = read_settings_file(path);
    std::lock_guard<std::mutex> lock(settings_mutex());
    settings_cache() = std::move(loaded);
    settings_loaded_flag() = true;
}

void reset() {
    std::lock_guard<std::mutex> lock(settings_mutex());
    settings_cache() = nlohmann::json::object();
    settings_loaded_flag() = false;
}

bool load_bool(std::string_view key, bool default_value) {
    std::lock_guard<std::mutex> lock(settings_mutex());
    ensure_loaded();
    const nlohmann::json* node = find_node(key);
    if (!node || !node->is_boolean()) {
        return default_value;
    }
    return node->get<bool>();
}

double load_number(std::string_view key, double default_value) {
    std::lock_guard<std::mutex> lock(settings_mutex());
    ensure_loaded();
    const nlohmann::json* node = find_node(key);
    if (!node) {
        return default_value;
    }
    if (node->is_number_float()) {
        return node->get<double>();
    }
    if (node->is_number_integer()) {
        return static_cast<double>(node->get<int64_t>());
    }
    if (node->is_string()) {
        const std::string text = node->get<std::string>();
        char* end = nullptr;
        const double parsed = std::strtod(text.c_str(), &end);
        if (!text.empty() && end == text.c_str() + text.size()) {
            return parsed;
        }
    }
    return default_value;
}

int load_int(std::string_view key, int default_value) {
    const double value = load_number(key, static_cast<double>(default_value));
    if (!std::isfinite(value)) {
        return default_value;
    }
    return static_cast<int>(std::lround(value));
}

std::string load_string(std::string_view key, const std::string& default_value) {
    std::lock_guard<std::mutex> lock(settings_mutex());
    ensure_loaded();
    const nlohmann::json* node = find_node(key);
    if (!node || !node->is_string()) {
        return default_value;
    }
    return node->get<std::string>();
}

std::vector<std::string> load_string_list(std::string_view key) {
    std::lock_guard<std::mutex> lock(settings_mutex());
    ensure_loaded();
    std::vector<std::string> out;
    const nlohmann::json* node = find_node(key);
    if (!node) {
        return out;
    }
    if (node->is_string()) {
        out.push_back(node->get<std::string>());
        return out;
    }
    if (!node->is_array()) {
        return out;
    }
    for (const auto& entry : *node) {
        if (entry.is_string()) {
            out.push_back(entry.get<std::string>());
        }
    }
    return out;
}

}
