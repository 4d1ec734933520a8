#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace captionist::settings {

// CAPTIONIST_SETTINGS overrides the default "captionist_settings.json" in the working directory.
std::filesystem::path settings_path();

void load_from(const std::filesystem::path& path);
void reset();

bool load_bool(std::string_view key, bool default_value);
double load_number(std::string_view key, double default_value);
int load_int(std::string_view key, int default_value);
std::string load_string(std::string_view key, const std::string& default_value);
std::vector<std::string> load_string_list(std::string_view key);

}
