#pragma once

#include <filesystem>
#include <optional>

#include <nlohmann/json.hpp>

#include "utils/staged_write.hpp"

namespace captionist::document_store {

// The layer document lives beside its GIF with a .json extension, and vice versa.
std::filesystem::path document_path_for(const std::filesystem::path& gif_path);
std::filesystem::path gif_path_for(const std::filesystem::path& document_path);

// nullopt when the file is missing, unreadable or not valid JSON (the last two are logged).
std::optional<nlohmann::json> load_document(const std::filesystem::path& path);

// Writes the document beside path without touching path itself; the caller commits it
// once everything that belongs with it has been written. Throws std::runtime_error.
utils::StagedWrite stage_document(const std::filesystem::path& path, const nlohmann::json& document);

// Pretty-printed with a 4-space indent, replacing path atomically. Throws std::runtime_error
// and leaves an existing file untouched on failure.
void save_document(const std::filesystem::path& path, const nlohmann::json& document);

}
