#include "persistence/document_store.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>

#include "utils/log.hpp"

namespace captionist::document_store {

namespace {
constexpr int kDocumentIndent = 4;
}

std::filesystem::path document_path_for(const std::filesystem::path& gif_path) {
    std::filesystem::path path = gif_path;
    path.replace_extension(".json");
    return path;
}

std::filesystem::path gif_path_for(const std::filesystem::path& document_path) {
    std::filesystem::path path = document_path;
    path.replace_extension(".gif");
    return path;
}

std::optional<nlohmann::json> load_document(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::nullopt;
    }
    std::ifstream in(path);
    if (!in.is_open()) {
        log::warn("[DocumentStore] Unable to open '" + path.string() + "'");
        return std::nullopt;
    }
    try {
        nlohmann::json document;
        in >> document;
        return document;
    } catch (const nlohmann::json::parse_error& ex) {
        log::warn("[DocumentStore] Parse error in '" + path.string() + "': " + ex.what());
        return std::nullopt;
    }
}

utils::StagedWrite stage_document(const std::filesystem::path& path, const nlohmann::json& document) {
    utils::StagedWrite staged(path);
    {
        std::ofstream out(staged.temp_path(), std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            std::ostringstream oss;
            oss << "Unable to open '" << staged.temp_path().string() << "' for writing.";
            throw std::runtime_error(oss.str());
        }
        out << document.dump(kDocumentIndent);
        out.flush();
        if (!out.good()) {
            std::ostringstream oss;
            oss << "Failed while writing document '" << staged.temp_path().string() << "'.";
            throw std::runtime_error(oss.str());
        }
    }
    return staged;
}

void save_document(const std::filesystem::path& path, const nlohmann::json& document) {
    utils::StagedWrite staged = stage_document(path, document);
    staged.commit();
    log::debug("[DocumentStore] Wrote " + path.string());
}

}
