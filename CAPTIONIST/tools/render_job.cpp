#include "tools/render_job.hpp"

#include <cstddef>
#include <exception>
#include <system_error>

#include <nlohmann/json.hpp>

#include "composition/layer_set.hpp"
#include "persistence/document_store.hpp"
#include "sequence/sequence.hpp"
#include "text/text_service.hpp"
#include "utils/log.hpp"

namespace fs = std::filesystem;

namespace captionist::render_job {

std::optional<RenderArgs> parse_args(int argc, const char* const argv[]) {
    RenderArgs args;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i] ? argv[i] : "";
        if (arg == "-t" || arg == "--text") {
            if (i + 1 >= argc) {
                log::error("[Render] " + arg + " expects a value");
                return std::nullopt;
            }
            args.texts.emplace_back(argv[++i]);
        } else if (arg == "-o" || arg == "--output") {
            if (i + 1 >= argc) {
                log::error("[Render] " + arg + " expects a value");
                return std::nullopt;
            }
            args.output_path = argv[++i];
        } else if (arg == "--once") {
            args.loop_forever = false;
        } else if (!arg.empty() && arg[0] == '-') {
            log::error("[Render] Unknown option '" + arg + "'");
            return std::nullopt;
        } else if (args.template_path.empty()) {
            args.template_path = arg;
        } else {
            log::error("[Render] Unexpected argument '" + arg + "'");
            return std::nullopt;
        }
    }
    if (args.template_path.empty() || args.output_path.empty() || args.texts.empty()) {
        return std::nullopt;
    }
    return args;
}

int render(const RenderArgs& args, const TextService& text_service) {
    std::error_code ec;
    if (!fs::is_regular_file(args.template_path, ec)) {
        log::error("[Render] Template '" + args.template_path.string() + "' does not exist");
        return kExitUsage;
    }
    const fs::path document_path = document_store::document_path_for(args.template_path);
    std::optional<nlohmann::json> document = document_store::load_document(document_path);
    if (!document) {
        log::error("[Render] No readable layer document at '" + document_path.string() + "'");
        return kExitUsage;
    }

    try {
        LayerSet layers = LayerSet::from_json(*document);
        if (args.texts.size() != layers.size()) {
            log::error("[Render] Template has " + std::to_string(layers.size()) + " text layers but " +
                       std::to_string(args.texts.size()) + " texts were given");
            return kExitUsage;
        }
        ContentByLayer contents;
        const std::vector<std::string> ids = layers.ids();
        for (std::size_t i = 0; i < ids.size(); ++i) {
            contents[ids[i]] = args.texts[i];
        }

        Sequence sequence = Sequence::open(args.template_path);
        if (!layers.render_all(sequence, contents, text_service)) {
            log::warn("[Render] Some captions could not be drawn");
        }
        sequence.save(args.output_path, args.loop_forever);
    } catch (const std::exception& ex) {
        log::error(std::string("[Render] ") + ex.what());
        return kExitUsage;
    }

    log::info("[Render] Wrote " + args.output_path.string());
    return kExitOk;
}

}
