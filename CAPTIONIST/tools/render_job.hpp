#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace captionist {

class TextService;

namespace render_job {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitInit = 2;

struct RenderArgs {
    std::filesystem::path template_path;
    std::vector<std::string> texts;
    std::filesystem::path output_path;
    bool loop_forever = true;
};

// Parses "<template.gif> -t <text> [-t <text> ...] -o <output.gif> [--once]".
std::optional<RenderArgs> parse_args(int argc, const char* const argv[]);

// Fills the template's layers, in document order, with args.texts and writes the result.
// Returns kExitOk, or kExitUsage for a missing template or document, a layer/text count
// mismatch, or any failure while decoding, rendering or encoding.
int render(const RenderArgs& args, const TextService& text_service);

}

}
