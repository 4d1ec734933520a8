#include <SDL.h>
#include <SDL_ttf.h>

#include <iostream>
#include <optional>
#include <string>

#include "config/settings.hpp"
#include "text/ttf_text_service.hpp"
#include "tools/render_job.hpp"
#include "utils/log.hpp"

namespace {

void print_usage(const char* program) {
    std::cerr << "usage: " << program << " <template.gif> -t <text> [-t <text> ...] -o <output.gif> [--once]\n";
}

}

int main(int argc, char* argv[]) {
    namespace job = captionist::render_job;

    std::optional<job::RenderArgs> args = job::parse_args(argc, argv);
    if (!args) {
        print_usage(argc > 0 && argv[0] ? argv[0] : "captionist_render");
        return job::kExitUsage;
    }

    captionist::settings::load_from(captionist::settings::settings_path());

    if (SDL_Init(0) < 0) {
        captionist::log::error(std::string("SDL_Init failed: ") + SDL_GetError());
        return job::kExitInit;
    }
    if (TTF_Init() < 0) {
        captionist::log::error(std::string("TTF_Init failed: ") + TTF_GetError());
        SDL_Quit();
        return job::kExitInit;
    }

    int result = job::kExitUsage;
    {
        captionist::TtfTextService text_service;
        result = job::render(*args, text_service);
    }

    TTF_Quit();
    SDL_Quit();
    return result;
}
