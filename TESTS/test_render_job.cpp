#include "doctest/doctest.h"

#include <filesystem>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "persistence/document_store.hpp"
#include "sequence/sequence.hpp"
#include "stubs/fake_text_service.hpp"
#include "tools/render_job.hpp"
#include "utils/log.hpp"

namespace fs = std::filesystem;
namespace job = captionist::render_job;
using captionist::Frame;
using captionist::Sequence;

static fs::path test_root() {
#ifdef PROJECT_ROOT
    return fs::path(PROJECT_ROOT) / "TEST_TMP" / "render_job";
#else
    return fs::current_path() / "TEST_TMP" / "render_job";
#endif
}

namespace {
fs::path fresh_dir(const char* name) {
    const fs::path dir = test_root() / name;
    std::error_code ec;
    fs::remove_all(dir, ec);
    fs::create_directories(dir, ec);
    return dir;
}

fs::path write_template(const fs::path& dir, bool with_document) {
    const fs::path gif = dir / "template.gif";
    Sequence::repeat(Frame::blank(80, 60, SDL_Color{0, 0, 0, 255}, 100), 2).save(gif, true);
    if (with_document) {
        const nlohmann::json document = nlohmann::json::parse(R"([{"id": "Top", "keyframes": []}])");
        captionist::document_store::save_document(captionist::document_store::document_path_for(gif), document);
    }
    return gif;
}

job::RenderArgs args_for(const fs::path& gif, const fs::path& output, std::vector<std::string> texts) {
    job::RenderArgs args;
    args.template_path = gif;
    args.output_path = output;
    args.texts = std::move(texts);
    return args;
}
}

TEST_CASE("command line arguments are parsed") {
    captionist::log::ScopedLevel quiet_log(captionist::log::Level::Error);
    const char* argv[] = {"captionist_render", "cat.gif", "-t", "top", "--text", "bottom", "-o", "out.gif", "--once"};
    const auto args = job::parse_args(9, argv);
    REQUIRE(args.has_value());
    CHECK(args->template_path == fs::path("cat.gif"));
    CHECK(args->texts == std::vector<std::string>{"top", "bottom"});
    CHECK(args->output_path == fs::path("out.gif"));
    CHECK_FALSE(args->loop_forever);

    const char* no_output[] = {"captionist_render", "cat.gif", "-t", "top"};
    CHECK_FALSE(job::parse_args(4, no_output).has_value());
    const char* dangling[] = {"captionist_render", "cat.gif", "-o", "out.gif", "-t"};
    CHECK_FALSE(job::parse_args(5, dangling).has_value());
    const char* unknown[] = {"captionist_render", "cat.gif", "-t", "a", "-o", "out.gif", "--fast"};
    CHECK_FALSE(job::parse_args(7, unknown).has_value());
}

TEST_CASE("a missing template is a usage error") {
    captionist::log::ScopedLevel quiet_log(captionist::log::Level::Error);
    FakeTextService service;
    const fs::path dir = fresh_dir("missing_template");
    CHECK(job::render(args_for(dir / "absent.gif", dir / "out.gif", {"hi"}), service) == job::kExitUsage);
    CHECK_FALSE(fs::exists(dir / "out.gif"));
}

TEST_CASE("a template without its layer document is a usage error") {
    captionist::log::ScopedLevel quiet_log(captionist::log::Level::Error);
    FakeTextService service;
    const fs::path dir = fresh_dir("missing_document");
    const fs::path gif = write_template(dir, false);
    CHECK(job::render(args_for(gif, dir / "out.gif", {"hi"}), service) == job::kExitUsage);
    CHECK_FALSE(fs::exists(dir / "out.gif"));
}

TEST_CASE("the number of texts must match the number of layers") {
    captionist::log::ScopedLevel quiet_log(captionist::log::Level::Error);
    FakeTextService service;
    const fs::path dir = fresh_dir("count_mismatch");
    const fs::path gif = write_template(dir, true);
    CHECK(job::render(args_for(gif, dir / "out.gif", {"one", "two"}), service) == job::kExitUsage);
    CHECK_FALSE(fs::exists(dir / "out.gif"));
    CHECK(service.draw_calls == 0);
}

TEST_CASE("rendering fills every frame and keeps the loop flag") {
    captionist::log::ScopedLevel quiet_log(captionist::log::Level::Error);
    FakeTextService service;
    const fs::path dir = fresh_dir("success");
    const fs::path gif = write_template(dir, true);

    job::RenderArgs args = args_for(gif, dir / "out.gif", {"hi"});
    REQUIRE(job::render(args, service) == job::kExitOk);
    CHECK(service.draw_calls == 2);

    const Sequence rendered = Sequence::open(dir / "out.gif");
    REQUIRE(rendered.size() == 2);
    CHECK(rendered.loop());
    const SDL_Color centre = rendered[1].pixel(20, 20);
    CHECK(centre.r == 255);
    CHECK(centre.g == 255);
    CHECK(centre.b == 255);

    args.loop_forever = false;
    REQUIRE(job::render(args, service) == job::kExitOk);
    CHECK_FALSE(Sequence::open(dir / "out.gif").loop());
}
