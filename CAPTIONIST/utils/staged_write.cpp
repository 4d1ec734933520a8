#include "utils/staged_write.hpp"

#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include "utils/log.hpp"

namespace captionist::utils {

StagedWrite::StagedWrite(std::filesystem::path target)
: target_(std::move(target)), temp_(target_.string() + ".tmp") {
    const auto parent = target_.parent_path();
    if (parent.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec && !std::filesystem::is_directory(parent)) {
        pending_ = false;
        std::ostringstream oss;
        oss << "Failed to create directory '" << parent.string() << "': " << ec.message();
        throw std::runtime_error(oss.str());
    }
}

StagedWrite::StagedWrite(StagedWrite&& other) noexcept
: target_(std::move(other.target_)), temp_(std::move(other.temp_)), pending_(other.pending_) {
    other.pending_ = false;
}

StagedWrite::~StagedWrite() {
    discard();
}

void StagedWrite::discard() {
    if (!pending_) {
        return;
    }
    pending_ = false;
    std::error_code ec;
    std::filesystem::remove(temp_, ec);
    if (ec) {
        log::warn("[StagedWrite] Could not remove '" + temp_.string() + "': " + ec.message());
    }
}

void StagedWrite::commit() {
    if (!pending_) {
        throw std::runtime_error("'" + target_.string() + "' has no staged write to commit");
    }
    std::error_code ec;
    const auto target_status = std::filesystem::status(target_, ec);
    if (!ec && std::filesystem::is_regular_file(target_status)) {
        std::filesystem::permissions(temp_, target_status.permissions(), ec);
    }

    ec.clear();
    std::filesystem::rename(temp_, target_, ec);
    if (ec) {
        discard();
        std::ostringstream oss;
        oss << "rename('" << temp_.string() << "' -> '" << target_.string() << "') failed: " << ec.message();
        throw std::runtime_error(oss.str());
    }
    pending_ = false;
}

}
