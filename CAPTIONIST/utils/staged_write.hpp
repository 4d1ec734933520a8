#pragma once

#include <filesystem>

namespace captionist::utils {

// Stages a replacement for target at "<target>.tmp". commit() renames it over target;
// a staged file that is never committed is removed, so target is either the old file or
// the complete new one.
class StagedWrite {
public:
    // Creates the parent directory. Throws std::runtime_error when it cannot.
    explicit StagedWrite(std::filesystem::path target);
    ~StagedWrite();

    StagedWrite(StagedWrite&& other) noexcept;
    StagedWrite& operator=(StagedWrite&&) = delete;
    StagedWrite(const StagedWrite&) = delete;
    StagedWrite& operator=(const StagedWrite&) = delete;

    const std::filesystem::path& target() const { return target_; }
    const std::filesystem::path& temp_path() const { return temp_; }

    // Throws std::runtime_error when the rename fails; the temp file is removed either way.
    void commit();

private:
    void discard();

    std::filesystem::path target_;
    std::filesystem::path temp_;
    bool pending_ = true;
};

}
