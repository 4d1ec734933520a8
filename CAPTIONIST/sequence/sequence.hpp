#pragma once

#include <cstddef>
#include <filesystem>
#include <vector>

#include "sequence/frame.hpp"

namespace captionist {

class Sequence {
public:
    Sequence() = default;
    explicit Sequence(std::vector<Frame> frames, bool loop = false);

    // Throws std::runtime_error when the file is missing or cannot be decoded.
    static Sequence open(const std::filesystem::path& path);

    void save(const std::filesystem::path& path, bool loop_forever) const;
    void save(const std::filesystem::path& path) const { save(path, loop_); }

    Sequence copy() const { return *this; }

    // Half-open [begin, end), clamped to the sequence.
    Sequence slice(int begin, int end) const;

    // Frame sizes must match; throws std::runtime_error otherwise.
    static Sequence concat(const Sequence& first, const Sequence& second);
    static Sequence repeat(const Frame& frame, int count);

    void append(Frame frame);

    std::size_t size() const { return frames_.size(); }
    int length() const { return static_cast<int>(frames_.size()); }
    bool empty() const { return frames_.empty(); }

    Frame& operator[](std::size_t index) { return frames_[index]; }
    const Frame& operator[](std::size_t index) const { return frames_[index]; }
    Frame& at(int index);
    const Frame& at(int index) const;

    // Replaces both the image and the duration of the frame at index.
    void set(int index, const Frame& frame);

    bool loop() const { return loop_; }
    void set_loop(bool loop) { loop_ = loop; }

    std::vector<Frame>::iterator begin() { return frames_.begin(); }
    std::vector<Frame>::iterator end() { return frames_.end(); }
    std::vector<Frame>::const_iterator begin() const { return frames_.begin(); }
    std::vector<Frame>::const_iterator end() const { return frames_.end(); }

    bool operator==(const Sequence& other) const;
    bool operator!=(const Sequence& other) const { return !(*this == other); }

private:
    std::vector<Frame> frames_;
    bool loop_ = false;
};

Sequence operator+(const Sequence& first, const Sequence& second);

}
