#include "sequence/sequence.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include "sequence/gif_codec.hpp"
#include "utils/log.hpp"
#include "utils/staged_write.hpp"

namespace captionist {

namespace {

[[noreturn]] void throw_out_of_range(int index, std::size_t size) {
    std::ostringstream oss;
    oss << "Sequence: frame index " << index << " out of range (size " << size << ")";
    throw std::out_of_range(oss.str());
}

}

Sequence::Sequence(std::vector<Frame> frames, bool loop)
: frames_(std::move(frames)), loop_(loop) {}

Sequence Sequence::open(const std::filesystem::path& path) {
    gif_codec::DecodedGif decoded = gif_codec::decode_file(path);
    log::info("[Sequence] Opened " + path.string() + " (" + std::to_string(decoded.frames.size()) + " frames, " +
              (decoded.loop_forever ? "looping" : "play once") + ")");
    return Sequence(std::move(decoded.frames), decoded.loop_forever);
}

void Sequence::save(const std::filesystem::path& path, bool loop_forever) const {
    utils::StagedWrite staged(path);
    gif_codec::encode_file(staged.temp_path(), frames_, loop_forever);
    staged.commit();
    log::info("[Sequence] Saved " + std::to_string(frames_.size()) + " frames to " + path.string());
}

Sequence Sequence::slice(int begin, int end) const {
    const int count = length();
    begin = std::clamp(begin, 0, count);
    end = std::clamp(end, begin, count);
    std::vector<Frame> frames(frames_.begin() + begin, frames_.begin() + end);
    return Sequence(std::move(frames), loop_);
}

Sequence Sequence::concat(const Sequence& first, const Sequence& second) {
    const Frame* reference = !first.empty() ? &first.frames_.front()
                           : (!second.empty() ? &second.frames_.front() : nullptr);
    if (reference) {
        for (const Sequence* part : {&first, &second}) {
            for (const Frame& frame : part->frames_) {
                if (!frame.same_size(*reference)) {
                    std::ostringstream oss;
                    oss << "Sequence: cannot concatenate " << frame.width() << "x" << frame.height()
                        << " frame onto " << reference->width() << "x" << reference->height() << " sequence";
                    throw std::runtime_error(oss.str());
                }
            }
        }
    }
    std::vector<Frame> frames;
    frames.reserve(first.size() + second.size());
    frames.insert(frames.end(), first.frames_.begin(), first.frames_.end());
    frames.insert(frames.end(), second.frames_.begin(), second.frames_.end());
    return Sequence(std::move(frames), first.loop_);
}

Sequence Sequence::repeat(const Frame& frame, int count) {
    std::vector<Frame> frames;
    if (count > 0) {
        frames.reserve(static_cast<std::size_t>(count));
        for (int i = 0; i < count; ++i) {
            frames.push_back(frame);
        }
    }
    return Sequence(std::move(frames));
}

void Sequence::append(Frame frame) {
    if (!frames_.empty() && !frame.same_size(frames_.front())) {
        throw std::runtime_error("Sequence: appended frame size does not match the sequence");
    }
    frames_.push_back(std::move(frame));
}

Frame& Sequence::at(int index) {
    if (index < 0 || index >= length()) {
        throw_out_of_range(index, frames_.size());
    }
    return frames_[static_cast<std::size_t>(index)];
}

const Frame& Sequence::at(int index) const {
    if (index < 0 || index >= length()) {
        throw_out_of_range(index, frames_.size());
    }
    return frames_[static_cast<std::size_t>(index)];
}

void Sequence::set(int index, const Frame& frame) {
    at(index) = frame;
}

bool Sequence::operator==(const Sequence& other) const {
    return loop_ == other.loop_ && frames_ == other.frames_;
}

Sequence operator+(const Sequence& first, const Sequence& second) {
    return Sequence::concat(first, second);
}

}
