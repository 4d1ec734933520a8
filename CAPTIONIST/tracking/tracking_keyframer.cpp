#include "tracking_keyframer.hpp"

#include <algorithm>
#include <cstdlib>
#include <string>
#include <utility>

#include "keyframes/keyframe_store.hpp"
#include "sequence/sequence.hpp"
#include "utils/log.hpp"

namespace captionist {

const char* to_string(TrackerState state) {
    switch (state) {
        case TrackerState::Idle: return "idle";
        case TrackerState::RegionSelected: return "region-selected";
        case TrackerState::TrackingActive: return "tracking";
        case TrackerState::Failed: return "failed";
    }
    return "unknown";
}

TrackingKeyframer::TrackingKeyframer(RegionTrackerFactory factory)
: factory_(std::move(factory)) {}

void TrackingKeyframer::transition(TrackerState next) {
    if (next != state_) {
        log::debug(std::string("[Tracking] ") + to_string(state_) + " -> " + to_string(next));
    }
    state_ = next;
}

SDL_Rect TrackingKeyframer::region() const {
    return SDL_Rect{std::min(begin_.x, end_.x),
                    std::min(begin_.y, end_.y),
                    std::abs(end_.x - begin_.x),
                    std::abs(end_.y - begin_.y)};
}

SDL_Point TrackingKeyframer::center() const {
    const SDL_Rect rect = region();
    return SDL_Point{rect.x + rect.w / 2, rect.y + rect.h / 2};
}

void TrackingKeyframer::press(SDL_Point point) {
    tracker_.reset();
    begin_ = point;
    end_ = point;
    transition(TrackerState::Idle);
}

void TrackingKeyframer::drag(SDL_Point point) {
    if (state_ == TrackerState::TrackingActive) {
        return;
    }
    end_ = point;
    if (has_region()) {
        transition(TrackerState::RegionSelected);
    }
}

bool TrackingKeyframer::release(SDL_Point point, const Frame& frame) {
    if (state_ == TrackerState::TrackingActive) {
        return false;
    }
    end_ = point;
    const SDL_Rect rect = region();
    if (rect.w <= 0 || rect.h <= 0) {
        reset();
        return false;
    }
    tracker_ = factory_ ? factory_() : nullptr;
    if (!tracker_ || !tracker_->init(frame, rect)) {
        log::warn("[Tracking] Tracker refused region " + std::to_string(rect.w) + "x" + std::to_string(rect.h) +
                  " at (" + std::to_string(rect.x) + ", " + std::to_string(rect.y) + ")");
        reset();
        return false;
    }
    begin_ = SDL_Point{rect.x, rect.y};
    end_ = SDL_Point{rect.x + rect.w, rect.y + rect.h};
    transition(TrackerState::TrackingActive);
    return true;
}

TrackStep TrackingKeyframer::step(int direction, int current_index, const Sequence& sequence, KeyframeStore& store) {
    TrackStep result;
    result.next_index = current_index;
    if (state_ != TrackerState::TrackingActive || !tracker_ || direction == 0) {
        return result;
    }
    const int next = current_index + (direction > 0 ? 1 : -1);
    if (current_index < 0 || current_index >= sequence.length() || next < 0 || next >= sequence.length()) {
        return result;
    }

    SDL_Point reference = store.interpolate(current_index).position;
    if (auto existing = store.get(current_index); existing && existing->position) {
        reference = *existing->position;
    }

    const SDL_Point old_center = center();
    std::optional<SDL_Rect> moved = tracker_->update(sequence.at(next));
    if (!moved) {
        log::warn("[Tracking] Lost the region on frame " + std::to_string(next));
        tracker_.reset();
        begin_ = SDL_Point{0, 0};
        end_ = SDL_Point{0, 0};
        transition(TrackerState::Failed);
        result.failed = true;
        return result;
    }

    begin_ = SDL_Point{moved->x, moved->y};
    end_ = SDL_Point{moved->x + moved->w, moved->y + moved->h};
    const SDL_Point new_center = center();
    result.delta = SDL_Point{new_center.x - old_center.x, new_center.y - old_center.y};

    Keyframe keyframe;
    keyframe.frame_index = next;
    keyframe.position = SDL_Point{reference.x + result.delta.x, reference.y + result.delta.y};
    store.insert_or_merge(keyframe);

    result.advanced = true;
    result.next_index = next;
    return result;
}

void TrackingKeyframer::reset() {
    tracker_.reset();
    begin_ = SDL_Point{0, 0};
    end_ = SDL_Point{0, 0};
    transition(TrackerState::Idle);
}

}
