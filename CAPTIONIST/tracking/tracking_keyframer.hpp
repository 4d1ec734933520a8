#pragma once

#include <SDL.h>

#include <memory>

#include "tracking/region_tracker.hpp"

namespace captionist {

class Frame;
class KeyframeStore;
class Sequence;

enum class TrackerState {
    Idle,
    RegionSelected,
    TrackingActive,
    Failed,
};

const char* to_string(TrackerState state);

struct TrackStep {
    bool advanced = false;
    bool failed = false;
    int next_index = 0;
    SDL_Point delta{0, 0};
};

// Turns a user-marked region into position keyframes by following it frame to frame.
class TrackingKeyframer {
public:
    explicit TrackingKeyframer(RegionTrackerFactory factory);

    void press(SDL_Point point);
    void drag(SDL_Point point);
    // Seeds the tracker on frame with the marked region; false when the region is
    // empty or the tracker refused it.
    bool release(SDL_Point point, const Frame& frame);

    // Tracks into current_index + direction and writes a position keyframe there. Refused
    // (nothing changes) unless tracking is active and the target index is in range.
    TrackStep step(int direction, int current_index, const Sequence& sequence, KeyframeStore& store);

    void reset();

    TrackerState state() const { return state_; }
    SDL_Point begin() const { return begin_; }
    SDL_Point end() const { return end_; }
    bool has_region() const { return begin_.x != end_.x || begin_.y != end_.y; }
    SDL_Rect region() const;

private:
    SDL_Point center() const;
    void transition(TrackerState next);

    RegionTrackerFactory factory_;
    std::unique_ptr<RegionTracker> tracker_;
    SDL_Point begin_{0, 0};
    SDL_Point end_{0, 0};
    TrackerState state_ = TrackerState::Idle;
};

}
