#pragma once

#include <SDL.h>

#include <functional>
#include <memory>
#include <optional>

namespace captionist {

class Frame;

// Single-object visual tracker: seeded with a rectangle on one frame, then follows it.
class RegionTracker {
public:
    virtual ~RegionTracker() = default;

    virtual bool init(const Frame& frame, const SDL_Rect& region) = 0;
    // Where the region moved to on frame; nullopt when the target was lost.
    virtual std::optional<SDL_Rect> update(const Frame& frame) = 0;
};

using RegionTrackerFactory = std::function<std::unique_ptr<RegionTracker>()>;

}
