#pragma once

#include <opencv2/core.hpp>
#include <opencv2/video/tracking.hpp>

#include "tracking/region_tracker.hpp"

namespace captionist {

// RegionTracker backed by OpenCV's MIL tracker.
class OpenCvRegionTracker : public RegionTracker {
public:
    bool init(const Frame& frame, const SDL_Rect& region) override;
    std::optional<SDL_Rect> update(const Frame& frame) override;

    static RegionTrackerFactory factory();

private:
    cv::Ptr<cv::TrackerMIL> tracker_;
};

}
