#include "opencv_region_tracker.hpp"

#include <string>

#include <opencv2/imgproc.hpp>

#include "sequence/frame.hpp"
#include "utils/log.hpp"

namespace captionist {

namespace {

cv::Mat to_bgr(const Frame& frame) {
    SDL_Surface* surface = frame.surface();
    // Frames are packed RGB24; wrap the pixels without copying, then convert.
    cv::Mat rgb(surface->h, surface->w, CV_8UC3, surface->pixels, static_cast<std::size_t>(surface->pitch));
    cv::Mat bgr;
    cv::cvtColor(rgb, bgr, cv::COLOR_RGB2BGR);
    return bgr;
}

}

bool OpenCvRegionTracker::init(const Frame& frame, const SDL_Rect& region) {
    if (region.w <= 0 || region.h <= 0) {
        return false;
    }
    try {
        tracker_ = cv::TrackerMIL::create();
        tracker_->init(to_bgr(frame), cv::Rect(region.x, region.y, region.w, region.h));
    } catch (const cv::Exception& ex) {
        log::warn(std::string("[OpenCvRegionTracker] init failed: ") + ex.what());
        tracker_.release();
        return false;
    }
    return true;
}

std::optional<SDL_Rect> OpenCvRegionTracker::update(const Frame& frame) {
    if (!tracker_) {
        return std::nullopt;
    }
    cv::Rect box;
    try {
        if (!tracker_->update(to_bgr(frame), box)) {
            return std::nullopt;
        }
    } catch (const cv::Exception& ex) {
        log::warn(std::string("[OpenCvRegionTracker] update failed: ") + ex.what());
        return std::nullopt;
    }
    return SDL_Rect{box.x, box.y, box.width, box.height};
}

RegionTrackerFactory OpenCvRegionTracker::factory() {
    return []() -> std::unique_ptr<RegionTracker> { return std::make_unique<OpenCvRegionTracker>(); };
}

}
