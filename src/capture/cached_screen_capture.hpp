#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include "capture_source.hpp"

// Crops requested rectangles out of a shared full frame. A frame younger than
// the cache window is reused by every caller; the first caller to miss grabs a
// new one (two concurrent misses may both grab).
class CachedScreenCapture : public CaptureSource
{
public:
    explicit CachedScreenCapture(std::shared_ptr<FrameGrabber> grabber,
                                 std::chrono::milliseconds cache_window = std::chrono::milliseconds(50));

    bool capture(const cv::Rect &rect, cv::Mat &out) override;
    bool captureWithTime(const cv::Rect &rect, cv::Mat &out, std::chrono::steady_clock::time_point &taken_at) override;

    // Latest full frame, grabbing if the cache is stale
    bool frame(cv::Mat &out);

    void invalidate();

    uint64_t grabCount() const { return grabs_; }
    uint64_t cacheHits() const { return hits_; }
    uint64_t failures() const { return failures_; }

private:
    bool currentFrame(cv::Mat &out, std::chrono::steady_clock::time_point &taken_at);

    std::shared_ptr<FrameGrabber> grabber_;
    std::chrono::milliseconds cache_window_;

    std::mutex mutex_;
    cv::Mat cached_frame_;
    std::chrono::steady_clock::time_point cached_at_{}; // When the grab of the cached frame started

    std::atomic<uint64_t> grabs_{0};
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> failures_{0};
};
