#pragma once
#include <opencv2/opencv.hpp>
#include <chrono>
#include <string>

// Produces the pixels of a screen rectangle on demand
class CaptureSource
{
public:
    virtual ~CaptureSource() = default;

    // Fill `out` with the BGR pixels of `rect`; false if the surface is unavailable
    virtual bool capture(const cv::Rect &rect, cv::Mat &out) = 0;

    // As capture(), also reporting when the pixels were taken. Sources that
    // reuse frames override this; the default assumes a live read.
    virtual bool captureWithTime(const cv::Rect &rect, cv::Mat &out, std::chrono::steady_clock::time_point &taken_at)
    {
        taken_at = std::chrono::steady_clock::now();
        return capture(rect, out);
    }
};

// Produces whole frames of the target surface
class FrameGrabber
{
public:
    virtual ~FrameGrabber() = default;

    // Open the underlying device or file
    virtual bool initialize() = 0;

    // Grab the most recent full frame (BGR)
    virtual bool grab(cv::Mat &frame) = 0;

    virtual std::string describe() const = 0;
};
