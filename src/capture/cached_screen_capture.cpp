#include "cached_screen_capture.hpp"
#include "utils/logging.hpp"

using namespace std;

CachedScreenCapture::CachedScreenCapture(shared_ptr<FrameGrabber> grabber, chrono::milliseconds cache_window)
    : grabber_(move(grabber)), cache_window_(cache_window)
{
}

bool CachedScreenCapture::currentFrame(cv::Mat &out, chrono::steady_clock::time_point &taken_at)
{
    auto now = chrono::steady_clock::now();
    {
        lock_guard<mutex> lock(mutex_);
        if (!cached_frame_.empty() && now - cached_at_ < cache_window_)
        {
            out = cached_frame_;
            taken_at = cached_at_;
            hits_++;
            return true;
        }
    }

    if (!grabber_)
    {
        failures_++;
        return false;
    }

    // Grab outside the lock so readers of a fresh frame are never blocked
    cv::Mat grabbed;
    bool ok = false;
    try
    {
        ok = grabber_->grab(grabbed);
    }
    catch (const exception &e)
    {
        log_error("Frame grab failed on " + grabber_->describe() + ": " + string(e.what()));
        ok = false;
    }

    if (!ok || grabbed.empty())
    {
        failures_++;
        return false;
    }

    grabs_++;
    {
        lock_guard<mutex> lock(mutex_);
        cached_frame_ = grabbed;
        cached_at_ = now;
    }

    out = grabbed;
    taken_at = now;
    return true;
}

bool CachedScreenCapture::frame(cv::Mat &out)
{
    chrono::steady_clock::time_point taken_at;
    return currentFrame(out, taken_at);
}

bool CachedScreenCapture::capture(const cv::Rect &rect, cv::Mat &out)
{
    chrono::steady_clock::time_point taken_at;
    return captureWithTime(rect, out, taken_at);
}

bool CachedScreenCapture::captureWithTime(const cv::Rect &rect, cv::Mat &out, chrono::steady_clock::time_point &taken_at)
{
    cv::Mat full;
    if (!currentFrame(full, taken_at))
        return false;

    cv::Rect clamped = rect & cv::Rect(0, 0, full.cols, full.rows);
    if (clamped.area() <= 0)
    {
        log_debug("Capture rect " + to_string(rect.x) + "," + to_string(rect.y) + " " +
                  to_string(rect.width) + "x" + to_string(rect.height) + " is outside the frame");
        failures_++;
        return false;
    }

    out = full(clamped).clone();
    return true;
}

void CachedScreenCapture::invalidate()
{
    lock_guard<mutex> lock(mutex_);
    cached_frame_.release();
    cached_at_ = {};
}
