#include "frame_grabbers.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <cctype>
#include <vector>

using namespace cv;
using namespace std;

namespace camera
{
    static bool hasExtension(const string &path, const vector<string> &extensions)
    {
        string lower_path = path;
        transform(lower_path.begin(), lower_path.end(), lower_path.begin(), [](unsigned char c)
                  { return static_cast<char>(tolower(c)); });

        for (const auto &ext : extensions)
        {
            if (lower_path.length() >= ext.length() &&
                lower_path.substr(lower_path.length() - ext.length()) == ext)
            {
                return true;
            }
        }
        return false;
    }

    bool isVideoFile(const string &path)
    {
        return hasExtension(path, {".mp4", ".avi", ".mkv", ".mov", ".wmv"});
    }

    bool isImageFile(const string &path)
    {
        return hasExtension(path, {".png", ".bmp", ".jpg", ".jpeg"});
    }

    string decodeFourCC(int fourcc)
    {
        char code[5];
        code[0] = (fourcc & 0xFF);
        code[1] = (fourcc >> 8) & 0xFF;
        code[2] = (fourcc >> 16) & 0xFF;
        code[3] = (fourcc >> 24) & 0xFF;
        code[4] = '\0';
        return string(code);
    }
}

VideoFrameGrabber::VideoFrameGrabber(const string &source, int width, int height, int fps)
    : source_(source), width_(width), height_(height), fps_(fps)
{
}

VideoFrameGrabber::~VideoFrameGrabber()
{
    lock_guard<mutex> lock(mutex_);
    if (cap_.isOpened())
        cap_.release();
}

bool VideoFrameGrabber::initialize()
{
    lock_guard<mutex> lock(mutex_);
    log_debug("Opening capture source: " + source_);

    if (camera::isVideoFile(source_))
    {
        log_debug("Detected video file: " + source_);
        cap_.open(source_);
    }
    else
    {
        cap_.open(source_, CAP_V4L2);
        cap_.set(CAP_PROP_FRAME_WIDTH, width_);
        cap_.set(CAP_PROP_FRAME_HEIGHT, height_);
        cap_.set(CAP_PROP_FPS, fps_);

        // Keep only the newest frame so the bar state is never stale
        cap_.set(CAP_PROP_BUFFERSIZE, 1);
    }

    if (!cap_.isOpened())
    {
        log_error("Failed to open capture source " + source_);
        return false;
    }

    if (!camera::isVideoFile(source_))
    {
        double actual_width = cap_.get(CAP_PROP_FRAME_WIDTH);
        double actual_height = cap_.get(CAP_PROP_FRAME_HEIGHT);
        double actual_fps = cap_.get(CAP_PROP_FPS);

        log_debug("Capture source verification:");
        log_debug("  Resolution: " + log_string((int)actual_width) + "x" + log_string((int)actual_height) + " (expected: " + log_string(width_) + "x" + log_string(height_) + ")");
        log_debug("  FPS: " + log_string((int)actual_fps) + " (expected: " + log_string(fps_) + ")");
        log_debug("  FOURCC: " + log_string_src(camera::decodeFourCC((int)cap_.get(CAP_PROP_FOURCC))));
        log_debug("  Backend: " + log_string_src(cap_.getBackendName()));
    }

    log_info("Capture source " + source_ + " initialized successfully");
    return true;
}

bool VideoFrameGrabber::grab(Mat &frame)
{
    lock_guard<mutex> lock(mutex_);
    if (!cap_.isOpened())
        return false;

    if (!cap_.read(frame) || frame.empty())
    {
        // Loop recorded sessions
        if (camera::isVideoFile(source_))
        {
            cap_.set(CAP_PROP_POS_FRAMES, 0);
            if (cap_.read(frame) && !frame.empty())
                return true;
        }
        log_warning("Failed to capture frame from " + source_);
        return false;
    }

    return true;
}

ImageFrameGrabber::ImageFrameGrabber(const string &path)
    : path_(path)
{
}

ImageFrameGrabber::ImageFrameGrabber(const Mat &frame)
    : frame_(frame)
{
}

bool ImageFrameGrabber::initialize()
{
    lock_guard<mutex> lock(mutex_);
    if (path_.empty())
        return !frame_.empty();

    frame_ = imread(path_, IMREAD_COLOR);
    if (frame_.empty())
    {
        log_error("Failed to load screenshot " + path_);
        return false;
    }

    log_info("Loaded screenshot " + path_ + " (" + to_string(frame_.cols) + "x" + to_string(frame_.rows) + ")");
    return true;
}

bool ImageFrameGrabber::grab(Mat &frame)
{
    lock_guard<mutex> lock(mutex_);
    if (frame_.empty())
        return false;

    frame = frame_;
    return true;
}

void ImageFrameGrabber::setFrame(const Mat &frame)
{
    lock_guard<mutex> lock(mutex_);
    frame_ = frame;
}
