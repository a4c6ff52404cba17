#pragma once

#include <opencv2/opencv.hpp>
#include <mutex>
#include <string>
#include "capture_source.hpp"

namespace camera
{
    // Determine if a given path is a video file based on its extension
    bool isVideoFile(const std::string &path);

    // Determine if a given path is a still image based on its extension
    bool isImageFile(const std::string &path);

    // Simple function to decode fourcc code to a human-readable string
    std::string decodeFourCC(int fourcc);
}

// Frames from a V4L2 device (capture card, v4l2loopback of the desktop) or a recorded video
class VideoFrameGrabber : public FrameGrabber
{
public:
    VideoFrameGrabber(const std::string &source, int width, int height, int fps);
    ~VideoFrameGrabber() override;

    bool initialize() override;
    bool grab(cv::Mat &frame) override;
    std::string describe() const override { return source_; }

private:
    std::string source_;
    int width_;
    int height_;
    int fps_;

    std::mutex mutex_; // VideoCapture is not safe to read from two threads
    cv::VideoCapture cap_;
};

// A fixed screenshot, for replaying a captured session offline
class ImageFrameGrabber : public FrameGrabber
{
public:
    explicit ImageFrameGrabber(const std::string &path);
    explicit ImageFrameGrabber(const cv::Mat &frame);

    bool initialize() override;
    bool grab(cv::Mat &frame) override;
    std::string describe() const override { return path_.empty() ? "in-memory image" : path_; }

    // Swap the served frame (replay stepping)
    void setFrame(const cv::Mat &frame);

private:
    std::string path_;
    std::mutex mutex_;
    cv::Mat frame_;
};
