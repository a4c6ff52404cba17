#pragma once

#include <opencv2/opencv.hpp>
#include "method_result.hpp"

namespace overlay_processing
{
    // Cooldown overlays darken the whole icon: a high share of dark grey levels means COOLDOWN
    MethodResult classify(const cv::Mat &region, const DetectionConfig &config);

} // namespace overlay_processing
