#pragma once

#include <opencv2/opencv.hpp>
#include "method_result.hpp"

namespace color_processing
{
    // Greyed-out icons lose saturation and brightness together
    MethodResult classify(const cv::Mat &region, const DetectionConfig &config);

} // namespace color_processing
