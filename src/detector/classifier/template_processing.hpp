#pragma once

#include <opencv2/opencv.hpp>
#include <vector>
#include "method_result.hpp"

using namespace cv;
using namespace std;

namespace template_processing
{
    // Best location of an icon inside a captured region
    struct TemplateMatch
    {
        float confidence = 0.0f; // TM_CCOEFF_NORMED peak, clamped to [0, 1]
        Point location{-1, -1};  // Top-left of the match inside the region
        float scale = 1.0f;
        Mat scaled_icon;         // Icon at the winning scale

        bool found() const { return location.x >= 0 && !scaled_icon.empty(); }
    };

    // `steps` evenly spaced scale factors across [min_scale, max_scale]
    vector<float> scaleSteps(float min_scale, float max_scale, int steps = 5);

    // Match at one scale; no match if the scaled icon does not fit in the region
    TemplateMatch matchAtScale(const Mat &region, const Mat &icon, float scale);

    // Best match over the configured scales (or 1.0 when multi-scale is off)
    TemplateMatch findBestMatch(const Mat &region, const Mat &icon, const DetectionConfig &config);

    // Brightness of the matched sub-region relative to the icon; a dark overlay means cooldown
    AbilityState inferState(const Mat &region, const TemplateMatch &match, const DetectionConfig &config);

    // Full method: confidence is the match score, state is UNAVAILABLE below the threshold
    MethodResult classify(const Mat &region, const Mat &icon, const DetectionConfig &config);

} // namespace template_processing
