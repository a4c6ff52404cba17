#include "color_processing.hpp"
#include "utils/colors.hpp"

using namespace cv;
using namespace std;

namespace color_processing
{
    MethodResult classify(const Mat &region, const DetectionConfig &config)
    {
        MethodResult result;
        result.method = DetectionMethod::COLOR_ANALYSIS;

        if (region.empty())
            return result;

        Scalar hsv = colors::meanHsv(region);
        double avg_saturation = hsv[1];
        double avg_brightness = hsv[2];

        if (avg_saturation < config.saturation_limit && avg_brightness < config.brightness_limit)
        {
            result.state = AbilityState::COOLDOWN;
            result.confidence = 0.7f;
        }
        else
        {
            result.state = AbilityState::READY;
            result.confidence = 0.8f;
        }

        return result;
    }

} // namespace color_processing
