#include "overlay_processing.hpp"
#include "utils/colors.hpp"
#include <algorithm>

using namespace cv;
using namespace std;

namespace overlay_processing
{
    MethodResult classify(const Mat &region, const DetectionConfig &config)
    {
        MethodResult result;
        result.method = DetectionMethod::COOLDOWN_OVERLAY;

        if (region.empty())
            return result;

        float dark = static_cast<float>(colors::darkFraction(colors::toBgr(region), config.dark_pixel_level));

        if (dark > config.dark_concentration)
        {
            result.state = AbilityState::COOLDOWN;
            result.confidence = std::min(dark, config.cooldown_threshold + 0.2f);
        }
        else
        {
            result.state = AbilityState::READY;
            result.confidence = 1.0f - dark;
        }

        return result;
    }

} // namespace overlay_processing
