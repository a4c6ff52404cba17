#include "template_processing.hpp"
#include "utils/colors.hpp"
#include "utils/logging.hpp"
#include <cmath>

using namespace cv;
using namespace std;

namespace template_processing
{
    vector<float> scaleSteps(float min_scale, float max_scale, int steps)
    {
        vector<float> scales;
        if (steps <= 1 || max_scale <= min_scale)
        {
            scales.push_back(min_scale);
            return scales;
        }

        float step = (max_scale - min_scale) / (steps - 1);
        for (int i = 0; i < steps; i++)
            scales.push_back(min_scale + step * i);

        return scales;
    }

    TemplateMatch matchAtScale(const Mat &region, const Mat &icon, float scale)
    {
        TemplateMatch match;
        match.scale = scale;

        if (region.empty() || icon.empty() || scale <= 0.0f)
            return match;

        int width = cvRound(icon.cols * scale);
        int height = cvRound(icon.rows * scale);
        if (width <= 0 || height <= 0)
            return match;

        // A template larger than the region cannot be matched
        if (width > region.cols || height > region.rows)
            return match;

        Mat scaled;
        if (width == icon.cols && height == icon.rows)
            scaled = icon;
        else
            resize(icon, scaled, Size(width, height), 0, 0, scale < 1.0f ? INTER_AREA : INTER_LINEAR);

        Mat result;
        matchTemplate(region, scaled, result, TM_CCOEFF_NORMED);

        double max_val = 0.0;
        Point max_loc;
        minMaxLoc(result, nullptr, &max_val, nullptr, &max_loc);

        // Flat regions can yield NaN; negative correlation is no match
        if (!std::isfinite(max_val))
            max_val = 0.0;

        match.confidence = static_cast<float>(std::min(std::max(max_val, 0.0), 1.0));
        match.location = max_loc;
        match.scaled_icon = scaled;
        return match;
    }

    TemplateMatch findBestMatch(const Mat &region, const Mat &icon, const DetectionConfig &config)
    {
        if (!config.use_multi_scale)
            return matchAtScale(region, icon, 1.0f);

        TemplateMatch best;
        for (float scale : scaleSteps(config.scale_min, config.scale_max, 5))
        {
            TemplateMatch match = matchAtScale(region, icon, scale);
            if (match.found() && (!best.found() || match.confidence > best.confidence))
                best = match;
        }
        return best;
    }

    AbilityState inferState(const Mat &region, const TemplateMatch &match, const DetectionConfig &config)
    {
        if (!match.found() || match.confidence < config.template_threshold)
            return AbilityState::UNAVAILABLE;

        Rect matched_rect(match.location, match.scaled_icon.size());
        matched_rect &= Rect(0, 0, region.cols, region.rows);
        if (matched_rect.area() <= 0)
            return AbilityState::UNKNOWN;

        double matched_brightness = colors::meanBrightness(region(matched_rect));
        double icon_brightness = colors::meanBrightness(match.scaled_icon);
        if (icon_brightness <= 0.0)
            return AbilityState::UNKNOWN;

        double ratio = matched_brightness / icon_brightness;
        if (ratio < config.cooldown_brightness_ratio)
            return AbilityState::COOLDOWN;
        if (ratio > config.ready_brightness_ratio)
            return AbilityState::READY;

        return AbilityState::UNKNOWN;
    }

    MethodResult classify(const Mat &region, const Mat &icon, const DetectionConfig &config)
    {
        MethodResult result;
        result.method = DetectionMethod::TEMPLATE_MATCH;

        Mat bgr_region = colors::toBgr(region);
        Mat bgr_icon = colors::toBgr(icon);

        TemplateMatch match = findBestMatch(bgr_region, bgr_icon, config);
        result.confidence = match.confidence;
        result.state = inferState(bgr_region, match, config);
        return result;
    }

} // namespace template_processing
