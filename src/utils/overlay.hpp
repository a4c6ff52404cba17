#pragma once

#include <opencv2/opencv.hpp>
#include <vector>
#include "colors.hpp"
#include "detector/skill_types.hpp"

namespace overlay
{
    // Draw every slot of the bar, coloured by the state of the ability bound to it
    inline Mat drawBar(const Mat &frame, const SkillBarMapping &mapping, const vector<Ability> &abilities)
    {
        Mat canvas = colors::toBgr(frame).clone();
        if (canvas.empty())
            return canvas;

        rectangle(canvas, mapping.bar_region, Scalar(255, 255, 255), 1);

        for (size_t i = 0; i < mapping.slot_regions.size(); i++)
        {
            const Rect &slot = mapping.slot_regions[i];
            rectangle(canvas, slot, Scalar(90, 90, 90), 1);
            putText(canvas, to_string(i), Point(slot.x + 2, slot.y + 12), FONT_HERSHEY_SIMPLEX, 0.35,
                    Scalar(200, 200, 200), 1);
        }

        for (const auto &ability : abilities)
        {
            if (!ability.hasPosition())
                continue;

            const Rect &slot = ability.position.region;
            Scalar color = colors::stateColor(static_cast<int>(ability.state));
            rectangle(canvas, slot, color, 2);
            putText(canvas, ability.name, Point(slot.x + 2, slot.y + slot.height - 4), FONT_HERSHEY_SIMPLEX, 0.35,
                    color, 1);
        }

        return canvas;
    }

    // Just the bar, enlarged for streaming
    inline Mat cropBar(const Mat &annotated, const Rect &bar_region, double scale = 2.0)
    {
        Rect bounded = bar_region & Rect(0, 0, annotated.cols, annotated.rows);
        if (bounded.area() <= 0)
            return annotated;

        Mat crop;
        resize(annotated(bounded), crop, Size(), scale, scale, INTER_NEAREST);
        return crop;
    }
}
