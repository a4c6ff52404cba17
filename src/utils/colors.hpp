#pragma once

#include <opencv2/opencv.hpp>
#include <algorithm>
#include <vector>
#include <cmath>

using namespace cv;
using namespace std;

namespace colors
{
    // Normalise any capture (grey, BGR, BGRA) to 8-bit BGR
    inline Mat toBgr(const Mat &image)
    {
        if (image.empty())
            return image;

        Mat converted = image;
        if (image.depth() != CV_8U)
            image.convertTo(converted, CV_8U);

        Mat bgr;
        switch (converted.channels())
        {
        case 1:
            cvtColor(converted, bgr, COLOR_GRAY2BGR);
            return bgr;
        case 4:
            cvtColor(converted, bgr, COLOR_BGRA2BGR);
            return bgr;
        default:
            return converted;
        }
    }

    // Single channel greyscale view of a BGR image
    inline Mat toGray(const Mat &bgr)
    {
        if (bgr.channels() == 1)
            return bgr;

        Mat gray;
        cvtColor(bgr, gray, COLOR_BGR2GRAY);
        return gray;
    }

    // Average grey level (0-255)
    inline double meanBrightness(const Mat &bgr)
    {
        if (bgr.empty())
            return 0.0;
        return mean(toGray(bgr))[0];
    }

    // Average HSV values; OpenCV hue is 0-180, saturation and value 0-255
    inline Scalar meanHsv(const Mat &bgr)
    {
        if (bgr.empty())
            return Scalar::all(0);

        Mat hsv;
        cvtColor(toBgr(bgr), hsv, COLOR_BGR2HSV);
        return mean(hsv);
    }

    // Fraction of pixels whose grey level falls in [0, level)
    inline double darkFraction(const Mat &bgr, int level)
    {
        if (bgr.empty())
            return 0.0;

        Mat gray = toGray(bgr);
        int channels[] = {0};
        int histSize[] = {256};
        float range[] = {0, 256};
        const float *ranges[] = {range};

        Mat hist;
        calcHist(&gray, 1, channels, Mat(), hist, 1, histSize, ranges);

        double total = sum(hist)[0];
        if (total <= 0.0)
            return 0.0;

        int upper = std::min(std::max(level, 0), 256);
        double dark = 0.0;
        for (int i = 0; i < upper; i++)
            dark += hist.at<float>(i);

        return dark / total;
    }

    // BGR colour used when drawing a state on the debug overlay
    inline Scalar stateColor(int state_index)
    {
        static const vector<Scalar> palette = {
            Scalar(0, 220, 0),     // ready
            Scalar(0, 0, 220),     // cooldown
            Scalar(0, 200, 255),   // casting
            Scalar(128, 128, 128), // unavailable
            Scalar(80, 80, 80),    // not learned
            Scalar(255, 0, 255)};  // unknown
        if (state_index < 0 || state_index >= (int)palette.size())
            return palette.back();
        return palette[state_index];
    }
}
