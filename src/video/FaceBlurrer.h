#pragma once
#include <vector>
#include <opencv2/core.hpp>

struct BlurParams {
    double scale = 2.0;  // box expansion about its center
    int kernel = 31;     // odd Gaussian kernel size
};

namespace FaceBlurrer {
    /** Scales @p box about its center and clips it to the frame. */
    cv::Rect expandBox(const cv::Rect& box, double scale, const cv::Size& frame);

    /** Largest odd kernel not above @p requested that still fits inside @p roi. 1 means no blur. */
    int clampKernel(int requested, const cv::Size& roi);

    /**
     * @brief Blurs every box in place.
     * @return the regions actually blurred (after expansion and clipping)
     */
    std::vector<cv::Rect> blurRegions(cv::Mat& frame, const std::vector<cv::Rect>& boxes, const BlurParams& params);
}
