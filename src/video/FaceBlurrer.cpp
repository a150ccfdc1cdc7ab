#include "video/FaceBlurrer.h"
#include <algorithm>
#include <cmath>
#include <opencv2/imgproc.hpp>

namespace FaceBlurrer {

cv::Rect expandBox(const cv::Rect& box, double scale, const cv::Size& frame) {
    const double cx = box.x + box.width / 2.0;
    const double cy = box.y + box.height / 2.0;
    const double w = box.width * scale;
    const double h = box.height * scale;
    cv::Rect expanded(static_cast<int>(std::lround(cx - w / 2.0)), static_cast<int>(std::lround(cy - h / 2.0)),
                      static_cast<int>(std::lround(w)), static_cast<int>(std::lround(h)));
    return expanded & cv::Rect(0, 0, frame.width, frame.height);
}

int clampKernel(int requested, const cv::Size& roi) {
    int k = requested % 2 == 0 ? requested - 1 : requested;
    int limit = std::min(roi.width, roi.height);
    if (limit % 2 == 0) limit -= 1;
    k = std::min(k, limit);
    return std::max(k, 1);
}

std::vector<cv::Rect> blurRegions(cv::Mat& frame, const std::vector<cv::Rect>& boxes, const BlurParams& params) {
    std::vector<cv::Rect> regions;
    for (const auto& box : boxes) {
        cv::Rect region = expandBox(box, params.scale, frame.size());
        if (region.area() <= 0) continue;

        int k = clampKernel(params.kernel, region.size());
        if (k > 1) {
            cv::Mat roi = frame(region);
            cv::GaussianBlur(roi, roi, cv::Size(k, k), 0);
        }
        regions.push_back(region);
    }
    return regions;
}

}
