#include "video/AppearanceTracker.h"
#include <cmath>
#include <opencv2/imgproc.hpp>

namespace {
    // Flat patches correlate with anything; they carry no appearance.
    constexpr double kMinTextureStdDev = 2.0;

    double stdDevOf(const cv::Mat& m) {
        cv::Scalar mean, stddev;
        cv::meanStdDev(m, mean, stddev);
        return stddev[0];
    }
}

AppearanceTracker::AppearanceTracker(double minCorrelation, double searchMargin)
    : minCorrelation(minCorrelation), searchMargin(searchMargin) {}

cv::Mat AppearanceTracker::extractTemplate(const cv::Mat& gray, const cv::Rect& box) {
    cv::Rect clipped = box & cv::Rect(0, 0, gray.cols, gray.rows);
    if (clipped.area() <= 0) return cv::Mat();
    return gray(clipped).clone();
}

TrackerMatch AppearanceTracker::locate(const cv::Mat& gray, const cv::Mat& templ, const cv::Rect2f& predicted) const {
    TrackerMatch result;
    if (gray.empty() || templ.empty()) return result;
    if (stdDevOf(templ) < kMinTextureStdDev) return result;

    const int marginX = static_cast<int>(std::ceil(predicted.width * searchMargin));
    const int marginY = static_cast<int>(std::ceil(predicted.height * searchMargin));
    cv::Rect window(static_cast<int>(predicted.x) - marginX, static_cast<int>(predicted.y) - marginY,
                    static_cast<int>(predicted.width) + 2 * marginX, static_cast<int>(predicted.height) + 2 * marginY);
    window &= cv::Rect(0, 0, gray.cols, gray.rows);
    if (window.width < templ.cols || window.height < templ.rows) return result;

    cv::Mat search = gray(window);
    cv::Mat scores;
    cv::matchTemplate(search, templ, scores, cv::TM_CCOEFF_NORMED);

    double maxVal = 0.0;
    cv::Point maxLoc;
    cv::minMaxLoc(scores, nullptr, &maxVal, nullptr, &maxLoc);
    if (!std::isfinite(maxVal) || maxVal < minCorrelation) return result;

    cv::Rect hit(window.x + maxLoc.x, window.y + maxLoc.y, templ.cols, templ.rows);
    if (stdDevOf(gray(hit)) < kMinTextureStdDev) return result;

    result.found = true;
    result.box = hit;
    result.correlation = maxVal;
    return result;
}
