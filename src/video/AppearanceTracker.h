#pragma once
#include <opencv2/core.hpp>

struct TrackerMatch {
    bool found = false;
    cv::Rect box;
    double correlation = 0.0;
};

/**
 * @brief Secondary tracker: normalized cross-correlation of a face template
 * inside a search window around the predicted position.
 */
class AppearanceTracker {
public:
    AppearanceTracker(double minCorrelation = 0.5, double searchMargin = 0.5);

    /** Grayscale crop of @p box, clipped to the frame. Empty if nothing is left. */
    static cv::Mat extractTemplate(const cv::Mat& gray, const cv::Rect& box);

    /**
     * @param gray current frame, single channel
     * @param templ template from extractTemplate
     * @param predicted where the motion model expects the face
     */
    TrackerMatch locate(const cv::Mat& gray, const cv::Mat& templ, const cv::Rect2f& predicted) const;

private:
    double minCorrelation;
    double searchMargin;  // fraction of the box size added on each side
};
