#pragma once
#include <opencv2/core.hpp>

struct ContrastParams {
    double clipLimit = 4.0;
    int tileSize = 6;
    double lowContrastStdDev = 40.0;
};

/**
 * @brief Preprocessing for grayscale or washed-out footage before detection.
 */
class ContrastEnhancer {
public:
    explicit ContrastEnhancer(const ContrastParams& params = ContrastParams());

    /** Single channel, or three channels carrying the same values. */
    static bool isGrayscale(const cv::Mat& frame);

    bool isLowContrast(const cv::Mat& frame) const;

    bool needsEnhancement(const cv::Mat& frame) const { return isGrayscale(frame) || isLowContrast(frame); }

    /** CLAHE on luminance followed by an unsharp mask. Output is BGR. */
    cv::Mat enhance(const cv::Mat& frame) const;

    /** enhance() when needed, otherwise the frame itself. */
    cv::Mat prepare(const cv::Mat& frame) const;

private:
    ContrastParams params;
};
