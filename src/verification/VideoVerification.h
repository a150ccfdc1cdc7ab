#pragma once
#include <vector>
#include <opencv2/core.hpp>
#include "verification/VerificationResult.h"
#include "video/FaceTrackingEngine.h"

struct ContinuityThresholds {
    double maxMissRatio = 0.10;      // exclusive
    double maxShortGapRatio = 0.10;  // exclusive
    double shortGapSec = 0.5;
};

namespace VideoVerification {
    /**
     * @brief Detection continuity.
     *
     * miss ratio = predicted track-frames / all track-frames,
     * short-gap ratio = frames in prediction runs shorter than shortGapSec / all track-frames.
     * Both must be strictly below their limit.
     */
    VerificationResult verifyContinuity(const TrackingStats& stats, double fps,
                                        const ContinuityThresholds& limits = ContinuityThresholds());

    /** Variance of the Laplacian of a region (grayscale). */
    double laplacianVariance(const cv::Mat& region);

    /** Average Laplacian variance of the blurred regions must be below @p maxAverage. */
    VerificationResult verifyBlurIntensity(const std::vector<double>& regionVariances, double maxAverage = 50.0);
}
