#include "verification/VideoVerification.h"
#include <numeric>
#include <opencv2/imgproc.hpp>

namespace VideoVerification {

VerificationResult verifyContinuity(const TrackingStats& stats, double fps, const ContinuityThresholds& limits) {
    const double safeFps = fps > 0.0 ? fps : 30.0;
    long shortGapFrames = 0;
    int shortGaps = 0;
    for (int gap : stats.gapLengths) {
        if (gap / safeFps < limits.shortGapSec) {
            shortGapFrames += gap;
            shortGaps++;
        }
    }

    const double total = static_cast<double>(stats.trackFrames);
    const double missRatio = total > 0 ? stats.predictedFrames / total : 0.0;
    const double shortGapRatio = total > 0 ? shortGapFrames / total : 0.0;

    nlohmann::json metrics = {{"miss_ratio", missRatio},
                              {"short_gap_ratio", shortGapRatio},
                              {"track_frames", stats.trackFrames},
                              {"predicted_frames", stats.predictedFrames},
                              {"short_gaps", shortGaps},
                              {"tracks", stats.tracksCreated},
                              {"frames", stats.frames},
                              {"fps", safeFps}};

    if (missRatio >= limits.maxMissRatio) {
        return VerificationResult::fail("continuity", ErrorCategory::DetectionVerificationFailure,
                                        "miss ratio " + std::to_string(missRatio) + " is not below " +
                                            std::to_string(limits.maxMissRatio),
                                        metrics);
    }
    if (shortGapRatio >= limits.maxShortGapRatio) {
        return VerificationResult::fail("continuity", ErrorCategory::DetectionVerificationFailure,
                                        "short-gap ratio " + std::to_string(shortGapRatio) + " is not below " +
                                            std::to_string(limits.maxShortGapRatio),
                                        metrics);
    }
    return VerificationResult::pass("continuity", metrics);
}

double laplacianVariance(const cv::Mat& region) {
    if (region.empty()) return 0.0;
    cv::Mat gray;
    if (region.channels() == 3) {
        cv::cvtColor(region, gray, cv::COLOR_BGR2GRAY);
    } else {
        gray = region;
    }
    cv::Mat lap;
    cv::Laplacian(gray, lap, CV_64F);
    cv::Scalar mean, stddev;
    cv::meanStdDev(lap, mean, stddev);
    return stddev[0] * stddev[0];
}

VerificationResult verifyBlurIntensity(const std::vector<double>& regionVariances, double maxAverage) {
    const double average = regionVariances.empty()
                               ? 0.0
                               : std::accumulate(regionVariances.begin(), regionVariances.end(), 0.0) /
                                     static_cast<double>(regionVariances.size());
    nlohmann::json metrics = {{"avg_laplacian_variance", average},
                              {"regions", regionVariances.size()},
                              {"threshold", maxAverage}};
    if (average >= maxAverage) {
        return VerificationResult::fail("intensity", ErrorCategory::RedactionVerificationFailure,
                                        "blurred regions still sharp: average Laplacian variance " +
                                            std::to_string(average),
                                        metrics);
    }
    return VerificationResult::pass("intensity", metrics);
}

}
