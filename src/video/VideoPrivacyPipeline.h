#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "pipeline/CancellationToken.h"
#include "verification/VideoVerification.h"
#include "video/FaceBlurrer.h"
#include "video/FaceTrackingEngine.h"
#include "video/FrameIO.h"

/**
 * @brief Output of the detection pass: every face box of every frame.
 *
 * Persisted as the detections file handed from detect_faces to blur.
 */
struct DetectionPass {
    double fps = 30.0;
    cv::Size frameSize;
    std::vector<FrameResult> frames;
    TrackingStats stats;

    nlohmann::json toJson() const;
    static DetectionPass fromJson(const nlohmann::json& j);

    void save(const std::string& path) const;
    /** @throws std::runtime_error on unreadable or malformed files */
    static DetectionPass load(const std::string& path);
};

struct BlurPass {
    int framesWritten = 0;
    int regionsBlurred = 0;
    std::vector<double> regionVariances;
};

struct OfflineResult {
    DetectionPass detection;
    VerificationResult continuity;
    BlurPass blur;
    VerificationResult intensity;
};

class VideoPrivacyPipeline {
public:
    VideoPrivacyPipeline(IFaceDetector& detector, const TrackingParams& params);

    /** First pass: run the hybrid engine over the whole input. */
    DetectionPass detect(FrameSource& source, const CancellationToken* cancel = nullptr);

    /** Second pass: blur the trusted boxes frame by frame. */
    static BlurPass blur(FrameSource& source, const DetectionPass& detection, FrameSink& sink,
                         const BlurParams& params, const CancellationToken* cancel = nullptr);

    /**
     * @brief Detect, verify, then blur.
     * @throws DetectionVerificationFailure before any frame is written when continuity fails
     */
    OfflineResult runOffline(FrameSource& source, FrameSink& sink, const BlurParams& params,
                             const CancellationToken* cancel = nullptr,
                             const ContinuityThresholds& limits = ContinuityThresholds());

private:
    IFaceDetector& detector;
    TrackingParams params;
};
