#pragma once
#include <vector>
#include <nlohmann/json.hpp>
#include <opencv2/core.hpp>
#include "core/ConfigManager.h"
#include "video/AppearanceTracker.h"
#include "video/ContrastEnhancer.h"
#include "video/FaceDetector.h"
#include "video/KalmanMotion.h"
#include "video/Track.h"

struct TrackingParams {
    int detectEvery = 3;
    float scoreThreshold = 0.5f;
    float nmsThreshold = 0.3f;
    float iouMatchThreshold = 0.3f;
    double minCorrelation = 0.5;
    int maxPredictedFrames = 60;
    KalmanParams kalman;
    ContrastParams contrast;

    static TrackingParams fromConfig(const Config::Video& cfg);
};

struct FaceObservation {
    int trackId = 0;
    cv::Rect box;
    TrackState state = TrackState::Detected;
};

struct FrameResult {
    int frameIndex = 0;
    bool detectorRan = false;
    std::vector<FaceObservation> faces;
};

/**
 * @brief Continuity counters over every emitted track-frame.
 */
struct TrackingStats {
    int frames = 0;
    long trackFrames = 0;
    long predictedFrames = 0;
    std::vector<int> gapLengths;  // prediction runs, in frames
    int tracksCreated = 0;
    int tracksDropped = 0;

    nlohmann::json toJson() const;
    static TrackingStats fromJson(const nlohmann::json& j);
};

/**
 * @brief Hybrid per-frame face engine: detector on a cadence, appearance
 * tracker in between, Kalman prediction when both miss.
 *
 * Holds per-job state; one instance per video stream.
 */
class FaceTrackingEngine {
public:
    FaceTrackingEngine(IFaceDetector& detector, const TrackingParams& params = TrackingParams());

    FrameResult process(const cv::Mat& frame);

    const std::vector<Track>& tracks() const { return active; }

    /** Counters so far; prediction runs still open are included. */
    TrackingStats stats() const;

    void reset();

private:
    IFaceDetector& detector;
    TrackingParams params;
    ContrastEnhancer enhancer;
    AppearanceTracker tracker;

    std::vector<Track> active;
    TrackingStats counters;
    int frameIndex = 0;
    int nextTrackId = 1;

    void closeGap(Track& track);
};

float intersectionOverUnion(const cv::Rect2f& a, const cv::Rect2f& b);
