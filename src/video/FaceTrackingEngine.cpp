#include "video/FaceTrackingEngine.h"
#include <algorithm>
#include <tuple>
#include <opencv2/imgproc.hpp>

TrackingParams TrackingParams::fromConfig(const Config::Video& cfg) {
    TrackingParams p;
    p.detectEvery = cfg.detectEvery;
    p.scoreThreshold = cfg.scoreThreshold;
    p.nmsThreshold = cfg.nmsThreshold;
    p.iouMatchThreshold = cfg.iouMatchThreshold;
    p.minCorrelation = cfg.trackerMinCorrelation;
    p.maxPredictedFrames = cfg.maxPredictedFrames;
    p.contrast.clipLimit = cfg.claheClipLimit;
    p.contrast.tileSize = cfg.claheTileSize;
    p.contrast.lowContrastStdDev = cfg.lowContrastStdDev;
    return p;
}

nlohmann::json TrackingStats::toJson() const {
    return {{"frames", frames},
            {"track_frames", trackFrames},
            {"predicted_frames", predictedFrames},
            {"gap_lengths", gapLengths},
            {"tracks_created", tracksCreated},
            {"tracks_dropped", tracksDropped}};
}

TrackingStats TrackingStats::fromJson(const nlohmann::json& j) {
    TrackingStats s;
    s.frames = j.value("frames", 0);
    s.trackFrames = j.value("track_frames", 0L);
    s.predictedFrames = j.value("predicted_frames", 0L);
    s.gapLengths = j.value("gap_lengths", std::vector<int>{});
    s.tracksCreated = j.value("tracks_created", 0);
    s.tracksDropped = j.value("tracks_dropped", 0);
    return s;
}

float intersectionOverUnion(const cv::Rect2f& a, const cv::Rect2f& b) {
    float inter = (a & b).area();
    float uni = a.area() + b.area() - inter;
    return uni > 0.0f ? inter / uni : 0.0f;
}

FaceTrackingEngine::FaceTrackingEngine(IFaceDetector& detector, const TrackingParams& params)
    : detector(detector), params(params), enhancer(params.contrast), tracker(params.minCorrelation) {}

void FaceTrackingEngine::reset() {
    active.clear();
    counters = TrackingStats();
    frameIndex = 0;
    nextTrackId = 1;
}

void FaceTrackingEngine::closeGap(Track& track) {
    if (track.predictedFrames > 0) {
        counters.gapLengths.push_back(track.predictedFrames);
        track.predictedFrames = 0;
    }
}

TrackingStats FaceTrackingEngine::stats() const {
    TrackingStats s = counters;
    for (const auto& t : active) {
        if (t.predictedFrames > 0) s.gapLengths.push_back(t.predictedFrames);
    }
    return s;
}

FrameResult FaceTrackingEngine::process(const cv::Mat& frame) {
    FrameResult result;
    result.frameIndex = frameIndex;
    const cv::Rect2f bounds(0.0f, 0.0f, static_cast<float>(frame.cols), static_cast<float>(frame.rows));

    cv::Mat prepared = enhancer.prepare(frame);
    cv::Mat gray;
    if (prepared.channels() == 3) {
        cv::cvtColor(prepared, gray, cv::COLOR_BGR2GRAY);
    } else {
        gray = prepared;
    }

    for (auto& t : active) {
        t.kalman = KalmanMotion::predict(t.kalman, 1.0f, params.kalman);
    }

    const size_t existing = active.size();
    std::vector<bool> matched(existing, false);

    result.detectorRan = params.detectEvery <= 1 || frameIndex % params.detectEvery == 0;
    if (result.detectorRan) {
        std::vector<FaceDetection> detections =
            filterDetections(detector.detect(prepared), params.scoreThreshold, params.nmsThreshold);

        // Greedy association, best IoU first
        std::vector<std::tuple<float, size_t, size_t>> pairs;
        for (size_t ti = 0; ti < existing; ++ti) {
            cv::Rect2f predicted = KalmanMotion::box(active[ti].kalman);
            for (size_t di = 0; di < detections.size(); ++di) {
                float iou = intersectionOverUnion(predicted, cv::Rect2f(detections[di].box));
                if (iou >= params.iouMatchThreshold) pairs.emplace_back(iou, ti, di);
            }
        }
        std::sort(pairs.begin(), pairs.end(),
                  [](const auto& a, const auto& b) { return std::get<0>(a) > std::get<0>(b); });

        std::vector<bool> used(detections.size(), false);
        for (const auto& [iou, ti, di] : pairs) {
            if (matched[ti] || used[di]) continue;
            matched[ti] = true;
            used[di] = true;
            Track& t = active[ti];
            t.kalman = KalmanMotion::correct(t.kalman, cv::Rect2f(detections[di].box), params.kalman);
            t.box = cv::Rect2f(detections[di].box);
            t.state = TrackState::Detected;
            t.appearance = AppearanceTracker::extractTemplate(gray, detections[di].box);
            closeGap(t);
        }

        for (size_t di = 0; di < detections.size(); ++di) {
            if (used[di]) continue;
            Track t;
            t.id = nextTrackId++;
            t.state = TrackState::Detected;
            t.box = cv::Rect2f(detections[di].box);
            t.kalman = KalmanMotion::init(t.box, params.kalman);
            t.appearance = AppearanceTracker::extractTemplate(gray, detections[di].box);
            t.firstFrame = frameIndex;
            active.push_back(std::move(t));
            counters.tracksCreated++;
        }
    }

    for (size_t ti = 0; ti < existing; ++ti) {
        if (matched[ti]) continue;
        Track& t = active[ti];
        cv::Rect2f predicted = KalmanMotion::box(t.kalman);
        TrackerMatch m = tracker.locate(gray, t.appearance, predicted);
        if (m.found) {
            t.kalman = KalmanMotion::correct(t.kalman, cv::Rect2f(m.box), params.kalman);
            t.box = cv::Rect2f(m.box);
            t.state = TrackState::Tracked;
            closeGap(t);
        } else {
            t.box = predicted;
            t.state = TrackState::Predicted;
            t.predictedFrames++;
        }
    }

    std::vector<Track> survivors;
    survivors.reserve(active.size());
    for (auto& t : active) {
        bool expired = t.predictedFrames > params.maxPredictedFrames;
        bool offFrame = (t.box & bounds).area() <= 0.0f;
        if (expired || offFrame) {
            // The frame that triggered the drop is not emitted
            if (t.predictedFrames - 1 > 0) counters.gapLengths.push_back(t.predictedFrames - 1);
            counters.tracksDropped++;
            continue;
        }

        t.velocity = KalmanMotion::velocity(t.kalman);
        t.lastFrame = frameIndex;
        cv::Rect2f clipped = t.box & bounds;
        result.faces.push_back(FaceObservation{t.id, cv::Rect(clipped), t.state});
        counters.trackFrames++;
        if (t.state == TrackState::Predicted) counters.predictedFrames++;
        survivors.push_back(std::move(t));
    }
    active.swap(survivors);

    counters.frames++;
    frameIndex++;
    return result;
}
