#pragma once
#include <string>
#include <opencv2/core.hpp>
#include "video/KalmanMotion.h"

enum class TrackState { Detected, Tracked, Predicted };

inline std::string trackStateName(TrackState s) {
    switch (s) {
        case TrackState::Detected: return "detected";
        case TrackState::Tracked: return "tracked";
        case TrackState::Predicted: return "predicted";
    }
    return "predicted";
}

inline TrackState trackStateFromName(const std::string& name) {
    if (name == "detected") return TrackState::Detected;
    if (name == "tracked") return TrackState::Tracked;
    return TrackState::Predicted;
}

/**
 * @brief One followed face.
 *
 * Created on a detector hit, updated every frame, dropped once it has been
 * carried by prediction alone for longer than the prediction limit.
 */
struct Track {
    int id = 0;
    TrackState state = TrackState::Detected;
    cv::Rect2f box;
    cv::Vec4f velocity;
    int predictedFrames = 0;  // consecutive prediction-only frames
    KalmanState kalman;
    cv::Mat appearance;       // grayscale template from the last detection
    int firstFrame = 0;
    int lastFrame = 0;
};
