#pragma once
#include <memory>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include <opencv2/dnn.hpp>
#include <opencv2/objdetect.hpp>
#include "core/ConfigManager.h"

struct FaceDetection {
    cv::Rect box;
    float score = 1.0f;
};

/**
 * @brief Primary per-frame face detector.
 */
class IFaceDetector {
public:
    virtual ~IFaceDetector() = default;
    virtual std::vector<FaceDetection> detect(const cv::Mat& bgr) = 0;
    virtual std::string name() const = 0;
};

/** Haar cascade; unscored, every hit gets score 1.0. */
class HaarFaceDetector : public IFaceDetector {
public:
    /** @throws std::runtime_error when the cascade cannot be loaded */
    explicit HaarFaceDetector(const std::string& cascadePath);
    std::vector<FaceDetection> detect(const cv::Mat& bgr) override;
    std::string name() const override { return "haar"; }

private:
    cv::CascadeClassifier cascade;
};

/** OpenCV DNN SSD face model (res10 300x300). */
class DnnFaceDetector : public IFaceDetector {
public:
    /** @throws std::runtime_error when the network cannot be loaded */
    DnnFaceDetector(const std::string& configPath, const std::string& modelPath);
    std::vector<FaceDetection> detect(const cv::Mat& bgr) override;
    std::string name() const override { return "dnn"; }

private:
    cv::dnn::Net net;
};

/** Drops detections under @p scoreThreshold, then applies non-maximum suppression. */
std::vector<FaceDetection> filterDetections(const std::vector<FaceDetection>& raw,
                                            float scoreThreshold, float nmsThreshold);

std::unique_ptr<IFaceDetector> makeFaceDetector(const Config::Video& cfg);
