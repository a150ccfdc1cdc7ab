#include "video/FaceDetector.h"
#include <stdexcept>
#include <opencv2/imgproc.hpp>
#include "utils/Logger.h"

HaarFaceDetector::HaarFaceDetector(const std::string& cascadePath) {
    if (!cascade.load(cascadePath)) {
        throw std::runtime_error("Failed to load Haar cascade at: " + cascadePath);
    }
    Logger::getInstance().info("Haar cascade loaded: " + cascadePath);
}

std::vector<FaceDetection> HaarFaceDetector::detect(const cv::Mat& bgr) {
    std::vector<FaceDetection> out;
    if (bgr.empty()) return out;

    cv::Mat gray;
    if (bgr.channels() == 3) {
        cv::cvtColor(bgr, gray, cv::COLOR_BGR2GRAY);
    } else {
        gray = bgr.clone();
    }
    cv::equalizeHist(gray, gray);

    std::vector<cv::Rect> faces;
    cascade.detectMultiScale(gray, faces, 1.1, 4, 0, cv::Size(24, 24));
    out.reserve(faces.size());
    for (const auto& r : faces) {
        out.push_back(FaceDetection{r, 1.0f});
    }
    return out;
}

DnnFaceDetector::DnnFaceDetector(const std::string& configPath, const std::string& modelPath) {
    try {
        net = cv::dnn::readNetFromCaffe(configPath, modelPath);
    } catch (const cv::Exception& e) {
        throw std::runtime_error("Failed to load face model " + modelPath + ": " + e.what());
    }
    if (net.empty()) throw std::runtime_error("Face model is empty: " + modelPath);
    net.setPreferableBackend(cv::dnn::DNN_BACKEND_OPENCV);
    net.setPreferableTarget(cv::dnn::DNN_TARGET_CPU);
    Logger::getInstance().info("DNN face model loaded: " + modelPath);
}

std::vector<FaceDetection> DnnFaceDetector::detect(const cv::Mat& bgr) {
    std::vector<FaceDetection> out;
    if (bgr.empty()) return out;

    cv::Mat input = bgr;
    if (bgr.channels() == 1) cv::cvtColor(bgr, input, cv::COLOR_GRAY2BGR);

    cv::Mat blob = cv::dnn::blobFromImage(input, 1.0, cv::Size(300, 300), cv::Scalar(104.0, 177.0, 123.0));
    net.setInput(blob);
    cv::Mat pred = net.forward();

    // [1, 1, N, 7]: image_id, label, confidence, x1, y1, x2, y2 (normalized)
    cv::Mat rows(pred.size[2], pred.size[3], CV_32F, pred.ptr<float>());
    const cv::Rect frame(0, 0, input.cols, input.rows);
    for (int i = 0; i < rows.rows; ++i) {
        float score = rows.at<float>(i, 2);
        int x1 = static_cast<int>(rows.at<float>(i, 3) * input.cols);
        int y1 = static_cast<int>(rows.at<float>(i, 4) * input.rows);
        int x2 = static_cast<int>(rows.at<float>(i, 5) * input.cols);
        int y2 = static_cast<int>(rows.at<float>(i, 6) * input.rows);
        cv::Rect box = cv::Rect(cv::Point(x1, y1), cv::Point(x2, y2)) & frame;
        if (box.area() <= 0) continue;
        out.push_back(FaceDetection{box, score});
    }
    return out;
}

std::vector<FaceDetection> filterDetections(const std::vector<FaceDetection>& raw,
                                            float scoreThreshold, float nmsThreshold) {
    std::vector<cv::Rect> boxes;
    std::vector<float> scores;
    for (const auto& d : raw) {
        boxes.push_back(d.box);
        scores.push_back(d.score);
    }

    std::vector<int> keep;
    cv::dnn::NMSBoxes(boxes, scores, scoreThreshold, nmsThreshold, keep);

    std::vector<FaceDetection> out;
    out.reserve(keep.size());
    for (int idx : keep) out.push_back(raw[idx]);
    return out;
}

std::unique_ptr<IFaceDetector> makeFaceDetector(const Config::Video& cfg) {
    if (cfg.detectorBackend == "dnn") {
        return std::make_unique<DnnFaceDetector>(cfg.dnnConfigPath, cfg.dnnModelPath);
    }
    if (cfg.detectorBackend == "haar") {
        return std::make_unique<HaarFaceDetector>(cfg.haarCascadePath);
    }
    throw std::runtime_error("Unknown detector backend: " + cfg.detectorBackend);
}
