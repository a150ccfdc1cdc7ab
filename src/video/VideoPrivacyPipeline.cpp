#include "video/VideoPrivacyPipeline.h"
#include <fstream>
#include <stdexcept>
#include "core/Errors.h"
#include "utils/Logger.h"

nlohmann::json DetectionPass::toJson() const {
    nlohmann::json framesJson = nlohmann::json::array();
    for (const auto& f : frames) {
        nlohmann::json faces = nlohmann::json::array();
        for (const auto& o : f.faces) {
            faces.push_back({{"track", o.trackId},
                             {"box", {o.box.x, o.box.y, o.box.width, o.box.height}},
                             {"state", trackStateName(o.state)}});
        }
        framesJson.push_back({{"frame", f.frameIndex}, {"detector", f.detectorRan}, {"faces", faces}});
    }
    return {{"fps", fps},
            {"width", frameSize.width},
            {"height", frameSize.height},
            {"frame_count", frames.size()},
            {"frames", framesJson},
            {"stats", stats.toJson()}};
}

DetectionPass DetectionPass::fromJson(const nlohmann::json& j) {
    DetectionPass pass;
    pass.fps = j.value("fps", 30.0);
    pass.frameSize = cv::Size(j.value("width", 0), j.value("height", 0));
    for (const auto& f : j.at("frames")) {
        FrameResult fr;
        fr.frameIndex = f.at("frame").get<int>();
        fr.detectorRan = f.value("detector", false);
        for (const auto& o : f.at("faces")) {
            const auto& b = o.at("box");
            fr.faces.push_back(FaceObservation{o.value("track", 0),
                                               cv::Rect(b.at(0).get<int>(), b.at(1).get<int>(),
                                                        b.at(2).get<int>(), b.at(3).get<int>()),
                                               trackStateFromName(o.value("state", std::string("detected")))});
        }
        pass.frames.push_back(std::move(fr));
    }
    if (j.contains("stats")) pass.stats = TrackingStats::fromJson(j["stats"]);
    return pass;
}

void DetectionPass::save(const std::string& path) const {
    std::ofstream out(path);
    if (!out.is_open()) throw std::runtime_error("Cannot write detections file: " + path);
    out << toJson().dump();
}

DetectionPass DetectionPass::load(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) throw std::runtime_error("Cannot read detections file: " + path);
    try {
        return fromJson(nlohmann::json::parse(in));
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Malformed detections file " + path + ": " + e.what());
    }
}

VideoPrivacyPipeline::VideoPrivacyPipeline(IFaceDetector& detector, const TrackingParams& params)
    : detector(detector), params(params) {}

DetectionPass VideoPrivacyPipeline::detect(FrameSource& source, const CancellationToken* cancel) {
    FaceTrackingEngine engine(detector, params);
    DetectionPass pass;
    pass.fps = source.fps();
    pass.frameSize = source.frameSize();

    cv::Mat frame;
    while (source.read(frame)) {
        checkCancelled(cancel);
        if (pass.frameSize.area() == 0) pass.frameSize = frame.size();
        pass.frames.push_back(engine.process(frame));
    }
    pass.stats = engine.stats();
    Logger::getInstance().info("Detection pass: " + std::to_string(pass.frames.size()) + " frames, " +
                               std::to_string(pass.stats.tracksCreated) + " tracks");
    return pass;
}

BlurPass VideoPrivacyPipeline::blur(FrameSource& source, const DetectionPass& detection, FrameSink& sink,
                                    const BlurParams& params, const CancellationToken* cancel) {
    BlurPass result;
    cv::Mat frame;
    size_t index = 0;
    while (source.read(frame)) {
        checkCancelled(cancel);
        if (index < detection.frames.size()) {
            std::vector<cv::Rect> boxes;
            for (const auto& o : detection.frames[index].faces) boxes.push_back(o.box);
            for (const auto& region : FaceBlurrer::blurRegions(frame, boxes, params)) {
                result.regionVariances.push_back(VideoVerification::laplacianVariance(frame(region)));
                result.regionsBlurred++;
            }
        }
        sink.write(frame);
        result.framesWritten++;
        index++;
    }
    return result;
}

OfflineResult VideoPrivacyPipeline::runOffline(FrameSource& source, FrameSink& sink, const BlurParams& blurParams,
                                               const CancellationToken* cancel, const ContinuityThresholds& limits) {
    OfflineResult result;
    result.detection = detect(source, cancel);
    result.continuity = VideoVerification::verifyContinuity(result.detection.stats, result.detection.fps, limits);
    if (!result.continuity.verified) {
        throw DetectionVerificationFailure(result.continuity.error, result.continuity.toJson());
    }

    source.rewind();
    result.blur = blur(source, result.detection, sink, blurParams, cancel);
    result.intensity = VideoVerification::verifyBlurIntensity(result.blur.regionVariances);
    return result;
}
