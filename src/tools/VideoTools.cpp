#include "tools/VideoTools.h"
#include <algorithm>
#include "core/Errors.h"
#include "utils/Logger.h"
#include "verification/VideoVerification.h"
#include "video/FrameIO.h"
#include "video/VideoPrivacyPipeline.h"

// ============================================================================
// Shared passes
// ============================================================================

namespace {

TrackingParams trackingFor(const Config::Video& cfg, const nlohmann::json& args) {
    TrackingParams params = TrackingParams::fromConfig(cfg);
    params.detectEvery = std::max(1, args.value("detect_every", params.detectEvery));
    params.scoreThreshold = args.value("score_threshold", params.scoreThreshold);
    return params;
}

BlurParams blurFor(const Config::Video& cfg, const nlohmann::json& args) {
    BlurParams params;
    params.kernel = args.value("blur_kernel", cfg.blurKernel);
    params.scale = args.value("scale", cfg.blurScale);
    return params;
}

nlohmann::json runDetection(const ToolServices& services, const ToolContext& ctx, const nlohmann::json& args) {
    std::string video = args.value("video_path", ctx.inputPath);
    std::unique_ptr<IFaceDetector> detector = services.detectorFactory();
    VideoFileSource source(video);
    VideoPrivacyPipeline pipeline(*detector, trackingFor(services.config.video, args));
    DetectionPass pass = pipeline.detect(source, ctx.cancel);

    std::string path = ToolResult::outputPath(ctx, video, "_detections", ".json");
    pass.save(path);
    return {{"detections_path", path},
            {"video_path", video},
            {"summary",
             {{"frames", pass.frames.size()},
              {"tracks", pass.stats.tracksCreated},
              {"detector", detector->name()},
              {"stats", pass.stats.toJson()}}}};
}

nlohmann::json verifyDetections(const std::string& detectionsPath) {
    DetectionPass pass = DetectionPass::load(detectionsPath);
    return VideoVerification::verifyContinuity(pass.stats, pass.fps).toJson();
}

nlohmann::json runBlur(const ToolServices& services, const ToolContext& ctx, const nlohmann::json& args,
                       const std::string& detectionsPath) {
    std::string video = args.value("video_path", ctx.inputPath);
    DetectionPass detection = DetectionPass::load(detectionsPath);
    BlurParams params = blurFor(services.config.video, args);
    std::string out = ToolResult::outputPath(ctx, video, "_blurred", ".mp4");

    BlurPass pass;
    {
        VideoFileSource source(video);
        VideoFileSink sink(out, source.fps(), source.frameSize());
        pass = VideoPrivacyPipeline::blur(source, detection, sink, params, ctx.cancel);
    }
    return {{"output_path", out},
            {"detections_path", detectionsPath},
            {"summary",
             {{"frames_written", pass.framesWritten},
              {"regions_blurred", pass.regionsBlurred},
              {"blur_kernel", params.kernel},
              {"scale", params.scale}}}};
}

// Measured on the encoded output, not on the frames before encoding.
nlohmann::json verifyBlurOutput(const ToolServices& services, const nlohmann::json& args, const nlohmann::json& output) {
    DetectionPass detection = DetectionPass::load(output.at("detections_path").get<std::string>());
    BlurParams params = blurFor(services.config.video, args);
    VideoFileSource source(output.at("output_path").get<std::string>());

    std::vector<double> variances;
    cv::Mat frame;
    for (size_t index = 0; source.read(frame) && index < detection.frames.size(); ++index) {
        for (const auto& face : detection.frames[index].faces) {
            cv::Rect region = FaceBlurrer::expandBox(face.box, params.scale, frame.size());
            if (region.area() > 0) variances.push_back(VideoVerification::laplacianVariance(frame(region)));
        }
    }
    return VideoVerification::verifyBlurIntensity(variances).toJson();
}

// Denser cadence and a lower score bar after a continuity failure.
nlohmann::json denserDetection(const nlohmann::json& args, int attempt, const Config::Video& cfg) {
    nlohmann::json adjusted = args;
    adjusted["detect_every"] = 1;
    adjusted["score_threshold"] = std::max(0.3, cfg.scoreThreshold - 0.1 * attempt);
    return adjusted;
}

nlohmann::json strongerBlur(const nlohmann::json& args, int attempt, const Config::Video& cfg) {
    nlohmann::json adjusted = args;
    if (!cfg.retryKernels.empty()) {
        size_t i = std::min<size_t>(static_cast<size_t>(attempt - 1), cfg.retryKernels.size() - 1);
        adjusted["blur_kernel"] = cfg.retryKernels[i];
    }
    return adjusted;
}

template <typename Fn>
nlohmann::json guarded(const char* what, Fn fn) {
    try {
        return fn();
    } catch (const ShieldError&) {
        throw;
    } catch (const std::exception& e) {
        Logger::getInstance().error(std::string(what) + " failed: " + e.what());
        return ToolResult::error(e.what());
    }
}

const nlohmann::json kVideoPathArg = {{"type", "string"}, {"description", "Input video (defaults to the job input)"}};
const nlohmann::json kDetectEveryArg = {{"type", "integer"}, {"description", "Run the face detector every N frames"}};
const nlohmann::json kKernelArg = {{"type", "integer"}, {"description", "Odd Gaussian kernel size"}};
const nlohmann::json kScaleArg = {{"type", "number"}, {"description", "Box expansion factor around each face"}};

}

// ============================================================================
// DetectFacesTool
// ============================================================================

DetectFacesTool::DetectFacesTool(const ToolServices& services) : services(services) {}

std::string DetectFacesTool::getDescription() const {
    return "Detects and tracks faces across every frame of a video. Produces a detections file "
           "(detections_path) for blur. The video itself is passed through.";
}

nlohmann::json DetectFacesTool::getSchema() const {
    return {{"type", "object"},
            {"properties",
             {{"video_path", kVideoPathArg},
              {"detect_every", kDetectEveryArg},
              {"score_threshold", {{"type", "number"}, {"description", "Minimum detector confidence"}}}}}};
}

nlohmann::json DetectFacesTool::apply(const ToolContext& ctx, const nlohmann::json& args) {
    return guarded("detect_faces", [&] {
        nlohmann::json result = runDetection(services, ctx, args);
        result["output_path"] = result["video_path"];
        return result;
    });
}

nlohmann::json DetectFacesTool::verify(const ToolContext& ctx, const nlohmann::json& args,
                                       const nlohmann::json& applied) {
    (void)ctx;
    (void)args;
    return verifyDetections(applied.at("detections_path").get<std::string>());
}

nlohmann::json DetectFacesTool::adjustArguments(const nlohmann::json& args, int attempt,
                                                const nlohmann::json& diagnostics) const {
    (void)diagnostics;
    return denserDetection(args, attempt, services.config.video);
}

// ============================================================================
// BlurTool
// ============================================================================

BlurTool::BlurTool(const ToolServices& services) : services(services) {}

std::string BlurTool::getDescription() const {
    return "Blurs the face boxes listed in a detections file (use \"$prev.detections_path\" after detect_faces).";
}

nlohmann::json BlurTool::getSchema() const {
    return {{"type", "object"},
            {"properties",
             {{"video_path", kVideoPathArg},
              {"detections_path", {{"type", "string"}, {"description", "Detections file from detect_faces"}}},
              {"blur_kernel", kKernelArg},
              {"scale", kScaleArg}}},
            {"required", {"detections_path"}}};
}

nlohmann::json BlurTool::apply(const ToolContext& ctx, const nlohmann::json& args) {
    if (!args.contains("detections_path") || !args["detections_path"].is_string()) {
        return ToolResult::error("blur needs detections_path");
    }
    return guarded("blur", [&] { return runBlur(services, ctx, args, args["detections_path"].get<std::string>()); });
}

nlohmann::json BlurTool::verify(const ToolContext& ctx, const nlohmann::json& args, const nlohmann::json& applied) {
    (void)ctx;
    return verifyBlurOutput(services, args, applied);
}

nlohmann::json BlurTool::adjustArguments(const nlohmann::json& args, int attempt,
                                         const nlohmann::json& diagnostics) const {
    (void)diagnostics;
    return strongerBlur(args, attempt, services.config.video);
}

// ============================================================================
// BlurFacesTool
// ============================================================================

BlurFacesTool::BlurFacesTool(const ToolServices& services) : services(services) {}

std::string BlurFacesTool::getDescription() const {
    return "Blurs every face in a video. Detects and tracks faces, verifies detection continuity, "
           "then blurs and verifies blur strength.";
}

nlohmann::json BlurFacesTool::getSchema() const {
    return {{"type", "object"},
            {"properties",
             {{"video_path", kVideoPathArg},
              {"detect_every", kDetectEveryArg},
              {"blur_kernel", kKernelArg},
              {"scale", kScaleArg}}}};
}

nlohmann::json BlurFacesTool::detect(const ToolContext& ctx, const nlohmann::json& args) {
    return guarded("blur_faces detection", [&] { return runDetection(services, ctx, args); });
}

nlohmann::json BlurFacesTool::verifyDetection(const ToolContext& ctx, const nlohmann::json& args,
                                              const nlohmann::json& detection) {
    (void)ctx;
    (void)args;
    return verifyDetections(detection.at("detections_path").get<std::string>());
}

nlohmann::json BlurFacesTool::transform(const ToolContext& ctx, const nlohmann::json& args,
                                        const nlohmann::json& detection) {
    return guarded("blur_faces transform", [&] {
        return runBlur(services, ctx, args, detection.at("detections_path").get<std::string>());
    });
}

nlohmann::json BlurFacesTool::verifyTransform(const ToolContext& ctx, const nlohmann::json& args,
                                              const nlohmann::json& detection, const nlohmann::json& output) {
    (void)ctx;
    (void)detection;
    return verifyBlurOutput(services, args, output);
}

nlohmann::json BlurFacesTool::adjustArguments(const nlohmann::json& args, int attempt,
                                              const nlohmann::json& diagnostics) const {
    if (diagnostics.value("check", std::string()) == "intensity") {
        return strongerBlur(args, attempt, services.config.video);
    }
    return denserDetection(args, attempt, services.config.video);
}
