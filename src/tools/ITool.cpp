#include "tools/ITool.h"
#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

std::string toolKindName(ToolKind kind) {
    switch (kind) {
        case ToolKind::Detector: return "detector";
        case ToolKind::Transform: return "transform";
        case ToolKind::Composite: return "composite";
    }
    return "composite";
}

ToolKind toolKindFromName(const std::string& name) {
    if (name == "detector") return ToolKind::Detector;
    if (name == "transform") return ToolKind::Transform;
    if (name == "composite") return ToolKind::Composite;
    throw std::invalid_argument("Unknown tool kind: " + name);
}

bool isTransformVerb(const std::string& verb) {
    for (const char* v : {"blur", "mute", "beep", "mask", "redact", "remove", "transform"}) {
        if (verb == v) return true;
    }
    return false;
}

ToolKind inferToolKind(const std::string& toolName) {
    const std::string verb = toolName.substr(0, toolName.find('_'));
    if (verb == "detect") return ToolKind::Detector;
    if (isTransformVerb(verb)) return ToolKind::Transform;
    return ToolKind::Composite;
}

nlohmann::json PhasedTool::apply(const ToolContext& ctx, const nlohmann::json& args) {
    nlohmann::json detection = detect(ctx, args);
    if (ToolResult::isError(detection)) return detection;

    nlohmann::json check = verifyDetection(ctx, args, detection);
    if (!ToolResult::isVerified(check)) {
        nlohmann::json err = ToolResult::error(check.value("error", std::string("detection verification failed")),
                                               check.value("category", std::string("DetectionVerificationFailure")));
        err["verification"] = check;
        return err;
    }

    nlohmann::json output = transform(ctx, args, detection);
    if (ToolResult::isError(output)) return output;
    output["detection"] = detection;
    return output;
}

nlohmann::json PhasedTool::verify(const ToolContext& ctx, const nlohmann::json& args,
                                  const nlohmann::json& applied) {
    nlohmann::json detection = applied.value("detection", nlohmann::json::object());
    return verifyTransform(ctx, args, detection, applied);
}

namespace ToolResult {

nlohmann::json error(const std::string& message, const std::string& category) {
    return {{"error", message}, {"category", category}};
}

bool isError(const nlohmann::json& result) {
    return !result.is_object() || result.contains("error");
}

bool isVerified(const nlohmann::json& verification) {
    return verification.is_object() && verification.value("verified", false);
}

std::string outputPath(const ToolContext& ctx, const std::string& input, const std::string& suffix,
                       const std::string& extension) {
    fs::path dir = ctx.outputDir.empty() ? fs::path(".") : fs::path(ctx.outputDir);
    fs::create_directories(dir);
    return (dir / (fs::path(input).stem().string() + suffix + extension)).string();
}

}
