#pragma once
#include "tools/ITool.h"
#include "tools/ToolServices.h"

/**
 * @brief detect_faces: hybrid detection pass over a video.
 *
 * Writes <stem>_detections.json to the output directory and passes the video
 * through unchanged. Verification is the continuity check.
 */
class DetectFacesTool : public ITool {
public:
    explicit DetectFacesTool(const ToolServices& services);

    std::string getName() const override { return "detect_faces"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    ToolKind getKind() const override { return ToolKind::Detector; }

    nlohmann::json apply(const ToolContext& ctx, const nlohmann::json& args) override;
    nlohmann::json verify(const ToolContext& ctx, const nlohmann::json& args, const nlohmann::json& applied) override;
    nlohmann::json adjustArguments(const nlohmann::json& args, int attempt,
                                   const nlohmann::json& diagnostics) const override;

private:
    ToolServices services;
};

/**
 * @brief blur: Gaussian blur of the boxes listed in a detections file.
 */
class BlurTool : public ITool {
public:
    explicit BlurTool(const ToolServices& services);

    std::string getName() const override { return "blur"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    ToolKind getKind() const override { return ToolKind::Transform; }

    nlohmann::json apply(const ToolContext& ctx, const nlohmann::json& args) override;
    nlohmann::json verify(const ToolContext& ctx, const nlohmann::json& args, const nlohmann::json& applied) override;
    nlohmann::json adjustArguments(const nlohmann::json& args, int attempt,
                                   const nlohmann::json& diagnostics) const override;

private:
    ToolServices services;
};

/**
 * @brief blur_faces: detect_faces and blur as one two-phase step.
 */
class BlurFacesTool : public PhasedTool {
public:
    explicit BlurFacesTool(const ToolServices& services);

    std::string getName() const override { return "blur_faces"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    ToolKind getKind() const override { return ToolKind::Composite; }

    nlohmann::json detect(const ToolContext& ctx, const nlohmann::json& args) override;
    nlohmann::json verifyDetection(const ToolContext& ctx, const nlohmann::json& args,
                                   const nlohmann::json& detection) override;
    nlohmann::json transform(const ToolContext& ctx, const nlohmann::json& args,
                             const nlohmann::json& detection) override;
    nlohmann::json verifyTransform(const ToolContext& ctx, const nlohmann::json& args,
                                   const nlohmann::json& detection, const nlohmann::json& output) override;
    nlohmann::json adjustArguments(const nlohmann::json& args, int attempt,
                                   const nlohmann::json& diagnostics) const override;

private:
    ToolServices services;
};
