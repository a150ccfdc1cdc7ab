#pragma once
#include "tools/ITool.h"
#include "tools/ToolServices.h"

/**
 * @brief detect_keywords: transcribe, ask the model for the phrases the request
 * targets, and localize them.
 *
 * Writes <stem>_segments.json (phrases, words, segments, duration) and passes
 * the audio through unchanged. Verification is the temporal integrity check.
 */
class DetectKeywordsTool : public ITool {
public:
    explicit DetectKeywordsTool(const ToolServices& services);

    std::string getName() const override { return "detect_keywords"; }
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
 * @brief mute_segments: overwrites the segments of a segments file.
 *
 * Verified by temporal integrity and by re-transcribing the output.
 */
class MuteSegmentsTool : public ITool {
public:
    explicit MuteSegmentsTool(const ToolServices& services);

    std::string getName() const override { return "mute_segments"; }
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
 * @brief mute_keywords: detect_keywords and mute_segments as one two-phase step.
 */
class MuteKeywordsTool : public PhasedTool {
public:
    explicit MuteKeywordsTool(const ToolServices& services);

    std::string getName() const override { return "mute_keywords"; }
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
