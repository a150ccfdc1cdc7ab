#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "pipeline/CancellationToken.h"

enum class ToolKind { Detector, Transform, Composite };

std::string toolKindName(ToolKind kind);
ToolKind toolKindFromName(const std::string& name);

/** From the leading word: detect_ is a detector, blur_/mute_/... a transform, anything else a composite. */
ToolKind inferToolKind(const std::string& toolName);
bool isTransformVerb(const std::string& verb);

/**
 * @brief Where a step runs: the input it consumes and the directory it may write to.
 */
struct ToolContext {
    std::string inputPath;
    std::string outputDir;
    const CancellationToken* cancel = nullptr;
};

/**
 * @brief 工具接口定义
 *
 * Every privacy tool, built-in or generated, implements this two-method contract.
 *
 * apply returns:
 * {
 *   "output_path": "...",
 *   "summary": {...}
 * }
 *
 * verify returns:
 * {
 *   "verified": true|false,
 *   "check": "continuity",
 *   "category": "DetectionVerificationFailure",
 *   "metrics": {...},
 *   "error": "..."
 * }
 *
 * Failures inside apply are reported as {"error": "..."} (optionally with "category").
 */
class ITool {
public:
    virtual ~ITool() = default;

    virtual std::string getName() const = 0;
    virtual std::string getDescription() const = 0;

    /** JSON Schema of the accepted arguments, shown to the planner. */
    virtual nlohmann::json getSchema() const = 0;

    virtual ToolKind getKind() const = 0;

    /** Changes whenever the implementation's behavior changes; feeds the content hash. */
    virtual std::string getVersion() const { return "1"; }

    virtual nlohmann::json apply(const ToolContext& ctx, const nlohmann::json& args) = 0;

    /**
     * @param args the step arguments
     * @param applied the result returned by apply
     */
    virtual nlohmann::json verify(const ToolContext& ctx, const nlohmann::json& args,
                                  const nlohmann::json& applied) = 0;

    /**
     * @brief Substitute configuration for local retry number @p attempt (1-based).
     * @param diagnostics the failed verification result
     */
    virtual nlohmann::json adjustArguments(const nlohmann::json& args, int attempt,
                                           const nlohmann::json& diagnostics) const {
        (void)attempt;
        (void)diagnostics;
        return args;
    }
};

/**
 * @brief Tool whose detection and transform phases are verified separately.
 *
 * The Executor runs detect, verifies it, and only then runs transform
 * with the trusted detections.
 */
class PhasedTool : public ITool {
public:
    /** @return {"detections_path": ..., "summary": {...}} or {"error": ...} */
    virtual nlohmann::json detect(const ToolContext& ctx, const nlohmann::json& args) = 0;

    virtual nlohmann::json verifyDetection(const ToolContext& ctx, const nlohmann::json& args,
                                           const nlohmann::json& detection) = 0;

    /** @return {"output_path": ..., "summary": {...}} or {"error": ...} */
    virtual nlohmann::json transform(const ToolContext& ctx, const nlohmann::json& args,
                                     const nlohmann::json& detection) = 0;

    virtual nlohmann::json verifyTransform(const ToolContext& ctx, const nlohmann::json& args,
                                           const nlohmann::json& detection,
                                           const nlohmann::json& output) = 0;

    // Single-call form, for callers that do not drive the phases themselves.
    nlohmann::json apply(const ToolContext& ctx, const nlohmann::json& args) override;

    nlohmann::json verify(const ToolContext& ctx, const nlohmann::json& args,
                          const nlohmann::json& applied) override;
};

/** Result helpers shared by the built-in tools. */
namespace ToolResult {
    nlohmann::json error(const std::string& message, const std::string& category = "ToolError");
    bool isError(const nlohmann::json& result);
    bool isVerified(const nlohmann::json& verification);
    /** <outputDir>/<input stem><suffix><extension> */
    std::string outputPath(const ToolContext& ctx, const std::string& input, const std::string& suffix,
                           const std::string& extension);
}
