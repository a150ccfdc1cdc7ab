#pragma once
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "audit/AuditSink.h"
#include "core/LLMClient.h"
#include "generator/ToolGenerator.h"
#include "planner/Manifest.h"
#include "tools/ToolRegistry.h"

/**
 * @brief Why the previous manifest failed, handed back to the planner on replan.
 */
struct DiagnosticContext {
    Manifest priorManifest;
    std::string failedStage;  // detection, transform, apply or verify
    std::string tool;
    std::string category;
    std::string error;
    nlohmann::json attempts = nlohmann::json::array();  // arguments tried and what each verification reported

    nlohmann::json toJson() const;
};

/**
 * @brief Turns a free-text request into a Manifest of registered tools.
 *
 * Tools the model proposes that are not registered yet are generated before
 * the manifest is returned, so every step of a returned manifest resolves.
 */
class Planner {
public:
    Planner(std::shared_ptr<LLMClient> llm, ToolRegistry& registry, ToolGenerator& generator,
            AuditSink* audit = nullptr);
    virtual ~Planner() = default;

    /**
     * @throws PlanningFailure on malformed model output, malformed tool names,
     * or a tool whose generation failed twice
     */
    virtual Manifest plan(const std::string& userText,
                          const std::optional<DiagnosticContext>& diagnostics = std::nullopt);

    /** detect_<object>, blur_<object>, <action>_<target>: lower-case words joined by '_'. */
    static bool isWellFormedToolName(const std::string& name);

    /**
     * @brief Naming convention by kind: detectors and only detectors start
     * with detect_, transforms start with a transform verb (blur_, mute_, ...).
     */
    static bool nameMatchesKind(const std::string& name, ToolKind kind);

private:
    std::shared_ptr<LLMClient> llm;
    ToolRegistry& registry;
    ToolGenerator& generator;
    AuditSink* audit;

    std::string buildSystemPrompt() const;
    std::string buildPrompt(const std::string& userText, const std::optional<DiagnosticContext>& diagnostics) const;
    void resolveTool(ManifestStep& step, const nlohmann::json& raw, const std::string& description);
    bool isGenerated(const std::string& name) const;
    void record(AuditOutcome outcome, nlohmann::json detail) const;
};
