#pragma once
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "audit/AuditSink.h"
#include "core/ConfigManager.h"
#include "core/LLMClient.h"
#include "generator/SandboxScreen.h"
#include "tools/ToolRegistry.h"

struct GenerationRequest {
    std::string name;
    std::string description;
    nlohmann::json arguments = nlohmann::json::object();  // already inferred by the planner
    std::string previousFailure;                          // reason the last attempt failed, if any
    std::optional<ToolKind> kind;                         // inferred from the name when unset
};

/**
 * @brief Synthesizes missing tools with the language model.
 *
 * Candidate source -> sandbox screen -> file under
 * <generated_tools_dir>/<detectors|transforms|composites>/<name>.py -> registry.
 * A screen rejection is reported, never retried here.
 */
class ToolGenerator {
public:
    ToolGenerator(std::shared_ptr<LLMClient> llm, ToolRegistry& registry, const Config::Pipeline& cfg,
                  AuditSink* audit = nullptr);
    virtual ~ToolGenerator() = default;

    /**
     * @brief Generates, screens and registers @p request.name.
     *
     * Returns the registered spec. When another job registered the name
     * first, that spec is returned instead.
     * @throws GenerationFailure on synthesis errors or screen rejection
     */
    virtual ToolSpec generate(const GenerationRequest& request);

    /** Registers generated tools already on disk. @return number registered */
    size_t loadGeneratedTools();

    static std::string kindDirectory(ToolKind kind);

private:
    std::shared_ptr<LLMClient> llm;
    ToolRegistry& registry;
    Config::Pipeline cfg;
    SandboxScreen screen;
    AuditSink* audit;

    std::string buildSystemPrompt() const;
    std::string buildPrompt(const GenerationRequest& request) const;
    ToolSpec makeSpec(const std::string& name, ToolKind kind, const std::string& description,
                      const nlohmann::json& arguments, const std::string& source, const std::string& path) const;
    void record(AuditOutcome outcome, nlohmann::json detail) const;
};
