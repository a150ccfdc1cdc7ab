#include "planner/Planner.h"
#include <chrono>
#include <regex>
#include <stdexcept>
#include "core/Errors.h"
#include "utils/Logger.h"
#include "utils/TextNormalize.h"

namespace {

const char* kPlanningRules = R"(You plan privacy protection pipelines for video and audio files.
Reply with one JSON object:
{"pipeline": [{"tool": "<tool name>", "args": {...},
               "description": "<only for tools that are not registered>",
               "kind": "<detector|transform|composite, only for tools that are not registered>"}]}

Rules:
- Use registered tools whenever one fits. Prefer one composite tool over several steps.
- Steps run in order; each step receives the previous step's output file.
- A string argument "$prev.<field>" is replaced by that field of the previous step's result.
- If no registered tool fits, propose a new one and describe what it must do. Name it
  detect_<object> for detectors, blur_<object> or mute_<object> for transforms,
  <action>_<target> for composites, using lower-case words joined by underscores.)";

}

nlohmann::json DiagnosticContext::toJson() const {
    return {{"prior_manifest", priorManifest.toJson()},
            {"failed_stage", failedStage},
            {"tool", tool},
            {"category", category},
            {"error", error},
            {"attempts", attempts}};
}

Planner::Planner(std::shared_ptr<LLMClient> llm, ToolRegistry& registry, ToolGenerator& generator, AuditSink* audit)
    : llm(std::move(llm)), registry(registry), generator(generator), audit(audit) {}

bool Planner::isWellFormedToolName(const std::string& name) {
    static const std::regex pattern("^[a-z][a-z0-9]*(_[a-z0-9]+)+$");
    return std::regex_match(name, pattern);
}

bool Planner::nameMatchesKind(const std::string& name, ToolKind kind) {
    const std::string verb = name.substr(0, name.find('_'));
    switch (kind) {
        case ToolKind::Detector: return verb == "detect";
        case ToolKind::Transform: return isTransformVerb(verb);
        case ToolKind::Composite: return verb != "detect";
    }
    return false;
}

std::string Planner::buildSystemPrompt() const {
    std::string catalogue;
    for (const auto& schema : registry.listToolSchemas()) catalogue += schema.dump() + "\n";
    return std::string(kPlanningRules) + "\n\nRegistered tools:\n" + catalogue;
}

std::string Planner::buildPrompt(const std::string& userText,
                                 const std::optional<DiagnosticContext>& diagnostics) const {
    std::string prompt = "Request: " + userText;
    if (diagnostics) {
        prompt += "\n\nThe previous plan failed and was abandoned.";
        prompt += "\nPrevious manifest: " + diagnostics->priorManifest.toJson().dump();
        prompt += "\nFailed stage: " + diagnostics->failedStage + " of " + diagnostics->tool;
        prompt += "\nCategory: " + diagnostics->category;
        prompt += "\nError: " + diagnostics->error;
        prompt += "\nAttempts: " + diagnostics->attempts.dump();
        prompt += "\nPropose a different tool or different arguments.";
    }
    return prompt;
}

void Planner::record(AuditOutcome outcome, nlohmann::json detail) const {
    if (!audit) return;
    try {
        audit->append(AuditEntry::now(AuditStage::Plan, outcome, std::move(detail)));
    } catch (const std::exception& e) {
        Logger::getInstance().error(std::string("Audit append failed: ") + e.what());
    }
}

bool Planner::isGenerated(const std::string& name) const {
    std::optional<ToolSpec> spec = registry.lookup(name);
    return spec && spec->origin == ToolOrigin::Generated;
}

void Planner::resolveTool(ManifestStep& step, const nlohmann::json& raw, const std::string& description) {
    if (registry.hasTool(step.tool)) {
        step.generated = isGenerated(step.tool);
        return;
    }

    const std::string original = step.tool;
    step.tool = TextNormalize::toSnakeIdentifier(step.tool);
    if (registry.hasTool(step.tool)) {
        step.generated = isGenerated(step.tool);
        return;
    }
    if (!isWellFormedToolName(step.tool)) {
        throw PlanningFailure("malformed tool name '" + original + "'", {{"tool", original}});
    }

    ToolKind kind = inferToolKind(step.tool);
    if (raw.contains("kind") && raw["kind"].is_string()) {
        try {
            kind = toolKindFromName(raw["kind"].get<std::string>());
        } catch (const std::invalid_argument&) {
            throw PlanningFailure("unknown kind '" + raw["kind"].get<std::string>() + "' for " + step.tool,
                                  {{"tool", step.tool}, {"kind", raw["kind"]}});
        }
    }
    if (!nameMatchesKind(step.tool, kind)) {
        throw PlanningFailure("tool name '" + step.tool + "' does not follow the naming of a " + toolKindName(kind),
                              {{"tool", step.tool}, {"kind", toolKindName(kind)}});
    }

    GenerationRequest request;
    request.name = step.tool;
    request.description = description;
    request.arguments = step.args;
    request.kind = kind;
    try {
        generator.generate(request);
    } catch (const GenerationFailure& first) {
        Logger::getInstance().warn("Generation of " + step.tool + " failed, retrying with feedback: " + first.what());
        request.previousFailure = first.what();
        try {
            generator.generate(request);
        } catch (const GenerationFailure& second) {
            throw PlanningFailure("could not generate " + step.tool + ": " + second.what(),
                                  {{"tool", step.tool}, {"first_failure", first.what()}, {"second_failure", second.what()}});
        }
    }
    step.generated = isGenerated(step.tool);
}

Manifest Planner::plan(const std::string& userText, const std::optional<DiagnosticContext>& diagnostics) {
    auto& logger = Logger::getInstance();
    auto started = std::chrono::steady_clock::now();
    auto elapsed = [&] {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    };
    logger.stage(diagnostics ? "Replanning: " + userText : "Planning: " + userText);

    try {
        nlohmann::json answer;
        try {
            answer = llm->chatJson(buildPrompt(userText, diagnostics), buildSystemPrompt());
        } catch (const std::runtime_error& e) {
            throw PlanningFailure(std::string("planner reply unusable: ") + e.what());
        }

        Manifest manifest;
        try {
            manifest = Manifest::fromJson(answer);
        } catch (const MalformedManifest& e) {
            throw PlanningFailure(std::string("planner reply is not a manifest: ") + e.what(), e.detail());
        }

        for (size_t i = 0; i < manifest.steps.size(); ++i) {
            const auto& raw = answer["pipeline"][i];
            std::string description = raw.contains("description") && raw["description"].is_string()
                                          ? raw["description"].get<std::string>()
                                          : manifest.steps[i].tool + " for: " + userText;
            resolveTool(manifest.steps[i], raw, description);
        }

        logger.success("Manifest: " + manifest.toJson().dump());
        record(AuditOutcome::Ok, {{"request", userText},
                                  {"replan", diagnostics.has_value()},
                                  {"manifest", manifest.toJson()},
                                  {"elapsed_sec", elapsed()}});
        return manifest;
    } catch (const PlanningFailure& e) {
        logger.error(std::string("Planning failed: ") + e.what());
        record(AuditOutcome::Fail, {{"request", userText},
                                    {"replan", diagnostics.has_value()},
                                    {"error", e.what()},
                                    {"detail", e.detail()},
                                    {"elapsed_sec", elapsed()}});
        throw;
    }
}
