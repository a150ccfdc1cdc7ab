#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "audit/AuditSink.h"
#include "core/ConfigManager.h"
#include "core/Errors.h"
#include "pipeline/CancellationToken.h"
#include "planner/Planner.h"
#include "tools/ToolRegistry.h"

enum class ExecutorState { Planned, Executing, Verifying, Retrying, Replanning, Committed, Aborted };

std::string executorStateName(ExecutorState state);

struct ExecutorOptions {
    int maxLocalRetries = 2;  // re-executions of one step before escalating
    int maxReplans = 2;
    double stepTimeoutSec = 600.0;  // per tool phase
    double abandonedGraceSec = 30.0;
    std::string outputDir = "data/results";

    static ExecutorOptions fromConfig(const Config::Pipeline& cfg);
};

struct JobFailure {
    std::string stage;
    ErrorCategory category = ErrorCategory::ToolError;
    std::string message;
    nlohmann::json detail = nlohmann::json::object();

    nlohmann::json toJson() const;
};

/**
 * @brief Outcome of one job: the verified artifact, or a structured failure.
 */
struct JobResult {
    std::string jobId;
    bool success = false;
    std::string outputPath;
    nlohmann::json summary = nlohmann::json::object();
    std::optional<JobFailure> failure;
    nlohmann::json diagnosticTrail = nlohmann::json::array();  // every failed attempt, across replans
    nlohmann::json executionRecord = nlohmann::json::array();  // committed steps of the final manifest
    std::vector<ExecutorState> transitions;
    int replans = 0;

    nlohmann::json toJson() const;
};

/**
 * @brief Closed-loop job runner.
 *
 * PLANNED -> EXECUTING -> VERIFYING -> COMMITTED, with local retries
 * (RETRYING) per step and escalation to the planner (REPLANNING) once they
 * are exhausted. Fatal categories go straight to ABORTED. Jobs are
 * independent; one Executor may run several concurrently.
 */
class Executor {
public:
    Executor(Planner& planner, ToolRegistry& registry, AuditSink& audit, ExecutorOptions options = ExecutorOptions());

    /**
     * @brief Plans and executes @p userText over @p inputPath.
     *
     * Never throws for job failures; they are reported in the result. Every
     * attempt writes into its own directory and only a verified attempt is
     * promoted to <outputDir>/<job>/step-<n>. Outputs of failed or cancelled
     * jobs are removed.
     */
    JobResult run(const std::string& userText, const std::string& inputPath,
                  std::shared_ptr<CancellationToken> cancel = nullptr);

    /** "video", "audio" or "" from the file extension. */
    static std::string inputKind(const std::string& path);

    /**
     * @brief Replaces "$prev.<field>" strings with fields of @p previous.
     * @throws MalformedManifest when a referenced field is missing
     */
    static nlohmann::json resolveReferences(const nlohmann::json& args, const nlohmann::json& previous);

private:
    struct Job;
    struct StepOutcome;
    struct ManifestOutcome;

    Planner& planner;
    ToolRegistry& registry;
    AuditSink& audit;
    ExecutorOptions options;

    ManifestOutcome executeManifest(Job& job, const Manifest& manifest);
    StepOutcome runStep(Job& job, size_t index, const ManifestStep& step, const std::shared_ptr<ITool>& tool,
                        const nlohmann::json& args);
    StepOutcome runAttempt(Job& job, const std::shared_ptr<ITool>& tool, const nlohmann::json& args);
    nlohmann::json timed(Job& job, const std::string& phase,
                         std::function<nlohmann::json(const ToolContext&)> call) const;

    void promote(Job& job, size_t index, StepOutcome& outcome) const;
    bool settle(Job& job) const;

    void transition(Job& job, ExecutorState next) const;
    void record(AuditStage stage, AuditOutcome outcome, nlohmann::json detail) const;
    void abort(Job& job, JobFailure failure);
};
