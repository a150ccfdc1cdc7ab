#include "pipeline/Executor.h"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <future>
#include <set>
#include <thread>
#include "utils/Logger.h"

namespace fs = std::filesystem;

namespace {

using Clock = std::chrono::steady_clock;

double secondsSince(Clock::time_point start) {
    return std::chrono::duration<double>(Clock::now() - start).count();
}

std::string makeJobId() {
    static std::atomic<unsigned> counter{0};
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y%m%d-%H%M%S", &tm);
    return std::string(stamp) + "-" + std::to_string(counter.fetch_add(1));
}

ErrorCategory categoryOf(const nlohmann::json& result, ErrorCategory fallback) {
    if (result.is_object() && result.contains("category") && result["category"].is_string()) {
        return categoryFromName(result["category"].get<std::string>());
    }
    return fallback;
}

// Rewrites every string under @p from (a path prefix) to live under @p to.
nlohmann::json rebase(const nlohmann::json& value, const std::string& from, const std::string& to) {
    if (value.is_string()) {
        const std::string& s = value.get_ref<const std::string&>();
        if (s.compare(0, from.size(), from) == 0 && (s.size() == from.size() || s[from.size()] == '/')) {
            return to + s.substr(from.size());
        }
        return value;
    }
    if (value.is_object() || value.is_array()) {
        nlohmann::json out = value;
        for (auto it = out.begin(); it != out.end(); ++it) *it = rebase(*it, from, to);
        return out;
    }
    return value;
}

std::string messageOf(const nlohmann::json& result, const std::string& fallback) {
    if (result.is_object() && result.contains("error")) {
        return result["error"].is_string() ? result["error"].get<std::string>() : result["error"].dump();
    }
    return fallback;
}

}

// ============================================================================
// Value types
// ============================================================================

std::string executorStateName(ExecutorState state) {
    switch (state) {
        case ExecutorState::Planned: return "PLANNED";
        case ExecutorState::Executing: return "EXECUTING";
        case ExecutorState::Verifying: return "VERIFYING";
        case ExecutorState::Retrying: return "RETRYING";
        case ExecutorState::Replanning: return "REPLANNING";
        case ExecutorState::Committed: return "COMMITTED";
        case ExecutorState::Aborted: return "ABORTED";
    }
    return "ABORTED";
}

ExecutorOptions ExecutorOptions::fromConfig(const Config::Pipeline& cfg) {
    ExecutorOptions o;
    o.maxLocalRetries = cfg.maxLocalRetries;
    o.maxReplans = cfg.maxReplans;
    o.stepTimeoutSec = cfg.stepTimeoutSec;
    o.abandonedGraceSec = cfg.abandonedGraceSec;
    o.outputDir = cfg.outputDir;
    return o;
}

nlohmann::json JobFailure::toJson() const {
    return {{"stage", stage}, {"category", categoryName(category)}, {"message", message}, {"detail", detail}};
}

nlohmann::json JobResult::toJson() const {
    nlohmann::json states = nlohmann::json::array();
    for (auto s : transitions) states.push_back(executorStateName(s));
    nlohmann::json j = {{"job_id", jobId},
                        {"success", success},
                        {"replans", replans},
                        {"transitions", states},
                        {"execution_record", executionRecord},
                        {"diagnostic_trail", diagnosticTrail}};
    if (success) {
        j["output_path"] = outputPath;
        j["summary"] = summary;
    }
    if (failure) j["failure"] = failure->toJson();
    return j;
}

// ============================================================================
// Executor
// ============================================================================

struct Executor::Job {
    std::string id;
    std::string userText;
    std::string inputPath;
    std::string currentInput;  // input of the step being run
    fs::path dir;
    fs::path attemptDir;  // private to the running attempt
    std::shared_ptr<CancellationToken> cancel;
    std::vector<std::future<nlohmann::json>> abandoned;  // phases given up on timeout or cancel
    JobResult result;
};

struct Executor::StepOutcome {
    bool passed = false;
    nlohmann::json result = nlohmann::json::object();
    nlohmann::json verification = nlohmann::json::object();
    std::string stage;
    ErrorCategory category = ErrorCategory::ToolError;
    std::string error;
    nlohmann::json attempts = nlohmann::json::array();

    static StepOutcome failed(const std::string& stage, ErrorCategory category, const std::string& error,
                              nlohmann::json verification) {
        StepOutcome o;
        o.stage = stage;
        o.category = category;
        o.error = error;
        o.verification = std::move(verification);
        return o;
    }
};

struct Executor::ManifestOutcome {
    bool committed = false;
    std::string outputPath;
    nlohmann::json finalResult = nlohmann::json::object();
    DiagnosticContext diagnostics;
};

Executor::Executor(Planner& planner, ToolRegistry& registry, AuditSink& audit, ExecutorOptions options)
    : planner(planner), registry(registry), audit(audit), options(std::move(options)) {}

std::string Executor::inputKind(const std::string& path) {
    static const std::set<std::string> video = {".mp4", ".avi", ".mov", ".mkv", ".wmv", ".flv"};
    static const std::set<std::string> audio = {".wav", ".mp3", ".flac", ".aac", ".ogg", ".m4a"};
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });
    if (video.count(ext)) return "video";
    if (audio.count(ext)) return "audio";
    return "";
}

nlohmann::json Executor::resolveReferences(const nlohmann::json& args, const nlohmann::json& previous) {
    static const std::string prefix = "$prev.";
    if (args.is_string()) {
        const std::string& s = args.get_ref<const std::string&>();
        if (s.compare(0, prefix.size(), prefix) != 0) return args;

        std::string field = s.substr(prefix.size());
        std::string pointer = "/" + field;
        std::replace(pointer.begin(), pointer.end(), '.', '/');
        nlohmann::json::json_pointer ptr(pointer);
        if (field.empty() || !previous.contains(ptr)) {
            throw MalformedManifest("unresolved reference " + s, {{"reference", s}, {"previous", previous}});
        }
        return previous.at(ptr);
    }
    if (args.is_object() || args.is_array()) {
        nlohmann::json out = args;
        for (auto it = out.begin(); it != out.end(); ++it) *it = resolveReferences(*it, previous);
        return out;
    }
    return args;
}

void Executor::transition(Job& job, ExecutorState next) const {
    job.result.transitions.push_back(next);
    Logger::getInstance().stage("[" + job.id + "] " + executorStateName(next));
}

void Executor::record(AuditStage stage, AuditOutcome outcome, nlohmann::json detail) const {
    try {
        audit.append(AuditEntry::now(stage, outcome, std::move(detail)));
    } catch (const std::exception& e) {
        Logger::getInstance().error(std::string("Audit append failed: ") + e.what());
    }
}

nlohmann::json Executor::timed(Job& job, const std::string& phase,
                               std::function<nlohmann::json(const ToolContext&)> call) const {
    auto attemptToken = std::make_shared<CancellationToken>(job.cancel);
    ToolContext ctx;
    ctx.inputPath = job.currentInput;
    ctx.outputDir = job.attemptDir.string();

    // Captures are owned by the worker; an abandoned phase may outlive this call.
    auto task = std::make_shared<std::packaged_task<nlohmann::json()>>([call, ctx, attemptToken]() mutable {
        ctx.cancel = attemptToken.get();
        return call(ctx);
    });
    std::future<nlohmann::json> result = task->get_future();
    std::thread([task] { (*task)(); }).detach();

    const auto deadline = Clock::now() + std::chrono::duration_cast<Clock::duration>(
                                             std::chrono::duration<double>(options.stepTimeoutSec));
    while (result.wait_for(std::chrono::milliseconds(100)) != std::future_status::ready) {
        if (job.cancel->cancelled()) {
            attemptToken->cancel();
            job.abandoned.push_back(std::move(result));
            throw JobCancelled();
        }
        if (Clock::now() >= deadline) {
            attemptToken->cancel();
            job.abandoned.push_back(std::move(result));
            throw ExecutionTimeout(phase + " exceeded " + std::to_string(options.stepTimeoutSec) + "s",
                                   {{"phase", phase}, {"timeout_sec", options.stepTimeoutSec}});
        }
    }
    return result.get();
}

Executor::StepOutcome Executor::runAttempt(Job& job, const std::shared_ptr<ITool>& tool, const nlohmann::json& args) {
    auto phaseError = [](const std::string& stage, const nlohmann::json& r) {
        ErrorCategory category = categoryOf(r, ErrorCategory::ToolError);
        if (isFatal(category)) throw ShieldError(category, messageOf(r, stage + " failed"), r);
        return StepOutcome::failed(stage, category, messageOf(r, stage + " failed"), r);
    };
    auto checkFailed = [](const std::string& stage, const nlohmann::json& check, ErrorCategory fallback) {
        ErrorCategory category = categoryOf(check, fallback);
        if (isFatal(category)) throw ShieldError(category, messageOf(check, stage + " verification failed"), check);
        return StepOutcome::failed(stage, category, messageOf(check, stage + " verification failed"), check);
    };

    try {
        if (auto phased = std::dynamic_pointer_cast<PhasedTool>(tool)) {
            transition(job, ExecutorState::Executing);
            nlohmann::json detection =
                timed(job, "detection", [phased, args](const ToolContext& c) { return phased->detect(c, args); });
            if (ToolResult::isError(detection)) return phaseError("detection", detection);

            transition(job, ExecutorState::Verifying);
            nlohmann::json detectionCheck = timed(job, "detection verification", [phased, args, detection](const ToolContext& c) {
                return phased->verifyDetection(c, args, detection);
            });
            if (!ToolResult::isVerified(detectionCheck)) {
                // Offline gate: the transform never runs on untrusted detections.
                return checkFailed("detection", detectionCheck, ErrorCategory::DetectionVerificationFailure);
            }

            transition(job, ExecutorState::Executing);
            nlohmann::json output = timed(job, "transform", [phased, args, detection](const ToolContext& c) {
                return phased->transform(c, args, detection);
            });
            if (ToolResult::isError(output)) return phaseError("transform", output);

            transition(job, ExecutorState::Verifying);
            nlohmann::json transformCheck = timed(job, "transform verification", [phased, args, detection, output](const ToolContext& c) {
                return phased->verifyTransform(c, args, detection, output);
            });
            if (!ToolResult::isVerified(transformCheck)) {
                return checkFailed("transform", transformCheck, ErrorCategory::RedactionVerificationFailure);
            }

            StepOutcome ok;
            ok.passed = true;
            ok.result = output;
            ok.result["detection"] = detection;
            ok.verification = {{"detection", detectionCheck}, {"transform", transformCheck}};
            return ok;
        }

        transition(job, ExecutorState::Executing);
        nlohmann::json output = timed(job, "apply", [tool, args](const ToolContext& c) { return tool->apply(c, args); });
        if (ToolResult::isError(output)) return phaseError("apply", output);

        transition(job, ExecutorState::Verifying);
        nlohmann::json check = timed(job, "verify", [tool, args, output](const ToolContext& c) {
            return tool->verify(c, args, output);
        });
        if (!ToolResult::isVerified(check)) {
            ErrorCategory fallback = tool->getKind() == ToolKind::Detector ? ErrorCategory::DetectionVerificationFailure
                                                                           : ErrorCategory::RedactionVerificationFailure;
            return checkFailed("verify", check, fallback);
        }

        StepOutcome ok;
        ok.passed = true;
        ok.result = output;
        ok.verification = check;
        return ok;
    } catch (const ShieldError& e) {
        if (e.fatal()) throw;
        return StepOutcome::failed("execute", e.category(), e.what(), e.toJson());
    } catch (const std::exception& e) {
        return StepOutcome::failed("execute", ErrorCategory::ToolError, e.what(), {{"error", e.what()}});
    }
}

void Executor::promote(Job& job, size_t index, StepOutcome& outcome) const {
    const fs::path target = job.dir / ("step-" + std::to_string(index));
    std::error_code ec;
    fs::remove_all(target, ec);
    if (!fs::exists(job.attemptDir)) return;

    fs::rename(job.attemptDir, target);
    const std::string to = target.string();
    for (const fs::path& from : {job.attemptDir, fs::absolute(job.attemptDir)}) {
        outcome.result = rebase(outcome.result, from.string(), from.is_absolute() ? fs::absolute(target).string() : to);
        outcome.verification =
            rebase(outcome.verification, from.string(), from.is_absolute() ? fs::absolute(target).string() : to);
    }
}

bool Executor::settle(Job& job) const {
    if (job.abandoned.empty()) return true;
    auto& logger = Logger::getInstance();
    logger.info("Waiting for " + std::to_string(job.abandoned.size()) + " abandoned phase(s) of job " + job.id);

    const auto deadline = Clock::now() + std::chrono::duration_cast<Clock::duration>(
                                             std::chrono::duration<double>(options.abandonedGraceSec));
    bool settled = true;
    for (auto& pending : job.abandoned) {
        if (pending.wait_until(deadline) != std::future_status::ready) settled = false;
    }
    if (!settled) {
        logger.warn("Abandoned phases of job " + job.id + " still running after " +
                    std::to_string(options.abandonedGraceSec) + "s; their attempt directories are left in place");
    } else {
        job.abandoned.clear();
    }
    return settled;
}

Executor::StepOutcome Executor::runStep(Job& job, size_t index, const ManifestStep& step,
                                        const std::shared_ptr<ITool>& tool, const nlohmann::json& args) {
    auto& logger = Logger::getInstance();
    nlohmann::json attemptArgs = args;
    nlohmann::json attempts = nlohmann::json::array();
    StepOutcome outcome;

    for (int attempt = 0; attempt <= options.maxLocalRetries; ++attempt) {
        job.cancel->throwIfCancelled();
        if (attempt > 0) {
            transition(job, ExecutorState::Retrying);
            attemptArgs = tool->adjustArguments(attemptArgs, attempt, outcome.verification);
            logger.warn("Retry " + std::to_string(attempt) + "/" + std::to_string(options.maxLocalRetries) + " of " +
                        step.tool + " with " + attemptArgs.dump());
            record(AuditStage::Recover, AuditOutcome::Ok,
                   {{"job", job.id}, {"action", "retry"}, {"step", index}, {"tool", step.tool},
                    {"attempt", attempt}, {"args", attemptArgs}});
        }

        job.attemptDir = job.dir / ".attempts" /
                         ("r" + std::to_string(job.result.replans) + "-s" + std::to_string(index) + "-a" +
                          std::to_string(attempt));
        auto started = Clock::now();
        record(AuditStage::Execute, AuditOutcome::Ok,
               {{"job", job.id}, {"event", "step_started"}, {"step", index}, {"tool", step.tool},
                {"attempt", attempt}, {"args", attemptArgs}});
        outcome = runAttempt(job, tool, attemptArgs);
        const double elapsed = secondsSince(started);

        nlohmann::json entry = {{"attempt", attempt}, {"args", attemptArgs}, {"elapsed_sec", elapsed}};
        if (outcome.passed) {
            promote(job, index, outcome);
            entry["verification"] = outcome.verification;
            attempts.push_back(entry);
            record(AuditStage::Verify, AuditOutcome::Ok,
                   {{"job", job.id}, {"step", index}, {"tool", step.tool}, {"attempt", attempt},
                    {"verification", outcome.verification}, {"elapsed_sec", elapsed}});
            logger.success(step.tool + " committed after " + std::to_string(attempt + 1) + " attempt(s)");
            outcome.attempts = attempts;
            return outcome;
        }

        entry["stage"] = outcome.stage;
        entry["category"] = categoryName(outcome.category);
        entry["error"] = outcome.error;
        entry["verification"] = outcome.verification;
        attempts.push_back(entry);

        nlohmann::json diag = entry;
        diag["job"] = job.id;
        diag["step"] = index;
        diag["tool"] = step.tool;
        diag["replan"] = job.result.replans;
        job.result.diagnosticTrail.push_back(diag);

        record(AuditStage::Verify, AuditOutcome::Fail, diag);
        logger.warn(step.tool + " failed at " + outcome.stage + " (" + categoryName(outcome.category) +
                    "): " + outcome.error);
    }

    outcome.attempts = attempts;
    return outcome;
}

Executor::ManifestOutcome Executor::executeManifest(Job& job, const Manifest& manifest) {
    manifest.requireRegistered(registry);
    job.result.executionRecord = nlohmann::json::array();

    ManifestOutcome out;
    nlohmann::json previous = nlohmann::json::object();
    job.currentInput = job.inputPath;

    for (size_t i = 0; i < manifest.steps.size(); ++i) {
        const ManifestStep& step = manifest.steps[i];
        std::shared_ptr<ITool> tool = registry.getTool(step.tool);
        if (!tool) throw MalformedManifest("tool " + step.tool + " is not registered", {{"tool", step.tool}});

        nlohmann::json args = resolveReferences(step.args, previous);
        const std::string kind = inputKind(job.currentInput);
        if (!kind.empty() && !args.contains(kind + "_path")) args[kind + "_path"] = job.currentInput;
        nlohmann::json schema = tool->getSchema();
        if (schema.contains("properties") && schema["properties"].contains("request") && !args.contains("request")) {
            args["request"] = job.userText;
        }

        auto started = Clock::now();
        StepOutcome outcome = runStep(job, i, step, tool, args);
        if (!outcome.passed) {
            out.diagnostics.priorManifest = manifest;
            out.diagnostics.failedStage = outcome.stage;
            out.diagnostics.tool = step.tool;
            out.diagnostics.category = categoryName(outcome.category);
            out.diagnostics.error = outcome.error;
            out.diagnostics.attempts = outcome.attempts;
            return out;
        }

        record(AuditStage::Execute, AuditOutcome::Ok,
               {{"job", job.id}, {"event", "step_committed"}, {"step", i}, {"tool", step.tool},
                {"elapsed_sec", secondsSince(started)}});
        job.result.executionRecord.push_back({{"step", i},
                                              {"tool", step.tool},
                                              {"generated", step.generated},
                                              {"attempts", outcome.attempts},
                                              {"result", outcome.result},
                                              {"verification", outcome.verification}});

        previous = outcome.result;
        if (previous.contains("output_path") && previous["output_path"].is_string() &&
            !previous["output_path"].get<std::string>().empty()) {
            job.currentInput = previous["output_path"].get<std::string>();
        }
    }

    out.committed = true;
    out.outputPath = job.currentInput;
    out.finalResult = previous;
    return out;
}

void Executor::abort(Job& job, JobFailure failure) {
    auto& logger = Logger::getInstance();
    transition(job, ExecutorState::Aborted);
    logger.error("Job " + job.id + " aborted at " + failure.stage + " (" + categoryName(failure.category) +
                 "): " + failure.message);

    std::error_code ec;
    if (settle(job)) {
        fs::remove_all(job.dir, ec);
    } else {
        // Only the promoted steps; running workers still own their attempt directories.
        for (const auto& entry : fs::directory_iterator(job.dir, ec)) {
            if (entry.path().filename() != ".attempts") fs::remove_all(entry.path(), ec);
        }
    }
    if (ec) logger.error("Could not remove partial outputs in " + job.dir.string() + ": " + ec.message());

    record(AuditStage::Execute, AuditOutcome::Fail,
           {{"job", job.id}, {"terminal", "ABORTED"}, {"failure", failure.toJson()},
            {"diagnostic_trail", job.result.diagnosticTrail}});
    job.result.success = false;
    job.result.outputPath.clear();
    job.result.failure = std::move(failure);
}

JobResult Executor::run(const std::string& userText, const std::string& inputPath,
                        std::shared_ptr<CancellationToken> cancel) {
    auto& logger = Logger::getInstance();
    auto started = Clock::now();

    Job job;
    job.id = makeJobId();
    job.userText = userText;
    job.inputPath = inputPath;
    job.dir = fs::path(options.outputDir) / job.id;
    job.cancel = cancel ? std::move(cancel) : std::make_shared<CancellationToken>();
    job.result.jobId = job.id;

    logger.info("Job " + job.id + ": \"" + userText + "\" on " + inputPath);
    record(AuditStage::Execute, AuditOutcome::Ok,
           {{"job", job.id}, {"event", "job_started"}, {"request", userText}, {"input", inputPath}});

    std::string stage = "input";
    try {
        if (!fs::is_regular_file(inputPath)) {
            throw MissingInput("input file not found: " + inputPath, {{"input", inputPath}});
        }
        job.cancel->throwIfCancelled();

        stage = "plan";
        Manifest manifest = planner.plan(userText);
        transition(job, ExecutorState::Planned);

        while (true) {
            job.cancel->throwIfCancelled();
            stage = "execute";
            ManifestOutcome outcome = executeManifest(job, manifest);
            if (outcome.committed) {
                if (settle(job)) {
                    std::error_code ec;
                    fs::remove_all(job.dir / ".attempts", ec);
                }
                transition(job, ExecutorState::Committed);
                job.result.success = true;
                job.result.outputPath = outcome.outputPath;
                job.result.summary = outcome.finalResult.value("summary", nlohmann::json::object());
                record(AuditStage::Execute, AuditOutcome::Ok,
                       {{"job", job.id}, {"terminal", "COMMITTED"}, {"output", outcome.outputPath},
                        {"replans", job.result.replans}, {"elapsed_sec", secondsSince(started)}});
                logger.success("Job " + job.id + " committed: " + outcome.outputPath);
                return job.result;
            }

            if (job.result.replans >= options.maxReplans) {
                JobFailure failure;
                failure.stage = outcome.diagnostics.failedStage;
                failure.category = categoryFromName(outcome.diagnostics.category);
                failure.message = "retries and replans exhausted: " + outcome.diagnostics.error;
                failure.detail = outcome.diagnostics.toJson();
                abort(job, std::move(failure));
                return job.result;
            }

            job.result.replans++;
            transition(job, ExecutorState::Replanning);
            record(AuditStage::Recover, AuditOutcome::Ok,
                   {{"job", job.id}, {"action", "replan"}, {"replan", job.result.replans},
                    {"diagnostics", outcome.diagnostics.toJson()}});
            stage = "plan";
            manifest = planner.plan(userText, outcome.diagnostics);
            transition(job, ExecutorState::Planned);
        }
    } catch (const ShieldError& e) {
        abort(job, JobFailure{stage, e.category(), e.what(), e.detail()});
    } catch (const std::exception& e) {
        abort(job, JobFailure{stage, ErrorCategory::ToolError, e.what(), nlohmann::json::object()});
    }
    return job.result;
}
