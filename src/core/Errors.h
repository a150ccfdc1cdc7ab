#pragma once
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief Failure categories of a privacy job.
 *
 * The category decides the recovery policy of the Executor:
 * retryable categories go through local retries and then replanning,
 * fatal categories abort the job immediately.
 */
enum class ErrorCategory {
    PlanningFailure,
    GenerationFailure,
    DetectionVerificationFailure,
    RedactionVerificationFailure,
    TemporalIntegrityError,
    ExecutionTimeout,
    ToolError,
    SandboxViolation,
    MalformedManifest,
    MissingInput,
    RegistryConflict,
    Cancelled
};

inline std::string categoryName(ErrorCategory c) {
    switch (c) {
        case ErrorCategory::PlanningFailure: return "PlanningFailure";
        case ErrorCategory::GenerationFailure: return "GenerationFailure";
        case ErrorCategory::DetectionVerificationFailure: return "DetectionVerificationFailure";
        case ErrorCategory::RedactionVerificationFailure: return "RedactionVerificationFailure";
        case ErrorCategory::TemporalIntegrityError: return "TemporalIntegrityError";
        case ErrorCategory::ExecutionTimeout: return "ExecutionTimeout";
        case ErrorCategory::ToolError: return "ToolError";
        case ErrorCategory::SandboxViolation: return "SandboxViolation";
        case ErrorCategory::MalformedManifest: return "MalformedManifest";
        case ErrorCategory::MissingInput: return "MissingInput";
        case ErrorCategory::RegistryConflict: return "RegistryConflict";
        case ErrorCategory::Cancelled: return "Cancelled";
    }
    return "ToolError";
}

/** Maps a category name found in a tool result back to the enum. Unknown names map to ToolError. */
inline ErrorCategory categoryFromName(const std::string& name) {
    static const ErrorCategory all[] = {
        ErrorCategory::PlanningFailure, ErrorCategory::GenerationFailure,
        ErrorCategory::DetectionVerificationFailure, ErrorCategory::RedactionVerificationFailure,
        ErrorCategory::TemporalIntegrityError, ErrorCategory::ExecutionTimeout,
        ErrorCategory::ToolError, ErrorCategory::SandboxViolation,
        ErrorCategory::MalformedManifest, ErrorCategory::MissingInput,
        ErrorCategory::RegistryConflict, ErrorCategory::Cancelled};
    for (ErrorCategory c : all) {
        if (categoryName(c) == name) return c;
    }
    return ErrorCategory::ToolError;
}

/** Fatal categories skip retries and replanning. */
inline bool isFatal(ErrorCategory c) {
    switch (c) {
        case ErrorCategory::SandboxViolation:
        case ErrorCategory::MalformedManifest:
        case ErrorCategory::MissingInput:
        case ErrorCategory::RegistryConflict:
        case ErrorCategory::Cancelled:
        case ErrorCategory::PlanningFailure:
            return true;
        default:
            return false;
    }
}

/**
 * @brief Base of every error raised by the pipeline.
 *
 * Carries a category and an optional JSON payload with diagnostics
 * (verification metrics, offending tool, paths).
 */
class ShieldError : public std::runtime_error {
public:
    ShieldError(ErrorCategory category, const std::string& message,
                nlohmann::json detail = nlohmann::json::object())
        : std::runtime_error(message), cat(category), payload(std::move(detail)) {}

    ErrorCategory category() const { return cat; }
    const nlohmann::json& detail() const { return payload; }
    bool fatal() const { return isFatal(cat); }

    nlohmann::json toJson() const {
        return {{"category", categoryName(cat)}, {"message", what()}, {"detail", payload}};
    }

private:
    ErrorCategory cat;
    nlohmann::json payload;
};

#define WORDSHIELD_DEFINE_ERROR(Name)                                                   \
    class Name : public ShieldError {                                                   \
    public:                                                                             \
        explicit Name(const std::string& message,                                       \
                      nlohmann::json detail = nlohmann::json::object())                 \
            : ShieldError(ErrorCategory::Name, message, std::move(detail)) {}           \
    };

WORDSHIELD_DEFINE_ERROR(PlanningFailure)
WORDSHIELD_DEFINE_ERROR(GenerationFailure)
WORDSHIELD_DEFINE_ERROR(DetectionVerificationFailure)
WORDSHIELD_DEFINE_ERROR(RedactionVerificationFailure)
WORDSHIELD_DEFINE_ERROR(TemporalIntegrityError)
WORDSHIELD_DEFINE_ERROR(ExecutionTimeout)
WORDSHIELD_DEFINE_ERROR(ToolError)
WORDSHIELD_DEFINE_ERROR(SandboxViolation)
WORDSHIELD_DEFINE_ERROR(MalformedManifest)
WORDSHIELD_DEFINE_ERROR(MissingInput)
WORDSHIELD_DEFINE_ERROR(RegistryConflict)

#undef WORDSHIELD_DEFINE_ERROR

/** Raised when a job's cancellation token fires. */
class JobCancelled : public ShieldError {
public:
    explicit JobCancelled(const std::string& message = "Job cancelled")
        : ShieldError(ErrorCategory::Cancelled, message) {}
};
