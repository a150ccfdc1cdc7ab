#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "core/Errors.h"

/**
 * @brief Verdict of one verification check.
 */
struct VerificationResult {
    bool verified = false;
    std::string check;
    ErrorCategory category = ErrorCategory::ToolError;  // meaningful only when !verified
    nlohmann::json metrics = nlohmann::json::object();
    std::string error;

    static VerificationResult pass(const std::string& check, nlohmann::json metrics) {
        VerificationResult r;
        r.verified = true;
        r.check = check;
        r.metrics = std::move(metrics);
        return r;
    }

    static VerificationResult fail(const std::string& check, ErrorCategory category,
                                   const std::string& error, nlohmann::json metrics) {
        VerificationResult r;
        r.verified = false;
        r.check = check;
        r.category = category;
        r.error = error;
        r.metrics = std::move(metrics);
        return r;
    }

    nlohmann::json toJson() const {
        nlohmann::json j = {{"verified", verified}, {"check", check}, {"metrics", metrics}};
        if (!verified) {
            j["category"] = categoryName(category);
            j["error"] = error;
        }
        return j;
    }
};
