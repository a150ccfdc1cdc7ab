#include "verification/AudioVerification.h"
#include <cmath>

namespace AudioVerification {

VerificationResult verifyTemporalIntegrity(const std::vector<RedactionSegment>& segments, double duration,
                                           const TemporalThresholds& limits) {
    nlohmann::json invalid = nlohmann::json::array();
    nlohmann::json implausible = nlohmann::json::array();
    constexpr double eps = 1e-6;

    for (size_t i = 0; i < segments.size(); ++i) {
        const auto& s = segments[i];
        if (!(s.start < s.end) || s.start < 0.0 || s.end > duration + eps) {
            invalid.push_back({{"index", i}, {"start", s.start}, {"end", s.end}});
        } else if (s.end - s.start > limits.maxSegmentSec) {
            implausible.push_back({{"index", i}, {"duration", s.end - s.start}});
        }
    }

    size_t conflicting = 0;
    for (size_t i = 0; i < segments.size(); ++i) {
        for (size_t j = 0; j < segments.size(); ++j) {
            if (i == j) continue;
            const auto& a = segments[i];
            const auto& b = segments[j];
            bool duplicate = std::fabs(a.start - b.start) < eps && std::fabs(a.end - b.end) < eps;
            bool overlap = a.start < b.end && b.start < a.end;
            if (duplicate || overlap) {
                conflicting++;
                break;
            }
        }
    }
    const double overlapRatio = segments.empty() ? 0.0 : static_cast<double>(conflicting) / segments.size();

    nlohmann::json metrics = {{"segments", segments.size()},
                              {"duration", duration},
                              {"invalid", invalid},
                              {"implausible_long", implausible},
                              {"overlap_ratio", overlapRatio}};

    if (!invalid.empty()) {
        return VerificationResult::fail("temporal_integrity", ErrorCategory::TemporalIntegrityError,
                                        std::to_string(invalid.size()) + " segment(s) outside [0, duration] or reversed",
                                        metrics);
    }
    if (overlapRatio > limits.maxOverlapRatio) {
        return VerificationResult::fail("temporal_integrity", ErrorCategory::TemporalIntegrityError,
                                        "overlapping or duplicate segment ratio " + std::to_string(overlapRatio),
                                        metrics);
    }
    return VerificationResult::pass("temporal_integrity", metrics);
}

VerificationResult verifyCompliance(ITranscriber& transcriber, const AudioBuffer& redacted,
                                    const std::vector<std::string>& phrases, const PhraseLocalizer& localizer) {
    std::vector<TranscriptWord> words = transcriber.transcribe(redacted);
    std::vector<PhraseMatch> survivors = localizer.locate(words, phrases);

    nlohmann::json found = nlohmann::json::array();
    for (const auto& m : survivors) {
        found.push_back({{"phrase", m.phrase}, {"start", m.start}, {"end", m.end}});
    }
    nlohmann::json metrics = {{"phrases", phrases.size()}, {"surviving", found}, {"words", words.size()}};

    if (!survivors.empty()) {
        return VerificationResult::fail("compliance", ErrorCategory::RedactionVerificationFailure,
                                        std::to_string(survivors.size()) + " phrase occurrence(s) still audible",
                                        metrics);
    }
    return VerificationResult::pass("compliance", metrics);
}

}
