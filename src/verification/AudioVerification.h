#pragma once
#include <string>
#include <vector>
#include "audio/AudioRedactor.h"
#include "audio/PhraseLocalizer.h"
#include "audio/Transcript.h"
#include "verification/VerificationResult.h"

struct TemporalThresholds {
    double maxSegmentSec = 15.0;    // longer segments are flagged, not failed
    double maxOverlapRatio = 0.5;   // fail when strictly above
};

namespace AudioVerification {
    /**
     * @brief Chronological validity of a segment set.
     *
     * Every segment needs start < end <= duration. Fails when more than half
     * of the segments overlap or duplicate another one.
     */
    VerificationResult verifyTemporalIntegrity(const std::vector<RedactionSegment>& segments, double duration,
                                               const TemporalThresholds& limits = TemporalThresholds());

    /** Re-transcribes the redacted audio; any phrase still found fails. */
    VerificationResult verifyCompliance(ITranscriber& transcriber, const AudioBuffer& redacted,
                                        const std::vector<std::string>& phrases,
                                        const PhraseLocalizer& localizer = PhraseLocalizer());
}
