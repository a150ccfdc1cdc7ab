/**
 * Temporal integrity of segment sets and compliance by re-transcription.
 */
#include <gtest/gtest.h>
#include "verification/AudioVerification.h"
#include "TestDoubles.h"

namespace {

RedactionSegment seg(double s, double e) {
    return RedactionSegment{s, e, RedactionMode::Silence};
}

const std::vector<ToneWord> kSpeech = {
    {"my", 0.0, 0.4, 300.0}, {"secret", 0.5, 0.9, 500.0}, {"code", 1.0, 1.4, 700.0}};

}

TEST(TemporalIntegrityTest, DisjointSegmentsPass) {
    VerificationResult r = AudioVerification::verifyTemporalIntegrity({seg(0.1, 0.3), seg(0.5, 0.9)}, 2.0);
    EXPECT_TRUE(r.verified);
    EXPECT_DOUBLE_EQ(r.metrics["overlap_ratio"].get<double>(), 0.0);
}

TEST(TemporalIntegrityTest, ReversedOrOutOfRangeSegmentsFail) {
    for (const auto& bad : {seg(0.5, 0.5), seg(0.6, 0.4), seg(-0.1, 0.2), seg(1.5, 2.5)}) {
        VerificationResult r = AudioVerification::verifyTemporalIntegrity({seg(0.0, 0.1), bad}, 2.0);
        EXPECT_FALSE(r.verified) << bad.start << "-" << bad.end;
        EXPECT_EQ(r.category, ErrorCategory::TemporalIntegrityError);
        EXPECT_EQ(r.metrics["invalid"].size(), 1u);
    }
}

TEST(TemporalIntegrityTest, HalfOverlappingPasses) {
    // Two of four segments overlap each other
    VerificationResult r = AudioVerification::verifyTemporalIntegrity(
        {seg(0.0, 0.5), seg(0.4, 0.8), seg(1.0, 1.2), seg(1.5, 1.7)}, 2.0);
    EXPECT_TRUE(r.verified) << r.toJson().dump(2);
    EXPECT_DOUBLE_EQ(r.metrics["overlap_ratio"].get<double>(), 0.5);
}

TEST(TemporalIntegrityTest, MostlyOverlappingFails) {
    VerificationResult r =
        AudioVerification::verifyTemporalIntegrity({seg(0.0, 0.5), seg(0.4, 0.8), seg(1.0, 1.2)}, 2.0);
    EXPECT_FALSE(r.verified);
    EXPECT_EQ(r.category, ErrorCategory::TemporalIntegrityError);

    VerificationResult dup = AudioVerification::verifyTemporalIntegrity({seg(0.2, 0.4), seg(0.2, 0.4)}, 2.0);
    EXPECT_FALSE(dup.verified);
}

TEST(TemporalIntegrityTest, LongSegmentIsFlaggedOnly) {
    VerificationResult r = AudioVerification::verifyTemporalIntegrity({seg(1.0, 20.0)}, 30.0);
    EXPECT_TRUE(r.verified);
    ASSERT_EQ(r.metrics["implausible_long"].size(), 1u);
    EXPECT_DOUBLE_EQ(r.metrics["implausible_long"][0]["duration"].get<double>(), 19.0);
}

TEST(TemporalIntegrityTest, EmptySetPasses) {
    EXPECT_TRUE(AudioVerification::verifyTemporalIntegrity({}, 2.0).verified);
}

TEST(ComplianceTest, BeepedPhraseIsGone) {
    AudioBuffer audio = renderTones(kSpeech, 2.0);
    ToneTranscriber asr(kSpeech);
    auto segments = PhraseLocalizer().segments(asr.transcribe(audio), {"secret"}, RedactionMode::Beep);
    ASSERT_EQ(segments.size(), 1u);

    AudioBuffer redacted = AudioRedactor::apply(audio, segments, 0.15);
    VerificationResult r = AudioVerification::verifyCompliance(asr, redacted, {"secret"});
    EXPECT_TRUE(r.verified) << r.toJson().dump(2);
    // The neighbouring word survives the tail pad
    EXPECT_EQ(r.metrics["words"], 2);
}

TEST(ComplianceTest, SilencedPhraseIsGone) {
    AudioBuffer audio = renderTones(kSpeech, 2.0);
    ToneTranscriber asr(kSpeech);
    AudioBuffer redacted = AudioRedactor::apply(audio, {seg(0.5, 0.9)}, 0.15);
    EXPECT_TRUE(AudioVerification::verifyCompliance(asr, redacted, {"secret"}).verified);
}

TEST(ComplianceTest, ModeNoneFails) {
    AudioBuffer audio = renderTones(kSpeech, 2.0);
    ToneTranscriber asr(kSpeech);
    AudioBuffer redacted = AudioRedactor::apply(audio, {{0.5, 0.9, RedactionMode::None}}, 0.15);

    VerificationResult r = AudioVerification::verifyCompliance(asr, redacted, {"secret"});
    EXPECT_FALSE(r.verified);
    EXPECT_EQ(r.category, ErrorCategory::RedactionVerificationFailure);
    ASSERT_EQ(r.metrics["surviving"].size(), 1u);
    EXPECT_EQ(r.metrics["surviving"][0]["phrase"], "secret");
}
