/**
 * Built-in audio tools over a WAV file: "mute my home address" end to end,
 * with tone-rendered speech and a tone-matching transcriber.
 */
#include <gtest/gtest.h>
#include <fstream>

#include "audio/AudioDecoder.h"
#include "audio/WavWriter.h"
#include "pipeline/Executor.h"
#include "tools/AudioTools.h"
#include "verification/AudioVerification.h"
#include "TestDoubles.h"

namespace {

const std::vector<ToneWord> kSpeech = {{"I", 0.0, 0.3, 300.0},      {"live", 0.4, 0.7, 350.0},
                                       {"at", 0.8, 1.0, 400.0},     {"123", 1.1, 1.5, 450.0},
                                       {"Main", 1.6, 1.9, 520.0},   {"Street", 2.0, 2.4, 610.0},
                                       {"okay", 2.6, 3.0, 700.0}};

class AudioToolsTest : public ::testing::Test {
protected:
    void SetUp() override {
        root = freshDirectory("wordshield_audio_tools");
        input = (root / "talk.wav").string();
        WavWriter::write(input, renderTones(kSpeech, 3.2));

        llm = std::make_shared<MockLLMClient>();
        asr = std::make_shared<ToneTranscriber>(kSpeech);
        services.llm = llm;
        services.transcriber = asr;
        ctx.inputPath = input;
        ctx.outputDir = (root / "out").string();
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    static nlohmann::json readJson(const std::string& path) {
        std::ifstream in(path);
        return nlohmann::json::parse(in);
    }

    fs::path root;
    std::string input;
    std::shared_ptr<MockLLMClient> llm;
    std::shared_ptr<ToneTranscriber> asr;
    ToolServices services;
    ToolContext ctx;
};

}

TEST_F(AudioToolsTest, MutesHomeAddressInTwoVerifiedPhases) {
    llm->queueJson({{"phrases", {"123 Main Street"}}});
    MuteKeywordsTool tool(services);
    nlohmann::json args = {{"request", "mute my home address"}};

    nlohmann::json detection = tool.detect(ctx, args);
    ASSERT_FALSE(detection.contains("error")) << detection.dump(2);
    EXPECT_EQ(llm->jsonCalls, 1);
    EXPECT_NE(llm->prompts[0].find("mute my home address"), std::string::npos);
    EXPECT_NE(llm->prompts[0].find("I live at 123 Main Street okay"), std::string::npos);

    nlohmann::json segmentsDoc = readJson(detection["segments_path"].get<std::string>());
    ASSERT_EQ(segmentsDoc["segments"].size(), 1u);
    EXPECT_NEAR(segmentsDoc["segments"][0]["start"].get<double>(), 1.1, 1e-9);
    EXPECT_NEAR(segmentsDoc["segments"][0]["end"].get<double>(), 2.4, 1e-9);

    nlohmann::json detectionCheck = tool.verifyDetection(ctx, args, detection);
    ASSERT_TRUE(ToolResult::isVerified(detectionCheck)) << detectionCheck.dump(2);

    nlohmann::json output = tool.transform(ctx, args, detection);
    ASSERT_FALSE(output.contains("error")) << output.dump(2);
    EXPECT_EQ(fs::path(output["output_path"].get<std::string>()).filename(), "talk_muted.wav");

    nlohmann::json check = tool.verifyTransform(ctx, args, detection, output);
    EXPECT_TRUE(ToolResult::isVerified(check)) << check.dump(2);

    AudioBuffer muted = AudioDecoder::decodeFile(output["output_path"].get<std::string>());
    EXPECT_EQ(muted.sampleRate, 16000);
    for (size_t i = 3; i <= 5; ++i) EXPECT_FALSE(ToneTranscriber::audible(muted, kSpeech[i])) << kSpeech[i].text;
    EXPECT_TRUE(ToneTranscriber::audible(muted, kSpeech[2]));
    EXPECT_TRUE(ToneTranscriber::audible(muted, kSpeech[6]));
}

TEST_F(AudioToolsTest, ModeNoneFailsVerificationAndRetryWidens) {
    MuteKeywordsTool tool(services);
    nlohmann::json args = {{"phrases", {"123 Main Street"}}, {"mode", "none"}};

    nlohmann::json detection = tool.detect(ctx, args);
    EXPECT_EQ(llm->jsonCalls, 0);
    nlohmann::json output = tool.transform(ctx, args, detection);
    nlohmann::json check = tool.verifyTransform(ctx, args, detection, output);
    ASSERT_FALSE(ToolResult::isVerified(check));
    EXPECT_EQ(check["category"], "RedactionVerificationFailure");

    nlohmann::json retry = tool.adjustArguments(args, 1, check);
    EXPECT_EQ(retry["mode"], "silence");
    EXPECT_DOUBLE_EQ(retry["lead_pad_sec"].get<double>(), 0.1);
    EXPECT_DOUBLE_EQ(retry["tail_pad_sec"].get<double>(), 0.4);

    output = tool.transform(ctx, retry, detection);
    EXPECT_TRUE(ToolResult::isVerified(tool.verifyTransform(ctx, retry, detection, output)));
}

TEST_F(AudioToolsTest, TemporalFailureRetriesWithNormalizedSegments) {
    MuteKeywordsTool tool(services);
    nlohmann::json diag = {{"verified", false}, {"check", "temporal_integrity"}};
    nlohmann::json retry = tool.adjustArguments({{"mode", "beep"}}, 1, diag);
    EXPECT_TRUE(retry["normalize_segments"].get<bool>());
    EXPECT_EQ(retry["mode"], "beep");
    EXPECT_FALSE(retry.contains("tail_pad_sec"));
}

TEST_F(AudioToolsTest, DetectThenMuteChainThroughPrevious) {
    DetectKeywordsTool detect(services);
    MuteSegmentsTool mute(services);

    nlohmann::json detected = detect.apply(ctx, {{"phrases", {"123 Main Street"}}, {"mode", "beep"}});
    ASSERT_FALSE(detected.contains("error")) << detected.dump(2);
    EXPECT_EQ(detected["output_path"], input);
    EXPECT_TRUE(ToolResult::isVerified(detect.verify(ctx, {}, detected)));

    nlohmann::json args = Executor::resolveReferences({{"segments_path", "$prev.segments_path"}}, detected);
    nlohmann::json muted = mute.apply(ctx, args);
    ASSERT_FALSE(muted.contains("error")) << muted.dump(2);
    EXPECT_EQ(muted["segments"][0]["mode"], "beep");
    nlohmann::json check = mute.verify(ctx, args, muted);
    EXPECT_TRUE(ToolResult::isVerified(check)) << check.dump(2);
    EXPECT_EQ(asr->calls, 2);
}

TEST_F(AudioToolsTest, LeadPadIsAppliedBeforeNormalizing) {
    const std::string segmentsPath = (root / "segments.json").string();
    std::ofstream(segmentsPath) << nlohmann::json{
        {"segments", segmentsToJson({RedactionSegment{1.1, 1.5, RedactionMode::Silence},
                                     RedactionSegment{1.6, 2.4, RedactionMode::Silence}})},
        {"duration", 3.2}};

    MuteSegmentsTool mute(services);
    nlohmann::json muted =
        mute.apply(ctx, {{"segments_path", segmentsPath}, {"lead_pad_sec", 0.2}, {"normalize_segments", true}});
    ASSERT_FALSE(muted.contains("error")) << muted.dump(2);

    // Padding made the two spans overlap; normalizing afterwards merges them
    std::vector<RedactionSegment> applied = segmentsFromJson(muted["segments"]);
    ASSERT_EQ(applied.size(), 1u);
    EXPECT_NEAR(applied[0].start, 0.9, 1e-9);
    EXPECT_NEAR(applied[0].end, 2.4, 1e-9);
    EXPECT_TRUE(AudioVerification::verifyTemporalIntegrity(applied, 3.2).verified);
}

TEST_F(AudioToolsTest, MuteSegmentsNeedsSegmentsFile) {
    MuteSegmentsTool mute(services);
    EXPECT_TRUE(ToolResult::isError(mute.apply(ctx, nlohmann::json::object())));

    nlohmann::json missing = mute.apply(ctx, {{"segments_path", (root / "absent.json").string()}});
    ASSERT_TRUE(ToolResult::isError(missing));
    EXPECT_EQ(missing["category"], "ToolError");
}

TEST_F(AudioToolsTest, UndecodableInputIsToolError) {
    std::string bogus = (root / "bogus.wav").string();
    std::ofstream(bogus) << "not audio";
    ctx.inputPath = bogus;
    DetectKeywordsTool detect(services);
    EXPECT_TRUE(ToolResult::isError(detect.apply(ctx, {{"phrases", {"x"}}})));
}
