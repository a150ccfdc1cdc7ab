/**
 * FaceTrackingEngine: cadence, association, prediction and the drop limit.
 *
 * Flat frames carry no texture, so the appearance tracker never locks on and
 * every frame without a detection is a prediction.
 */
#include <gtest/gtest.h>
#include "video/FaceTrackingEngine.h"
#include "TestDoubles.h"

namespace {

const cv::Rect kFace(40, 30, 40, 40);

TrackingParams everyFrame() {
    TrackingParams p;
    p.detectEvery = 1;
    return p;
}

}

TEST(FaceTrackingEngineTest, DetectorRunsOnCadence) {
    ScriptedFaceDetector detector;
    TrackingParams params;
    params.detectEvery = 3;
    FaceTrackingEngine engine(detector, params);

    std::vector<bool> ran;
    for (const auto& f : flatFrames(7)) ran.push_back(engine.process(f).detectorRan);
    EXPECT_EQ(ran, (std::vector<bool>{true, false, false, true, false, false, true}));
    EXPECT_EQ(detector.calls, 3u);
}

TEST(FaceTrackingEngineTest, RedetectionKeepsTheTrackAndClosesTheGap) {
    ScriptedFaceDetector detector({{{kFace, 0.9f}}, {{kFace, 0.9f}}});
    TrackingParams params;
    params.detectEvery = 3;
    FaceTrackingEngine engine(detector, params);

    std::vector<FrameResult> results;
    for (const auto& f : flatFrames(4)) results.push_back(engine.process(f));

    ASSERT_EQ(results[0].faces.size(), 1u);
    EXPECT_EQ(results[0].faces[0].state, TrackState::Detected);
    EXPECT_EQ(results[1].faces[0].state, TrackState::Predicted);
    EXPECT_EQ(results[2].faces[0].state, TrackState::Predicted);
    EXPECT_EQ(results[3].faces[0].state, TrackState::Detected);
    EXPECT_EQ(results[3].faces[0].trackId, results[0].faces[0].trackId);

    TrackingStats s = engine.stats();
    EXPECT_EQ(s.tracksCreated, 1);
    EXPECT_EQ(s.trackFrames, 4);
    EXPECT_EQ(s.predictedFrames, 2);
    EXPECT_EQ(s.gapLengths, (std::vector<int>{2}));
}

TEST(FaceTrackingEngineTest, LowScoreDetectionsAreIgnored) {
    ScriptedFaceDetector detector({{{kFace, 0.2f}}});
    FaceTrackingEngine engine(detector, everyFrame());
    EXPECT_TRUE(engine.process(flatFrames(1)[0]).faces.empty());
    EXPECT_EQ(engine.stats().tracksCreated, 0);
}

TEST(FaceTrackingEngineTest, TrackIsDroppedAfterSixtyPredictedFrames) {
    ScriptedFaceDetector detector({{{kFace, 0.9f}}});
    FaceTrackingEngine engine(detector, everyFrame());

    std::vector<FrameResult> results;
    for (const auto& f : flatFrames(62)) results.push_back(engine.process(f));

    EXPECT_EQ(results[0].faces[0].state, TrackState::Detected);
    for (int i = 1; i <= 60; ++i) {
        ASSERT_EQ(results[i].faces.size(), 1u) << "frame " << i;
        EXPECT_EQ(results[i].faces[0].state, TrackState::Predicted);
    }
    // The 61st prediction exceeds the limit; that frame carries no face
    EXPECT_TRUE(results[61].faces.empty());
    EXPECT_TRUE(engine.tracks().empty());

    TrackingStats s = engine.stats();
    EXPECT_EQ(s.tracksDropped, 1);
    EXPECT_EQ(s.predictedFrames, 60);
    EXPECT_EQ(s.trackFrames, 61);
    EXPECT_EQ(s.gapLengths, (std::vector<int>{60}));
}

TEST(FaceTrackingEngineTest, ResetStartsOver) {
    ScriptedFaceDetector detector({{{kFace, 0.9f}}});
    FaceTrackingEngine engine(detector, everyFrame());
    engine.process(flatFrames(1)[0]);
    engine.reset();
    EXPECT_TRUE(engine.tracks().empty());
    EXPECT_EQ(engine.stats().frames, 0);
    EXPECT_EQ(engine.process(flatFrames(1)[0]).frameIndex, 0);
}

TEST(FaceTrackingEngineTest, StatsJsonRoundTrip) {
    TrackingStats s;
    s.frames = 90;
    s.trackFrames = 120;
    s.predictedFrames = 7;
    s.gapLengths = {3, 4};
    s.tracksCreated = 2;
    s.tracksDropped = 1;
    TrackingStats back = TrackingStats::fromJson(s.toJson());
    EXPECT_EQ(back.trackFrames, 120);
    EXPECT_EQ(back.gapLengths, s.gapLengths);
    EXPECT_EQ(back.tracksDropped, 1);
}

TEST(FaceTrackingEngineTest, IntersectionOverUnion) {
    EXPECT_FLOAT_EQ(intersectionOverUnion(cv::Rect2f(0, 0, 10, 10), cv::Rect2f(0, 0, 10, 10)), 1.0f);
    EXPECT_FLOAT_EQ(intersectionOverUnion(cv::Rect2f(0, 0, 10, 10), cv::Rect2f(5, 0, 10, 10)), 50.0f / 150.0f);
    EXPECT_FLOAT_EQ(intersectionOverUnion(cv::Rect2f(0, 0, 10, 10), cv::Rect2f(20, 20, 5, 5)), 0.0f);
}
